#include "bot/movement.hpp"

#include "recordingActuator.hpp"

#include <gtest/gtest.h>

namespace flyff::gtest {

using namespace std::chrono_literals;
using bot::MovementCoordinator;

TEST(Movement, SameSeedGivesSameManeuvers) {
	RecordingActuator first;
	RecordingActuator second;
	MovementCoordinator a{first, 42, 50ms};
	MovementCoordinator b{second, 42, 50ms};

	for (int i = 0; i < 5; ++i) {
		a.rotate();
		a.avoidObstacle(i);
		a.circleMove(100ms);
		b.rotate();
		b.avoidObstacle(i);
		b.circleMove(100ms);
	}
	EXPECT_EQ(first.actions, second.actions);
}

TEST(Movement, JitterStaysWithinBounds) {
	RecordingActuator actuator;
	MovementCoordinator movement{actuator, 7, 50ms};

	for (int i = 0; i < 100; ++i) {
		const auto d = movement.jittered(200ms);
		EXPECT_GE(d, 200ms);
		EXPECT_LE(d, 250ms);
	}
}

TEST(Movement, RotateWithoutJitter) {
	RecordingActuator actuator;
	MovementCoordinator movement{actuator, 1, 0ms};

	movement.rotate();
	const std::vector<std::string> expected{"hold D", "wait 50", "release D", "wait 50"};
	EXPECT_EQ(actuator.actions, expected);
}

TEST(Movement, FirstObstacleAttemptLocksAndJumps) {
	RecordingActuator actuator;
	MovementCoordinator movement{actuator, 1, 0ms};

	movement.avoidObstacle(0);
	const std::vector<std::string> expected{"press Z", "hold W", "hold Space", "wait 800", "release Space", "release W"};
	EXPECT_EQ(actuator.actions, expected);
}

TEST(Movement, LaterObstacleAttemptsAlternateStrafe) {
	RecordingActuator actuator;
	MovementCoordinator movement{actuator, 1, 0ms};

	movement.avoidObstacle(1);
	EXPECT_TRUE(actuator.contains("hold D"));
	EXPECT_FALSE(actuator.contains("hold A"));
	EXPECT_EQ(actuator.actions.back(), "press Z");

	actuator.clear();
	movement.avoidObstacle(2);
	EXPECT_TRUE(actuator.contains("hold A"));
	EXPECT_FALSE(actuator.contains("hold D"));
}

TEST(Movement, CircleMoveReleasesAllKeys) {
	RecordingActuator actuator;
	MovementCoordinator movement{actuator, 1, 0ms};

	movement.circleMove(100ms);
	for (const auto* key: {"W", "Space", "D", "S"}) {
		EXPECT_EQ(actuator.count(std::string("hold ") + key), actuator.count(std::string("release ") + key)) << key;
	}
	EXPECT_TRUE(actuator.contains("wait 100"));
}

TEST(Movement, CancelTargetPressesEscape) {
	RecordingActuator actuator;
	MovementCoordinator movement{actuator, 1, 0ms};

	movement.cancelTarget();
	movement.clickTarget({10, 20});
	const std::vector<std::string> expected{"press Escape", "click 10,20"};
	EXPECT_EQ(actuator.actions, expected);
}

} // namespace flyff::gtest
