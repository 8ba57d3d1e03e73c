#include "bot/botRunner.hpp"

#include "common/syntheticFrame.hpp"
#include "recordingActuator.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <deque>
#include <stdexcept>

namespace flyff::gtest {

using namespace std::chrono_literals;
using bot::BotRunner;
using bot::SharedConfig;

//! Hands out queued frames, then the fallback frame if set, else nothing.
class QueuedFrameSource : public bot::IFrameSource {
public:
	std::optional<cv::Mat> captureFrame() override {
		++captures;
		if (throwOnCapture) {
			throw std::runtime_error("capture backend gone");
		}
		if (frames.empty()) {
			return fallback;
		}
		auto frame = frames.front();
		frames.pop_front();
		return frame;
	}

	std::deque<cv::Mat> frames;
	std::optional<cv::Mat> fallback;
	bool throwOnCapture{false};
	std::atomic<int> captures{0};
};

static cv::Mat playerFrame() {
	auto frame = blankFrame();
	paint(frame, {110, 40, 100, 4}, HP_COLOR);
	paint(frame, {110, 55, 100, 4}, MP_COLOR);
	paint(frame, {110, 70, 100, 4}, FP_COLOR);
	return frame;
}

TEST(SharedConfig, SnapshotSeesUpdates) {
	SharedConfig config;
	EXPECT_EQ(config.snapshot().thresholds.heal, 50);

	const auto before = config.snapshot();
	config.update([](bot::Config& cfg) { cfg.thresholds.heal = 80; });

	EXPECT_EQ(config.snapshot().thresholds.heal, 80);
	EXPECT_EQ(before.thresholds.heal, 50);
}

TEST(SharedConfig, DefaultsMatchClientLayout) {
	const bot::Config cfg;

	EXPECT_EQ(cfg.slots.attack, std::vector<int>{0});
	EXPECT_EQ(cfg.slots.pickup, std::vector<int>{4});
	EXPECT_FALSE(cfg.slots.pickupPet.has_value());
	EXPECT_EQ(cfg.behavior.obstacleMaxRetries, 3);
	EXPECT_EQ(cfg.behavior.captureIntervalMs, 1000);
	EXPECT_EQ(cfg.detection.mobs.minLabelWidth, 15);
	EXPECT_EQ(cfg.detection.marker.colors.front(), (vision::Color{131, 148, 205}));
}

TEST(BotRunner, SkipsTickWithoutFrame) {
	QueuedFrameSource frames;
	RecordingActuator actuator;
	SharedConfig config;
	BotRunner runner{frames, actuator, config, 1};

	EXPECT_FALSE(runner.runIteration(vision::Clock::now()));
	EXPECT_EQ(runner.stateName(), "SearchingForEnemy");
}

TEST(BotRunner, PublishesStateAfterTick) {
	QueuedFrameSource frames;
	frames.frames.push_back(playerFrame());
	RecordingActuator actuator;
	SharedConfig config;
	BotRunner runner{frames, actuator, config, 1};

	EXPECT_TRUE(runner.runIteration(vision::Clock::now()));
	EXPECT_EQ(runner.stateName(), "NoEnemyFound");
	EXPECT_TRUE(runner.targets().empty());

	const auto bars = runner.statusBars();
	EXPECT_EQ(bars[0].percentage, 100);
	EXPECT_TRUE(bars[0].detected);
}

TEST(BotRunner, CaptureErrorsDoNotEscape) {
	QueuedFrameSource frames;
	frames.throwOnCapture = true;
	RecordingActuator actuator;
	SharedConfig config;
	BotRunner runner{frames, actuator, config, 1};

	EXPECT_NO_THROW(EXPECT_FALSE(runner.runIteration(vision::Clock::now())));
}

TEST(BotRunner, StopsOnMobTimeout) {
	QueuedFrameSource frames;
	frames.fallback = playerFrame();
	RecordingActuator actuator;
	SharedConfig config;
	config.update([](bot::Config& cfg) {
		cfg.behavior.captureIntervalMs = 0;
		cfg.behavior.mobsTimeoutMs     = 1;
		cfg.behavior.jitterMs          = 0;
	});
	BotRunner runner{frames, actuator, config, 1};

	runner.start();
	for (int i = 0; i < 500 && runner.isRunning(); ++i) {
		std::this_thread::sleep_for(10ms);
	}
	EXPECT_FALSE(runner.isRunning());
	runner.stop();

	EXPECT_EQ(runner.statistics(vision::Clock::now()).kills, 0);
}

TEST(BotRunner, RestartsAfterBehaviorStop) {
	QueuedFrameSource frames;
	frames.fallback = playerFrame();
	RecordingActuator actuator;
	SharedConfig config;
	config.update([](bot::Config& cfg) {
		cfg.behavior.captureIntervalMs = 0;
		cfg.behavior.mobsTimeoutMs     = 1;
		cfg.behavior.jitterMs          = 0;
	});
	BotRunner runner{frames, actuator, config, 1};

	runner.start();
	for (int i = 0; i < 500 && runner.isRunning(); ++i) {
		std::this_thread::sleep_for(10ms);
	}
	ASSERT_FALSE(runner.isRunning());

	const int before = frames.captures.load();
	runner.start();
	for (int i = 0; i < 500 && frames.captures.load() == before; ++i) {
		std::this_thread::sleep_for(10ms);
	}
	EXPECT_GT(frames.captures.load(), before);
	runner.stop();
	EXPECT_FALSE(runner.isRunning());
}

} // namespace flyff::gtest
