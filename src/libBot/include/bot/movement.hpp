#pragma once

#include "bot/actuator.hpp"

#include <chrono>
#include <cstdint>
#include <random>

namespace flyff::bot {

//! Movement maneuvers built from actuator primitives. Timings get a random jitter.
class MovementCoordinator {
public:
	MovementCoordinator(IActuator& actuator, std::uint32_t seed, std::chrono::milliseconds jitter);

	void setJitter(std::chrono::milliseconds jitter);

	//! Turn the camera right for a short moment.
	void rotate();

	//! Run in a circle (forward, jump and strafe right) for the given duration.
	void circleMove(std::chrono::milliseconds duration);

	/*! Try to get around whatever blocks the way to the target.
	 * Attempt 0 locks on the target and jumps forward. Later attempts strafe left or right
	 * in alternation while jumping forward and then lock on again.
	 */
	void avoidObstacle(int attempt);

	void clickTarget(const vision::Point& anchor);

	//! Release the current target.
	void cancelTarget();

	//! Base duration plus a random jitter.
	std::chrono::milliseconds jittered(std::chrono::milliseconds base);

private:
	void hold(Key key, std::chrono::milliseconds duration);

	IActuator& m_actuator;
	std::mt19937 m_rng;
	std::chrono::milliseconds m_jitter;
};

} // namespace flyff::bot
