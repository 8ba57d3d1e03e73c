#include "bot/movement.hpp"

#include "Logging.hpp"

#include <format>

namespace flyff::bot {

using namespace std::chrono_literals;

std::string_view toString(const Key key) {
	switch (key) {
	case Key::W:
		return "W";
	case Key::A:
		return "A";
	case Key::S:
		return "S";
	case Key::D:
		return "D";
	case Key::Space:
		return "Space";
	case Key::Z:
		return "Z";
	case Key::Escape:
		return "Escape";
	}
	return "Unknown";
}

MovementCoordinator::MovementCoordinator(IActuator& actuator, const std::uint32_t seed, const std::chrono::milliseconds jitter)
    : m_actuator{actuator}, m_rng{seed}, m_jitter{jitter} {}

void MovementCoordinator::setJitter(const std::chrono::milliseconds jitter) {
	m_jitter = jitter;
}

std::chrono::milliseconds MovementCoordinator::jittered(const std::chrono::milliseconds base) {
	if (m_jitter <= 0ms) {
		return base;
	}
	std::uniform_int_distribution<std::chrono::milliseconds::rep> dist(0, m_jitter.count());
	return base + std::chrono::milliseconds{dist(m_rng)};
}

void MovementCoordinator::hold(const Key key, const std::chrono::milliseconds duration) {
	m_actuator.holdKey(key);
	m_actuator.wait(duration);
	m_actuator.releaseKey(key);
}

void MovementCoordinator::rotate() {
	hold(Key::D, jittered(50ms));
	m_actuator.wait(50ms);
}

void MovementCoordinator::circleMove(const std::chrono::milliseconds duration) {
	m_actuator.holdKey(Key::W);
	m_actuator.holdKey(Key::Space);
	m_actuator.holdKey(Key::D);
	m_actuator.wait(jittered(duration));
	m_actuator.releaseKey(Key::D);
	m_actuator.wait(20ms);
	m_actuator.releaseKey(Key::Space);
	m_actuator.releaseKey(Key::W);
	hold(Key::S, 50ms);
}

void MovementCoordinator::avoidObstacle(const int attempt) {
	Logger().Log(Logging::LogLevel::Debug, std::format("[Movement] Obstacle avoidance attempt {}.", attempt));

	if (attempt == 0) {
		m_actuator.pressKey(Key::Z);
		m_actuator.holdKey(Key::W);
		m_actuator.holdKey(Key::Space);
		m_actuator.wait(jittered(800ms));
		m_actuator.releaseKey(Key::Space);
		m_actuator.releaseKey(Key::W);
		return;
	}

	const Key strafe = attempt % 2 == 0 ? Key::A : Key::D;
	m_actuator.holdKey(Key::W);
	m_actuator.holdKey(Key::Space);
	hold(strafe, jittered(200ms));
	m_actuator.wait(jittered(200ms));
	m_actuator.releaseKey(Key::Space);
	m_actuator.releaseKey(Key::W);
	m_actuator.pressKey(Key::Z);
}

void MovementCoordinator::clickTarget(const vision::Point& anchor) {
	m_actuator.click(anchor);
}

void MovementCoordinator::cancelTarget() {
	m_actuator.pressKey(Key::Escape);
}

} // namespace flyff::bot
