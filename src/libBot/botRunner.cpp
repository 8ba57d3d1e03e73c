#include "bot/botRunner.hpp"

#include "Logging.hpp"

#include <format>

namespace flyff::bot {

BotRunner::BotRunner(IFrameSource& frames, IActuator& actuator, SharedConfig& config, const std::uint32_t seed)
    : m_frames{frames}, m_config{config}, m_behavior{actuator, vision::Clock::now(), seed}, m_stateName{m_behavior.stateName()},
      m_statusBars{m_behavior.clientStats().snapshots()} {}

BotRunner::~BotRunner() {
	stop();
}

bool BotRunner::runIteration(const vision::TimePoint now) {
	try {
		const auto frame = m_frames.captureFrame();
		if (!frame || frame->empty()) {
			Logger().Log(Logging::LogLevel::Debug, "[Runner] No frame captured. Skipping tick.");
			return false;
		}

		const Config cfg = m_config.snapshot();
		m_behavior.tick(*frame, cfg, now);
		publish();
		return true;
	} catch (const std::exception& e) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Runner] Tick failed: {}", e.what()));
		return false;
	}
}

void BotRunner::run() {
	m_running = true;
	loop();
}

void BotRunner::loop() {
	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, "[Runner] Farming loop started.");

	while (m_running) {
		const auto started = vision::Clock::now();
		runIteration(started);

		if (m_behavior.stopRequested()) {
			logger.Log(Logging::LogLevel::Warning, "[Runner] Stop requested by farming behavior.");
			m_running = false;
			break;
		}

		const std::chrono::milliseconds interval{m_config.snapshot().behavior.captureIntervalMs};
		while (m_running && vision::Clock::now() - started < interval) {
			std::this_thread::sleep_for(SLEEP_STEP);
		}
	}

	logger.Log(Logging::LogLevel::Info, "[Runner] Farming loop stopped.");
}

void BotRunner::start() {
	if (m_thread.joinable()) {
		if (m_running) {
			return;
		}
		// Loop already left on its own.
		m_thread.join();
	}
	m_running = true;
	m_thread  = std::thread([this] { loop(); });
}

void BotRunner::stop() {
	m_running = false;
	if (m_thread.joinable()) {
		m_thread.join();
	}
}

bool BotRunner::isRunning() const {
	return m_running;
}

void BotRunner::publish() {
	std::lock_guard<std::mutex> lock(m_viewMutex);
	m_stateName  = m_behavior.stateName();
	m_statusBars = m_behavior.clientStats().snapshots();
	m_targets    = m_behavior.detectedTargets();
}

std::string BotRunner::stateName() const {
	std::lock_guard<std::mutex> lock(m_viewMutex);
	return m_stateName;
}

std::array<vision::StatusBarSnapshot, 5> BotRunner::statusBars() const {
	std::lock_guard<std::mutex> lock(m_viewMutex);
	return m_statusBars;
}

std::vector<vision::Target> BotRunner::targets() const {
	std::lock_guard<std::mutex> lock(m_viewMutex);
	return m_targets;
}

StatisticsSnapshot BotRunner::statistics(const vision::TimePoint now) const {
	return m_behavior.statistics().snapshot(now);
}

} // namespace flyff::bot
