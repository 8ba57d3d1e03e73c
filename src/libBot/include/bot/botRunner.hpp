#pragma once

#include "bot/actuator.hpp"
#include "bot/config.hpp"
#include "bot/farmingBehavior.hpp"
#include "bot/statistics.hpp"

#include "vision/statusBar.hpp"
#include "vision/types.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace flyff::bot {

//! Drives the farming behavior: capture, tick, publish and pace to the capture interval.
class BotRunner {
public:
	static constexpr std::chrono::milliseconds SLEEP_STEP{50};

	BotRunner(IFrameSource& frames, IActuator& actuator, SharedConfig& config, std::uint32_t seed);
	~BotRunner();

	BotRunner(const BotRunner&)            = delete;
	BotRunner& operator=(const BotRunner&) = delete;

	/*! Capture a frame and run one tick.
	 * Exceptions are logged and never leave this function.
	 * \return True if a tick was run to completion, false if it was skipped or failed.
	 */
	bool runIteration(vision::TimePoint now);

	//! Blocking loop until stop() is called or the behavior requests a stop.
	void run();

	//! Run the loop on its own thread.
	void start();
	void stop();
	bool isRunning() const;

	// Views for status display and overlays. Safe to call from any thread.
	std::string stateName() const;
	std::array<vision::StatusBarSnapshot, 5> statusBars() const;
	std::vector<vision::Target> targets() const;
	StatisticsSnapshot statistics(vision::TimePoint now) const;

private:
	void loop();
	void publish();

	IFrameSource& m_frames;
	SharedConfig& m_config;
	FarmingBehavior m_behavior;

	std::atomic<bool> m_running{false};
	std::thread m_thread;

	mutable std::mutex m_viewMutex;
	std::string m_stateName;
	std::array<vision::StatusBarSnapshot, 5> m_statusBars{};
	std::vector<vision::Target> m_targets;
};

} // namespace flyff::bot
