#pragma once

#include "vision/types.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace flyff::bot {

//! Read-only copy of the farming statistics.
struct StatisticsSnapshot {
	int kills;
	std::chrono::milliseconds totalKillTime;
	std::chrono::milliseconds totalSearchTime;
	std::chrono::milliseconds averageKillTime;
	std::chrono::milliseconds averageSearchTime;
	double killsPerMinute;
	double killsPerHour;
	std::chrono::milliseconds uptime;
};

//! Kill and search timing aggregation. Safe to read from other threads.
class Statistics {
public:
	explicit Statistics(vision::TimePoint startedAt);

	/*! Record a kill.
	 * \param [in] killTime   Time spent on the engagement.
	 * \param [in] searchTime Time from the previous kill to the start of the engagement.
	 * \param [in] now        Time of the kill.
	 */
	void addKill(std::chrono::milliseconds killTime, std::chrono::milliseconds searchTime, vision::TimePoint now);

	int kills() const;
	std::optional<vision::TimePoint> lastKillAt() const;
	StatisticsSnapshot snapshot(vision::TimePoint now) const;

	//! Uptime as "1h 2m 3s".
	std::string uptime(vision::TimePoint now) const;

private:
	mutable std::mutex m_mutex;
	vision::TimePoint m_startedAt;
	std::optional<vision::TimePoint> m_lastKill;
	int m_kills{0};
	std::chrono::milliseconds m_totalKillTime{0};
	std::chrono::milliseconds m_totalSearchTime{0};
};

//! Format a duration as "1h 2m 3s".
std::string formatDuration(std::chrono::milliseconds duration);

} // namespace flyff::bot
