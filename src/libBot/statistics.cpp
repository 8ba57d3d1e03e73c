#include "bot/statistics.hpp"

#include "Logging.hpp"

#include <format>

namespace flyff::bot {

using namespace std::chrono;

Statistics::Statistics(const vision::TimePoint startedAt) : m_startedAt{startedAt} {}

void Statistics::addKill(const milliseconds killTime, const milliseconds searchTime, const vision::TimePoint now) {
	int kills{};
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		++m_kills;
		m_totalKillTime += killTime;
		m_totalSearchTime += searchTime;
		m_lastKill = now;
		kills      = m_kills;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Stats] Kill #{} after {}ms (search {}ms).", kills, killTime.count(), searchTime.count()));
}

int Statistics::kills() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_kills;
}

std::optional<vision::TimePoint> Statistics::lastKillAt() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_lastKill;
}

StatisticsSnapshot Statistics::snapshot(const vision::TimePoint now) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto up         = duration_cast<milliseconds>(now - m_startedAt);
	const double minutes  = duration<double, std::ratio<60>>(up).count();
	const double perMinute = minutes > 0.0 ? static_cast<double>(m_kills) / minutes : 0.0;

	return {
	        .kills             = m_kills,
	        .totalKillTime     = m_totalKillTime,
	        .totalSearchTime   = m_totalSearchTime,
	        .averageKillTime   = m_kills > 0 ? m_totalKillTime / m_kills : milliseconds{0},
	        .averageSearchTime = m_kills > 0 ? m_totalSearchTime / m_kills : milliseconds{0},
	        .killsPerMinute    = perMinute,
	        .killsPerHour      = perMinute * 60.0,
	        .uptime            = up,
	};
}

std::string Statistics::uptime(const vision::TimePoint now) const {
	return formatDuration(snapshot(now).uptime);
}

std::string formatDuration(const milliseconds duration) {
	const auto h = duration_cast<hours>(duration);
	const auto m = duration_cast<minutes>(duration - h);
	const auto s = duration_cast<seconds>(duration - h - m);
	return std::format("{}h {}m {}s", h.count(), m.count(), s.count());
}

} // namespace flyff::bot
