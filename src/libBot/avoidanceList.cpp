#include "bot/avoidanceList.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <format>

namespace flyff::bot {

void AvoidanceList::add(const Bounds& bounds, const TimePoint now, const std::chrono::milliseconds duration) {
	m_areas.push_back({bounds, now, duration});
	Logger().Log(Logging::LogLevel::Debug, std::format("[Avoid] Avoiding ({},{} {}x{}) for {}ms.", bounds.x, bounds.y, bounds.w, bounds.h, duration.count()));
}

bool AvoidanceList::isAvoided(const Bounds& bounds, const TimePoint now) const {
	return std::ranges::any_of(m_areas, [&](const AvoidedArea& area) { return !area.expired(now) && area.bounds.overlaps(bounds); });
}

bool AvoidanceList::isAvoided(const Point& point, const TimePoint now) const {
	return std::ranges::any_of(m_areas, [&](const AvoidedArea& area) { return !area.expired(now) && area.bounds.contains(point); });
}

std::size_t AvoidanceList::pruneExpired(const TimePoint now) {
	return std::erase_if(m_areas, [&](const AvoidedArea& area) { return area.expired(now); });
}

std::size_t AvoidanceList::size() const {
	return m_areas.size();
}

const std::vector<AvoidedArea>& AvoidanceList::areas() const {
	return m_areas;
}

} // namespace flyff::bot
