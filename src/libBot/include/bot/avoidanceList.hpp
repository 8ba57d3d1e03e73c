#pragma once

#include "vision/types.hpp"

#include <chrono>
#include <vector>

namespace flyff::bot {

using vision::Bounds;
using vision::Point;
using vision::TimePoint;

//! Temporary "do not click here" zone.
struct AvoidedArea {
	Bounds bounds;
	TimePoint createdAt;
	std::chrono::milliseconds duration;

	bool expired(TimePoint now) const { return now - createdAt > duration; }
};

//! Time-decaying set of avoided zones. Areas are never modified after creation.
class AvoidanceList {
public:
	void add(const Bounds& bounds, TimePoint now, std::chrono::milliseconds duration);

	//! True if a live area overlaps the rectangle (open interval on both axes).
	bool isAvoided(const Bounds& bounds, TimePoint now) const;

	//! True if a live area contains the point.
	bool isAvoided(const Point& point, TimePoint now) const;

	//! Drop expired areas. Returns the number of removed entries.
	std::size_t pruneExpired(TimePoint now);

	std::size_t size() const;
	const std::vector<AvoidedArea>& areas() const;

private:
	std::vector<AvoidedArea> m_areas;
};

} // namespace flyff::bot
