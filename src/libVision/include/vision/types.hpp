#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <string_view>

namespace flyff::vision {

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

//! Pixel coordinate in screen space.
struct Point {
	int x, y;

	//! Euclidean distance to another point.
	double distance(const Point& other) const {
		const double dx = static_cast<double>(x - other.x);
		const double dy = static_cast<double>(y - other.y);
		return std::sqrt(dx * dx + dy * dy);
	}

	bool operator==(const Point&) const = default;
};

//! Axis-aligned rectangle. Width and height are the coordinate span (max - min).
struct Bounds {
	int x, y; //!< Top-left corner
	int w, h; //!< Extent in pixels

	Point center() const { return {x + w / 2, y + h / 2}; }
	Point bottomCenter() const { return {x + w / 2, y + h}; } //!< Click anchor for labels
	int area() const { return w * h; }

	//! Inclusive on all edges.
	bool contains(const Point& p) const { return p.x >= x && p.x <= x + w && p.y >= y && p.y <= y + h; }

	//! Open interval overlap on both axes (touching edges do not overlap).
	bool overlaps(const Bounds& o) const { return x < o.x + o.w && x + w > o.x && y < o.y + o.h && y + h > o.y; }

	//! Grow by amount in total, split evenly on both sides.
	Bounds grow(int amount) const { return {x - amount / 2, y - amount / 2, w + amount, h + amount}; }

	bool operator==(const Bounds&) const = default;
};

//! 8-bit RGB color.
struct Color {
	std::uint8_t r, g, b;

	//! True if every channel differs by at most tolerance. Symmetric in both colors.
	bool matches(const Color& other, std::uint8_t tolerance) const {
		return absDiff(r, other.r) <= tolerance && absDiff(g, other.g) <= tolerance && absDiff(b, other.b) <= tolerance;
	}

	bool operator==(const Color&) const = default;

private:
	static constexpr std::uint8_t absDiff(std::uint8_t a, std::uint8_t b) {
		return a > b ? static_cast<std::uint8_t>(a - b) : static_cast<std::uint8_t>(b - a);
	}
};

enum class MobType { Passive, Aggressive, Violet };

inline constexpr std::string_view toString(MobType type) {
	switch (type) {
	case MobType::Passive:
		return "Passive";
	case MobType::Aggressive:
		return "Aggressive";
	case MobType::Violet:
		return "Violet";
	}
	return "Unknown";
}

//! Classified on-screen entity. Created fresh each scan.
struct Target {
	MobType type;
	Bounds bounds;

	Point attackAnchor() const { return bounds.bottomCenter(); }
};

} // namespace flyff::vision
