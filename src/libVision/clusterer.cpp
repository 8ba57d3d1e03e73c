#include "vision/clusterer.hpp"

#include <algorithm>

namespace flyff::vision {

Bounds envelope(const std::vector<Point>& points) {
	if (points.empty()) {
		return {0, 0, 0, 0};
	}

	int minX = points.front().x;
	int maxX = points.front().x;
	int minY = points.front().y;
	int maxY = points.front().y;
	for (const auto& p: points) {
		minX = std::min(minX, p.x);
		maxX = std::max(maxX, p.x);
		minY = std::min(minY, p.y);
		maxY = std::max(maxY, p.y);
	}

	return {minX, minY, maxX - minX, maxY - minY};
}

//! Split a sorted range where the gap in the projected coordinate exceeds the threshold.
template <class Projection>
static std::vector<std::vector<Point>> splitByGap(const std::vector<Point>& sorted, int threshold, Projection coord) {
	std::vector<std::vector<Point>> groups;
	if (sorted.empty()) {
		return groups;
	}

	groups.push_back({sorted.front()});
	for (std::size_t i = 1; i < sorted.size(); ++i) {
		if (coord(sorted[i]) - coord(sorted[i - 1]) <= threshold) {
			groups.back().push_back(sorted[i]);
		} else {
			groups.push_back({sorted[i]});
		}
	}
	return groups;
}

std::vector<Bounds> clusterPoints(std::vector<Point> points, const ClusterThreshold threshold) {
	std::vector<Bounds> result;
	if (points.empty()) {
		return result;
	}

	// Full (x, y) order makes the result independent of input order.
	std::sort(points.begin(), points.end(), [](const Point& a, const Point& b) { return a.x != b.x ? a.x < b.x : a.y < b.y; });

	const auto xClusters = splitByGap(points, threshold.x, [](const Point& p) { return p.x; });
	for (auto xCluster: xClusters) {
		std::sort(xCluster.begin(), xCluster.end(), [](const Point& a, const Point& b) { return a.y != b.y ? a.y < b.y : a.x < b.x; });

		for (const auto& group: splitByGap(xCluster, threshold.y, [](const Point& p) { return p.y; })) {
			result.push_back(envelope(group));
		}
	}

	return result;
}

} // namespace flyff::vision
