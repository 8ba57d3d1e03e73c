#pragma once

#include "vision/types.hpp"

#include <vector>

namespace flyff::vision {

//! Maximum gap between neighbouring points that still joins them into one cluster.
struct ClusterThreshold {
	int x; //!< Gap along x (first pass)
	int y; //!< Gap along y (second pass, inside each x cluster)
};

//! Bounding box of a point set. Empty input yields an all-zero box.
Bounds envelope(const std::vector<Point>& points);

//! Group pixel coordinates into bounding boxes by two-pass gap clustering.
//! Points are sorted by x and split where consecutive x values differ by more than threshold.x;
//! every x cluster is then sorted by y and split the same way with threshold.y.
//! \param points    [in] Unordered pixel coordinates.
//! \param threshold [in] Gap thresholds for both passes.
//! \return          One box per resulting group, ordered by x cluster then by y.
std::vector<Bounds> clusterPoints(std::vector<Point> points, ClusterThreshold threshold);

} // namespace flyff::vision
