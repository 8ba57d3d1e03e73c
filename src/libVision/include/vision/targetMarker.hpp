#pragma once

#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace flyff::vision {

//! Marker colors in priority order. The first color with enough pixels wins.
struct MarkerDetector {
	std::vector<Color> colors;
	std::uint8_t tolerance;
	std::size_t minPixels; //!< Match count has to exceed this.
};

struct MarkerResult {
	bool confirmed;                //!< A target is selected.
	std::optional<Point> centroid; //!< Center of the winning color's pixel envelope.
	std::optional<int> distance;   //!< Centroid distance to screen center (px).
};

//! Upper-middle part of the screen where the selection marker is drawn.
Bounds markerRegion(int frameWidth, int frameHeight);

//! Look for the target selection marker in the frame.
MarkerResult detectTargetMarker(const cv::Mat& frame, const MarkerDetector& detector);

} // namespace flyff::vision
