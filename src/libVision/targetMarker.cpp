#include "vision/targetMarker.hpp"

#include "vision/clusterer.hpp"
#include "vision/pixelScanner.hpp"

#include "Logging.hpp"

#include <format>

namespace flyff::vision {

Bounds markerRegion(const int frameWidth, const int frameHeight) {
	return {frameWidth / 4, frameHeight / 6, frameWidth / 2, frameHeight / 3};
}

MarkerResult detectTargetMarker(const cv::Mat& frame, const MarkerDetector& detector) {
	if (frame.empty()) {
		return {false, std::nullopt, std::nullopt};
	}

	const Bounds region = markerRegion(frame.cols, frame.rows);
	for (const auto& color: detector.colors) {
		const auto points = scanPixels(frame, ScanRequest{
		                                              .region    = region,
		                                              .colors    = {color},
		                                              .tolerance = detector.tolerance,
		                                              .exclusion = std::nullopt,
		                                      });
		if (points.size() <= detector.minPixels) {
			continue;
		}

		const Point centroid = envelope(points).center();
		const Point screenCenter{frame.cols / 2, frame.rows / 2};
		const int distance = static_cast<int>(centroid.distance(screenCenter));

		Logger().Log(Logging::LogLevel::Debug,
		             std::format("[Marker] Target marker ({},{},{}) detected with {} pixels at ({}, {}).", color.r, color.g, color.b, points.size(),
		                         centroid.x, centroid.y));
		return {true, centroid, distance};
	}

	return {false, std::nullopt, std::nullopt};
}

} // namespace flyff::vision
