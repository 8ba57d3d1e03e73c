#include "vision/pixelScanner.hpp"

#include <opencv2/core.hpp>
#include <opencv2/core/utility.hpp>

#include <numeric>

namespace flyff::vision {

//! Clip the requested region to the frame. Empty if nothing remains.
static cv::Rect clampRegion(const Bounds& region, const cv::Size& size) {
	const cv::Rect frameRect(0, 0, size.width, size.height);
	return cv::Rect(region.x, region.y, region.w, region.h) & frameRect;
}

template <class Pixel>
static Color toColor(const Pixel& px) {
	// OpenCV channel order is B, G, R(, A)
	return {px[2], px[1], px[0]};
}

//! Scan a single row of the clipped region and append matches.
template <class Pixel>
static void scanRow(const cv::Mat& frame, int y, const cv::Rect& roi, const ScanRequest& request, std::vector<Point>& out) {
	const auto* row = frame.ptr<Pixel>(y);
	for (int x = roi.x; x < roi.x + roi.width; ++x) {
		if (request.exclusion && request.exclusion->contains({x, y})) {
			continue;
		}

		const Pixel& px = row[x];
		std::uint8_t alpha = 255;
		if constexpr (Pixel::channels == 4) {
			alpha = px[3];
		}

		const Color observed = toColor(px);
		for (const auto& target: request.colors) {
			if (colorMatches(observed, alpha, target, request.tolerance)) {
				out.push_back({x, y});
				break;
			}
		}
	}
}

template <class Pixel>
static std::vector<Point> scanRegion(const cv::Mat& frame, const cv::Rect& roi, const ScanRequest& request) {
	// One bucket per row keeps the merge order independent of thread scheduling.
	std::vector<std::vector<Point>> rows(static_cast<std::size_t>(roi.height));

	cv::parallel_for_(cv::Range(0, roi.height), [&](const cv::Range& range) {
		for (int r = range.start; r < range.end; ++r) {
			scanRow<Pixel>(frame, roi.y + r, roi, request, rows[static_cast<std::size_t>(r)]);
		}
	});

	const std::size_t total =
	        std::accumulate(rows.begin(), rows.end(), std::size_t{0}, [](std::size_t sum, const auto& row) { return sum + row.size(); });

	std::vector<Point> result;
	result.reserve(total);
	for (const auto& row: rows) {
		result.insert(result.end(), row.begin(), row.end());
	}
	return result;
}

std::vector<Point> scanPixels(const cv::Mat& frame, const ScanRequest& request) {
	if (frame.empty() || frame.depth() != CV_8U || request.colors.empty()) {
		return {};
	}

	const cv::Rect roi = clampRegion(request.region, frame.size());
	if (roi.empty()) {
		return {};
	}

	switch (frame.channels()) {
	case 4:
		return scanRegion<cv::Vec4b>(frame, roi, request);
	case 3:
		return scanRegion<cv::Vec3b>(frame, roi, request);
	default:
		return {};
	}
}

} // namespace flyff::vision
