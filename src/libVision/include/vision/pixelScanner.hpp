#pragma once

#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace flyff::vision {

//! Pixels with lower alpha are treated as transparent noise.
inline constexpr std::uint8_t MIN_PIXEL_ALPHA = 250;

/*! Check a single observed pixel against a target color.
 * \param [in] observed  Observed color channels.
 * \param [in] alpha     Observed opacity (255 for frames without alpha channel).
 * \param [in] target    Color to match.
 * \param [in] tolerance Maximum per-channel difference.
 * \return     True if the pixel is opaque enough and every channel is within tolerance.
 */
inline bool colorMatches(const Color& observed, std::uint8_t alpha, const Color& target, std::uint8_t tolerance) {
	if (alpha < MIN_PIXEL_ALPHA) {
		return false;
	}
	return observed.matches(target, tolerance);
}

//! Parameters of one scan.
struct ScanRequest {
	Bounds region;                   //!< Region to scan. Clipped to the frame.
	std::vector<Color> colors;       //!< Pixel matches if it matches any of these.
	std::uint8_t tolerance;          //!< Per-channel tolerance.
	std::optional<Bounds> exclusion; //!< Pixels inside (inclusive) are skipped.
};

/*! Scan a frame region for pixels matching any of the requested colors.
 * Accepts BGRA (CV_8UC4) and BGR (CV_8UC3) frames; other layouts yield no matches.
 * Rows are scanned in parallel and merged, so the output is always in row-major order.
 * \param [in] frame   Captured frame.
 * \param [in] request Region, colors, tolerance and optional exclusion rectangle.
 * \return     Matching pixel coordinates in frame space.
 */
std::vector<Point> scanPixels(const cv::Mat& frame, const ScanRequest& request);

} // namespace flyff::vision
