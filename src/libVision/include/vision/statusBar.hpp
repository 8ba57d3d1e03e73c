#pragma once

#include "vision/clusterer.hpp"
#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace flyff::vision {

enum class StatusBarKind { HP, MP, FP, TargetHP, TargetMP };

std::string_view toString(StatusBarKind kind);

//! Where and how a single bar is searched for.
struct BarDetector {
	Bounds region;              //!< Fixed screen region of the bar.
	std::vector<Color> shades;  //!< Gradient/lighting variants of the bar color.
	std::uint8_t tolerance;     //!< Per-channel tolerance for every shade.
	int minWidth, maxWidth;     //!< Accepted cluster width (inclusive).
	int minHeight, maxHeight;   //!< Accepted cluster height (inclusive).
	ClusterThreshold cluster;   //!< Gap thresholds for grouping bar pixels.
};

//! Read-only copy of a bar's state for rendering and status display.
struct StatusBarSnapshot {
	StatusBarKind kind;
	int percentage;                     //!< 0-100
	int runningMaxWidth;                //!< Calibrated full width (0 until first detection)
	bool detected;                      //!< Bar was found in the latest frame.
	std::optional<Bounds> lastDetected; //!< Bounds of the last successful detection.
};

/*! Find the bar in a frame: scan, cluster, apply the size filter and keep the widest cluster.
 * \param [in] frame    Captured frame.
 * \param [in] detector Bar region, colors and size filter.
 * \return     Bounds of the widest qualifying cluster, or nothing.
 */
std::optional<Bounds> findBar(const cv::Mat& frame, const BarDetector& detector);

//! Self-calibrating percentage tracker for one status bar.
//! The widest bar seen so far is taken as 100%; the running maximum never shrinks.
class StatusBar {
public:
	explicit StatusBar(StatusBarKind kind);

	/*! Measure the bar in a new frame.
	 * On a miss the percentage is kept, the bar is flagged undetected and no timestamp is refreshed.
	 * \return True if the percentage or the calibration changed.
	 */
	bool update(const cv::Mat& frame, const BarDetector& detector, TimePoint now);

	//! Restart the progress window, e.g. after a maneuver or at the start of an engagement.
	void resetStaleness(TimePoint now);

	//! Time since the bar last made progress (changed value or calibration). Maximum if it never did.
	std::chrono::milliseconds staleness(TimePoint now) const;

	StatusBarKind kind() const;
	int percentage() const;
	int runningMaxWidth() const;
	bool detected() const;
	std::optional<TimePoint> lastMeasuredAt() const;
	std::optional<Bounds> lastDetectedBounds() const;

	StatusBarSnapshot snapshot() const;

private:
	StatusBarKind m_kind;
	int m_runningMaxWidth{0};                //!< Only grows.
	int m_percentage{0};                     //!< 0 before the first measurement.
	bool m_detected{false};
	std::optional<TimePoint> m_lastMeasured; //!< Last successful detection.
	std::optional<TimePoint> m_lastChanged;  //!< Last progress or explicit reset.
	std::optional<Bounds> m_lastBounds;
};

} // namespace flyff::vision
