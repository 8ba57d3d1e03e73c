#include "vision/statusBar.hpp"

#include "vision/pixelScanner.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace flyff::vision {

std::string_view toString(const StatusBarKind kind) {
	switch (kind) {
	case StatusBarKind::HP:
		return "HP";
	case StatusBarKind::MP:
		return "MP";
	case StatusBarKind::FP:
		return "FP";
	case StatusBarKind::TargetHP:
		return "Target HP";
	case StatusBarKind::TargetMP:
		return "Target MP";
	}
	return "Unknown";
}

std::optional<Bounds> findBar(const cv::Mat& frame, const BarDetector& detector) {
	const auto points = scanPixels(frame, ScanRequest{
	                                              .region    = detector.region,
	                                              .colors    = detector.shades,
	                                              .tolerance = detector.tolerance,
	                                              .exclusion = std::nullopt,
	                                      });
	if (points.empty()) {
		return std::nullopt;
	}

	// Text fragments next to the bar form small clusters; the size filter and the widest pick remove them.
	std::optional<Bounds> best;
	for (const auto& cluster: clusterPoints(points, detector.cluster)) {
		if (cluster.w < detector.minWidth || cluster.w > detector.maxWidth) {
			continue;
		}
		if (cluster.h < detector.minHeight || cluster.h > detector.maxHeight) {
			continue;
		}
		if (!best || cluster.w > best->w) {
			best = cluster;
		}
	}
	return best;
}

StatusBar::StatusBar(const StatusBarKind kind) : m_kind{kind} {}

bool StatusBar::update(const cv::Mat& frame, const BarDetector& detector, const TimePoint now) {
	const auto bar = findBar(frame, detector);
	if (!bar) {
		m_detected = false;
		return false;
	}

	const int oldMax     = m_runningMaxWidth;
	const int oldPercent = m_percentage;

	m_detected     = true;
	m_lastMeasured = now;
	m_lastBounds   = bar;

	m_runningMaxWidth = std::max(m_runningMaxWidth, bar->w);
	if (m_runningMaxWidth > 0) {
		const double fraction = static_cast<double>(bar->w) / static_cast<double>(m_runningMaxWidth);
		m_percentage          = std::clamp(static_cast<int>(std::lround(fraction * 100.0)), 0, 100);
	} else {
		m_percentage = 0;
	}

	const bool changed = oldMax != m_runningMaxWidth || oldPercent != m_percentage;
	if (changed) {
		m_lastChanged = now;
	}
	if (oldMax != m_runningMaxWidth) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[StatusBar] {}: max width {} -> {}.", toString(m_kind), oldMax, m_runningMaxWidth));
	}

	return changed;
}

void StatusBar::resetStaleness(const TimePoint now) {
	m_lastChanged = now;
}

std::chrono::milliseconds StatusBar::staleness(const TimePoint now) const {
	if (!m_lastChanged) {
		return std::chrono::milliseconds::max();
	}
	return std::chrono::duration_cast<std::chrono::milliseconds>(now - *m_lastChanged);
}

StatusBarKind StatusBar::kind() const {
	return m_kind;
}

int StatusBar::percentage() const {
	return m_percentage;
}

int StatusBar::runningMaxWidth() const {
	return m_runningMaxWidth;
}

bool StatusBar::detected() const {
	return m_detected;
}

std::optional<TimePoint> StatusBar::lastMeasuredAt() const {
	return m_lastMeasured;
}

std::optional<Bounds> StatusBar::lastDetectedBounds() const {
	return m_lastBounds;
}

StatusBarSnapshot StatusBar::snapshot() const {
	return {
	        .kind            = m_kind,
	        .percentage      = m_percentage,
	        .runningMaxWidth = m_runningMaxWidth,
	        .detected        = m_detected,
	        .lastDetected    = m_lastBounds,
	};
}

} // namespace flyff::vision
