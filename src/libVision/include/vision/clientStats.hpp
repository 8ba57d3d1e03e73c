#pragma once

#include "vision/statusBar.hpp"
#include "vision/targetMarker.hpp"
#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <array>
#include <optional>

namespace flyff::vision {

enum class AliveState { TrayClosed, Alive, Dead };

std::string_view toString(AliveState state);

//! Detectors of all tracked bars.
struct StatusLayout {
	BarDetector hp;
	BarDetector mp;
	BarDetector fp;
	BarDetector targetHp;
	BarDetector targetMp;
};

//! Aggregated per-tick view of the client: player bars, target bars and the selection marker.
class ClientStats {
public:
	//! Consecutive ticks without any player bar before the tray counts as closed.
	static constexpr int TRAY_CLOSED_AFTER = 5;

	ClientStats();

	//! Measure every bar and the target marker in a new frame.
	void update(const cv::Mat& frame, const StatusLayout& layout, const MarkerDetector& marker, TimePoint now);

	//! Restart the target HP progress window.
	void resetTargetStaleness(TimePoint now);

	const StatusBar& hp() const { return m_hp; }
	const StatusBar& mp() const { return m_mp; }
	const StatusBar& fp() const { return m_fp; }
	const StatusBar& targetHp() const { return m_targetHp; }
	const StatusBar& targetMp() const { return m_targetMp; }

	bool trayOpen() const;
	AliveState aliveState() const;

	bool targetOnScreen() const;
	bool targetIsAlive() const;
	bool targetIsMover() const;
	bool targetIsNpc() const;
	std::optional<Point> targetMarkerPosition() const;
	std::optional<int> targetDistance() const;

	std::array<StatusBarSnapshot, 5> snapshots() const;

private:
	StatusBar m_hp;
	StatusBar m_mp;
	StatusBar m_fp;
	StatusBar m_targetHp;
	StatusBar m_targetMp;

	int m_missedTrayTicks{TRAY_CLOSED_AFTER}; //!< Closed until a bar is seen.
	MarkerResult m_marker{false, std::nullopt, std::nullopt};
};

} // namespace flyff::vision
