#include "vision/clientStats.hpp"

#include "Logging.hpp"

#include <format>

namespace flyff::vision {

std::string_view toString(const AliveState state) {
	switch (state) {
	case AliveState::TrayClosed:
		return "TrayClosed";
	case AliveState::Alive:
		return "Alive";
	case AliveState::Dead:
		return "Dead";
	}
	return "Unknown";
}

ClientStats::ClientStats()
    : m_hp{StatusBarKind::HP}, m_mp{StatusBarKind::MP}, m_fp{StatusBarKind::FP}, m_targetHp{StatusBarKind::TargetHP},
      m_targetMp{StatusBarKind::TargetMP} {}

void ClientStats::update(const cv::Mat& frame, const StatusLayout& layout, const MarkerDetector& marker, const TimePoint now) {
	const bool wasOpen = trayOpen();

	m_hp.update(frame, layout.hp, now);
	m_mp.update(frame, layout.mp, now);
	m_fp.update(frame, layout.fp, now);
	m_targetHp.update(frame, layout.targetHp, now);
	m_targetMp.update(frame, layout.targetMp, now);

	if (m_hp.detected() || m_mp.detected() || m_fp.detected()) {
		m_missedTrayTicks = 0;
	} else if (m_missedTrayTicks < TRAY_CLOSED_AFTER) {
		++m_missedTrayTicks;
	}

	if (wasOpen != trayOpen()) {
		Logger().Log(Logging::LogLevel::Info, std::format("[Stats] Status tray {}.", trayOpen() ? "opened" : "closed"));
	}

	m_marker = detectTargetMarker(frame, marker);
}

void ClientStats::resetTargetStaleness(const TimePoint now) {
	m_targetHp.resetStaleness(now);
}

bool ClientStats::trayOpen() const {
	return m_missedTrayTicks < TRAY_CLOSED_AFTER;
}

AliveState ClientStats::aliveState() const {
	if (!trayOpen()) {
		return AliveState::TrayClosed;
	}
	if (m_hp.detected() && m_hp.percentage() > 0) {
		return AliveState::Alive;
	}
	return AliveState::Dead;
}

bool ClientStats::targetOnScreen() const {
	return m_marker.confirmed;
}

bool ClientStats::targetIsAlive() const {
	return m_targetHp.detected() && m_targetHp.percentage() > 0;
}

bool ClientStats::targetIsMover() const {
	return m_targetMp.detected();
}

bool ClientStats::targetIsNpc() const {
	return m_targetHp.detected() && m_targetHp.percentage() == 100 && !m_targetMp.detected();
}

std::optional<Point> ClientStats::targetMarkerPosition() const {
	return m_marker.centroid;
}

std::optional<int> ClientStats::targetDistance() const {
	return m_marker.distance;
}

std::array<StatusBarSnapshot, 5> ClientStats::snapshots() const {
	return {m_hp.snapshot(), m_mp.snapshot(), m_fp.snapshot(), m_targetHp.snapshot(), m_targetMp.snapshot()};
}

} // namespace flyff::vision
