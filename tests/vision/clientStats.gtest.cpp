#include "vision/clientStats.hpp"

#include "common/syntheticFrame.hpp"

#include <gtest/gtest.h>

namespace flyff::gtest {

using namespace std::chrono_literals;
using vision::AliveState;
using vision::BarDetector;
using vision::Bounds;
using vision::ClientStats;
using vision::Color;

static BarDetector bar(const Bounds& region, const Color& shade) {
	return {
	        .region    = region,
	        .shades    = {shade},
	        .tolerance = 2,
	        .minWidth  = 2,
	        .maxWidth  = 250,
	        .minHeight = 2,
	        .maxHeight = 15,
	        .cluster   = {2, 2},
	};
}

static vision::StatusLayout layout() {
	const Bounds player{105, 30, 120, 80};
	const Bounds target{300, 30, 250, 30};
	return {
	        .hp       = bar(player, HP_COLOR),
	        .mp       = bar(player, MP_COLOR),
	        .fp       = bar(player, FP_COLOR),
	        .targetHp = bar(target, HP_COLOR),
	        .targetMp = bar(target, MP_COLOR),
	};
}

static vision::MarkerDetector marker() {
	return {.colors = {MARKER_BLUE, MARKER_RED}, .tolerance = 5, .minPixels = 20};
}

static void paintPlayerBars(cv::Mat& frame, const int hpWidth = 100) {
	if (hpWidth > 0) {
		paint(frame, {110, 40, hpWidth, 4}, HP_COLOR);
	}
	paint(frame, {110, 55, 100, 4}, MP_COLOR);
	paint(frame, {110, 70, 100, 4}, FP_COLOR);
}

TEST(ClientStats, TrayStartsClosed) {
	const ClientStats stats;

	EXPECT_FALSE(stats.trayOpen());
	EXPECT_EQ(stats.aliveState(), AliveState::TrayClosed);
}

TEST(ClientStats, PlayerWithHpIsAlive) {
	ClientStats stats;
	auto frame = blankFrame();
	paintPlayerBars(frame);

	stats.update(frame, layout(), marker(), vision::TimePoint{});

	EXPECT_TRUE(stats.trayOpen());
	EXPECT_EQ(stats.aliveState(), AliveState::Alive);
	EXPECT_EQ(stats.hp().percentage(), 100);
	EXPECT_EQ(stats.mp().percentage(), 100);
	EXPECT_EQ(stats.fp().percentage(), 100);
}

TEST(ClientStats, MissingHpWithOpenTrayIsDead) {
	ClientStats stats;
	auto frame = blankFrame();
	paintPlayerBars(frame, 0);

	stats.update(frame, layout(), marker(), vision::TimePoint{});

	EXPECT_TRUE(stats.trayOpen());
	EXPECT_EQ(stats.aliveState(), AliveState::Dead);
}

TEST(ClientStats, TrayClosesAfterFiveMissedTicks) {
	ClientStats stats;
	auto frame = blankFrame();
	paintPlayerBars(frame);
	const auto t0 = vision::TimePoint{};
	stats.update(frame, layout(), marker(), t0);

	for (int i = 1; i < ClientStats::TRAY_CLOSED_AFTER; ++i) {
		stats.update(blankFrame(), layout(), marker(), t0 + i * 1s);
		EXPECT_TRUE(stats.trayOpen()) << "tick " << i;
	}

	stats.update(blankFrame(), layout(), marker(), t0 + 10s);
	EXPECT_FALSE(stats.trayOpen());
	EXPECT_EQ(stats.aliveState(), AliveState::TrayClosed);

	stats.update(frame, layout(), marker(), t0 + 11s);
	EXPECT_TRUE(stats.trayOpen());
}

TEST(ClientStats, TargetFlags) {
	ClientStats stats;
	auto frame = blankFrame();
	paintPlayerBars(frame);
	paint(frame, {310, 35, 200, 4}, HP_COLOR);
	paint(frame, {310, 45, 200, 4}, MP_COLOR);
	paint(frame, {395, 200, 10, 4}, MARKER_BLUE);

	stats.update(frame, layout(), marker(), vision::TimePoint{});

	EXPECT_TRUE(stats.targetOnScreen());
	EXPECT_TRUE(stats.targetIsAlive());
	EXPECT_TRUE(stats.targetIsMover());
	EXPECT_FALSE(stats.targetIsNpc());
	EXPECT_EQ(stats.targetMarkerPosition(), (vision::Point{400, 202}));
	EXPECT_EQ(stats.targetDistance(), 98);
}

TEST(ClientStats, FullHpTargetWithoutMpIsNpc) {
	ClientStats stats;
	auto frame = blankFrame();
	paintPlayerBars(frame);
	paint(frame, {310, 35, 200, 4}, HP_COLOR);

	stats.update(frame, layout(), marker(), vision::TimePoint{});

	EXPECT_TRUE(stats.targetIsNpc());
	EXPECT_FALSE(stats.targetIsMover());
	EXPECT_FALSE(stats.targetOnScreen());
}

TEST(ClientStats, TargetWithoutHpBarIsNotAlive) {
	ClientStats stats;
	auto frame = blankFrame();
	paintPlayerBars(frame);

	stats.update(frame, layout(), marker(), vision::TimePoint{});

	EXPECT_FALSE(stats.targetIsAlive());
	EXPECT_FALSE(stats.targetIsNpc());
}

TEST(ClientStats, ResetsTargetStaleness) {
	ClientStats stats;
	auto frame = blankFrame();
	paintPlayerBars(frame);
	paint(frame, {310, 35, 200, 4}, HP_COLOR);
	const auto t0 = vision::TimePoint{};

	stats.update(frame, layout(), marker(), t0);
	stats.update(frame, layout(), marker(), t0 + 6s);
	EXPECT_EQ(stats.targetHp().staleness(t0 + 6s), 6000ms);

	stats.resetTargetStaleness(t0 + 6s);
	EXPECT_EQ(stats.targetHp().staleness(t0 + 7s), 1000ms);
}

TEST(ClientStats, SnapshotsCoverAllBars) {
	ClientStats stats;
	auto frame = blankFrame();
	paintPlayerBars(frame, 50);

	stats.update(frame, layout(), marker(), vision::TimePoint{});
	const auto snaps = stats.snapshots();

	EXPECT_EQ(snaps[0].kind, vision::StatusBarKind::HP);
	EXPECT_TRUE(snaps[0].detected);
	EXPECT_EQ(snaps[0].runningMaxWidth, 50);
	EXPECT_EQ(snaps[3].kind, vision::StatusBarKind::TargetHP);
	EXPECT_FALSE(snaps[3].detected);
	EXPECT_EQ(snaps[4].kind, vision::StatusBarKind::TargetMP);
}

} // namespace flyff::gtest
