#include "vision/statusBar.hpp"

#include "common/syntheticFrame.hpp"

#include <gtest/gtest.h>

namespace flyff::gtest {

using namespace std::chrono_literals;
using vision::BarDetector;
using vision::Bounds;
using vision::StatusBar;
using vision::StatusBarKind;

static BarDetector hpDetector() {
	return {
	        .region    = {100, 30, 200, 30},
	        .shades    = {HP_COLOR, {188, 24, 62}},
	        .tolerance = 2,
	        .minWidth  = 2,
	        .maxWidth  = 150,
	        .minHeight = 2,
	        .maxHeight = 15,
	        .cluster   = {2, 2},
	};
}

static cv::Mat barFrame(const int width) {
	auto frame = blankFrame();
	paint(frame, {110, 40, width, 4}, HP_COLOR);
	return frame;
}

TEST(StatusBar, StartsUncalibrated) {
	const StatusBar bar{StatusBarKind::HP};

	EXPECT_EQ(bar.percentage(), 0);
	EXPECT_EQ(bar.runningMaxWidth(), 0);
	EXPECT_FALSE(bar.detected());
	EXPECT_FALSE(bar.lastMeasuredAt().has_value());
	EXPECT_EQ(bar.staleness(vision::Clock::now()), std::chrono::milliseconds::max());
}

TEST(StatusBar, CalibratesOnWidestBar) {
	StatusBar bar{StatusBarKind::HP};
	const auto t0 = vision::TimePoint{};

	EXPECT_TRUE(bar.update(barFrame(40), hpDetector(), t0));
	EXPECT_EQ(bar.percentage(), 100);
	EXPECT_EQ(bar.runningMaxWidth(), 40);
	EXPECT_TRUE(bar.detected());

	EXPECT_TRUE(bar.update(barFrame(20), hpDetector(), t0 + 1s));
	EXPECT_EQ(bar.percentage(), 50);
	EXPECT_EQ(bar.runningMaxWidth(), 40);
	EXPECT_EQ(bar.lastDetectedBounds(), (Bounds{110, 40, 20, 4}));
	EXPECT_EQ(bar.lastMeasuredAt(), t0 + 1s);
}

TEST(StatusBar, RunningMaximumNeverShrinks) {
	StatusBar bar{StatusBarKind::MP};
	const auto t0 = vision::TimePoint{};

	bar.update(barFrame(30), hpDetector(), t0);
	bar.update(barFrame(60), hpDetector(), t0 + 1s);
	bar.update(barFrame(15), hpDetector(), t0 + 2s);

	EXPECT_EQ(bar.runningMaxWidth(), 60);
	EXPECT_EQ(bar.percentage(), 25);
}

TEST(StatusBar, PercentageIsMonotonicInWidth) {
	StatusBar bar{StatusBarKind::HP};
	const auto t0 = vision::TimePoint{};
	bar.update(barFrame(120), hpDetector(), t0);

	int previous = -1;
	for (int width = 2; width <= 120; width += 7) {
		bar.update(barFrame(width), hpDetector(), t0 + 1s);
		const int pct = bar.percentage();
		EXPECT_GE(pct, previous);
		EXPECT_GE(pct, 0);
		EXPECT_LE(pct, 100);

		bar.update(barFrame(width), hpDetector(), t0 + 2s);
		EXPECT_EQ(bar.percentage(), pct);
		previous = pct;
	}
}

TEST(StatusBar, MissKeepsPercentageAndTimestamp) {
	StatusBar bar{StatusBarKind::HP};
	const auto t0 = vision::TimePoint{};
	bar.update(barFrame(40), hpDetector(), t0);
	bar.update(barFrame(30), hpDetector(), t0 + 1s);

	EXPECT_FALSE(bar.update(blankFrame(), hpDetector(), t0 + 2s));
	EXPECT_FALSE(bar.detected());
	EXPECT_EQ(bar.percentage(), 75);
	EXPECT_EQ(bar.lastMeasuredAt(), t0 + 1s);
}

TEST(StatusBar, PicksWidestQualifyingCluster) {
	auto frame = blankFrame();
	paint(frame, {110, 40, 30, 4}, HP_COLOR);
	paint(frame, {160, 40, 10, 4}, HP_COLOR);
	paint(frame, {200, 40, 0, 4}, HP_COLOR);   // too narrow
	paint(frame, {220, 32, 40, 20}, HP_COLOR); // too tall

	const auto found = vision::findBar(frame, hpDetector());
	ASSERT_TRUE(found.has_value());
	EXPECT_EQ(*found, (Bounds{110, 40, 30, 4}));
}

TEST(StatusBar, IgnoresBarsOutsideRegion) {
	auto frame = blankFrame();
	paint(frame, {110, 200, 40, 4}, HP_COLOR);

	EXPECT_FALSE(vision::findBar(frame, hpDetector()).has_value());
}

TEST(StatusBar, StalenessTracksProgress) {
	StatusBar bar{StatusBarKind::TargetHP};
	const auto t0 = vision::TimePoint{};

	bar.update(barFrame(40), hpDetector(), t0);
	EXPECT_EQ(bar.staleness(t0 + 1s), 1000ms);

	EXPECT_FALSE(bar.update(barFrame(40), hpDetector(), t0 + 2s));
	EXPECT_EQ(bar.staleness(t0 + 3s), 3000ms);

	bar.resetStaleness(t0 + 3s);
	EXPECT_EQ(bar.staleness(t0 + 3s), 0ms);

	EXPECT_TRUE(bar.update(barFrame(35), hpDetector(), t0 + 4s));
	EXPECT_EQ(bar.staleness(t0 + 4s), 0ms);
}

TEST(StatusBar, SnapshotMirrorsState) {
	StatusBar bar{StatusBarKind::FP};
	bar.update(barFrame(40), hpDetector(), vision::TimePoint{});

	const auto snap = bar.snapshot();
	EXPECT_EQ(snap.kind, StatusBarKind::FP);
	EXPECT_EQ(snap.percentage, 100);
	EXPECT_EQ(snap.runningMaxWidth, 40);
	EXPECT_TRUE(snap.detected);
	EXPECT_EQ(snap.lastDetected, (Bounds{110, 40, 40, 4}));
}

} // namespace flyff::gtest
