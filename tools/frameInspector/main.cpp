#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <opencv2/highgui.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "bot/config.hpp"
#include "vision/clientStats.hpp"
#include "vision/mobClassifier.hpp"

namespace flyff::tools {

// Offline check of the perception stack on saved screenshots.
// Prints the bar readings and the detected mobs, then writes "<name>_inspected.png" beside the input.

static cv::Scalar toScalar(const vision::Color& c) {
	return {static_cast<double>(c.b), static_cast<double>(c.g), static_cast<double>(c.r), 255.0};
}

static cv::Rect toRect(const vision::Bounds& b) {
	return {b.x, b.y, b.w + 1, b.h + 1};
}

static cv::Scalar mobColor(const vision::MobType type) {
	switch (type) {
	case vision::MobType::Passive:
		return {0, 255, 255, 255};
	case vision::MobType::Aggressive:
		return {0, 0, 255, 255};
	case vision::MobType::Violet:
		return {255, 0, 255, 255};
	}
	return {255, 255, 255, 255};
}

static void drawBar(cv::Mat& canvas, const vision::StatusBarSnapshot& bar) {
	if (!bar.lastDetected) {
		return;
	}
	const auto rect = toRect(*bar.lastDetected);
	cv::rectangle(canvas, rect, {255, 255, 255, 255}, 1);
	cv::putText(canvas, std::format("{} {}%", vision::toString(bar.kind), bar.percentage), {rect.x + rect.width + 4, rect.y + rect.height},
	            cv::FONT_HERSHEY_SIMPLEX, 0.35, {255, 255, 255, 255}, 1);
}

bool inspect(const std::filesystem::path& path, const bot::Config& cfg, const bool show) {
	cv::Mat frame = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
	if (frame.empty()) {
		std::cerr << "Failed to load image: " << path << "\n";
		return false;
	}
	if (frame.channels() != 3 && frame.channels() != 4) {
		std::cerr << "Unsupported channel count " << frame.channels() << " in " << path << "\n";
		return false;
	}

	vision::ClientStats stats;
	stats.update(frame, cfg.detection.bars, cfg.detection.marker, vision::Clock::now());
	const auto mobs = vision::identifyMobs(frame, cfg.detection.mobs);

	std::cout << std::format("== {} ({}x{})\n", path.filename().string(), frame.cols, frame.rows);
	std::cout << std::format("   player: {}\n", vision::toString(stats.aliveState()));
	for (const auto& bar: stats.snapshots()) {
		std::cout << std::format("   {:<10} {:>3}% {}\n", vision::toString(bar.kind), bar.percentage, bar.detected ? "" : "(not detected)");
	}
	if (stats.targetOnScreen()) {
		const auto pos = *stats.targetMarkerPosition();
		std::cout << std::format("   marker at ({}, {}) distance {}\n", pos.x, pos.y, stats.targetDistance().value_or(-1));
	}
	std::cout << std::format("   mobs: {}\n", mobs.size());
	for (const auto& mob: mobs) {
		std::cout << std::format("     {:<10} ({}, {}) {}x{}\n", vision::toString(mob.type), mob.bounds.x, mob.bounds.y, mob.bounds.w, mob.bounds.h);
	}

	cv::Mat canvas = frame.clone();
	cv::rectangle(canvas, toRect(cfg.detection.mobs.excludedRegion), {128, 128, 128, 255}, 1);
	cv::rectangle(canvas, toRect(vision::markerRegion(frame.cols, frame.rows)), toScalar(cfg.detection.marker.colors.front()), 1);
	for (const auto& bar: stats.snapshots()) {
		drawBar(canvas, bar);
	}
	for (const auto& mob: mobs) {
		cv::rectangle(canvas, toRect(mob.bounds), mobColor(mob.type), 2);
		cv::circle(canvas, {mob.attackAnchor().x, mob.attackAnchor().y}, 3, mobColor(mob.type), cv::FILLED);
	}

	auto outPath = path;
	outPath.replace_filename(path.stem().string() + "_inspected.png");
	if (!cv::imwrite(outPath.string(), canvas)) {
		std::cerr << "Failed to write " << outPath << "\n";
		return false;
	}

	if (show) {
		cv::imshow("Frame Inspector", canvas);
		cv::waitKey(0);
	}
	return true;
}

} // namespace flyff::tools

int main(int argc, char** argv) {
	if (argc < 2) {
		std::cerr << "Usage: frameInspector [--show] <screenshot>...\n";
		return 1;
	}

	bool show = false;
	std::vector<std::filesystem::path> inputs;
	for (int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];
		if (arg == "--show") {
			show = true;
		} else {
			inputs.emplace_back(arg);
		}
	}

	const flyff::bot::Config cfg;
	int failures = 0;
	for (const auto& input: inputs) {
		if (!flyff::tools::inspect(input, cfg, show)) {
			++failures;
		}
	}

	return failures == 0 ? 0 : 1;
}
