#include "vision/mobClassifier.hpp"

#include "vision/pixelScanner.hpp"

#include "Logging.hpp"

#include <format>

namespace flyff::vision {

//! Scan and cluster a single mob class and keep label-shaped clusters.
static void detectClass(const cv::Mat& frame, const MobDetector& detector, const MobColor& mobColor, const MobType type, std::vector<Target>& out) {
	const Bounds searchRegion{0, 0, frame.cols, frame.rows - detector.bottomMargin};
	const auto points = scanPixels(frame, ScanRequest{
	                                              .region    = searchRegion,
	                                              .colors    = {mobColor.color},
	                                              .tolerance = mobColor.tolerance,
	                                              .exclusion = detector.excludedRegion,
	                                      });
	if (points.empty()) {
		return;
	}

	auto logger = Logger();
	for (const auto& cluster: clusterPoints(points, detector.cluster)) {
		if (cluster.w <= detector.minLabelWidth || cluster.w >= detector.maxLabelWidth || cluster.y < detector.minLabelY) {
			logger.Log(Logging::LogLevel::Debug, std::format("[Mobs] {} cluster rejected at ({},{}) size {}x{}.", toString(type), cluster.x, cluster.y,
			                                                 cluster.w, cluster.h));
			continue;
		}
		out.push_back({type, cluster});
	}
}

std::vector<Target> identifyMobs(const cv::Mat& frame, const MobDetector& detector) {
	std::vector<Target> mobs;
	if (frame.empty()) {
		return mobs;
	}

	detectClass(frame, detector, detector.passive, MobType::Passive, mobs);
	detectClass(frame, detector, detector.aggressive, MobType::Aggressive, mobs);
	detectClass(frame, detector, detector.violet, MobType::Violet, mobs);

	Logger().Log(Logging::LogLevel::Debug, std::format("[Mobs] Identified {} mobs.", mobs.size()));
	return mobs;
}

std::vector<Target> prioritizeMobs(const std::vector<Target>& mobs, const SelectionPolicy& policy) {
	std::vector<Target> passive;
	std::vector<Target> aggressive;
	for (const auto& mob: mobs) {
		if (mob.type == MobType::Passive) {
			passive.push_back(mob);
		} else if (mob.type == MobType::Aggressive) {
			aggressive.push_back(mob);
		}
	}

	if (!policy.prioritizeAggressive) {
		aggressive.insert(aggressive.end(), passive.begin(), passive.end());
		return aggressive;
	}

	// The single aggressive mob right after an aggressive kill is usually the corpse label fading out.
	const bool freshAggressiveKill = policy.lastKilled == MobType::Aggressive && policy.withinKillGrace && aggressive.size() == 1;
	if ((aggressive.empty() || freshAggressiveKill) && policy.playerHp >= policy.minHpForPassive) {
		return passive;
	}
	return aggressive;
}

std::optional<Target> selectTarget(const std::vector<Target>& candidates, const SelectionPolicy& policy,
                                   const std::function<bool(const Point&)>& isAvoided) {
	std::optional<Target> closest;
	double closestDistance = policy.maxDistance;

	for (const auto& candidate: candidates) {
		const Point anchor    = candidate.attackAnchor();
		const double distance = anchor.distance(policy.screenCenter);
		if (distance > policy.maxDistance) {
			continue;
		}
		if (isAvoided && isAvoided(anchor)) {
			continue;
		}
		if (!closest || distance < closestDistance) {
			closest         = candidate;
			closestDistance = distance;
		}
	}
	return closest;
}

} // namespace flyff::vision
