#pragma once

#include "vision/clusterer.hpp"
#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace flyff::vision {

//! Name label color of one mob class.
struct MobColor {
	Color color;
	std::uint8_t tolerance;
};

//! Label detection settings shared by all mob classes.
struct MobDetector {
	MobColor passive;
	MobColor aggressive;
	MobColor violet;         //!< Detected for display, never offered as an engageable target.
	int minLabelWidth;       //!< Exclusive lower bound.
	int maxLabelWidth;       //!< Exclusive upper bound.
	int minLabelY;           //!< Labels above this line belong to the UI.
	int bottomMargin;        //!< Bottom UI strip that is not scanned.
	Bounds excludedRegion;   //!< Player status area, skipped while scanning.
	ClusterThreshold cluster; //!< Tuned for glyph spacing in a name label.
};

//! Inputs of the target choice that change from tick to tick.
struct SelectionPolicy {
	bool prioritizeAggressive;
	int playerHp;                        //!< Player HP percentage.
	int minHpForPassive;                 //!< Passive mobs are only offered at or above this HP.
	std::optional<MobType> lastKilled;   //!< Type of the last kill, if any.
	bool withinKillGrace;                //!< Last kill happened within the grace window.
	Point screenCenter;
	double maxDistance;                  //!< Candidates further away from the center are ignored.
};

//! Detect mob name labels of every class. Violet labels are included and tagged as such.
std::vector<Target> identifyMobs(const cv::Mat& frame, const MobDetector& detector);

/*! Reduce detected mobs to the engageable candidates.
 * With aggression priority, aggressive mobs are offered; passive mobs replace them only when there is
 * no aggressive mob (or the only one left follows a fresh aggressive kill) and the player HP is high enough.
 * Violet mobs are never offered.
 */
std::vector<Target> prioritizeMobs(const std::vector<Target>& mobs, const SelectionPolicy& policy);

/*! Choose the candidate closest to screen center.
 * \param [in] candidates Engageable targets.
 * \param [in] policy     Screen center and maximum distance.
 * \param [in] isAvoided  Returns true for attack anchors inside an avoided area.
 * \return     The closest reachable candidate, or nothing.
 */
std::optional<Target> selectTarget(const std::vector<Target>& candidates, const SelectionPolicy& policy,
                                   const std::function<bool(const Point&)>& isAvoided);

} // namespace flyff::vision
