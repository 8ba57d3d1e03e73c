#include "bot/config.hpp"

#include <mutex>
#include <utility>

namespace flyff::bot {

using vision::BarDetector;
using vision::Bounds;
using vision::ClusterThreshold;
using vision::Color;

static constexpr Bounds PLAYER_BARS{105, 30, 120, 80};
static constexpr Bounds TARGET_BARS{300, 30, 250, 30};

static BarDetector playerBar(std::vector<Color> shades) {
	return {
	        .region    = PLAYER_BARS,
	        .shades    = std::move(shades),
	        .tolerance = 2,
	        .minWidth  = 2,
	        .maxWidth  = 120,
	        .minHeight = 2,
	        .maxHeight = 15,
	        .cluster   = {2, 2},
	};
}

static BarDetector targetBar(std::vector<Color> shades) {
	return {
	        .region    = TARGET_BARS,
	        .shades    = std::move(shades),
	        .tolerance = 2,
	        .minWidth  = 2,
	        .maxWidth  = 250,
	        .minHeight = 2,
	        .maxHeight = 15,
	        .cluster   = {2, 2},
	};
}

DetectionConfig defaultDetection() {
	const std::vector<Color> hpShades{{174, 18, 55}, {188, 24, 62}, {204, 30, 70}, {220, 36, 78}};
	const std::vector<Color> mpShades{{20, 84, 196}, {36, 132, 220}, {44, 164, 228}, {56, 188, 232}};
	const std::vector<Color> fpShades{{45, 230, 29}, {28, 172, 28}, {44, 124, 52}, {20, 146, 20}};

	return {
	        .mobs =
	                {
	                        .passive        = {{234, 234, 149}, 5},
	                        .aggressive     = {{179, 23, 23}, 5},
	                        .violet         = {{182, 144, 146}, 5},
	                        .minLabelWidth  = 15,
	                        .maxLabelWidth  = 150,
	                        .minLabelY      = 110,
	                        .bottomMargin   = 100,
	                        .excludedRegion = {0, 0, 250, 110},
	                        .cluster        = ClusterThreshold{50, 3},
	                },
	        .bars =
	                {
	                        .hp       = playerBar(hpShades),
	                        .mp       = playerBar(mpShades),
	                        .fp       = playerBar(fpShades),
	                        .targetHp = targetBar(hpShades),
	                        .targetMp = targetBar(mpShades),
	                },
	        .marker =
	                {
	                        .colors    = {{131, 148, 205}, {246, 90, 106}},
	                        .tolerance = 5,
	                        .minPixels = 20,
	                },
	};
}

SharedConfig::SharedConfig(Config config) : m_config{std::move(config)} {}

Config SharedConfig::snapshot() const {
	std::shared_lock lock(m_mutex);
	return m_config;
}

void SharedConfig::update(const std::function<void(Config&)>& fn) {
	std::unique_lock lock(m_mutex);
	fn(m_config);
}

} // namespace flyff::bot
