#pragma once

#include "vision/clientStats.hpp"
#include "vision/mobClassifier.hpp"
#include "vision/targetMarker.hpp"

#include <array>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace flyff::bot {

//! Number of action slots on the bar.
inline constexpr int SLOT_COUNT = 10;

//! Slot assignments per action category. Slots are 0-9.
struct SlotConfig {
	std::vector<int> attack{0};
	std::vector<int> aoeAttack{};
	std::vector<int> heal{1};
	std::vector<int> aoeHeal{};
	std::vector<int> buff{};
	std::vector<int> mpRestore{2};
	std::vector<int> fpRestore{3};
	std::vector<int> pickup{4};
	std::vector<int> party{};
	std::optional<int> pickupPet{};    //!< Summons the pickup pet.
	std::optional<int> pickupMotion{}; //!< Pickup emote.

	std::array<int, SLOT_COUNT> cooldownsMs{0, 0, 0, 0, 0, 0, 0, 0, 0, 0};
};

//! Player restoration thresholds in percent.
struct ThresholdConfig {
	int heal{50};
	int mp{30};
	int fp{30};
	int minHpAttack{70}; //!< Passive mobs are only engaged at or above this HP.
};

//! Timing and behavior switches of the farming loop.
struct BehaviorConfig {
	bool prioritizeAggressive{true};
	bool stopFighting{false};
	int circleMoveMs{100};         //!< 0 disables the circle pattern.
	int obstacleMaxRetries{3};
	int obstacleCooldownMs{5000};  //!< Target HP without progress for this long counts as blocked.
	int maxAoeFarming{1};          //!< Concurrent AOE targets.
	int mobsTimeoutMs{0};          //!< 0 disables the timeout.
	int maxRotations{30};
	int maxDistance{325};
	int maxDistanceCircle{1000};
	int aoeSkillDistance{75};
	int killGraceMs{5000};
	int verifyAvoidMs{5000};
	int abortAvoidMs{2000};
	int jitterMs{50};
	int captureIntervalMs{1000};   //!< 0 captures continuously.
};

//! Perception settings.
struct DetectionConfig {
	vision::MobDetector mobs;
	vision::StatusLayout bars;
	vision::MarkerDetector marker;
};

//! Default detection settings for the 800x600 client layout.
DetectionConfig defaultDetection();

struct Config {
	DetectionConfig detection{defaultDetection()};
	SlotConfig slots{};
	ThresholdConfig thresholds{};
	BehaviorConfig behavior{};
};

//! Config owner shared between the tick loop and the configuration surface.
class SharedConfig {
public:
	SharedConfig() = default;
	explicit SharedConfig(Config config);

	//! Copy of the current configuration.
	Config snapshot() const;

	//! Modify the configuration under an exclusive lock.
	void update(const std::function<void(Config&)>& fn);

private:
	mutable std::shared_mutex m_mutex;
	Config m_config;
};

} // namespace flyff::bot
