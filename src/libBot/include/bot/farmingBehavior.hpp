#pragma once

#include "bot/actuator.hpp"
#include "bot/avoidanceList.hpp"
#include "bot/config.hpp"
#include "bot/movement.hpp"
#include "bot/slotDispatcher.hpp"
#include "bot/statistics.hpp"

#include "vision/clientStats.hpp"
#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace flyff::bot {

enum class FarmingState { NoEnemyFound, SearchingForEnemy, EnemyFound, VerifyTarget, Attacking, AfterEnemyKill };

std::string_view toString(FarmingState state);

//! True if the state machine may move from one state to the other.
bool isTransitionAllowed(FarmingState from, FarmingState to);

//! Perceive-decide-act state machine of the farming mode. One tick per captured frame.
class FarmingBehavior {
public:
	static constexpr int MAX_RETRIES_FULL_HP  = 2;  //!< Obstacle attempts for a target that never lost HP.
	static constexpr int AOE_RELEASE_HP       = 90; //!< AOE targets are released below this HP.
	static constexpr int AOE_HEAL_CASTS       = 3;
	static constexpr int ABORT_ZONE_SIZE      = 40;
	static constexpr int ABORT_ZONE_GROWTH    = 10; //!< Per failed attempt on the same spot.

	FarmingBehavior(IActuator& actuator, vision::TimePoint startedAt, std::uint32_t seed);

	/*! Run one perceive-decide-act cycle.
	 * \param [in] frame Captured frame.
	 * \param [in] cfg   Configuration snapshot for this tick.
	 * \param [in] now   Tick time.
	 */
	void tick(const cv::Mat& frame, const Config& cfg, vision::TimePoint now);

	FarmingState state() const;
	std::string_view stateName() const;

	const vision::ClientStats& clientStats() const;
	const std::vector<vision::Target>& detectedTargets() const;
	const std::optional<vision::Target>& currentTarget() const;
	const AvoidanceList& avoidance() const;
	const Statistics& statistics() const;

	//! Pending delay that holds back state dispatch.
	std::optional<vision::TimePoint> waitingUntil() const;

	int rotations() const;
	int obstacleAttempts() const;
	int attackAttempts() const;
	int concurrentAoeTargets() const;

	//! Set once the mob timeout elapsed. The owner should stop ticking.
	bool stopRequested() const;

private:
	void transition(FarmingState next);
	void addWait(std::chrono::milliseconds duration, vision::TimePoint now);
	bool waiting(vision::TimePoint now);

	void restore(const Config& cfg, vision::TimePoint now);
	void useSupportSkills(const Config& cfg, vision::TimePoint now);
	void unsummonPet(const Config& cfg, vision::TimePoint now);
	void checkMobTimeout(const Config& cfg, vision::TimePoint now);

	void onNoEnemyFound(const Config& cfg);
	void onSearchingForEnemy(const cv::Mat& frame, const Config& cfg, vision::TimePoint now);
	void onEnemyFound(vision::TimePoint now);
	void onVerifyTarget(const Config& cfg, vision::TimePoint now);
	void onAttacking(const Config& cfg, vision::TimePoint now);
	void onAfterEnemyKill(const Config& cfg, vision::TimePoint now);

	void recordKill(vision::TimePoint now);
	void abortEngagement(const Config& cfg, vision::TimePoint now);
	void attack(const Config& cfg, vision::TimePoint now);

	IActuator& m_actuator;
	SlotDispatcher m_dispatcher;
	MovementCoordinator m_movement;
	vision::ClientStats m_clientStats;
	AvoidanceList m_avoidance;
	Statistics m_statistics;
	vision::TimePoint m_startedAt;

	FarmingState m_state{FarmingState::SearchingForEnemy};
	std::vector<vision::Target> m_detectedTargets;
	std::optional<vision::Target> m_currentTarget;
	std::optional<vision::MobType> m_lastKilledType;

	std::optional<vision::TimePoint> m_waitUntil;
	std::optional<vision::TimePoint> m_engagementStart;
	std::optional<vision::TimePoint> m_noTargetSince;
	std::optional<vision::TimePoint> m_petSummonedAt;

	std::optional<vision::Point> m_lastClick;
	std::optional<vision::Point> m_lastMarker;
	std::optional<vision::Bounds> m_lastAbortSpot; //!< Grown area around the click of the last aborted engagement.

	int m_rotations{0};
	int m_obstacleAttempts{0};
	int m_attackAttempts{0}; //!< Aborted engagements on the same spot.
	int m_concurrentAoe{0};
	std::size_t m_attackIndex{0};
	bool m_stopRequested{false};
	vision::AliveState m_lastAlive{vision::AliveState::Alive};
};

} // namespace flyff::bot
