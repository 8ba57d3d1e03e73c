#include "bot/farmingBehavior.hpp"

#include "vision/mobClassifier.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <array>
#include <format>

namespace flyff::bot {

using namespace std::chrono_literals;
using std::chrono::milliseconds;
using vision::TimePoint;

static constexpr milliseconds SETTLE_DELAY      = 150ms;
static constexpr milliseconds PET_PICKUP_DELAY  = 1500ms;
static constexpr milliseconds PICKUP_DELAY      = 1000ms;
static constexpr milliseconds PET_UNSUMMON_WAIT = 3000ms;
static constexpr milliseconds BUFF_DELAY        = 1500ms;
static constexpr milliseconds PARTY_SKILL_DELAY = 100ms;
static constexpr milliseconds AOE_HEAL_DELAY    = 100ms;

struct Transition {
	FarmingState from;
	FarmingState to;
};

static constexpr std::array TRANSITIONS{
        Transition{FarmingState::NoEnemyFound, FarmingState::SearchingForEnemy},
        Transition{FarmingState::NoEnemyFound, FarmingState::NoEnemyFound},
        Transition{FarmingState::SearchingForEnemy, FarmingState::SearchingForEnemy},
        Transition{FarmingState::SearchingForEnemy, FarmingState::EnemyFound},
        Transition{FarmingState::SearchingForEnemy, FarmingState::NoEnemyFound},
        Transition{FarmingState::EnemyFound, FarmingState::VerifyTarget},
        Transition{FarmingState::VerifyTarget, FarmingState::Attacking},
        Transition{FarmingState::VerifyTarget, FarmingState::SearchingForEnemy},
        Transition{FarmingState::Attacking, FarmingState::Attacking},
        Transition{FarmingState::Attacking, FarmingState::AfterEnemyKill},
        Transition{FarmingState::Attacking, FarmingState::SearchingForEnemy},
        Transition{FarmingState::AfterEnemyKill, FarmingState::SearchingForEnemy},
};

std::string_view toString(const FarmingState state) {
	switch (state) {
	case FarmingState::NoEnemyFound:
		return "NoEnemyFound";
	case FarmingState::SearchingForEnemy:
		return "SearchingForEnemy";
	case FarmingState::EnemyFound:
		return "EnemyFound";
	case FarmingState::VerifyTarget:
		return "VerifyTarget";
	case FarmingState::Attacking:
		return "Attacking";
	case FarmingState::AfterEnemyKill:
		return "AfterEnemyKill";
	}
	return "Unknown";
}

bool isTransitionAllowed(const FarmingState from, const FarmingState to) {
	return std::ranges::any_of(TRANSITIONS, [&](const Transition& t) { return t.from == from && t.to == to; });
}

FarmingBehavior::FarmingBehavior(IActuator& actuator, const TimePoint startedAt, const std::uint32_t seed)
    : m_actuator{actuator}, m_dispatcher{actuator, SlotConfig{}.cooldownsMs}, m_movement{actuator, seed, milliseconds{BehaviorConfig{}.jitterMs}},
      m_statistics{startedAt}, m_startedAt{startedAt} {}

void FarmingBehavior::tick(const cv::Mat& frame, const Config& cfg, const TimePoint now) {
	m_dispatcher.setCooldowns(cfg.slots.cooldownsMs);
	m_movement.setJitter(milliseconds{cfg.behavior.jitterMs});

	m_clientStats.update(frame, cfg.detection.bars, cfg.detection.marker, now);
	m_avoidance.pruneExpired(now);

	const auto alive = m_clientStats.aliveState();
	if (alive != m_lastAlive) {
		const auto level = alive == vision::AliveState::Alive ? Logging::LogLevel::Info : Logging::LogLevel::Warning;
		Logger().Log(level, std::format("[Farming] Player state changed to {}.", vision::toString(alive)));
		m_lastAlive = alive;
	}
	if (alive != vision::AliveState::Alive) {
		return;
	}

	restore(cfg, now);
	unsummonPet(cfg, now);
	if (waiting(now)) {
		return;
	}

	// Support waits gate the following ticks only.
	useSupportSkills(cfg, now);

	switch (m_state) {
	case FarmingState::NoEnemyFound:
		onNoEnemyFound(cfg);
		break;
	case FarmingState::SearchingForEnemy:
		onSearchingForEnemy(frame, cfg, now);
		break;
	case FarmingState::EnemyFound:
		onEnemyFound(now);
		break;
	case FarmingState::VerifyTarget:
		onVerifyTarget(cfg, now);
		break;
	case FarmingState::Attacking:
		onAttacking(cfg, now);
		break;
	case FarmingState::AfterEnemyKill:
		onAfterEnemyKill(cfg, now);
		break;
	}
}

void FarmingBehavior::transition(const FarmingState next) {
	if (!isTransitionAllowed(m_state, next)) {
		Logger().Log(Logging::LogLevel::Error,
		             std::format("[Farming] Invalid transition {} -> {}. Falling back to searching.", toString(m_state), toString(next)));
		m_state = FarmingState::SearchingForEnemy;
		return;
	}

	if (next != m_state) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Farming] {} -> {}.", toString(m_state), toString(next)));
	}
	m_state = next;
}

void FarmingBehavior::addWait(const milliseconds duration, const TimePoint now) {
	const TimePoint from = m_waitUntil && *m_waitUntil > now ? *m_waitUntil : now;
	m_waitUntil          = from + duration;
}

bool FarmingBehavior::waiting(const TimePoint now) {
	if (!m_waitUntil) {
		return false;
	}
	if (now < *m_waitUntil) {
		return true;
	}
	m_waitUntil.reset();
	return false;
}

void FarmingBehavior::restore(const Config& cfg, const TimePoint now) {
	const auto& hp = m_clientStats.hp();
	if (hp.percentage() <= 0) {
		return;
	}

	if (hp.percentage() < cfg.thresholds.heal) {
		if (!cfg.slots.heal.empty()) {
			m_dispatcher.useFirstAvailable(cfg.slots.heal, now);
		} else if (const auto slot = m_dispatcher.useFirstAvailable(cfg.slots.aoeHeal, now)) {
			for (int i = 1; i < AOE_HEAL_CASTS; ++i) {
				m_actuator.wait(AOE_HEAL_DELAY);
				m_actuator.useSlot(*slot);
			}
		}
	}

	const auto& mp = m_clientStats.mp();
	if (mp.detected() && mp.percentage() < cfg.thresholds.mp) {
		m_dispatcher.useFirstAvailable(cfg.slots.mpRestore, now);
	}

	const auto& fp = m_clientStats.fp();
	if (fp.detected() && fp.percentage() < cfg.thresholds.fp) {
		m_dispatcher.useFirstAvailable(cfg.slots.fpRestore, now);
	}
}

void FarmingBehavior::useSupportSkills(const Config& cfg, const TimePoint now) {
	for (const int slot: cfg.slots.party) {
		if (m_dispatcher.use(slot, now)) {
			addWait(PARTY_SKILL_DELAY, now);
		}
	}
	for (const int slot: cfg.slots.buff) {
		if (m_dispatcher.use(slot, now)) {
			Logger().Log(Logging::LogLevel::Debug, std::format("[Farming] Buff on slot {}.", slot));
			addWait(BUFF_DELAY, now);
		}
	}
}

void FarmingBehavior::unsummonPet(const Config& cfg, const TimePoint now) {
	if (!m_petSummonedAt || !cfg.slots.pickupPet) {
		m_petSummonedAt.reset();
		return;
	}

	const int slot         = *cfg.slots.pickupPet;
	const auto cooldown    = m_dispatcher.cooldown(slot);
	const auto summonDelay = cooldown > 0ms ? cooldown : PET_UNSUMMON_WAIT;
	if (now - *m_petSummonedAt < summonDelay) {
		return;
	}

	if (m_dispatcher.use(slot, now)) {
		Logger().Log(Logging::LogLevel::Debug, "[Farming] Pickup pet unsummoned.");
	}
	m_petSummonedAt.reset();
}

void FarmingBehavior::checkMobTimeout(const Config& cfg, const TimePoint now) {
	if (!m_noTargetSince) {
		m_noTargetSince = now;
	}
	if (cfg.behavior.mobsTimeoutMs <= 0 || m_stopRequested) {
		return;
	}

	if (now - *m_noTargetSince > milliseconds{cfg.behavior.mobsTimeoutMs}) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Farming] No mob found for {}ms. Stopping.", cfg.behavior.mobsTimeoutMs));
		m_stopRequested = true;
	}
}

void FarmingBehavior::onNoEnemyFound(const Config& cfg) {
	if (m_rotations < cfg.behavior.maxRotations) {
		m_movement.rotate();
		++m_rotations;
		transition(FarmingState::SearchingForEnemy);
		return;
	}

	if (cfg.behavior.circleMoveMs > 0) {
		m_movement.circleMove(milliseconds{cfg.behavior.circleMoveMs});
		transition(FarmingState::SearchingForEnemy);
		return;
	}

	m_rotations = 0;
	transition(FarmingState::NoEnemyFound);
}

void FarmingBehavior::onSearchingForEnemy(const cv::Mat& frame, const Config& cfg, const TimePoint now) {
	if (cfg.behavior.stopFighting) {
		m_detectedTargets.clear();
		transition(FarmingState::SearchingForEnemy);
		return;
	}

	m_detectedTargets = vision::identifyMobs(frame, cfg.detection.mobs);

	const auto lastKill = m_statistics.lastKillAt();
	const vision::SelectionPolicy policy{
	        .prioritizeAggressive = cfg.behavior.prioritizeAggressive,
	        .playerHp             = m_clientStats.hp().percentage(),
	        .minHpForPassive      = cfg.thresholds.minHpAttack,
	        .lastKilled           = m_lastKilledType,
	        .withinKillGrace      = lastKill && now - *lastKill < milliseconds{cfg.behavior.killGraceMs},
	        .screenCenter         = {frame.cols / 2, frame.rows / 2},
	        .maxDistance          = static_cast<double>(cfg.behavior.circleMoveMs > 0 ? cfg.behavior.maxDistanceCircle : cfg.behavior.maxDistance),
	};

	const auto candidates = vision::prioritizeMobs(m_detectedTargets, policy);
	const auto target =
	        vision::selectTarget(candidates, policy, [&](const vision::Point& anchor) { return m_avoidance.isAvoided(anchor, now); });
	if (!target) {
		checkMobTimeout(cfg, now);
		transition(FarmingState::NoEnemyFound);
		return;
	}

	m_currentTarget = target;
	m_noTargetSince.reset();
	m_rotations = 0;
	transition(FarmingState::EnemyFound);
}

void FarmingBehavior::onEnemyFound(const TimePoint now) {
	if (!m_currentTarget) {
		m_lastClick.reset();
		transition(FarmingState::VerifyTarget);
		return;
	}

	const auto anchor = m_currentTarget->attackAnchor();
	if (!m_lastAbortSpot || !m_lastAbortSpot->contains(anchor)) {
		m_attackAttempts = 0;
		m_lastAbortSpot.reset();
	}

	Logger().Log(Logging::LogLevel::Debug,
	             std::format("[Farming] Engaging {} mob at ({}, {}).", vision::toString(m_currentTarget->type), anchor.x, anchor.y));
	m_movement.clickTarget(anchor);
	m_lastClick = anchor;
	addWait(SETTLE_DELAY, now);
	transition(FarmingState::VerifyTarget);
}

void FarmingBehavior::onVerifyTarget(const Config& cfg, const TimePoint now) {
	if (m_clientStats.targetOnScreen() && m_clientStats.targetIsAlive() && !m_clientStats.targetIsNpc()) {
		m_engagementStart  = now;
		m_obstacleAttempts = 0;
		m_lastMarker       = m_clientStats.targetMarkerPosition();
		m_clientStats.resetTargetStaleness(now);
		transition(FarmingState::Attacking);
		return;
	}

	if (m_lastClick) {
		m_avoidance.add({m_lastClick->x - 1, m_lastClick->y - 1, 2, 2}, now, milliseconds{cfg.behavior.verifyAvoidMs});
	}
	Logger().Log(Logging::LogLevel::Debug, "[Farming] Target could not be verified.");
	m_currentTarget.reset();
	transition(FarmingState::SearchingForEnemy);
}

void FarmingBehavior::onAttacking(const Config& cfg, const TimePoint now) {
	if (!m_clientStats.targetIsAlive()) {
		recordKill(now);
		transition(FarmingState::AfterEnemyKill);
		return;
	}

	if (!m_clientStats.targetOnScreen()) {
		Logger().Log(Logging::LogLevel::Debug, "[Farming] Target lost.");
		m_currentTarget.reset();
		transition(FarmingState::SearchingForEnemy);
		return;
	}
	if (const auto marker = m_clientStats.targetMarkerPosition()) {
		m_lastMarker = marker;
	}

	const int targetHp = m_clientStats.targetHp().percentage();
	const int aoeCap   = cfg.behavior.maxAoeFarming;
	if (aoeCap > 1 && m_concurrentAoe < aoeCap && targetHp < AOE_RELEASE_HP) {
		++m_concurrentAoe;
		Logger().Log(Logging::LogLevel::Debug, std::format("[Farming] Gathering AOE target {}/{}.", m_concurrentAoe, aoeCap));
		m_movement.cancelTarget();
		m_currentTarget.reset();
		transition(FarmingState::SearchingForEnemy);
		return;
	}

	if (m_clientStats.targetHp().staleness(now) > milliseconds{cfg.behavior.obstacleCooldownMs}) {
		const int maxRetries = targetHp == 100 ? std::min(MAX_RETRIES_FULL_HP, cfg.behavior.obstacleMaxRetries) : cfg.behavior.obstacleMaxRetries;
		if (m_obstacleAttempts < maxRetries) {
			m_movement.avoidObstacle(m_obstacleAttempts);
			++m_obstacleAttempts;
			m_clientStats.resetTargetStaleness(now);
			transition(FarmingState::Attacking);
			return;
		}

		abortEngagement(cfg, now);
		return;
	}

	attack(cfg, now);
	transition(FarmingState::Attacking);
}

void FarmingBehavior::attack(const Config& cfg, const TimePoint now) {
	const auto distance = m_clientStats.targetDistance();
	if (distance && *distance < cfg.behavior.aoeSkillDistance) {
		m_dispatcher.useFirstAvailable(cfg.slots.aoeAttack, now);
	}

	const auto& slots = cfg.slots.attack;
	for (std::size_t i = 0; i < slots.size(); ++i) {
		const std::size_t index = (m_attackIndex + i) % slots.size();
		if (m_dispatcher.use(slots[index], now)) {
			m_attackIndex = index + 1;
			return;
		}
	}
}

void FarmingBehavior::abortEngagement(const Config& cfg, const TimePoint now) {
	const auto center = m_lastMarker ? m_lastMarker : m_lastClick;
	if (center) {
		const vision::Bounds zone =
		        vision::Bounds{center->x - ABORT_ZONE_SIZE / 2, center->y - ABORT_ZONE_SIZE / 2, ABORT_ZONE_SIZE, ABORT_ZONE_SIZE}.grow(
		                m_attackAttempts * ABORT_ZONE_GROWTH);
		m_avoidance.add(zone, now, milliseconds{cfg.behavior.abortAvoidMs});
	}
	if (m_lastClick) {
		m_lastAbortSpot = vision::Bounds{m_lastClick->x - ABORT_ZONE_SIZE / 2, m_lastClick->y - ABORT_ZONE_SIZE / 2, ABORT_ZONE_SIZE,
		                                 ABORT_ZONE_SIZE}
		                          .grow(m_attackAttempts * ABORT_ZONE_GROWTH);
	}
	++m_attackAttempts;

	Logger().Log(Logging::LogLevel::Info, std::format("[Farming] Target unreachable after {} attempts. Aborting.", m_obstacleAttempts));
	m_movement.cancelTarget();
	m_currentTarget.reset();
	transition(FarmingState::SearchingForEnemy);
}

void FarmingBehavior::recordKill(const TimePoint now) {
	const TimePoint start      = m_engagementStart.value_or(now);
	const TimePoint searchFrom = m_statistics.lastKillAt().value_or(m_startedAt);

	m_statistics.addKill(std::chrono::duration_cast<milliseconds>(now - start),
	                     std::chrono::duration_cast<milliseconds>(std::max(start - searchFrom, TimePoint::duration::zero())), now);
	if (m_currentTarget) {
		m_lastKilledType = m_currentTarget->type;
	}
	m_engagementStart.reset();
}

void FarmingBehavior::onAfterEnemyKill(const Config& cfg, const TimePoint now) {
	m_concurrentAoe  = 0;
	m_attackAttempts = 0;
	m_lastAbortSpot.reset();
	m_currentTarget.reset();

	if (cfg.slots.pickupPet && m_dispatcher.use(*cfg.slots.pickupPet, now)) {
		m_petSummonedAt = now;
		addWait(PET_PICKUP_DELAY, now);
	} else if (cfg.slots.pickupMotion && m_dispatcher.use(*cfg.slots.pickupMotion, now)) {
		addWait(PICKUP_DELAY, now);
	} else if (m_dispatcher.useFirstAvailable(cfg.slots.pickup, now)) {
		addWait(PICKUP_DELAY, now);
	}

	transition(FarmingState::SearchingForEnemy);
}

FarmingState FarmingBehavior::state() const {
	return m_state;
}

std::string_view FarmingBehavior::stateName() const {
	return toString(m_state);
}

const vision::ClientStats& FarmingBehavior::clientStats() const {
	return m_clientStats;
}

const std::vector<vision::Target>& FarmingBehavior::detectedTargets() const {
	return m_detectedTargets;
}

const std::optional<vision::Target>& FarmingBehavior::currentTarget() const {
	return m_currentTarget;
}

const AvoidanceList& FarmingBehavior::avoidance() const {
	return m_avoidance;
}

const Statistics& FarmingBehavior::statistics() const {
	return m_statistics;
}

std::optional<TimePoint> FarmingBehavior::waitingUntil() const {
	return m_waitUntil;
}

int FarmingBehavior::rotations() const {
	return m_rotations;
}

int FarmingBehavior::obstacleAttempts() const {
	return m_obstacleAttempts;
}

int FarmingBehavior::attackAttempts() const {
	return m_attackAttempts;
}

int FarmingBehavior::concurrentAoeTargets() const {
	return m_concurrentAoe;
}

bool FarmingBehavior::stopRequested() const {
	return m_stopRequested;
}

} // namespace flyff::bot
