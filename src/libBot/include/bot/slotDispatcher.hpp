#pragma once

#include "bot/config.hpp"

#include "vision/types.hpp"

#include <array>
#include <optional>
#include <vector>

namespace flyff::bot {

class IActuator;

//! Cooldown-aware slot usage. A slot on cooldown is skipped instead of pressed again.
class SlotDispatcher {
public:
	SlotDispatcher(IActuator& actuator, const std::array<int, SLOT_COUNT>& cooldownsMs);

	//! Replace the cooldown table, e.g. after a config change.
	void setCooldowns(const std::array<int, SLOT_COUNT>& cooldownsMs);

	//! True if the slot is valid and its cooldown has elapsed.
	bool ready(int slot, vision::TimePoint now) const;

	//! Press the slot if ready. Returns true if it was pressed.
	bool use(int slot, vision::TimePoint now);

	//! Press the first ready slot of the list. Returns the slot pressed.
	std::optional<int> useFirstAvailable(const std::vector<int>& slots, vision::TimePoint now);

	std::optional<vision::TimePoint> lastUsed(int slot) const;
	std::chrono::milliseconds cooldown(int slot) const;

private:
	static bool valid(int slot);

	IActuator& m_actuator;
	std::array<int, SLOT_COUNT> m_cooldownsMs;
	std::array<std::optional<vision::TimePoint>, SLOT_COUNT> m_lastUsed{};
};

} // namespace flyff::bot
