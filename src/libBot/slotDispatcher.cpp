#include "bot/slotDispatcher.hpp"
#include "bot/actuator.hpp"

#include "Logging.hpp"

#include <format>

namespace flyff::bot {

SlotDispatcher::SlotDispatcher(IActuator& actuator, const std::array<int, SLOT_COUNT>& cooldownsMs)
    : m_actuator{actuator}, m_cooldownsMs{cooldownsMs} {}

void SlotDispatcher::setCooldowns(const std::array<int, SLOT_COUNT>& cooldownsMs) {
	m_cooldownsMs = cooldownsMs;
}

bool SlotDispatcher::valid(const int slot) {
	return slot >= 0 && slot < SLOT_COUNT;
}

bool SlotDispatcher::ready(const int slot, const vision::TimePoint now) const {
	if (!valid(slot)) {
		return false;
	}
	const auto& last = m_lastUsed[static_cast<std::size_t>(slot)];
	return !last || now - *last >= cooldown(slot);
}

bool SlotDispatcher::use(const int slot, const vision::TimePoint now) {
	if (!valid(slot)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Slots] Ignoring invalid slot {}.", slot));
		return false;
	}
	if (!ready(slot, now)) {
		return false;
	}

	m_actuator.useSlot(slot);
	m_lastUsed[static_cast<std::size_t>(slot)] = now;
	return true;
}

std::optional<int> SlotDispatcher::useFirstAvailable(const std::vector<int>& slots, const vision::TimePoint now) {
	for (const int slot: slots) {
		if (use(slot, now)) {
			return slot;
		}
	}
	return std::nullopt;
}

std::optional<vision::TimePoint> SlotDispatcher::lastUsed(const int slot) const {
	if (!valid(slot)) {
		return std::nullopt;
	}
	return m_lastUsed[static_cast<std::size_t>(slot)];
}

std::chrono::milliseconds SlotDispatcher::cooldown(const int slot) const {
	if (!valid(slot)) {
		return std::chrono::milliseconds{0};
	}
	return std::chrono::milliseconds{m_cooldownsMs[static_cast<std::size_t>(slot)]};
}

} // namespace flyff::bot
