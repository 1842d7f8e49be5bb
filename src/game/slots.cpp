/// @file slots.cpp
/// @brief SlotRegistry implementation

#include <critter_engine/game/slots.hpp>

#include <algorithm>

namespace critter_game {

using critter_core::Err;
using critter_core::Error;
using critter_core::GameError;
using critter_core::Ok;
using critter_core::Result;

std::size_t SlotRegistry::scan_active() const {
    return static_cast<std::size_t>(std::count_if(m_slots.begin(), m_slots.end(),
        [](const CreatureSlot& slot) { return slot.is_active; }));
}

Result<void> SlotRegistry::require_active(std::size_t index) const {
    if (!valid_index(index)) {
        return Err(Error(GameError::invalid_slot_index(static_cast<std::uint32_t>(index))));
    }
    if (!m_slots[index].is_active) {
        return Err(Error(GameError::slot_not_active(static_cast<std::uint32_t>(index))));
    }
    return Ok();
}

Result<void> SlotRegistry::activate(
    std::size_t index,
    std::uint64_t creature_id,
    Position position,
    std::int64_t timestamp)
{
    if (!valid_index(index)) {
        return Err(Error(GameError::invalid_slot_index(static_cast<std::uint32_t>(index))));
    }
    if (m_slots[index].is_active) {
        return Err(Error(GameError::slot_occupied(static_cast<std::uint32_t>(index))));
    }
    auto next_count = checked_add<std::uint8_t>(m_active_count, 1);
    if (!next_count) {
        return Err(Error(GameError::math_overflow("active creature count")));
    }

    m_slots[index] = CreatureSlot{
        true,
        creature_id,
        position.x,
        position.y,
        0,
        timestamp,
    };
    m_active_count = *next_count;
    return Ok();
}

Result<CreatureSlot> SlotRegistry::clear(std::size_t index) {
    auto check = require_active(index);
    if (!check) {
        return Err<CreatureSlot>(check.error());
    }

    CreatureSlot previous = m_slots[index];
    m_slots[index] = CreatureSlot{};
    --m_active_count;
    return Ok(previous);
}

Result<std::uint8_t> SlotRegistry::record_miss(std::size_t index) {
    auto check = require_active(index);
    if (!check) {
        return Err<std::uint8_t>(check.error());
    }

    auto attempts = checked_add<std::uint8_t>(m_slots[index].throw_attempts, 1);
    if (!attempts) {
        return Err<std::uint8_t>(Error(GameError::math_overflow("throw attempts")));
    }
    m_slots[index].throw_attempts = *attempts;
    return Ok(*attempts);
}

Result<Position> SlotRegistry::relocate(std::size_t index, Position position) {
    auto check = require_active(index);
    if (!check) {
        return Err<Position>(check.error());
    }

    CreatureSlot& slot = m_slots[index];
    Position previous = slot.position();
    slot.pos_x = position.x;
    slot.pos_y = position.y;
    slot.throw_attempts = 0;
    return Ok(previous);
}

void SlotRegistry::reset() {
    m_slots.fill(CreatureSlot{});
    m_active_count = 0;
}

} // namespace critter_game
