#pragma once

/// @file slots.hpp
/// @brief Fixed-capacity creature slot registry

#include "types.hpp"

#include <critter_engine/core/error.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace critter_game {

/// Fixed array of creature slots with a redundant active count
///
/// The registry only enforces slot-level rules (index range, occupancy,
/// counter overflow). Soft caps and authority checks belong to CatchGame.
/// Invariant: active_count() == number of slots with is_active set.
class SlotRegistry {
public:
    SlotRegistry() = default;

    /// Check a raw slot index
    [[nodiscard]] static bool valid_index(std::size_t index) noexcept {
        return index < MAX_CREATURE_SLOTS;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// Get a slot by index
    /// @return Pointer to slot, nullptr if index is out of range
    [[nodiscard]] const CreatureSlot* get(std::size_t index) const noexcept {
        return valid_index(index) ? &m_slots[index] : nullptr;
    }

    /// Check if the slot at index holds a creature
    [[nodiscard]] bool is_active(std::size_t index) const noexcept {
        return valid_index(index) && m_slots[index].is_active;
    }

    [[nodiscard]] std::uint8_t active_count() const noexcept { return m_active_count; }

    [[nodiscard]] std::span<const CreatureSlot> slots() const noexcept {
        return std::span<const CreatureSlot>(m_slots.data(), m_slots.size());
    }

    /// Count active slots by scanning (used to verify active_count)
    [[nodiscard]] std::size_t scan_active() const;

    // =========================================================================
    // Transitions
    // =========================================================================

    /// Place a creature into an empty slot
    critter_core::Result<void> activate(
        std::size_t index,
        std::uint64_t creature_id,
        Position position,
        std::int64_t timestamp);

    /// Reset an active slot to the empty value
    /// @return The slot as it was before clearing
    critter_core::Result<CreatureSlot> clear(std::size_t index);

    /// Count one failed throw against an active slot
    /// @return Attempts after the increment
    critter_core::Result<std::uint8_t> record_miss(std::size_t index);

    /// Move an active creature and reset its attempt counter
    /// @return Position before the move
    critter_core::Result<Position> relocate(std::size_t index, Position position);

    /// Empty every slot
    void reset();

private:
    critter_core::Result<void> require_active(std::size_t index) const;

    std::array<CreatureSlot, MAX_CREATURE_SLOTS> m_slots{};
    std::uint8_t m_active_count = 0;
};

} // namespace critter_game
