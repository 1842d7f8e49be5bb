#pragma once

/// @file ledger.hpp
/// @brief Currency and item inventory ledgers

#include "types.hpp"

#include <critter_engine/core/error.hpp>

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace critter_game {

// =============================================================================
// ICurrencyLedger
// =============================================================================

/// External fungible currency used to buy items
class ICurrencyLedger {
public:
    virtual ~ICurrencyLedger() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    /// Balance in atomic units
    [[nodiscard]] virtual std::uint64_t balance(PlayerId account) const = 0;

    /// Move amount atomic units between accounts
    [[nodiscard]] virtual critter_core::Result<void> transfer(
        PlayerId from,
        PlayerId to,
        std::uint64_t amount) = 0;
};

/// Currency balances kept in process memory
class MemoryCurrencyLedger : public ICurrencyLedger {
public:
    MemoryCurrencyLedger() = default;

    [[nodiscard]] std::string name() const override { return "memory_currency"; }

    [[nodiscard]] std::uint64_t balance(PlayerId account) const override;

    [[nodiscard]] critter_core::Result<void> transfer(
        PlayerId from,
        PlayerId to,
        std::uint64_t amount) override;

    /// Create currency in an account
    [[nodiscard]] critter_core::Result<void> credit(PlayerId account, std::uint64_t amount);

private:
    mutable std::mutex m_mutex;
    std::unordered_map<PlayerId, std::uint64_t> m_balances;
};

// =============================================================================
// InventoryLedger
// =============================================================================

/// Per-player item balances and lifetime counters
///
/// Not synchronized; CatchGame holds its own lock around every call.
class InventoryLedger {
public:
    InventoryLedger() = default;

    /// Inventory of a player, nullptr before their first purchase
    [[nodiscard]] const PlayerInventory* find(PlayerId player) const;

    /// Items of a tier held by a player (0 for unknown players)
    [[nodiscard]] std::uint32_t balance(PlayerId player, ItemTier tier) const;

    /// Check that credit(player, tier, quantity) would succeed
    [[nodiscard]] critter_core::Result<void> can_credit(
        PlayerId player, ItemTier tier, std::uint32_t quantity) const;

    /// Add purchased items; creates the inventory on first use
    critter_core::Result<void> credit(PlayerId player, ItemTier tier, std::uint32_t quantity);

    /// Check that a throw of tier can be paid for
    [[nodiscard]] critter_core::Result<void> can_throw(PlayerId player, ItemTier tier) const;

    /// Remove items
    critter_core::Result<void> debit(PlayerId player, ItemTier tier, std::uint32_t quantity);

    /// Debit one item and count the throw
    critter_core::Result<void> record_throw(PlayerId player, ItemTier tier);

    /// Count a successful catch
    critter_core::Result<void> record_catch(PlayerId player);

    [[nodiscard]] std::size_t player_count() const noexcept { return m_inventories.size(); }

    [[nodiscard]] std::vector<PlayerInventory> all() const;

private:
    std::unordered_map<PlayerId, PlayerInventory> m_inventories;
};

} // namespace critter_game
