#pragma once

/// @file config.hpp
/// @brief Game settings (loaded from JSON) and persisted game configuration

#include "types.hpp"

#include <critter_engine/core/error.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>

namespace critter_game {

// =============================================================================
// GameSettings
// =============================================================================

/// Parameters supplied to CatchGame::initialize
///
/// Example JSON:
/// ```json
/// {
///     "authority": 1,
///     "treasury": 2,
///     "vault_account": 3,
///     "item_prices": [1000000, 10000000, 25000000, 49900000],
///     "catch_rates": [2, 20, 50, 99],
///     "max_active": 20,
///     "max_attempts": 3,
///     "max_coordinate": 999,
///     "vault_capacity": 20,
///     "max_purchase_amount": 500000000
/// }
/// ```
struct GameSettings {
    PlayerId authority;
    PlayerId treasury;
    PlayerId vault_account;
    std::array<std::uint64_t, NUM_ITEM_TIERS> item_prices = DEFAULT_ITEM_PRICES;
    std::array<std::uint8_t, NUM_ITEM_TIERS> catch_rates = DEFAULT_CATCH_RATES;
    std::uint8_t max_active = static_cast<std::uint8_t>(MAX_CREATURE_SLOTS);
    std::uint8_t max_attempts = DEFAULT_MAX_ATTEMPTS;
    std::uint16_t max_coordinate = DEFAULT_MAX_COORDINATE;
    std::size_t vault_capacity = MAX_VAULT_SIZE;
    std::uint64_t max_purchase_amount = DEFAULT_MAX_PURCHASE_AMOUNT;

    /// Check every field; nothing is persisted unless this passes
    [[nodiscard]] critter_core::Result<void> validate() const;

    /// Parse from a JSON document. Missing fields keep their defaults.
    [[nodiscard]] static critter_core::Result<GameSettings> from_json_string(const std::string& json_str);

    /// Load from a JSON file
    [[nodiscard]] static critter_core::Result<GameSettings> from_file(const std::filesystem::path& path);

    /// Serialize to a JSON document
    [[nodiscard]] std::string to_json() const;
};

// =============================================================================
// GameConfig
// =============================================================================

/// Persisted game configuration and monotonic counters
///
/// Counters only move through the checked helpers below; an overflow fails
/// the operation instead of wrapping.
struct GameConfig {
    PlayerId authority;
    PlayerId treasury;
    PlayerId vault_account;
    std::array<std::uint64_t, NUM_ITEM_TIERS> item_prices{};
    std::array<std::uint8_t, NUM_ITEM_TIERS> catch_rates{};
    std::uint8_t max_active = 0;
    std::uint8_t max_attempts = DEFAULT_MAX_ATTEMPTS;
    std::uint16_t max_coordinate = DEFAULT_MAX_COORDINATE;
    std::uint64_t max_purchase_amount = DEFAULT_MAX_PURCHASE_AMOUNT;

    std::uint64_t creature_id_counter = 0;
    std::uint64_t request_sequence = 0;
    std::uint64_t total_revenue = 0;
    std::uint64_t total_withdrawn = 0;
    bool is_initialized = false;

    /// Build the initial configuration from validated settings
    [[nodiscard]] static GameConfig from_settings(const GameSettings& settings);

    /// Value the creature id counter would take next
    [[nodiscard]] critter_core::Result<std::uint64_t> peek_creature_id() const;

    /// Value the request sequence would take next
    [[nodiscard]] critter_core::Result<std::uint64_t> peek_request_sequence() const;

    critter_core::Result<void> add_revenue(std::uint64_t amount);
    critter_core::Result<void> add_withdrawn(std::uint64_t amount);

    [[nodiscard]] std::uint64_t price(ItemTier tier) const {
        return item_prices[static_cast<std::size_t>(tier)];
    }

    [[nodiscard]] std::uint8_t catch_rate(ItemTier tier) const {
        return catch_rates[static_cast<std::size_t>(tier)];
    }
};

} // namespace critter_game
