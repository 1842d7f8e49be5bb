#pragma once

/// @file events.hpp
/// @brief Events emitted by the catch game

#include "types.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace critter_game {

// =============================================================================
// Lifecycle / Administration
// =============================================================================

struct GameInitialized {
    PlayerId authority;
    std::uint8_t max_active{0};
};

struct ItemPriceUpdated {
    ItemTier tier{ItemTier::Basic};
    std::uint64_t old_price{0};
    std::uint64_t new_price{0};
};

struct CatchRateUpdated {
    ItemTier tier{ItemTier::Basic};
    std::uint8_t old_rate{0};
    std::uint8_t new_rate{0};
};

struct MaxActiveUpdated {
    std::uint8_t old_max{0};
    std::uint8_t new_max{0};
};

struct RevenueWithdrawn {
    PlayerId recipient;
    std::uint64_t amount{0};
};

struct ItemsPurchased {
    PlayerId buyer;
    ItemTier tier{ItemTier::Basic};
    std::uint32_t quantity{0};
    std::uint64_t total_cost{0};
};

// =============================================================================
// Requests
// =============================================================================

struct SpawnRequested {
    RequestId request;
    std::uint8_t slot_index{0};
};

/// Spawn request consumed after its slot was filled by other means
struct SpawnSkipped {
    RequestId request;
    std::uint8_t slot_index{0};
};

struct ThrowAttempted {
    RequestId request;
    PlayerId thrower;
    std::uint64_t creature_id{0};
    std::uint8_t slot_index{0};
    ItemTier tier{ItemTier::Basic};
};

/// Throw consumed after its target creature left the slot
struct ThrowVoided {
    RequestId request;
    PlayerId thrower;
    std::uint64_t creature_id{0};
    std::uint8_t slot_index{0};
};

// =============================================================================
// Creatures
// =============================================================================

struct CreatureSpawned {
    std::uint64_t creature_id{0};
    std::uint8_t slot_index{0};
    Position position;
};

enum class RelocationReason : std::uint8_t {
    Admin,      ///< Authority repositioned the creature
    Exhausted   ///< Attempts ran out
};

[[nodiscard]] const char* relocation_reason_name(RelocationReason reason);

struct CreatureRelocated {
    std::uint64_t creature_id{0};
    std::uint8_t slot_index{0};
    Position from;
    Position to;
    RelocationReason reason{RelocationReason::Exhausted};
};

struct CreatureDespawned {
    std::uint64_t creature_id{0};
    std::uint8_t slot_index{0};
};

/// Successful throw. asset is default when the vault was empty.
struct CreatureCaught {
    PlayerId catcher;
    std::uint64_t creature_id{0};
    std::uint8_t slot_index{0};
    AssetId asset;
};

struct CatchFailed {
    PlayerId thrower;
    std::uint64_t creature_id{0};
    std::uint8_t slot_index{0};
    std::uint8_t attempts_remaining{0};
};

// =============================================================================
// Vault
// =============================================================================

struct AssetAwarded {
    PlayerId winner;
    AssetId asset;
    std::size_t vault_remaining{0};
};

/// Asset left the pool but custody did not move
struct AwardPendingReconciliation {
    PlayerId winner;
    AssetId asset;
    RequestId request;
    OwedReason reason{OwedReason::TransferDataMissing};
};

struct OwedAwardSettled {
    PlayerId winner;
    AssetId asset;
};

struct AssetDeposited {
    AssetId asset;
    std::size_t vault_count{0};
};

struct AssetWithdrawn {
    AssetId asset;
    std::size_t vault_count{0};
};

// =============================================================================
// GameEvent
// =============================================================================

using GameEvent = std::variant<
    GameInitialized,
    ItemPriceUpdated,
    CatchRateUpdated,
    MaxActiveUpdated,
    RevenueWithdrawn,
    ItemsPurchased,
    SpawnRequested,
    SpawnSkipped,
    ThrowAttempted,
    ThrowVoided,
    CreatureSpawned,
    CreatureRelocated,
    CreatureDespawned,
    CreatureCaught,
    CatchFailed,
    AssetAwarded,
    AwardPendingReconciliation,
    OwedAwardSettled,
    AssetDeposited,
    AssetWithdrawn
>;

/// Short event type name
[[nodiscard]] const char* event_name(const GameEvent& event);

/// Format an event for logs
[[nodiscard]] std::string format_game_event(const GameEvent& event);

/// True if event holds alternative T
template<typename T>
[[nodiscard]] bool event_is(const GameEvent& event) {
    return std::holds_alternative<T>(event);
}

} // namespace critter_game
