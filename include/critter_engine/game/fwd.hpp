#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for critter_game module

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace critter_game {

// =============================================================================
// Handle Types
// =============================================================================

/// @brief Identity of a player or administrator account
struct PlayerId {
    std::uint64_t value{0};
    bool operator==(const PlayerId&) const = default;
    bool operator!=(const PlayerId&) const = default;
    auto operator<=>(const PlayerId&) const = default;
    explicit operator bool() const { return value != 0; }
};

/// @brief Identifier of one scarce collectible held by the vault
struct AssetId {
    std::uint64_t value{0};
    bool operator==(const AssetId&) const = default;
    bool operator!=(const AssetId&) const = default;
    auto operator<=>(const AssetId&) const = default;
    explicit operator bool() const { return value != 0; }
};

/// @brief Identifier of a randomness request (its sequence number)
struct RequestId {
    std::uint64_t value{0};
    bool operator==(const RequestId&) const = default;
    bool operator!=(const RequestId&) const = default;
    auto operator<=>(const RequestId&) const = default;
};

// =============================================================================
// Forward Declarations
// =============================================================================

struct Position;
struct CreatureSlot;
struct Request;
struct PlayerInventory;
struct OwedAward;
struct TransferAccounts;
struct RandomnessRecord;
struct GameSettings;
struct GameConfig;
struct ConsumeOutcome;

class SlotRegistry;
class Vault;
class InventoryLedger;
class IRandomnessOracle;
class MemoryOracle;
class IAssetTransfer;
class MemoryAssetLedger;
class ICurrencyLedger;
class MemoryCurrencyLedger;
class CatchGame;

/// @brief Source of unix timestamps
using ClockFn = std::function<std::int64_t()>;

} // namespace critter_game

template<>
struct std::hash<critter_game::PlayerId> {
    std::size_t operator()(const critter_game::PlayerId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};

template<>
struct std::hash<critter_game::AssetId> {
    std::size_t operator()(const critter_game::AssetId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};
