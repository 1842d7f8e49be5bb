#pragma once

/// @file types.hpp
/// @brief Core types and constants for critter_game module

#include "fwd.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>

namespace critter_game {

// =============================================================================
// Constants
// =============================================================================

/// Hard cap on creature slots (size of the slot arena)
inline constexpr std::size_t MAX_CREATURE_SLOTS = 20;

/// Hard cap on vault capacity (size of the vault arena)
inline constexpr std::size_t MAX_VAULT_SIZE = 20;

/// Number of throwable item tiers
inline constexpr std::size_t NUM_ITEM_TIERS = 4;

/// Default largest coordinate value (positions are 0..=999)
inline constexpr std::uint16_t DEFAULT_MAX_COORDINATE = 999;

/// Default throws a creature tolerates before it relocates
inline constexpr std::uint8_t DEFAULT_MAX_ATTEMPTS = 3;

/// Default cap on the cost of a single purchase, in currency atomic units
inline constexpr std::uint64_t DEFAULT_MAX_PURCHASE_AMOUNT = 500'000'000;

/// Default item prices in currency atomic units (6 decimals)
inline constexpr std::array<std::uint64_t, NUM_ITEM_TIERS> DEFAULT_ITEM_PRICES = {
    1'000'000,    // Basic: 1.00
    10'000'000,   // Great: 10.00
    25'000'000,   // Ultra: 25.00
    49'900'000,   // Master: 49.90
};

/// Default catch probabilities in percent
inline constexpr std::array<std::uint8_t, NUM_ITEM_TIERS> DEFAULT_CATCH_RATES = {2, 20, 50, 99};

/// Size of one oracle randomness blob
inline constexpr std::size_t RANDOMNESS_SIZE = 64;

/// Size of a request seed
inline constexpr std::size_t SEED_SIZE = 32;

/// Events kept in a game's history and pending queue
inline constexpr std::size_t DEFAULT_EVENT_LIMIT = 4096;

/// Tag stamped into the tail of every request seed
inline constexpr std::array<std::uint8_t, 8> SEED_TAG = {'c', 'r', 'i', 't', 't', 'e', 'r', 's'};

using RandomnessBlob = std::array<std::uint8_t, RANDOMNESS_SIZE>;
using RequestSeed = std::array<std::uint8_t, SEED_SIZE>;

// =============================================================================
// Item Tiers
// =============================================================================

/// @brief Throwable item tier; determines price and catch probability
enum class ItemTier : std::uint8_t {
    Basic = 0,
    Great,
    Ultra,
    Master
};

/// @brief Check a raw tier index
[[nodiscard]] inline bool is_valid_tier(std::uint32_t tier) {
    return tier < NUM_ITEM_TIERS;
}

[[nodiscard]] const char* item_tier_name(ItemTier tier);

// =============================================================================
// Creature Slots
// =============================================================================

/// @brief Map coordinate pair
struct Position {
    std::uint16_t x{0};
    std::uint16_t y{0};

    bool operator==(const Position&) const = default;
};

/// @brief One addressable position in the creature registry
///
/// A default-constructed slot is the empty value.
struct CreatureSlot {
    bool is_active{false};
    std::uint64_t creature_id{0};
    std::uint16_t pos_x{0};
    std::uint16_t pos_y{0};
    std::uint8_t throw_attempts{0};
    std::int64_t spawn_timestamp{0};

    [[nodiscard]] Position position() const { return Position{pos_x, pos_y}; }

    bool operator==(const CreatureSlot&) const = default;
};

// =============================================================================
// Requests
// =============================================================================

/// @brief What a randomness request resolves
enum class RequestKind : std::uint8_t {
    Spawn = 0,
    Throw = 1
};

/// @brief Lifecycle of a request as observed by callers
enum class RequestState : std::uint8_t {
    Pending,    ///< Oracle has not answered
    Ready,      ///< Randomness published, not yet consumed
    Fulfilled   ///< Consumed (terminal)
};

[[nodiscard]] const char* request_kind_name(RequestKind kind);
[[nodiscard]] const char* request_state_name(RequestState state);

/// @brief Recorded intent to consume oracle randomness for one spawn or throw
struct Request {
    RequestId id;
    RequestKind kind{RequestKind::Spawn};
    PlayerId requester;
    std::uint8_t slot_index{0};
    std::uint8_t item_tier{0};          ///< Throw only
    std::uint64_t target_creature{0};   ///< Throw only: creature id at request time
    RequestSeed seed{};
    bool is_fulfilled{false};
    std::int64_t created_at{0};
};

/// @brief Build the unique seed for a request
[[nodiscard]] RequestSeed make_request_seed(std::uint64_t sequence, RequestKind kind);

/// @brief Hex rendering of a seed for logs
[[nodiscard]] std::string seed_to_hex(const RequestSeed& seed);

// =============================================================================
// Players
// =============================================================================

/// @brief Per-player item balances and lifetime counters
struct PlayerInventory {
    PlayerId player;
    std::array<std::uint32_t, NUM_ITEM_TIERS> items{};
    std::uint64_t total_purchased{0};
    std::uint64_t total_throws{0};
    std::uint64_t total_catches{0};
};

// =============================================================================
// Awards
// =============================================================================

/// @brief Why an award is still owed to its winner
enum class OwedReason : std::uint8_t {
    TransferDataMissing,    ///< Caller supplied no transfer accounts for the asset
    TransferFailed          ///< Transfer subsystem rejected the move
};

[[nodiscard]] const char* owed_reason_name(OwedReason reason);

/// @brief Asset removed from the pool whose custody has not moved yet
struct OwedAward {
    PlayerId winner;
    AssetId asset;
    RequestId request;
    OwedReason reason{OwedReason::TransferDataMissing};
};

// =============================================================================
// Checked Arithmetic
// =============================================================================

/// @brief Add without wrapping
/// @return Sum, nullopt on overflow
template<typename T>
[[nodiscard]] std::optional<T> checked_add(T a, T b) {
    static_assert(std::is_unsigned_v<T>, "checked_add is defined for unsigned counters");
    if (a > std::numeric_limits<T>::max() - b) {
        return std::nullopt;
    }
    return static_cast<T>(a + b);
}

} // namespace critter_game
