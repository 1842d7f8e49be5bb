#pragma once

/// @file catch_game.hpp
/// @brief Authoritative catch game state machine
///
/// CatchGame owns the configuration, creature slots, collectible vault,
/// item inventories and pending randomness requests. Spawns and throws are
/// two-phase: a request records intent and asks the oracle for randomness,
/// and a later consume() (callable by anyone) resolves it exactly once.
///
/// Every public operation runs under one internal mutex, so concurrent
/// callers observe each operation as atomic. Preconditions are checked
/// before any state changes; a failed operation leaves the game untouched.

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "slots.hpp"
#include "vault.hpp"
#include "ledger.hpp"
#include "oracle.hpp"
#include "transfer.hpp"
#include "events.hpp"

#include <critter_engine/core/error.hpp>
#include <critter_engine/event/event_log.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace critter_game {

// =============================================================================
// ConsumeOutcome
// =============================================================================

/// What a consume() call did
enum class ConsumeResult : std::uint8_t {
    Spawned,        ///< Creature placed into the target slot
    SpawnSkipped,   ///< Target slot was already occupied
    Caught,         ///< Throw succeeded, creature removed
    Missed,         ///< Throw failed, creature stays
    Relocated,      ///< Throw failed and used up the last attempt
    Voided          ///< Target creature had already left the slot
};

[[nodiscard]] const char* consume_result_name(ConsumeResult result);

struct ConsumeOutcome {
    RequestId request;
    RequestKind kind{RequestKind::Spawn};
    ConsumeResult result{ConsumeResult::Spawned};
    std::uint8_t slot_index{0};
    std::uint64_t creature_id{0};
    std::optional<Position> position;   ///< Spawn or relocation target
    std::uint8_t roll{0};               ///< Throw only
    AssetId awarded;                    ///< Default when nothing was awarded
    bool award_owed{false};             ///< Awarded asset is waiting for reconciliation
};

// =============================================================================
// CatchGame
// =============================================================================

class CatchGame {
public:
    using EventLog = critter_event::EventLog<GameEvent>;

    /// Create an uninitialized game bound to its collaborators
    /// @param clock Unix time source; system clock when empty
    /// @param event_limit Bound on both event history and undrained events
    CatchGame(
        IRandomnessOracle& oracle,
        IAssetTransfer& assets,
        ICurrencyLedger& currency,
        ClockFn clock = {},
        std::size_t event_limit = DEFAULT_EVENT_LIMIT);

    // Non-copyable, non-movable (contains std::mutex)
    CatchGame(const CatchGame&) = delete;
    CatchGame& operator=(const CatchGame&) = delete;
    CatchGame(CatchGame&&) = delete;
    CatchGame& operator=(CatchGame&&) = delete;

    // =========================================================================
    // Setup
    // =========================================================================

    /// One-time setup; caller becomes the authority and must match settings
    critter_core::Result<void> initialize(PlayerId caller, const GameSettings& settings);

    // =========================================================================
    // Request Phase
    // =========================================================================

    /// Ask for a randomized spawn into an empty slot (authority only)
    critter_core::Result<RequestId> request_spawn(PlayerId caller, std::uint8_t slot_index);

    /// Spend one item of tier on the creature in slot_index
    critter_core::Result<RequestId> request_throw(PlayerId player, std::uint8_t slot_index, std::uint8_t tier);

    // =========================================================================
    // Consume Phase
    // =========================================================================

    /// Resolve a request whose randomness is published
    ///
    /// Anyone may call this. transfers carries custody data for a possible
    /// award; when it lacks an entry for the awarded asset the award is
    /// recorded as owed instead of failing.
    critter_core::Result<ConsumeOutcome> consume(
        RequestId id,
        const std::vector<TransferAccounts>& transfers = {});

    // =========================================================================
    // Creature Administration
    // =========================================================================

    /// Place a creature at an explicit position
    /// @return The new creature id
    critter_core::Result<std::uint64_t> force_spawn(
        PlayerId caller, std::uint8_t slot_index, std::uint16_t x, std::uint16_t y);

    critter_core::Result<void> reposition(
        PlayerId caller, std::uint8_t slot_index, std::uint16_t x, std::uint16_t y);

    critter_core::Result<void> despawn(PlayerId caller, std::uint8_t slot_index);

    // =========================================================================
    // Vault Administration
    // =========================================================================

    /// Move an asset from the authority into the pool
    critter_core::Result<void> deposit_asset(PlayerId caller, AssetId asset);

    /// Move an asset from the pool back to the authority
    critter_core::Result<void> withdraw_asset(PlayerId caller, AssetId asset);

    /// Retry custody transfer for an owed award
    critter_core::Result<void> settle_owed_award(PlayerId caller, AssetId asset);

    // =========================================================================
    // Economy
    // =========================================================================

    /// Buy quantity items of tier with currency
    /// @return Total cost charged
    critter_core::Result<std::uint64_t> purchase_items(PlayerId buyer, std::uint8_t tier, std::uint32_t quantity);

    critter_core::Result<void> set_item_price(PlayerId caller, std::uint8_t tier, std::uint64_t price);
    critter_core::Result<void> set_catch_rate(PlayerId caller, std::uint8_t tier, std::uint8_t rate);
    critter_core::Result<void> set_max_active(PlayerId caller, std::uint8_t max_active);

    /// Move currency from the treasury to the authority
    critter_core::Result<void> withdraw_revenue(PlayerId caller, std::uint64_t amount);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool is_initialized() const;
    [[nodiscard]] GameConfig config() const;

    [[nodiscard]] std::optional<CreatureSlot> slot(std::size_t index) const;
    [[nodiscard]] std::vector<CreatureSlot> slots() const;
    [[nodiscard]] std::uint8_t active_count() const;

    /// Throws left before relocation (saturating, display only)
    [[nodiscard]] critter_core::Result<std::uint8_t> attempts_remaining(std::size_t index) const;

    [[nodiscard]] std::vector<AssetId> vault_assets() const;
    [[nodiscard]] std::size_t vault_count() const;
    [[nodiscard]] std::size_t vault_max_size() const;
    [[nodiscard]] bool vault_consistent() const;

    [[nodiscard]] std::optional<PlayerInventory> inventory(PlayerId player) const;

    [[nodiscard]] std::optional<Request> request(RequestId id) const;
    [[nodiscard]] critter_core::Result<RequestState> request_state(RequestId id) const;
    [[nodiscard]] std::vector<Request> pending_requests() const;

    [[nodiscard]] std::vector<OwedAward> owed_awards() const;

    /// Currency currently held by the treasury account
    [[nodiscard]] std::uint64_t treasury_balance() const;

    /// Event journal (internally synchronized)
    ///
    /// Holds at most event_limit events of history and of pending events.
    /// Callers that need every event drain() or process() it regularly.
    [[nodiscard]] EventLog& events() noexcept { return m_events; }
    [[nodiscard]] const EventLog& events() const noexcept { return m_events; }

private:
    critter_core::Result<void> require_initialized() const;
    critter_core::Result<void> require_authority(PlayerId caller, const char* operation) const;
    critter_core::Result<void> require_coordinates(std::uint16_t x, std::uint16_t y) const;

    critter_core::Result<ConsumeOutcome> consume_spawn(Request& request, const RandomnessBlob& blob);
    critter_core::Result<ConsumeOutcome> consume_throw(
        Request& request,
        const RandomnessBlob& blob,
        const std::vector<TransferAccounts>& transfers);

    /// Remove the selected asset and move it to the winner
    void award(const Request& request, std::size_t pool_index,
               const std::vector<TransferAccounts>& transfers, ConsumeOutcome& outcome);

    void record_owed(const Request& request, AssetId asset, OwedReason reason);

    [[nodiscard]] std::int64_t now() const;
    void emit(GameEvent event);

    IRandomnessOracle& m_oracle;
    IAssetTransfer& m_assets;
    ICurrencyLedger& m_currency;
    ClockFn m_clock;

    mutable std::mutex m_mutex;
    GameConfig m_config;
    SlotRegistry m_slots;
    Vault m_vault;
    InventoryLedger m_inventory;
    std::map<RequestId, Request> m_requests;
    std::vector<OwedAward> m_owed;
    EventLog m_events;
};

} // namespace critter_game
