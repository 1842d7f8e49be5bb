/// @file catch_game.cpp
/// @brief CatchGame implementation

#include <critter_engine/game/catch_game.hpp>
#include <critter_engine/game/randomness.hpp>
#include <critter_engine/core/log.hpp>

#include <algorithm>
#include <chrono>
#include <limits>

namespace critter_game {

using critter_core::Err;
using critter_core::Error;
using critter_core::ErrorCode;
using critter_core::GameError;
using critter_core::Ok;
using critter_core::Result;

const char* consume_result_name(ConsumeResult result) {
    switch (result) {
        case ConsumeResult::Spawned: return "Spawned";
        case ConsumeResult::SpawnSkipped: return "SpawnSkipped";
        case ConsumeResult::Caught: return "Caught";
        case ConsumeResult::Missed: return "Missed";
        case ConsumeResult::Relocated: return "Relocated";
        case ConsumeResult::Voided: return "Voided";
        default: return "Unknown";
    }
}

namespace {

/// Log and count a rejected operation, then hand the error back
template<typename T = void>
Result<T> reject(const char* operation, Error error) {
    critter_core::debug::record_error(error);
    critter_core::game_logger()->debug("{} rejected: {}", operation, critter_core::build_error_chain(error));
    return Err<T>(std::move(error));
}

std::uint8_t saturating_remaining(std::uint8_t max_attempts, std::uint8_t attempts) {
    return attempts >= max_attempts ? 0 : static_cast<std::uint8_t>(max_attempts - attempts);
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

CatchGame::CatchGame(
    IRandomnessOracle& oracle,
    IAssetTransfer& assets,
    ICurrencyLedger& currency,
    ClockFn clock,
    std::size_t event_limit)
    : m_oracle(oracle)
    , m_assets(assets)
    , m_currency(currency)
    , m_clock(std::move(clock))
    , m_events(event_limit, event_limit)
{
}

std::int64_t CatchGame::now() const {
    if (m_clock) {
        return m_clock();
    }
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void CatchGame::emit(GameEvent event) {
    critter_core::game_logger()->trace("event {}", format_game_event(event));
    m_events.publish(std::move(event));
}

// =============================================================================
// Precondition Helpers
// =============================================================================

Result<void> CatchGame::require_initialized() const {
    if (!m_config.is_initialized) {
        return Err(Error(GameError::not_initialized()));
    }
    return Ok();
}

Result<void> CatchGame::require_authority(PlayerId caller, const char* operation) const {
    auto init = require_initialized();
    if (!init) {
        return init;
    }
    if (caller != m_config.authority) {
        return Err(Error(GameError::unauthorized(operation)));
    }
    return Ok();
}

Result<void> CatchGame::require_coordinates(std::uint16_t x, std::uint16_t y) const {
    if (x > m_config.max_coordinate || y > m_config.max_coordinate) {
        return Err(Error(GameError::invalid_coordinate(x, y)));
    }
    return Ok();
}

// =============================================================================
// Setup
// =============================================================================

Result<void> CatchGame::initialize(PlayerId caller, const GameSettings& settings) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_config.is_initialized) {
        return reject("initialize", Error(GameError::already_initialized()));
    }
    if (caller != settings.authority) {
        return reject("initialize", Error(GameError::unauthorized("initialize")));
    }
    auto valid = settings.validate();
    if (!valid) {
        return reject("initialize", valid.error());
    }

    m_config = GameConfig::from_settings(settings);
    m_slots.reset();
    m_vault = Vault(settings.vault_capacity);

    critter_core::game_logger()->info(
        "Game initialized: authority={} max_active={} max_attempts={} vault_capacity={}",
        m_config.authority.value, m_config.max_active, m_config.max_attempts, m_vault.max_size());
    emit(GameInitialized{m_config.authority, m_config.max_active});
    return Ok();
}

// =============================================================================
// Request Phase
// =============================================================================

Result<RequestId> CatchGame::request_spawn(PlayerId caller, std::uint8_t slot_index) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto auth = require_authority(caller, "request_spawn");
    if (!auth) {
        return reject<RequestId>("request_spawn", auth.error());
    }
    if (!SlotRegistry::valid_index(slot_index)) {
        return reject<RequestId>("request_spawn", Error(GameError::invalid_slot_index(slot_index)));
    }
    if (m_slots.is_active(slot_index)) {
        return reject<RequestId>("request_spawn", Error(GameError::slot_occupied(slot_index)));
    }
    if (m_slots.active_count() >= m_config.max_active) {
        return reject<RequestId>("request_spawn", Error(GameError::max_active_reached(m_config.max_active)));
    }
    auto sequence = m_config.peek_request_sequence();
    if (!sequence) {
        return reject<RequestId>("request_spawn", sequence.error());
    }

    RequestSeed seed = make_request_seed(*sequence, RequestKind::Spawn);
    auto asked = m_oracle.request(seed);
    if (!asked) {
        Error error = asked.error();
        error.with_context("seed", seed_to_hex(seed));
        critter_core::oracle_logger()->error("Spawn randomness request failed: {}", critter_core::build_error_chain(error));
        return reject<RequestId>("request_spawn", std::move(error));
    }

    m_config.request_sequence = *sequence;

    Request request;
    request.id = RequestId{*sequence};
    request.kind = RequestKind::Spawn;
    request.requester = caller;
    request.slot_index = slot_index;
    request.seed = seed;
    request.created_at = now();
    m_requests.emplace(request.id, request);

    critter_core::oracle_logger()->info("Spawn request {} for slot {} (seed {})",
        request.id.value, slot_index, seed_to_hex(seed));
    emit(SpawnRequested{request.id, slot_index});
    return Ok(request.id);
}

Result<RequestId> CatchGame::request_throw(PlayerId player, std::uint8_t slot_index, std::uint8_t tier) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto init = require_initialized();
    if (!init) {
        return reject<RequestId>("request_throw", init.error());
    }
    if (!player) {
        return reject<RequestId>("request_throw", Error(ErrorCode::InvalidArgument, "Throw requires a player"));
    }
    if (!is_valid_tier(tier)) {
        return reject<RequestId>("request_throw", Error(GameError::invalid_tier(tier)));
    }
    if (!SlotRegistry::valid_index(slot_index)) {
        return reject<RequestId>("request_throw", Error(GameError::invalid_slot_index(slot_index)));
    }
    const CreatureSlot* slot = m_slots.get(slot_index);
    if (!slot->is_active) {
        return reject<RequestId>("request_throw", Error(GameError::slot_not_active(slot_index)));
    }
    if (slot->throw_attempts >= m_config.max_attempts) {
        return reject<RequestId>("request_throw", Error(GameError::max_attempts_reached(slot_index)));
    }
    auto item_tier = static_cast<ItemTier>(tier);
    auto affordable = m_inventory.can_throw(player, item_tier);
    if (!affordable) {
        return reject<RequestId>("request_throw", affordable.error());
    }
    auto sequence = m_config.peek_request_sequence();
    if (!sequence) {
        return reject<RequestId>("request_throw", sequence.error());
    }

    RequestSeed seed = make_request_seed(*sequence, RequestKind::Throw);
    auto asked = m_oracle.request(seed);
    if (!asked) {
        Error error = asked.error();
        error.with_context("seed", seed_to_hex(seed));
        critter_core::oracle_logger()->error("Throw randomness request failed: {}", critter_core::build_error_chain(error));
        return reject<RequestId>("request_throw", std::move(error));
    }

    // Checked by can_throw above
    auto charged = m_inventory.record_throw(player, item_tier);
    if (!charged) {
        return reject<RequestId>("request_throw", charged.error());
    }
    m_config.request_sequence = *sequence;

    Request request;
    request.id = RequestId{*sequence};
    request.kind = RequestKind::Throw;
    request.requester = player;
    request.slot_index = slot_index;
    request.item_tier = tier;
    request.target_creature = slot->creature_id;
    request.seed = seed;
    request.created_at = now();
    m_requests.emplace(request.id, request);

    critter_core::oracle_logger()->info("Throw request {} by player {} at slot {} with {} item",
        request.id.value, player.value, slot_index, item_tier_name(item_tier));
    emit(ThrowAttempted{request.id, player, slot->creature_id, slot_index, item_tier});
    return Ok(request.id);
}

// =============================================================================
// Consume Phase
// =============================================================================

Result<ConsumeOutcome> CatchGame::consume(RequestId id, const std::vector<TransferAccounts>& transfers) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_requests.find(id);
    if (it == m_requests.end()) {
        return reject<ConsumeOutcome>("consume", Error(GameError::request_not_found(id.value)));
    }
    Request& request = it->second;
    if (request.is_fulfilled) {
        return reject<ConsumeOutcome>("consume", Error(GameError::already_fulfilled(id.value)));
    }

    auto record = m_oracle.record(request.seed);
    std::optional<RandomnessBlob> blob;
    if (record) {
        blob = record->fulfilled_randomness();
    }
    if (!blob) {
        return reject<ConsumeOutcome>("consume", Error(GameError::not_ready(id.value)));
    }

    if (request.kind == RequestKind::Spawn) {
        return consume_spawn(request, *blob);
    }
    return consume_throw(request, *blob, transfers);
}

Result<ConsumeOutcome> CatchGame::consume_spawn(Request& request, const RandomnessBlob& blob) {
    ConsumeOutcome outcome;
    outcome.request = request.id;
    outcome.kind = RequestKind::Spawn;
    outcome.slot_index = request.slot_index;

    if (m_slots.is_active(request.slot_index)) {
        request.is_fulfilled = true;
        outcome.result = ConsumeResult::SpawnSkipped;
        outcome.creature_id = m_slots.get(request.slot_index)->creature_id;
        critter_core::game_logger()->warn("Spawn request {} skipped: slot {} already holds creature {}",
            request.id.value, request.slot_index, outcome.creature_id);
        emit(SpawnSkipped{request.id, request.slot_index});
        return Ok(outcome);
    }

    Position position = derive_spawn_position(blob, m_config.max_coordinate);
    outcome.position = position;

    auto creature_id = m_config.peek_creature_id();
    if (!creature_id) {
        return reject<ConsumeOutcome>("consume", creature_id.error());
    }
    auto placed = m_slots.activate(request.slot_index, *creature_id, position, now());
    if (!placed) {
        return reject<ConsumeOutcome>("consume", placed.error());
    }
    m_config.creature_id_counter = *creature_id;
    request.is_fulfilled = true;

    outcome.result = ConsumeResult::Spawned;
    outcome.creature_id = *creature_id;

    critter_core::game_logger()->info("Creature {} spawned in slot {} at ({}, {})",
        *creature_id, request.slot_index, position.x, position.y);
    emit(CreatureSpawned{*creature_id, request.slot_index, position});
    return Ok(outcome);
}

Result<ConsumeOutcome> CatchGame::consume_throw(
    Request& request,
    const RandomnessBlob& blob,
    const std::vector<TransferAccounts>& transfers)
{
    ConsumeOutcome outcome;
    outcome.request = request.id;
    outcome.kind = RequestKind::Throw;
    outcome.slot_index = request.slot_index;
    outcome.creature_id = request.target_creature;

    const CreatureSlot* slot = m_slots.get(request.slot_index);
    if (slot == nullptr || !slot->is_active || slot->creature_id != request.target_creature) {
        request.is_fulfilled = true;
        outcome.result = ConsumeResult::Voided;
        critter_core::game_logger()->warn("Throw request {} voided: creature {} left slot {}",
            request.id.value, request.target_creature, request.slot_index);
        emit(ThrowVoided{request.id, request.requester, request.target_creature, request.slot_index});
        return Ok(outcome);
    }

    auto tier = static_cast<ItemTier>(request.item_tier);
    ThrowDraw draw = derive_throw_draw(blob, m_config.catch_rate(tier), m_vault.count(), m_config.max_coordinate);
    outcome.roll = draw.roll;

    if (draw.caught) {
        auto counted = m_inventory.record_catch(request.requester);
        if (!counted) {
            return reject<ConsumeOutcome>("consume", counted.error());
        }

        if (draw.pool_index) {
            award(request, *draw.pool_index, transfers, outcome);
        }

        auto cleared = m_slots.clear(request.slot_index);
        if (!cleared) {
            return reject<ConsumeOutcome>("consume", cleared.error());
        }
        request.is_fulfilled = true;
        outcome.result = ConsumeResult::Caught;

        critter_core::game_logger()->info("Creature {} caught by player {} (roll {} < {}), asset {}",
            request.target_creature, request.requester.value, draw.roll,
            m_config.catch_rate(tier), outcome.awarded ? std::to_string(outcome.awarded.value) : "none");
        emit(CreatureCaught{request.requester, request.target_creature, request.slot_index, outcome.awarded});
        return Ok(outcome);
    }

    auto attempts = m_slots.record_miss(request.slot_index);
    if (!attempts) {
        return reject<ConsumeOutcome>("consume", attempts.error());
    }
    std::uint8_t remaining = saturating_remaining(m_config.max_attempts, *attempts);
    outcome.result = ConsumeResult::Missed;

    if (remaining == 0) {
        auto previous = m_slots.relocate(request.slot_index, draw.relocation);
        if (!previous) {
            return reject<ConsumeOutcome>("consume", previous.error());
        }
        outcome.result = ConsumeResult::Relocated;
        outcome.position = draw.relocation;

        critter_core::game_logger()->info("Creature {} in slot {} relocated ({}, {}) -> ({}, {}) after {} misses",
            request.target_creature, request.slot_index, previous->x, previous->y,
            draw.relocation.x, draw.relocation.y, *attempts);
        emit(CreatureRelocated{request.target_creature, request.slot_index, *previous, draw.relocation,
            RelocationReason::Exhausted});
    } else {
        critter_core::game_logger()->info("Creature {} escaped player {} (roll {}), {} attempts remaining",
            request.target_creature, request.requester.value, draw.roll, remaining);
    }

    request.is_fulfilled = true;
    emit(CatchFailed{request.requester, request.target_creature, request.slot_index, remaining});
    return Ok(outcome);
}

void CatchGame::award(
    const Request& request,
    std::size_t pool_index,
    const std::vector<TransferAccounts>& transfers,
    ConsumeOutcome& outcome)
{
    // Index comes from derive_pool_index over the live count, so removal succeeds
    auto removed = m_vault.remove(pool_index);
    if (!removed) {
        critter_core::vault_logger()->error("Award for request {} failed to remove index {}: {}",
            request.id.value, pool_index, removed.error().message());
        return;
    }
    AssetId asset = *removed;
    outcome.awarded = asset;

    auto accounts = std::find_if(transfers.begin(), transfers.end(),
        [asset](const TransferAccounts& entry) { return entry.asset == asset; });
    if (accounts == transfers.end()) {
        outcome.award_owed = true;
        record_owed(request, asset, OwedReason::TransferDataMissing);
        return;
    }

    if (accounts->source != m_config.vault_account || accounts->destination != request.requester) {
        critter_core::vault_logger()->warn(
            "Transfer data for asset {} does not route vault {} -> winner {}",
            asset.value, m_config.vault_account.value, request.requester.value);
        outcome.award_owed = true;
        record_owed(request, asset, OwedReason::TransferFailed);
        return;
    }

    auto moved = m_assets.transfer(*accounts, 1);
    if (!moved) {
        critter_core::debug::record_error(moved.error());
        critter_core::vault_logger()->warn("Transfer of asset {} to player {} failed: {}",
            asset.value, request.requester.value, critter_core::build_error_chain(moved.error()));
        outcome.award_owed = true;
        record_owed(request, asset, OwedReason::TransferFailed);
        return;
    }

    critter_core::vault_logger()->info("Asset {} awarded to player {} ({} left in vault)",
        asset.value, request.requester.value, m_vault.count());
    emit(AssetAwarded{request.requester, asset, m_vault.count()});
}

void CatchGame::record_owed(const Request& request, AssetId asset, OwedReason reason) {
    m_owed.push_back(OwedAward{request.requester, asset, request.id, reason});
    critter_core::vault_logger()->warn("Asset {} owed to player {} for request {} ({})",
        asset.value, request.requester.value, request.id.value, owed_reason_name(reason));
    emit(AwardPendingReconciliation{request.requester, asset, request.id, reason});
}

// =============================================================================
// Creature Administration
// =============================================================================

Result<std::uint64_t> CatchGame::force_spawn(
    PlayerId caller, std::uint8_t slot_index, std::uint16_t x, std::uint16_t y)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto auth = require_authority(caller, "force_spawn");
    if (!auth) {
        return reject<std::uint64_t>("force_spawn", auth.error());
    }
    if (!SlotRegistry::valid_index(slot_index)) {
        return reject<std::uint64_t>("force_spawn", Error(GameError::invalid_slot_index(slot_index)));
    }
    auto coords = require_coordinates(x, y);
    if (!coords) {
        return reject<std::uint64_t>("force_spawn", coords.error());
    }
    if (m_slots.is_active(slot_index)) {
        return reject<std::uint64_t>("force_spawn", Error(GameError::slot_occupied(slot_index)));
    }
    if (m_slots.active_count() >= m_config.max_active) {
        return reject<std::uint64_t>("force_spawn", Error(GameError::max_active_reached(m_config.max_active)));
    }
    auto creature_id = m_config.peek_creature_id();
    if (!creature_id) {
        return reject<std::uint64_t>("force_spawn", creature_id.error());
    }

    Position position{x, y};
    auto placed = m_slots.activate(slot_index, *creature_id, position, now());
    if (!placed) {
        return reject<std::uint64_t>("force_spawn", placed.error());
    }
    m_config.creature_id_counter = *creature_id;

    critter_core::game_logger()->info("Creature {} force-spawned in slot {} at ({}, {})",
        *creature_id, slot_index, x, y);
    emit(CreatureSpawned{*creature_id, slot_index, position});
    return Ok(*creature_id);
}

Result<void> CatchGame::reposition(PlayerId caller, std::uint8_t slot_index, std::uint16_t x, std::uint16_t y) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto auth = require_authority(caller, "reposition");
    if (!auth) {
        return reject("reposition", auth.error());
    }
    auto coords = require_coordinates(x, y);
    if (!coords) {
        return reject("reposition", coords.error());
    }

    Position target{x, y};
    auto previous = m_slots.relocate(slot_index, target);
    if (!previous) {
        return reject("reposition", previous.error());
    }
    std::uint64_t creature_id = m_slots.get(slot_index)->creature_id;

    critter_core::game_logger()->info("Creature {} in slot {} repositioned to ({}, {})",
        creature_id, slot_index, x, y);
    emit(CreatureRelocated{creature_id, slot_index, *previous, target, RelocationReason::Admin});
    return Ok();
}

Result<void> CatchGame::despawn(PlayerId caller, std::uint8_t slot_index) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto auth = require_authority(caller, "despawn");
    if (!auth) {
        return reject("despawn", auth.error());
    }
    auto cleared = m_slots.clear(slot_index);
    if (!cleared) {
        return reject("despawn", cleared.error());
    }

    critter_core::game_logger()->info("Creature {} despawned from slot {}", cleared->creature_id, slot_index);
    emit(CreatureDespawned{cleared->creature_id, slot_index});
    return Ok();
}

// =============================================================================
// Vault Administration
// =============================================================================

Result<void> CatchGame::deposit_asset(PlayerId caller, AssetId asset) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto auth = require_authority(caller, "deposit_asset");
    if (!auth) {
        return reject("deposit_asset", auth.error());
    }
    if (!asset) {
        return reject("deposit_asset", Error(ErrorCode::InvalidArgument, "Cannot deposit the default asset id"));
    }
    if (m_vault.full()) {
        return reject("deposit_asset", Error(GameError::vault_full(static_cast<std::uint32_t>(m_vault.max_size()))));
    }
    if (m_vault.contains(asset)) {
        return reject("deposit_asset", Error(GameError::duplicate_asset(asset.value)));
    }

    auto moved = m_assets.transfer(TransferAccounts{asset, caller, m_config.vault_account}, 1);
    if (!moved) {
        return reject("deposit_asset", moved.error());
    }

    auto stored = m_vault.deposit(asset);
    if (!stored) {
        return reject("deposit_asset", stored.error());
    }

    critter_core::vault_logger()->info("Asset {} deposited at index {} ({}/{})",
        asset.value, *stored, m_vault.count(), m_vault.max_size());
    emit(AssetDeposited{asset, m_vault.count()});
    return Ok();
}

Result<void> CatchGame::withdraw_asset(PlayerId caller, AssetId asset) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto auth = require_authority(caller, "withdraw_asset");
    if (!auth) {
        return reject("withdraw_asset", auth.error());
    }
    if (m_vault.empty()) {
        return reject("withdraw_asset", Error(GameError::vault_empty()));
    }

    auto removed = m_vault.remove_asset(asset);
    if (!removed) {
        return reject("withdraw_asset", removed.error());
    }

    auto moved = m_assets.transfer(TransferAccounts{asset, m_config.vault_account, caller}, 1);
    if (!moved) {
        // Custody did not move, so the asset goes back into the pool
        auto restored = m_vault.deposit(asset);
        if (!restored) {
            critter_core::vault_logger()->critical("Asset {} could not be restored after failed withdrawal: {}",
                asset.value, restored.error().message());
        }
        return reject("withdraw_asset", moved.error());
    }

    critter_core::vault_logger()->info("Asset {} withdrawn ({}/{})", asset.value, m_vault.count(), m_vault.max_size());
    emit(AssetWithdrawn{asset, m_vault.count()});
    return Ok();
}

Result<void> CatchGame::settle_owed_award(PlayerId caller, AssetId asset) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto auth = require_authority(caller, "settle_owed_award");
    if (!auth) {
        return reject("settle_owed_award", auth.error());
    }

    auto it = std::find_if(m_owed.begin(), m_owed.end(),
        [asset](const OwedAward& owed) { return owed.asset == asset; });
    if (it == m_owed.end()) {
        return reject("settle_owed_award",
            Error(ErrorCode::NotFound, "No owed award for asset " + std::to_string(asset.value)));
    }

    auto moved = m_assets.transfer(TransferAccounts{asset, m_config.vault_account, it->winner}, 1);
    if (!moved) {
        return reject("settle_owed_award", moved.error());
    }

    PlayerId winner = it->winner;
    m_owed.erase(it);

    critter_core::vault_logger()->info("Owed asset {} delivered to player {}", asset.value, winner.value);
    emit(OwedAwardSettled{winner, asset});
    return Ok();
}

// =============================================================================
// Economy
// =============================================================================

Result<std::uint64_t> CatchGame::purchase_items(PlayerId buyer, std::uint8_t tier, std::uint32_t quantity) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto init = require_initialized();
    if (!init) {
        return reject<std::uint64_t>("purchase_items", init.error());
    }
    if (!is_valid_tier(tier)) {
        return reject<std::uint64_t>("purchase_items", Error(GameError::invalid_tier(tier)));
    }
    if (quantity == 0) {
        return reject<std::uint64_t>("purchase_items", Error(GameError::zero_quantity()));
    }

    auto item_tier = static_cast<ItemTier>(tier);
    std::uint64_t price = m_config.price(item_tier);
    if (price > std::numeric_limits<std::uint64_t>::max() / quantity) {
        return reject<std::uint64_t>("purchase_items", Error(GameError::math_overflow("purchase cost")));
    }
    std::uint64_t cost = price * quantity;

    if (cost > m_config.max_purchase_amount) {
        return reject<std::uint64_t>("purchase_items",
            Error(GameError::purchase_exceeds_max(cost, m_config.max_purchase_amount)));
    }
    std::uint64_t available = m_currency.balance(buyer);
    if (available < cost) {
        return reject<std::uint64_t>("purchase_items", Error(GameError::insufficient_funds(cost, available)));
    }
    auto creditable = m_inventory.can_credit(buyer, item_tier, quantity);
    if (!creditable) {
        return reject<std::uint64_t>("purchase_items", creditable.error());
    }
    if (!checked_add<std::uint64_t>(m_config.total_revenue, cost)) {
        return reject<std::uint64_t>("purchase_items", Error(GameError::math_overflow("total revenue")));
    }

    auto paid = m_currency.transfer(buyer, m_config.treasury, cost);
    if (!paid) {
        return reject<std::uint64_t>("purchase_items", paid.error());
    }

    // Both checked above
    auto credited = m_inventory.credit(buyer, item_tier, quantity);
    if (!credited) {
        return reject<std::uint64_t>("purchase_items", credited.error());
    }
    auto revenue = m_config.add_revenue(cost);
    if (!revenue) {
        return reject<std::uint64_t>("purchase_items", revenue.error());
    }

    critter_core::game_logger()->info("Player {} bought {} {} item(s) for {}",
        buyer.value, quantity, item_tier_name(item_tier), cost);
    emit(ItemsPurchased{buyer, item_tier, quantity, cost});
    return Ok(cost);
}

Result<void> CatchGame::set_item_price(PlayerId caller, std::uint8_t tier, std::uint64_t price) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto auth = require_authority(caller, "set_item_price");
    if (!auth) {
        return reject("set_item_price", auth.error());
    }
    if (!is_valid_tier(tier)) {
        return reject("set_item_price", Error(GameError::invalid_tier(tier)));
    }
    if (price == 0) {
        return reject("set_item_price", Error(GameError::zero_price(tier)));
    }

    auto item_tier = static_cast<ItemTier>(tier);
    std::uint64_t old_price = m_config.item_prices[tier];
    m_config.item_prices[tier] = price;

    critter_core::game_logger()->info("{} price {} -> {}", item_tier_name(item_tier), old_price, price);
    emit(ItemPriceUpdated{item_tier, old_price, price});
    return Ok();
}

Result<void> CatchGame::set_catch_rate(PlayerId caller, std::uint8_t tier, std::uint8_t rate) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto auth = require_authority(caller, "set_catch_rate");
    if (!auth) {
        return reject("set_catch_rate", auth.error());
    }
    if (!is_valid_tier(tier)) {
        return reject("set_catch_rate", Error(GameError::invalid_tier(tier)));
    }
    if (rate > 100) {
        return reject("set_catch_rate", Error(GameError::invalid_catch_rate(rate)));
    }

    auto item_tier = static_cast<ItemTier>(tier);
    std::uint8_t old_rate = m_config.catch_rates[tier];
    m_config.catch_rates[tier] = rate;

    critter_core::game_logger()->info("{} catch rate {}% -> {}%", item_tier_name(item_tier), old_rate, rate);
    emit(CatchRateUpdated{item_tier, old_rate, rate});
    return Ok();
}

Result<void> CatchGame::set_max_active(PlayerId caller, std::uint8_t max_active) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto auth = require_authority(caller, "set_max_active");
    if (!auth) {
        return reject("set_max_active", auth.error());
    }
    if (max_active == 0 || max_active > MAX_CREATURE_SLOTS) {
        return reject("set_max_active",
            Error(GameError::invalid_max_active(max_active, static_cast<std::uint32_t>(MAX_CREATURE_SLOTS))));
    }

    std::uint8_t old_max = m_config.max_active;
    m_config.max_active = max_active;

    critter_core::game_logger()->info("Max active creatures {} -> {}", old_max, max_active);
    emit(MaxActiveUpdated{old_max, max_active});
    return Ok();
}

Result<void> CatchGame::withdraw_revenue(PlayerId caller, std::uint64_t amount) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto auth = require_authority(caller, "withdraw_revenue");
    if (!auth) {
        return reject("withdraw_revenue", auth.error());
    }
    std::uint64_t available = m_currency.balance(m_config.treasury);
    if (amount == 0 || amount > available) {
        return reject("withdraw_revenue", Error(GameError::invalid_withdrawal(amount, available)));
    }
    if (!checked_add<std::uint64_t>(m_config.total_withdrawn, amount)) {
        return reject("withdraw_revenue", Error(GameError::math_overflow("total withdrawn")));
    }

    auto paid = m_currency.transfer(m_config.treasury, caller, amount);
    if (!paid) {
        return reject("withdraw_revenue", paid.error());
    }
    auto recorded = m_config.add_withdrawn(amount);
    if (!recorded) {
        return reject("withdraw_revenue", recorded.error());
    }

    critter_core::game_logger()->info("Withdrew {} from treasury to {}", amount, caller.value);
    emit(RevenueWithdrawn{caller, amount});
    return Ok();
}

// =============================================================================
// Queries
// =============================================================================

bool CatchGame::is_initialized() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config.is_initialized;
}

GameConfig CatchGame::config() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

std::optional<CreatureSlot> CatchGame::slot(std::size_t index) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const CreatureSlot* found = m_slots.get(index);
    if (found == nullptr) {
        return std::nullopt;
    }
    return *found;
}

std::vector<CreatureSlot> CatchGame::slots() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto view = m_slots.slots();
    return std::vector<CreatureSlot>(view.begin(), view.end());
}

std::uint8_t CatchGame::active_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.active_count();
}

Result<std::uint8_t> CatchGame::attempts_remaining(std::size_t index) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const CreatureSlot* found = m_slots.get(index);
    if (found == nullptr) {
        return Err<std::uint8_t>(Error(GameError::invalid_slot_index(static_cast<std::uint32_t>(index))));
    }
    if (!found->is_active) {
        return Err<std::uint8_t>(Error(GameError::slot_not_active(static_cast<std::uint32_t>(index))));
    }
    return Ok(saturating_remaining(m_config.max_attempts, found->throw_attempts));
}

std::vector<AssetId> CatchGame::vault_assets() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto view = m_vault.assets();
    return std::vector<AssetId>(view.begin(), view.end());
}

std::size_t CatchGame::vault_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_vault.count();
}

std::size_t CatchGame::vault_max_size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_vault.max_size();
}

bool CatchGame::vault_consistent() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_vault.is_consistent();
}

std::optional<PlayerInventory> CatchGame::inventory(PlayerId player) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const PlayerInventory* found = m_inventory.find(player);
    if (found == nullptr) {
        return std::nullopt;
    }
    return *found;
}

std::optional<Request> CatchGame::request(RequestId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_requests.find(id);
    if (it == m_requests.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<RequestState> CatchGame::request_state(RequestId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_requests.find(id);
    if (it == m_requests.end()) {
        return Err<RequestState>(Error(GameError::request_not_found(id.value)));
    }
    if (it->second.is_fulfilled) {
        return Ok(RequestState::Fulfilled);
    }
    auto record = m_oracle.record(it->second.seed);
    if (record && record->fulfilled_randomness()) {
        return Ok(RequestState::Ready);
    }
    return Ok(RequestState::Pending);
}

std::vector<Request> CatchGame::pending_requests() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Request> pending;
    for (const auto& [id, request] : m_requests) {
        if (!request.is_fulfilled) {
            pending.push_back(request);
        }
    }
    return pending;
}

std::vector<OwedAward> CatchGame::owed_awards() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_owed;
}

std::uint64_t CatchGame::treasury_balance() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_config.treasury) {
        return 0;
    }
    return m_currency.balance(m_config.treasury);
}

} // namespace critter_game
