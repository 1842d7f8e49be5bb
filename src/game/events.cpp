/// @file events.cpp
/// @brief Game event formatting

#include <critter_engine/game/events.hpp>

#include <sstream>
#include <type_traits>

namespace critter_game {

const char* relocation_reason_name(RelocationReason reason) {
    switch (reason) {
        case RelocationReason::Admin: return "Admin";
        case RelocationReason::Exhausted: return "Exhausted";
        default: return "Unknown";
    }
}

const char* event_name(const GameEvent& event) {
    return std::visit([](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, GameInitialized>) return "GameInitialized";
        else if constexpr (std::is_same_v<T, ItemPriceUpdated>) return "ItemPriceUpdated";
        else if constexpr (std::is_same_v<T, CatchRateUpdated>) return "CatchRateUpdated";
        else if constexpr (std::is_same_v<T, MaxActiveUpdated>) return "MaxActiveUpdated";
        else if constexpr (std::is_same_v<T, RevenueWithdrawn>) return "RevenueWithdrawn";
        else if constexpr (std::is_same_v<T, ItemsPurchased>) return "ItemsPurchased";
        else if constexpr (std::is_same_v<T, SpawnRequested>) return "SpawnRequested";
        else if constexpr (std::is_same_v<T, SpawnSkipped>) return "SpawnSkipped";
        else if constexpr (std::is_same_v<T, ThrowAttempted>) return "ThrowAttempted";
        else if constexpr (std::is_same_v<T, ThrowVoided>) return "ThrowVoided";
        else if constexpr (std::is_same_v<T, CreatureSpawned>) return "CreatureSpawned";
        else if constexpr (std::is_same_v<T, CreatureRelocated>) return "CreatureRelocated";
        else if constexpr (std::is_same_v<T, CreatureDespawned>) return "CreatureDespawned";
        else if constexpr (std::is_same_v<T, CreatureCaught>) return "CreatureCaught";
        else if constexpr (std::is_same_v<T, CatchFailed>) return "CatchFailed";
        else if constexpr (std::is_same_v<T, AssetAwarded>) return "AssetAwarded";
        else if constexpr (std::is_same_v<T, AwardPendingReconciliation>) return "AwardPendingReconciliation";
        else if constexpr (std::is_same_v<T, OwedAwardSettled>) return "OwedAwardSettled";
        else if constexpr (std::is_same_v<T, AssetDeposited>) return "AssetDeposited";
        else if constexpr (std::is_same_v<T, AssetWithdrawn>) return "AssetWithdrawn";
        else return "Unknown";
    }, event);
}

namespace {

std::string position_text(const Position& p) {
    return "(" + std::to_string(p.x) + ", " + std::to_string(p.y) + ")";
}

} // anonymous namespace

std::string format_game_event(const GameEvent& event) {
    std::ostringstream ss;
    ss << event_name(event) << " { ";

    std::visit([&ss](const auto& e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, GameInitialized>) {
            ss << "authority: " << e.authority.value << ", max_active: " << static_cast<int>(e.max_active);
        } else if constexpr (std::is_same_v<T, ItemPriceUpdated>) {
            ss << "tier: " << item_tier_name(e.tier) << ", price: " << e.old_price << " -> " << e.new_price;
        } else if constexpr (std::is_same_v<T, CatchRateUpdated>) {
            ss << "tier: " << item_tier_name(e.tier) << ", rate: " << static_cast<int>(e.old_rate)
               << " -> " << static_cast<int>(e.new_rate);
        } else if constexpr (std::is_same_v<T, MaxActiveUpdated>) {
            ss << "max_active: " << static_cast<int>(e.old_max) << " -> " << static_cast<int>(e.new_max);
        } else if constexpr (std::is_same_v<T, RevenueWithdrawn>) {
            ss << "recipient: " << e.recipient.value << ", amount: " << e.amount;
        } else if constexpr (std::is_same_v<T, ItemsPurchased>) {
            ss << "buyer: " << e.buyer.value << ", tier: " << item_tier_name(e.tier)
               << ", quantity: " << e.quantity << ", cost: " << e.total_cost;
        } else if constexpr (std::is_same_v<T, SpawnRequested> || std::is_same_v<T, SpawnSkipped>) {
            ss << "request: " << e.request.value << ", slot: " << static_cast<int>(e.slot_index);
        } else if constexpr (std::is_same_v<T, ThrowAttempted>) {
            ss << "request: " << e.request.value << ", thrower: " << e.thrower.value
               << ", creature: " << e.creature_id << ", slot: " << static_cast<int>(e.slot_index)
               << ", tier: " << item_tier_name(e.tier);
        } else if constexpr (std::is_same_v<T, ThrowVoided>) {
            ss << "request: " << e.request.value << ", thrower: " << e.thrower.value
               << ", creature: " << e.creature_id << ", slot: " << static_cast<int>(e.slot_index);
        } else if constexpr (std::is_same_v<T, CreatureSpawned>) {
            ss << "creature: " << e.creature_id << ", slot: " << static_cast<int>(e.slot_index)
               << ", at: " << position_text(e.position);
        } else if constexpr (std::is_same_v<T, CreatureRelocated>) {
            ss << "creature: " << e.creature_id << ", slot: " << static_cast<int>(e.slot_index)
               << ", " << position_text(e.from) << " -> " << position_text(e.to) << ", reason: " << relocation_reason_name(e.reason);
        } else if constexpr (std::is_same_v<T, CreatureDespawned>) {
            ss << "creature: " << e.creature_id << ", slot: " << static_cast<int>(e.slot_index);
        } else if constexpr (std::is_same_v<T, CreatureCaught>) {
            ss << "catcher: " << e.catcher.value << ", creature: " << e.creature_id
               << ", slot: " << static_cast<int>(e.slot_index) << ", asset: ";
            if (e.asset) {
                ss << e.asset.value;
            } else {
                ss << "none";
            }
        } else if constexpr (std::is_same_v<T, CatchFailed>) {
            ss << "thrower: " << e.thrower.value << ", creature: " << e.creature_id
               << ", slot: " << static_cast<int>(e.slot_index)
               << ", attempts_remaining: " << static_cast<int>(e.attempts_remaining);
        } else if constexpr (std::is_same_v<T, AssetAwarded>) {
            ss << "winner: " << e.winner.value << ", asset: " << e.asset.value
               << ", vault_remaining: " << e.vault_remaining;
        } else if constexpr (std::is_same_v<T, AwardPendingReconciliation>) {
            ss << "winner: " << e.winner.value << ", asset: " << e.asset.value
               << ", request: " << e.request.value << ", reason: " << owed_reason_name(e.reason);
        } else if constexpr (std::is_same_v<T, OwedAwardSettled>) {
            ss << "winner: " << e.winner.value << ", asset: " << e.asset.value;
        } else if constexpr (std::is_same_v<T, AssetDeposited> || std::is_same_v<T, AssetWithdrawn>) {
            ss << "asset: " << e.asset.value << ", vault_count: " << e.vault_count;
        }
    }, event);

    ss << " }";
    return ss.str();
}

} // namespace critter_game
