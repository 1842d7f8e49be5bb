/// @file ledger.cpp
/// @brief Currency and inventory ledger implementation

#include <critter_engine/game/ledger.hpp>

#include <algorithm>

namespace critter_game {

using critter_core::CollaboratorError;
using critter_core::Err;
using critter_core::Error;
using critter_core::ErrorCode;
using critter_core::GameError;
using critter_core::Ok;
using critter_core::Result;

// =============================================================================
// MemoryCurrencyLedger
// =============================================================================

std::uint64_t MemoryCurrencyLedger::balance(PlayerId account) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_balances.find(account);
    return it != m_balances.end() ? it->second : 0;
}

Result<void> MemoryCurrencyLedger::transfer(PlayerId from, PlayerId to, std::uint64_t amount) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!from || !to) {
        return Err(Error(CollaboratorError::currency_failed(name(), "missing account")));
    }

    std::uint64_t available = 0;
    if (auto it = m_balances.find(from); it != m_balances.end()) {
        available = it->second;
    }
    if (available < amount) {
        return Err(Error(CollaboratorError::currency_failed(name(),
            "account " + std::to_string(from.value) + " holds " + std::to_string(available) +
            ", needs " + std::to_string(amount))));
    }

    if (from == to) {
        return Ok();
    }

    auto credited = checked_add<std::uint64_t>(m_balances[to], amount);
    if (!credited) {
        return Err(Error(CollaboratorError::currency_failed(name(), "balance overflow")));
    }

    m_balances[from] = available - amount;
    m_balances[to] = *credited;
    return Ok();
}

Result<void> MemoryCurrencyLedger::credit(PlayerId account, std::uint64_t amount) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!account) {
        return Err(Error(ErrorCode::InvalidArgument, "Cannot credit the default account"));
    }
    auto credited = checked_add<std::uint64_t>(m_balances[account], amount);
    if (!credited) {
        return Err(Error(GameError::math_overflow("currency balance")));
    }
    m_balances[account] = *credited;
    return Ok();
}

// =============================================================================
// InventoryLedger
// =============================================================================

namespace {

std::size_t tier_index(ItemTier tier) {
    return static_cast<std::size_t>(tier);
}

} // anonymous namespace

const PlayerInventory* InventoryLedger::find(PlayerId player) const {
    auto it = m_inventories.find(player);
    return it != m_inventories.end() ? &it->second : nullptr;
}

std::uint32_t InventoryLedger::balance(PlayerId player, ItemTier tier) const {
    const PlayerInventory* inventory = find(player);
    return inventory != nullptr ? inventory->items[tier_index(tier)] : 0;
}

Result<void> InventoryLedger::can_credit(PlayerId player, ItemTier tier, std::uint32_t quantity) const {
    if (quantity == 0) {
        return Err(Error(GameError::zero_quantity()));
    }
    const PlayerInventory* inventory = find(player);
    if (inventory == nullptr) {
        return Ok();
    }
    if (!checked_add<std::uint32_t>(inventory->items[tier_index(tier)], quantity)) {
        return Err(Error(GameError::math_overflow("item balance")));
    }
    if (!checked_add<std::uint64_t>(inventory->total_purchased, quantity)) {
        return Err(Error(GameError::math_overflow("total purchased")));
    }
    return Ok();
}

Result<void> InventoryLedger::credit(PlayerId player, ItemTier tier, std::uint32_t quantity) {
    auto check = can_credit(player, tier, quantity);
    if (!check) {
        return check;
    }

    auto [it, inserted] = m_inventories.try_emplace(player);
    PlayerInventory& inventory = it->second;
    if (inserted) {
        inventory.player = player;
    }
    inventory.items[tier_index(tier)] += quantity;
    inventory.total_purchased += quantity;
    return Ok();
}

Result<void> InventoryLedger::can_throw(PlayerId player, ItemTier tier) const {
    const PlayerInventory* inventory = find(player);
    if (inventory == nullptr || inventory->items[tier_index(tier)] == 0) {
        return Err(Error(GameError::insufficient_items(static_cast<std::uint32_t>(tier))));
    }
    if (!checked_add<std::uint64_t>(inventory->total_throws, 1)) {
        return Err(Error(GameError::math_overflow("total throws")));
    }
    return Ok();
}

Result<void> InventoryLedger::debit(PlayerId player, ItemTier tier, std::uint32_t quantity) {
    auto it = m_inventories.find(player);
    if (it == m_inventories.end() || it->second.items[tier_index(tier)] < quantity) {
        return Err(Error(GameError::insufficient_items(static_cast<std::uint32_t>(tier))));
    }
    it->second.items[tier_index(tier)] -= quantity;
    return Ok();
}

Result<void> InventoryLedger::record_throw(PlayerId player, ItemTier tier) {
    auto check = can_throw(player, tier);
    if (!check) {
        return check;
    }
    PlayerInventory& inventory = m_inventories.at(player);
    inventory.items[tier_index(tier)] -= 1;
    inventory.total_throws += 1;
    return Ok();
}

Result<void> InventoryLedger::record_catch(PlayerId player) {
    auto [it, inserted] = m_inventories.try_emplace(player);
    PlayerInventory& inventory = it->second;
    if (inserted) {
        inventory.player = player;
    }
    auto catches = checked_add<std::uint64_t>(inventory.total_catches, 1);
    if (!catches) {
        return Err(Error(GameError::math_overflow("total catches")));
    }
    inventory.total_catches = *catches;
    return Ok();
}

std::vector<PlayerInventory> InventoryLedger::all() const {
    std::vector<PlayerInventory> result;
    result.reserve(m_inventories.size());
    for (const auto& [player, inventory] : m_inventories) {
        result.push_back(inventory);
    }
    std::sort(result.begin(), result.end(), [](const PlayerInventory& a, const PlayerInventory& b) {
        return a.player < b.player;
    });
    return result;
}

} // namespace critter_game
