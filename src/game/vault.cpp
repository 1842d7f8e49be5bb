/// @file vault.cpp
/// @brief Vault implementation

#include <critter_engine/game/vault.hpp>

#include <unordered_set>

namespace critter_game {

using critter_core::Err;
using critter_core::Error;
using critter_core::ErrorCode;
using critter_core::GameError;
using critter_core::Ok;
using critter_core::Result;

Result<std::size_t> Vault::deposit(AssetId asset) {
    if (!asset) {
        return Err<std::size_t>(Error(ErrorCode::InvalidArgument, "Cannot deposit the default asset id"));
    }
    if (m_pool.full()) {
        return Err<std::size_t>(Error(GameError::vault_full(static_cast<std::uint32_t>(m_pool.max_size()))));
    }
    if (m_pool.contains(asset)) {
        return Err<std::size_t>(Error(GameError::duplicate_asset(asset.value)));
    }

    auto index = m_pool.push(asset);
    if (!index) {
        return Err<std::size_t>(Error(GameError::vault_full(static_cast<std::uint32_t>(m_pool.max_size()))));
    }
    return Ok(*index);
}

Result<AssetId> Vault::remove(std::size_t index) {
    auto removed = m_pool.swap_remove(index);
    if (!removed) {
        return Err<AssetId>(Error(GameError::invalid_vault_index(
            static_cast<std::uint32_t>(index), static_cast<std::uint32_t>(m_pool.size()))));
    }
    return Ok(*removed);
}

Result<AssetId> Vault::remove_asset(AssetId asset) {
    auto index = m_pool.find(asset);
    if (!index) {
        return Err<AssetId>(Error(GameError::asset_not_in_vault(asset.value)));
    }
    return remove(*index);
}

bool Vault::is_consistent() const {
    std::unordered_set<AssetId> seen;
    for (AssetId asset : m_pool.values()) {
        if (!asset || !seen.insert(asset).second) {
            return false;
        }
    }
    for (std::size_t i = m_pool.size(); i < m_pool.capacity(); ++i) {
        if (m_pool.raw(i)) {
            return false;
        }
    }
    return true;
}

} // namespace critter_game
