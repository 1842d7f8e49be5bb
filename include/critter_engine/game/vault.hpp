#pragma once

/// @file vault.hpp
/// @brief Bounded pool of collectible asset identifiers

#include "types.hpp"

#include <critter_engine/core/error.hpp>
#include <critter_engine/structures/fixed_pool.hpp>

#include <cstddef>
#include <optional>
#include <span>

namespace critter_game {

/// Unordered pool of distinct, non-default asset ids
///
/// Removal swaps the last live entry into the hole, so indices are not
/// stable across removals.
class Vault {
public:
    /// Create a vault with a capacity at most MAX_VAULT_SIZE
    explicit Vault(std::size_t max_size = MAX_VAULT_SIZE) : m_pool(max_size) {}

    /// Append an asset
    /// @return Index the asset was stored at
    critter_core::Result<std::size_t> deposit(AssetId asset);

    /// Swap-remove the asset at index
    /// @return The removed asset
    critter_core::Result<AssetId> remove(std::size_t index);

    /// Swap-remove a specific asset
    critter_core::Result<AssetId> remove_asset(AssetId asset);

    [[nodiscard]] std::optional<std::size_t> find(AssetId asset) const { return m_pool.find(asset); }
    [[nodiscard]] bool contains(AssetId asset) const { return m_pool.contains(asset); }

    [[nodiscard]] std::size_t count() const noexcept { return m_pool.size(); }
    [[nodiscard]] std::size_t max_size() const noexcept { return m_pool.max_size(); }
    [[nodiscard]] bool empty() const noexcept { return m_pool.empty(); }
    [[nodiscard]] bool full() const noexcept { return m_pool.full(); }

    /// Live assets, in storage order
    [[nodiscard]] std::span<const AssetId> assets() const noexcept { return m_pool.values(); }

    /// Entry at any storage position, including the default tail
    [[nodiscard]] AssetId entry(std::size_t index) const { return m_pool.raw(index); }

    /// Check the storage invariant: live entries distinct and non-default,
    /// tail entries default
    [[nodiscard]] bool is_consistent() const;

private:
    critter_structures::FixedPool<AssetId, MAX_VAULT_SIZE> m_pool;
};

} // namespace critter_game
