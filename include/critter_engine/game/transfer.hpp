#pragma once

/// @file transfer.hpp
/// @brief Asset custody transfer interface and in-memory implementation

#include "types.hpp"

#include <critter_engine/core/error.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace critter_game {

/// Follow-up data naming where one asset moves from and to
struct TransferAccounts {
    AssetId asset;
    PlayerId source;
    PlayerId destination;
};

// =============================================================================
// IAssetTransfer
// =============================================================================

/// External custody-transfer subsystem for collectibles
class IAssetTransfer {
public:
    virtual ~IAssetTransfer() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    /// Move quantity units of accounts.asset from source to destination
    [[nodiscard]] virtual critter_core::Result<void> transfer(
        const TransferAccounts& accounts,
        std::uint32_t quantity) = 0;
};

// =============================================================================
// MemoryAssetLedger
// =============================================================================

/// Single-owner asset registry kept in process memory
class MemoryAssetLedger : public IAssetTransfer {
public:
    MemoryAssetLedger() = default;

    [[nodiscard]] std::string name() const override { return "memory_assets"; }

    [[nodiscard]] critter_core::Result<void> transfer(
        const TransferAccounts& accounts,
        std::uint32_t quantity) override;

    /// Create an asset owned by owner
    [[nodiscard]] critter_core::Result<void> mint(AssetId asset, PlayerId owner);

    [[nodiscard]] std::optional<PlayerId> owner_of(AssetId asset) const;

    /// Make every transfer of asset fail until cleared
    void block(AssetId asset);
    void unblock(AssetId asset);

    /// Successful transfers so far
    [[nodiscard]] std::uint64_t transfer_count() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<AssetId, PlayerId> m_owners;
    std::unordered_set<AssetId> m_blocked;
    std::uint64_t m_transfer_count = 0;
};

} // namespace critter_game
