/// @file transfer.cpp
/// @brief MemoryAssetLedger implementation

#include <critter_engine/game/transfer.hpp>

namespace critter_game {

using critter_core::CollaboratorError;
using critter_core::Err;
using critter_core::Error;
using critter_core::ErrorCode;
using critter_core::Ok;
using critter_core::Result;

Result<void> MemoryAssetLedger::transfer(const TransferAccounts& accounts, std::uint32_t quantity) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (quantity != 1) {
        return Err(Error(CollaboratorError::transfer_failed(name(),
            "collectibles move one unit at a time, got " + std::to_string(quantity))));
    }
    if (!accounts.destination) {
        return Err(Error(CollaboratorError::transfer_failed(name(), "missing destination account")));
    }
    if (m_blocked.count(accounts.asset) != 0) {
        return Err(Error(CollaboratorError::transfer_failed(name(),
            "asset " + std::to_string(accounts.asset.value) + " is frozen")));
    }

    auto it = m_owners.find(accounts.asset);
    if (it == m_owners.end()) {
        return Err(Error(CollaboratorError::transfer_failed(name(),
            "unknown asset " + std::to_string(accounts.asset.value))));
    }
    if (it->second != accounts.source) {
        return Err(Error(CollaboratorError::transfer_failed(name(),
            "source " + std::to_string(accounts.source.value) + " does not hold asset " +
            std::to_string(accounts.asset.value))));
    }

    it->second = accounts.destination;
    ++m_transfer_count;
    return Ok();
}

Result<void> MemoryAssetLedger::mint(AssetId asset, PlayerId owner) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!asset || !owner) {
        return Err(Error(ErrorCode::InvalidArgument, "Asset and owner must be non-default"));
    }
    if (!m_owners.emplace(asset, owner).second) {
        return Err(Error(ErrorCode::AlreadyExists, "Asset " + std::to_string(asset.value) + " already minted"));
    }
    return Ok();
}

std::optional<PlayerId> MemoryAssetLedger::owner_of(AssetId asset) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_owners.find(asset);
    if (it == m_owners.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryAssetLedger::block(AssetId asset) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_blocked.insert(asset);
}

void MemoryAssetLedger::unblock(AssetId asset) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_blocked.erase(asset);
}

std::uint64_t MemoryAssetLedger::transfer_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_transfer_count;
}

} // namespace critter_game
