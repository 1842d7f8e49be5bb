/// @file oracle.cpp
/// @brief MemoryOracle implementation

#include <critter_engine/game/oracle.hpp>
#include <critter_engine/core/log.hpp>

namespace critter_game {

using critter_core::CollaboratorError;
using critter_core::Err;
using critter_core::Error;
using critter_core::ErrorCode;
using critter_core::Ok;
using critter_core::Result;

RandomnessBlob random_blob(std::mt19937_64& rng) {
    RandomnessBlob blob{};
    for (std::size_t i = 0; i < blob.size(); i += 8) {
        std::uint64_t word = rng();
        for (std::size_t b = 0; b < 8; ++b) {
            blob[i + b] = static_cast<std::uint8_t>((word >> (8 * b)) & 0xFF);
        }
    }
    return blob;
}

Result<void> MemoryOracle::request(const RequestSeed& seed) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_rejecting) {
        return Err(Error(CollaboratorError::oracle_rejected(name(), "oracle is not accepting requests")));
    }
    if (m_records.count(seed) != 0) {
        return Err(Error(CollaboratorError::oracle_rejected(name(), "seed already requested: " + seed_to_hex(seed))));
    }

    m_records.emplace(seed, RandomnessRecord{seed, std::nullopt});
    m_order.push_back(seed);
    return Ok();
}

std::optional<RandomnessRecord> MemoryOracle::record(const RequestSeed& seed) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(seed);
    if (it == m_records.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<void> MemoryOracle::fulfill(const RequestSeed& seed, const RandomnessBlob& blob) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_records.find(seed);
    if (it == m_records.end()) {
        return Err(Error(ErrorCode::NotFound, "No randomness request for seed " + seed_to_hex(seed)));
    }
    if (it->second.randomness) {
        return Err(Error(ErrorCode::AlreadyExists, "Randomness already published for seed " + seed_to_hex(seed)));
    }

    it->second.randomness = blob;
    critter_core::oracle_logger()->debug("Published randomness for seed {}", seed_to_hex(seed));
    return Ok();
}

std::size_t MemoryOracle::fulfill_all(std::mt19937_64& rng) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::size_t fulfilled = 0;
    for (const auto& seed : m_order) {
        auto& record = m_records[seed];
        if (!record.randomness) {
            record.randomness = random_blob(rng);
            ++fulfilled;
        }
    }
    return fulfilled;
}

std::vector<RequestSeed> MemoryOracle::pending_seeds() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<RequestSeed> pending;
    for (const auto& seed : m_order) {
        auto it = m_records.find(seed);
        if (it != m_records.end() && !it->second.randomness) {
            pending.push_back(seed);
        }
    }
    return pending;
}

void MemoryOracle::set_rejecting(bool rejecting) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_rejecting = rejecting;
}

std::size_t MemoryOracle::request_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_order.size();
}

} // namespace critter_game
