#pragma once

/// @file oracle.hpp
/// @brief Randomness oracle interface and in-memory implementation
///
/// The oracle is asked for randomness tied to a request seed, and publishes
/// a 64-byte blob for that seed at some later time. How the blob is produced
/// or proven is outside this library.

#include "types.hpp"

#include <critter_engine/core/error.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace critter_game {

/// Oracle-side record addressed by a request seed
struct RandomnessRecord {
    RequestSeed seed{};
    std::optional<RandomnessBlob> randomness;

    /// Published randomness, nullopt until the oracle answers
    [[nodiscard]] std::optional<RandomnessBlob> fulfilled_randomness() const { return randomness; }
};

// =============================================================================
// IRandomnessOracle
// =============================================================================

/// External verifiable-randomness provider
class IRandomnessOracle {
public:
    virtual ~IRandomnessOracle() = default;

    /// Oracle name for logs and error payloads
    [[nodiscard]] virtual std::string name() const = 0;

    /// Ask for randomness tied to seed
    [[nodiscard]] virtual critter_core::Result<void> request(const RequestSeed& seed) = 0;

    /// Look up the record for seed
    /// @return nullopt if the seed was never requested
    [[nodiscard]] virtual std::optional<RandomnessRecord> record(const RequestSeed& seed) const = 0;
};

// =============================================================================
// MemoryOracle
// =============================================================================

/// Oracle kept in process memory, fulfilled explicitly by the host
///
/// Thread-safe: tests fulfill seeds from other threads while the game
/// consumes.
class MemoryOracle : public IRandomnessOracle {
public:
    MemoryOracle() = default;

    [[nodiscard]] std::string name() const override { return "memory_oracle"; }

    [[nodiscard]] critter_core::Result<void> request(const RequestSeed& seed) override;

    [[nodiscard]] std::optional<RandomnessRecord> record(const RequestSeed& seed) const override;

    /// Publish randomness for a requested seed
    [[nodiscard]] critter_core::Result<void> fulfill(const RequestSeed& seed, const RandomnessBlob& blob);

    /// Publish PRNG output for every unanswered seed
    /// @return Number of seeds fulfilled
    std::size_t fulfill_all(std::mt19937_64& rng);

    /// Seeds requested but not yet fulfilled, in request order
    [[nodiscard]] std::vector<RequestSeed> pending_seeds() const;

    /// Make subsequent request() calls fail
    void set_rejecting(bool rejecting);

    [[nodiscard]] std::size_t request_count() const;

private:
    mutable std::mutex m_mutex;
    std::map<RequestSeed, RandomnessRecord> m_records;
    std::vector<RequestSeed> m_order;
    bool m_rejecting = false;
};

/// Fill a blob from a PRNG
[[nodiscard]] RandomnessBlob random_blob(std::mt19937_64& rng);

} // namespace critter_game
