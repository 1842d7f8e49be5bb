#pragma once

/// @file randomness.hpp
/// @brief Derivation of independent game outcomes from one oracle blob
///
/// Every decision reads its own byte range of the 64-byte blob, little-endian,
/// and reduces it modulo the range it needs:
///
/// | Decision            | Bytes       | Reduction               |
/// |---------------------|-------------|-------------------------|
/// | spawn x / y         | [0,2) [2,4) | mod (max_coordinate+1)  |
/// | catch roll          | [0,8)       | mod 100                 |
/// | pool selection      | [8,16)      | mod vault count         |
/// | relocation x / y    | [16,18) [18,20) | mod (max_coordinate+1) |
///
/// Spawn ranges overlap the catch roll, but a blob only ever resolves one
/// request kind. Within a throw (roll, selection, relocation) ranges are
/// disjoint.

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace critter_game {

/// @brief Half-open byte range of a randomness blob
struct ByteRange {
    std::size_t offset{0};
    std::size_t length{0};

    [[nodiscard]] constexpr std::size_t end() const { return offset + length; }

    [[nodiscard]] constexpr bool overlaps(const ByteRange& other) const {
        return offset < other.end() && other.offset < end();
    }
};

namespace ranges {
inline constexpr ByteRange SPAWN_X{0, 2};
inline constexpr ByteRange SPAWN_Y{2, 2};
inline constexpr ByteRange CATCH_ROLL{0, 8};
inline constexpr ByteRange POOL_SELECTION{8, 8};
inline constexpr ByteRange RELOCATE_X{16, 2};
inline constexpr ByteRange RELOCATE_Y{18, 2};
} // namespace ranges

/// @brief Read a little-endian u16 at offset
[[nodiscard]] std::uint16_t read_u16_le(const RandomnessBlob& blob, std::size_t offset);

/// @brief Read a little-endian u64 at offset
[[nodiscard]] std::uint64_t read_u64_le(const RandomnessBlob& blob, std::size_t offset);

/// @brief Position for a freshly spawned creature
[[nodiscard]] Position derive_spawn_position(const RandomnessBlob& blob, std::uint16_t max_coordinate);

/// @brief Catch roll in 0..=99
[[nodiscard]] std::uint8_t derive_catch_roll(const RandomnessBlob& blob);

/// @brief A throw catches iff the roll is strictly below the tier's rate
[[nodiscard]] inline bool is_caught(std::uint8_t roll, std::uint8_t catch_rate) {
    return roll < catch_rate;
}

/// @brief Vault index to award
/// @return nullopt when the pool is empty
[[nodiscard]] std::optional<std::size_t> derive_pool_index(const RandomnessBlob& blob, std::size_t count);

/// @brief New position for a creature that used up its attempts
[[nodiscard]] Position derive_relocation_position(const RandomnessBlob& blob, std::uint16_t max_coordinate);

/// @brief Everything a throw resolution can need, drawn in one pass
struct ThrowDraw {
    std::uint8_t roll{0};
    bool caught{false};
    std::optional<std::size_t> pool_index;
    Position relocation;
};

/// @brief Derive all throw outcomes for a tier rate and pool size
[[nodiscard]] ThrowDraw derive_throw_draw(
    const RandomnessBlob& blob,
    std::uint8_t catch_rate,
    std::size_t pool_count,
    std::uint16_t max_coordinate);

} // namespace critter_game
