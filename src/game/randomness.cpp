/// @file randomness.cpp
/// @brief Randomness derivation for critter_game module

#include <critter_engine/game/randomness.hpp>

namespace critter_game {

namespace {

std::uint16_t reduce_coordinate(std::uint16_t raw, std::uint16_t max_coordinate) {
    std::uint32_t modulus = static_cast<std::uint32_t>(max_coordinate) + 1;
    return static_cast<std::uint16_t>(raw % modulus);
}

} // anonymous namespace

std::uint16_t read_u16_le(const RandomnessBlob& blob, std::size_t offset) {
    return static_cast<std::uint16_t>(
        static_cast<std::uint16_t>(blob[offset]) |
        static_cast<std::uint16_t>(blob[offset + 1] << 8));
}

std::uint64_t read_u64_le(const RandomnessBlob& blob, std::size_t offset) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        value |= static_cast<std::uint64_t>(blob[offset + i]) << (8 * i);
    }
    return value;
}

Position derive_spawn_position(const RandomnessBlob& blob, std::uint16_t max_coordinate) {
    return Position{
        reduce_coordinate(read_u16_le(blob, ranges::SPAWN_X.offset), max_coordinate),
        reduce_coordinate(read_u16_le(blob, ranges::SPAWN_Y.offset), max_coordinate),
    };
}

std::uint8_t derive_catch_roll(const RandomnessBlob& blob) {
    return static_cast<std::uint8_t>(read_u64_le(blob, ranges::CATCH_ROLL.offset) % 100);
}

std::optional<std::size_t> derive_pool_index(const RandomnessBlob& blob, std::size_t count) {
    if (count == 0) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(read_u64_le(blob, ranges::POOL_SELECTION.offset) % count);
}

Position derive_relocation_position(const RandomnessBlob& blob, std::uint16_t max_coordinate) {
    return Position{
        reduce_coordinate(read_u16_le(blob, ranges::RELOCATE_X.offset), max_coordinate),
        reduce_coordinate(read_u16_le(blob, ranges::RELOCATE_Y.offset), max_coordinate),
    };
}

ThrowDraw derive_throw_draw(
    const RandomnessBlob& blob,
    std::uint8_t catch_rate,
    std::size_t pool_count,
    std::uint16_t max_coordinate)
{
    ThrowDraw draw;
    draw.roll = derive_catch_roll(blob);
    draw.caught = is_caught(draw.roll, catch_rate);
    draw.pool_index = derive_pool_index(blob, pool_count);
    draw.relocation = derive_relocation_position(blob, max_coordinate);
    return draw;
}

} // namespace critter_game
