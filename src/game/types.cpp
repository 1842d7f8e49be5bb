/// @file types.cpp
/// @brief Type helpers for critter_game module

#include <critter_engine/game/types.hpp>

#include <algorithm>

namespace critter_game {

const char* item_tier_name(ItemTier tier) {
    switch (tier) {
        case ItemTier::Basic: return "Basic";
        case ItemTier::Great: return "Great";
        case ItemTier::Ultra: return "Ultra";
        case ItemTier::Master: return "Master";
        default: return "Unknown";
    }
}

const char* request_kind_name(RequestKind kind) {
    switch (kind) {
        case RequestKind::Spawn: return "Spawn";
        case RequestKind::Throw: return "Throw";
        default: return "Unknown";
    }
}

const char* request_state_name(RequestState state) {
    switch (state) {
        case RequestState::Pending: return "Pending";
        case RequestState::Ready: return "Ready";
        case RequestState::Fulfilled: return "Fulfilled";
        default: return "Unknown";
    }
}

const char* owed_reason_name(OwedReason reason) {
    switch (reason) {
        case OwedReason::TransferDataMissing: return "TransferDataMissing";
        case OwedReason::TransferFailed: return "TransferFailed";
        default: return "Unknown";
    }
}

// Layout: [0..8) sequence LE, [8] kind, [24..32) tag. Everything else zero.
RequestSeed make_request_seed(std::uint64_t sequence, RequestKind kind) {
    RequestSeed seed{};
    for (std::size_t i = 0; i < 8; ++i) {
        seed[i] = static_cast<std::uint8_t>((sequence >> (8 * i)) & 0xFF);
    }
    seed[8] = static_cast<std::uint8_t>(kind);
    std::copy(SEED_TAG.begin(), SEED_TAG.end(), seed.begin() + 24);
    return seed;
}

std::string seed_to_hex(const RequestSeed& seed) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(seed.size() * 2);
    for (std::uint8_t byte : seed) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0F]);
    }
    return out;
}

} // namespace critter_game
