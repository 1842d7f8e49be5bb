/// @file error.cpp
/// @brief Error handling implementation for critter_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Game error kind names
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities

#include <critter_engine/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace critter_core {

const char* game_error_kind_name(GameError::Kind kind) {
    switch (kind) {
        case GameError::Kind::NotInitialized: return "NotInitialized";
        case GameError::Kind::AlreadyInitialized: return "AlreadyInitialized";
        case GameError::Kind::Unauthorized: return "Unauthorized";
        case GameError::Kind::InvalidTier: return "InvalidTier";
        case GameError::Kind::InvalidCatchRate: return "InvalidCatchRate";
        case GameError::Kind::ZeroPrice: return "ZeroPrice";
        case GameError::Kind::InvalidMaxActive: return "InvalidMaxActive";
        case GameError::Kind::InvalidSlotIndex: return "InvalidSlotIndex";
        case GameError::Kind::InvalidCoordinate: return "InvalidCoordinate";
        case GameError::Kind::SlotOccupied: return "SlotOccupied";
        case GameError::Kind::SlotNotActive: return "SlotNotActive";
        case GameError::Kind::MaxActiveReached: return "MaxActiveReached";
        case GameError::Kind::MaxAttemptsReached: return "MaxAttemptsReached";
        case GameError::Kind::InsufficientItems: return "InsufficientItems";
        case GameError::Kind::InsufficientFunds: return "InsufficientFunds";
        case GameError::Kind::ZeroQuantity: return "ZeroQuantity";
        case GameError::Kind::PurchaseExceedsMax: return "PurchaseExceedsMax";
        case GameError::Kind::VaultFull: return "VaultFull";
        case GameError::Kind::VaultEmpty: return "VaultEmpty";
        case GameError::Kind::InvalidVaultIndex: return "InvalidVaultIndex";
        case GameError::Kind::AssetNotInVault: return "AssetNotInVault";
        case GameError::Kind::DuplicateAsset: return "DuplicateAsset";
        case GameError::Kind::RequestNotFound: return "RequestNotFound";
        case GameError::Kind::AlreadyFulfilled: return "AlreadyFulfilled";
        case GameError::Kind::NotReady: return "NotReady";
        case GameError::Kind::InvalidWithdrawal: return "InvalidWithdrawal";
        case GameError::Kind::MathOverflow: return "MathOverflow";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_game_error(const GameError& err) {
    std::ostringstream oss;
    oss << "[GameError:" << game_error_kind_name(err.kind) << "] " << err.message;
    return oss.str();
}

std::string format_collaborator_error(const CollaboratorError& err) {
    std::ostringstream oss;
    oss << "[CollaboratorError] " << err.message;

    if (!err.collaborator.empty()) {
        oss << " (collaborator: " << err.collaborator << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, GameError>) {
            oss << detail::format_game_error(err);
        } else if constexpr (std::is_same_v<T, CollaboratorError>) {
            oss << detail::format_collaborator_error(err);
        }
    }, error.variant());

    if (!error.context().empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : error.context()) {
            if (!first) oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint32_t, Error>;
template class Result<std::uint64_t, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> game_errors{0};
    std::atomic<std::uint64_t> collaborator_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<GameError>()) {
        s_error_stats.game_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<CollaboratorError>()) {
        s_error_stats.collaborator_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t game_error_count() {
    return s_error_stats.game_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.game_errors.store(0, std::memory_order_relaxed);
    s_error_stats.collaborator_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Game: " << s_error_stats.game_errors.load() << "\n"
        << "  Collaborator: " << s_error_stats.collaborator_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace critter_core
