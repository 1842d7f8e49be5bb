#pragma once

/// @file error.hpp
/// @brief Error handling types for critter_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace critter_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    NotReady,
    Overflow,
    CapacityExceeded,
    InsufficientBalance,
    PermissionDenied,
    External,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::NotReady: return "NotReady";
        case ErrorCode::Overflow: return "Overflow";
        case ErrorCode::CapacityExceeded: return "CapacityExceeded";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::External: return "External";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Game rule violations. Every kind except MathOverflow is a precondition
/// failure reported before any state is touched.
struct GameError {
    enum class Kind : std::uint8_t {
        NotInitialized,
        AlreadyInitialized,
        Unauthorized,
        InvalidTier,
        InvalidCatchRate,
        ZeroPrice,
        InvalidMaxActive,
        InvalidSlotIndex,
        InvalidCoordinate,
        SlotOccupied,
        SlotNotActive,
        MaxActiveReached,
        MaxAttemptsReached,
        InsufficientItems,
        InsufficientFunds,
        ZeroQuantity,
        PurchaseExceedsMax,
        VaultFull,
        VaultEmpty,
        InvalidVaultIndex,
        AssetNotInVault,
        DuplicateAsset,
        RequestNotFound,
        AlreadyFulfilled,
        NotReady,
        InvalidWithdrawal,
        MathOverflow,
    };

    Kind kind;
    std::string message;

    [[nodiscard]] static GameError not_initialized() {
        return GameError{Kind::NotInitialized, "Game has not been initialized"};
    }

    [[nodiscard]] static GameError already_initialized() {
        return GameError{Kind::AlreadyInitialized, "Game has already been initialized"};
    }

    [[nodiscard]] static GameError unauthorized(const std::string& operation) {
        return GameError{Kind::Unauthorized, "Only the authority may call " + operation};
    }

    [[nodiscard]] static GameError invalid_tier(std::uint32_t tier) {
        return GameError{Kind::InvalidTier, "Invalid item tier: " + std::to_string(tier)};
    }

    [[nodiscard]] static GameError invalid_catch_rate(std::uint32_t rate) {
        return GameError{Kind::InvalidCatchRate,
            "Catch rate must be 0-100, got " + std::to_string(rate)};
    }

    [[nodiscard]] static GameError zero_price(std::uint32_t tier) {
        return GameError{Kind::ZeroPrice, "Price for tier " + std::to_string(tier) + " must be > 0"};
    }

    [[nodiscard]] static GameError invalid_max_active(std::uint32_t value, std::uint32_t hard_cap) {
        return GameError{Kind::InvalidMaxActive,
            "Max active creatures must be 1-" + std::to_string(hard_cap) + ", got " + std::to_string(value)};
    }

    [[nodiscard]] static GameError invalid_slot_index(std::uint32_t index) {
        return GameError{Kind::InvalidSlotIndex, "Invalid slot index: " + std::to_string(index)};
    }

    [[nodiscard]] static GameError invalid_coordinate(std::uint32_t x, std::uint32_t y) {
        return GameError{Kind::InvalidCoordinate,
            "Coordinate out of range: (" + std::to_string(x) + ", " + std::to_string(y) + ")"};
    }

    [[nodiscard]] static GameError slot_occupied(std::uint32_t index) {
        return GameError{Kind::SlotOccupied, "Slot " + std::to_string(index) + " is already occupied"};
    }

    [[nodiscard]] static GameError slot_not_active(std::uint32_t index) {
        return GameError{Kind::SlotNotActive, "Slot " + std::to_string(index) + " is not active"};
    }

    [[nodiscard]] static GameError max_active_reached(std::uint32_t cap) {
        return GameError{Kind::MaxActiveReached,
            "Active creature limit reached (" + std::to_string(cap) + ")"};
    }

    [[nodiscard]] static GameError max_attempts_reached(std::uint32_t index) {
        return GameError{Kind::MaxAttemptsReached,
            "Creature in slot " + std::to_string(index) + " has no attempts left"};
    }

    [[nodiscard]] static GameError insufficient_items(std::uint32_t tier) {
        return GameError{Kind::InsufficientItems, "No items of tier " + std::to_string(tier) + " left"};
    }

    [[nodiscard]] static GameError insufficient_funds(std::uint64_t needed, std::uint64_t available) {
        return GameError{Kind::InsufficientFunds,
            "Insufficient funds: need " + std::to_string(needed) + ", have " + std::to_string(available)};
    }

    [[nodiscard]] static GameError zero_quantity() {
        return GameError{Kind::ZeroQuantity, "Quantity must be greater than 0"};
    }

    [[nodiscard]] static GameError purchase_exceeds_max(std::uint64_t cost, std::uint64_t limit) {
        return GameError{Kind::PurchaseExceedsMax,
            "Purchase cost " + std::to_string(cost) + " exceeds limit " + std::to_string(limit)};
    }

    [[nodiscard]] static GameError vault_full(std::uint32_t max_size) {
        return GameError{Kind::VaultFull, "Vault is full (max " + std::to_string(max_size) + ")"};
    }

    [[nodiscard]] static GameError vault_empty() {
        return GameError{Kind::VaultEmpty, "Vault is empty"};
    }

    [[nodiscard]] static GameError invalid_vault_index(std::uint32_t index, std::uint32_t count) {
        return GameError{Kind::InvalidVaultIndex,
            "Vault index " + std::to_string(index) + " out of range (count " + std::to_string(count) + ")"};
    }

    [[nodiscard]] static GameError asset_not_in_vault(std::uint64_t asset) {
        return GameError{Kind::AssetNotInVault, "Asset " + std::to_string(asset) + " is not in the vault"};
    }

    [[nodiscard]] static GameError duplicate_asset(std::uint64_t asset) {
        return GameError{Kind::DuplicateAsset, "Asset " + std::to_string(asset) + " is already in the vault"};
    }

    [[nodiscard]] static GameError request_not_found(std::uint64_t id) {
        return GameError{Kind::RequestNotFound, "Unknown request: " + std::to_string(id)};
    }

    [[nodiscard]] static GameError already_fulfilled(std::uint64_t id) {
        return GameError{Kind::AlreadyFulfilled, "Request " + std::to_string(id) + " has already been fulfilled"};
    }

    [[nodiscard]] static GameError not_ready(std::uint64_t id) {
        return GameError{Kind::NotReady, "Randomness for request " + std::to_string(id) + " is not yet fulfilled"};
    }

    [[nodiscard]] static GameError invalid_withdrawal(std::uint64_t amount, std::uint64_t available) {
        return GameError{Kind::InvalidWithdrawal,
            "Cannot withdraw " + std::to_string(amount) + " (available " + std::to_string(available) + ")"};
    }

    [[nodiscard]] static GameError math_overflow(const std::string& what) {
        return GameError{Kind::MathOverflow, "Numerical overflow in " + what};
    }
};

/// Failures reported by an external collaborator (oracle, asset transfer,
/// currency ledger)
struct CollaboratorError {
    enum class Kind : std::uint8_t {
        OracleRejected,     // Oracle refused the randomness request
        TransferFailed,     // Asset transfer subsystem refused the move
        CurrencyFailed,     // Currency ledger refused the move
    };

    Kind kind;
    std::string message;
    std::string collaborator;

    [[nodiscard]] static CollaboratorError oracle_rejected(const std::string& name, const std::string& reason) {
        return CollaboratorError{Kind::OracleRejected, "Oracle request rejected: " + reason, name};
    }

    [[nodiscard]] static CollaboratorError transfer_failed(const std::string& name, const std::string& reason) {
        return CollaboratorError{Kind::TransferFailed, "Asset transfer failed: " + reason, name};
    }

    [[nodiscard]] static CollaboratorError currency_failed(const std::string& name, const std::string& reason) {
        return CollaboratorError{Kind::CurrencyFailed, "Currency transfer failed: " + reason, name};
    }
};

/// Get game error kind name
[[nodiscard]] const char* game_error_kind_name(GameError::Kind kind);

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        GameError,
        CollaboratorError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(GameError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(CollaboratorError err) : m_code(ErrorCode::External), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// True when this is a GameError of the given kind
    [[nodiscard]] bool is_game(GameError::Kind kind) const {
        const auto* game = as<GameError>();
        return game != nullptr && game->kind == kind;
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(GameError::Kind kind) {
        switch (kind) {
            case GameError::Kind::NotInitialized: return ErrorCode::InvalidState;
            case GameError::Kind::AlreadyInitialized: return ErrorCode::AlreadyExists;
            case GameError::Kind::Unauthorized: return ErrorCode::PermissionDenied;
            case GameError::Kind::InvalidTier: return ErrorCode::InvalidArgument;
            case GameError::Kind::InvalidCatchRate: return ErrorCode::InvalidArgument;
            case GameError::Kind::ZeroPrice: return ErrorCode::InvalidArgument;
            case GameError::Kind::InvalidMaxActive: return ErrorCode::InvalidArgument;
            case GameError::Kind::InvalidSlotIndex: return ErrorCode::InvalidArgument;
            case GameError::Kind::InvalidCoordinate: return ErrorCode::InvalidArgument;
            case GameError::Kind::SlotOccupied: return ErrorCode::InvalidState;
            case GameError::Kind::SlotNotActive: return ErrorCode::InvalidState;
            case GameError::Kind::MaxActiveReached: return ErrorCode::CapacityExceeded;
            case GameError::Kind::MaxAttemptsReached: return ErrorCode::InvalidState;
            case GameError::Kind::InsufficientItems: return ErrorCode::InsufficientBalance;
            case GameError::Kind::InsufficientFunds: return ErrorCode::InsufficientBalance;
            case GameError::Kind::ZeroQuantity: return ErrorCode::InvalidArgument;
            case GameError::Kind::PurchaseExceedsMax: return ErrorCode::InvalidArgument;
            case GameError::Kind::VaultFull: return ErrorCode::CapacityExceeded;
            case GameError::Kind::VaultEmpty: return ErrorCode::InvalidState;
            case GameError::Kind::InvalidVaultIndex: return ErrorCode::InvalidArgument;
            case GameError::Kind::AssetNotInVault: return ErrorCode::NotFound;
            case GameError::Kind::DuplicateAsset: return ErrorCode::AlreadyExists;
            case GameError::Kind::RequestNotFound: return ErrorCode::NotFound;
            case GameError::Kind::AlreadyFulfilled: return ErrorCode::InvalidState;
            case GameError::Kind::NotReady: return ErrorCode::NotReady;
            case GameError::Kind::InvalidWithdrawal: return ErrorCode::InsufficientBalance;
            case GameError::Kind::MathOverflow: return ErrorCode::Overflow;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Get count of game rule violations
std::uint64_t game_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace critter_core
