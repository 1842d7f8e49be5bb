#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for critter_core module

#include <cstdint>

namespace critter_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct GameError;
struct CollaboratorError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

enum class Subsystem : std::uint8_t;
struct LogConfig;
class LogScope;

} // namespace critter_core
