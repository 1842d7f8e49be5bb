#pragma once

/// @file core.hpp
/// @brief Main include file for critter_core module

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"

/// @namespace critter_core
/// @brief Foundational types shared by every critter_engine module
///
/// - **Error Handling**: Result<T> with categorized Error payloads
/// - **Logging**: spdlog subsystem loggers sharing one sink set
///
/// Example usage:
/// @code
/// #include <critter_engine/core/core.hpp>
///
/// using namespace critter_core;
///
/// Result<std::uint32_t> checked_tier(std::uint32_t tier) {
///     if (tier >= 4) {
///         return Err<std::uint32_t>(Error(GameError::invalid_tier(tier)));
///     }
///     return Ok(tier);
/// }
/// @endcode

namespace critter_core {

/// Library version string
[[nodiscard]] inline const char* critter_core_version_string() {
    return "critter_core 0.1.0";
}

} // namespace critter_core
