#pragma once

/// @file log.hpp
/// @brief Subsystem logging for critter_engine
///
/// The game writes to three named spdlog loggers that share one sink set:
/// - "critter_game": slot transitions, purchases, admin changes
/// - "vault": deposits, withdrawals, awards and owed-award reconciliation
/// - "oracle": randomness requests and publication

#include <spdlog/spdlog.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace critter_core {

// =============================================================================
// Subsystems
// =============================================================================

enum class Subsystem : std::uint8_t {
    Game,
    Vault,
    Oracle
};

/// spdlog registry name of a subsystem logger
[[nodiscard]] const char* subsystem_logger_name(Subsystem subsystem);

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    std::string log_file;                          ///< Rotating file shared by all subsystems (empty = none)
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
    std::map<Subsystem, spdlog::level::level_enum> subsystem_levels;  ///< Overrides of `level`
    std::vector<spdlog::sink_ptr> extra_sinks;     ///< Attached to every subsystem logger
};

/// Apply a configuration; existing subsystem loggers are replaced by new ones
/// built over the new sinks, and loggers already handed out stay unchanged
void configure_logging(const LogConfig& config);

/// Console-only defaults for the default spdlog logger
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Subsystem Loggers
// =============================================================================

[[nodiscard]] std::shared_ptr<spdlog::logger> subsystem_logger(Subsystem subsystem);

[[nodiscard]] std::shared_ptr<spdlog::logger> game_logger();
[[nodiscard]] std::shared_ptr<spdlog::logger> vault_logger();
[[nodiscard]] std::shared_ptr<spdlog::logger> oracle_logger();

/// Change one subsystem's level without touching the others
void set_subsystem_level(Subsystem subsystem, spdlog::level::level_enum level);

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// Traces entry and exit of a scope with its duration
class LogScope {
public:
    explicit LogScope(const std::string& name, Subsystem subsystem = Subsystem::Game);
    ~LogScope();

    // Non-copyable, non-movable
    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define CRITTER_LOG_SCOPE(name) ::critter_core::LogScope critter_log_scope_(name)

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Flush and drop the subsystem loggers
void shutdown_logging();

} // namespace critter_core
