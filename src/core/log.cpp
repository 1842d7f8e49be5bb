/// @file log.cpp
/// @brief Subsystem logging implementation

#include <critter_engine/core/log.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <mutex>

namespace critter_core {

namespace {

constexpr std::array<Subsystem, 3> ALL_SUBSYSTEMS = {Subsystem::Game, Subsystem::Vault, Subsystem::Oracle};

struct LoggerRegistry {
    std::mutex mutex;
    LogConfig config;
    std::vector<spdlog::sink_ptr> sinks;
    std::map<Subsystem, std::shared_ptr<spdlog::logger>> loggers;
    bool sinks_built = false;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

/// Build the shared sink set from the current config (registry lock held)
void rebuild_sinks(LoggerRegistry& reg) {
    reg.sinks.clear();

    if (reg.config.console_enabled) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        reg.sinks.push_back(console_sink);
    }

    if (!reg.config.log_file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                reg.config.log_file,
                reg.config.max_file_size,
                reg.config.max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            reg.sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file '{}': {}", reg.config.log_file, e.what());
        }
    }

    for (const auto& sink : reg.config.extra_sinks) {
        reg.sinks.push_back(sink);
    }
    reg.sinks_built = true;
}

spdlog::level::level_enum level_for(const LogConfig& config, Subsystem subsystem) {
    auto it = config.subsystem_levels.find(subsystem);
    return it != config.subsystem_levels.end() ? it->second : config.level;
}

/// Create a subsystem logger over the current sinks and publish it to spdlog (registry lock held)
std::shared_ptr<spdlog::logger> make_logger(LoggerRegistry& reg, Subsystem subsystem) {
    const char* name = subsystem_logger_name(subsystem);
    auto logger = std::make_shared<spdlog::logger>(name, reg.sinks.begin(), reg.sinks.end());
    logger->set_level(level_for(reg.config, subsystem));

    spdlog::drop(name);
    spdlog::register_logger(logger);
    reg.loggers[subsystem] = logger;
    return logger;
}

} // anonymous namespace

const char* subsystem_logger_name(Subsystem subsystem) {
    switch (subsystem) {
        case Subsystem::Game: return "critter_game";
        case Subsystem::Vault: return "vault";
        case Subsystem::Oracle: return "oracle";
        default: return "critter";
    }
}

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config = config;
    rebuild_sinks(reg);

    // Loggers are replaced rather than edited; a thread still holding the
    // previous logger keeps writing to the previous sinks until it looks
    // the subsystem up again.
    for (const Subsystem subsystem : ALL_SUBSYSTEMS) {
        if (reg.loggers.count(subsystem) != 0) {
            make_logger(reg, subsystem);
        }
    }

    spdlog::set_level(config.level);
}

// =============================================================================
// Subsystem Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> subsystem_logger(Subsystem subsystem) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(subsystem);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    if (!reg.sinks_built) {
        rebuild_sinks(reg);
    }
    return make_logger(reg, subsystem);
}

std::shared_ptr<spdlog::logger> game_logger() {
    return subsystem_logger(Subsystem::Game);
}

std::shared_ptr<spdlog::logger> vault_logger() {
    return subsystem_logger(Subsystem::Vault);
}

std::shared_ptr<spdlog::logger> oracle_logger() {
    return subsystem_logger(Subsystem::Oracle);
}

void set_subsystem_level(Subsystem subsystem, spdlog::level::level_enum level) {
    auto logger = subsystem_logger(subsystem);

    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.config.subsystem_levels[subsystem] = level;
    logger->set_level(level);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

// =============================================================================
// Log Scoping
// =============================================================================

LogScope::LogScope(const std::string& name, Subsystem subsystem)
    : m_name(name)
    , m_logger(subsystem_logger(subsystem))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace(">>> {}", m_name);
}

LogScope::~LogScope() {
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("<<< {} ({}us)", m_name, duration.count());
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [subsystem, logger] : reg.loggers) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    flush_all_loggers();

    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (const Subsystem subsystem : ALL_SUBSYSTEMS) {
        spdlog::drop(subsystem_logger_name(subsystem));
    }
    reg.loggers.clear();
}

} // namespace critter_core
