// critter_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <critter_engine/core/log.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>
#include <string>

using namespace critter_core;

namespace {

LogConfig capture_config(std::ostringstream& out) {
    LogConfig config;
    config.console_enabled = false;
    config.level = spdlog::level::info;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    sink->set_pattern("%n|%l|%v");
    config.extra_sinks.push_back(sink);
    return config;
}

} // anonymous namespace

TEST_CASE("parse_log_level", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("info") == spdlog::level::info);
    REQUIRE(parse_log_level("warn") == spdlog::level::warn);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("critical") == spdlog::level::critical);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("loud").has_value());
    REQUIRE_FALSE(parse_log_level("").has_value());
}

TEST_CASE("Subsystem logger names", "[core][log]") {
    REQUIRE(std::string(subsystem_logger_name(Subsystem::Game)) == "critter_game");
    REQUIRE(std::string(subsystem_logger_name(Subsystem::Vault)) == "vault");
    REQUIRE(std::string(subsystem_logger_name(Subsystem::Oracle)) == "oracle");

    REQUIRE(game_logger()->name() == "critter_game");
    REQUIRE(vault_logger()->name() == "vault");
    REQUIRE(oracle_logger()->name() == "oracle");
    REQUIRE(game_logger() == subsystem_logger(Subsystem::Game));
}

TEST_CASE("Subsystem loggers share configured sinks", "[core][log]") {
    std::ostringstream out;
    configure_logging(capture_config(out));

    game_logger()->info("slot filled");
    vault_logger()->info("asset stored");
    game_logger()->debug("hidden");
    flush_all_loggers();

    const std::string text = out.str();
    REQUIRE(text.find("critter_game|info|slot filled") != std::string::npos);
    REQUIRE(text.find("vault|info|asset stored") != std::string::npos);
    REQUIRE(text.find("hidden") == std::string::npos);

    configure_logging(LogConfig{});
}

TEST_CASE("Subsystem level overrides", "[core][log]") {
    std::ostringstream out;
    LogConfig config = capture_config(out);
    config.subsystem_levels[Subsystem::Oracle] = spdlog::level::warn;
    configure_logging(config);

    SECTION("override from config") {
        oracle_logger()->info("quiet oracle");
        oracle_logger()->warn("loud oracle");
        game_logger()->info("game info");
        flush_all_loggers();

        const std::string text = out.str();
        REQUIRE(text.find("quiet oracle") == std::string::npos);
        REQUIRE(text.find("loud oracle") != std::string::npos);
        REQUIRE(text.find("game info") != std::string::npos);
    }

    SECTION("set_subsystem_level leaves other subsystems alone") {
        set_subsystem_level(Subsystem::Vault, spdlog::level::debug);
        REQUIRE(vault_logger()->level() == spdlog::level::debug);
        REQUIRE(game_logger()->level() == spdlog::level::info);
        REQUIRE(oracle_logger()->level() == spdlog::level::warn);
    }

    configure_logging(LogConfig{});
}

TEST_CASE("LogScope traces entry and exit", "[core][log]") {
    std::ostringstream out;
    LogConfig config = capture_config(out);
    config.level = spdlog::level::trace;
    configure_logging(config);

    {
        CRITTER_LOG_SCOPE("round");
    }
    {
        LogScope scope("deposit", Subsystem::Vault);
    }
    flush_all_loggers();

    const std::string text = out.str();
    REQUIRE(text.find("critter_game|trace|>>> round") != std::string::npos);
    REQUIRE(text.find("critter_game|trace|<<< round") != std::string::npos);
    REQUIRE(text.find("vault|trace|>>> deposit") != std::string::npos);

    configure_logging(LogConfig{});
}

TEST_CASE("Reconfiguring replaces subsystem loggers", "[core][log]") {
    std::ostringstream first_out;
    configure_logging(capture_config(first_out));
    auto before = vault_logger();

    std::ostringstream second_out;
    configure_logging(capture_config(second_out));
    auto after = vault_logger();

    REQUIRE(before != after);
    REQUIRE(spdlog::get("vault") == after);

    // The earlier logger keeps its own sinks
    before->info("old handle");
    after->info("new handle");
    flush_all_loggers();
    before->flush();

    REQUIRE(first_out.str().find("vault|info|old handle") != std::string::npos);
    REQUIRE(first_out.str().find("new handle") == std::string::npos);
    REQUIRE(second_out.str().find("vault|info|new handle") != std::string::npos);
    REQUIRE(second_out.str().find("old handle") == std::string::npos);

    configure_logging(LogConfig{});
}
