/// @file main.cpp
/// @brief Catch game simulation
///
/// Drives a CatchGame against in-memory collaborators: stocks the vault,
/// spawns creatures, lets a few players buy items and throw them, and
/// publishes oracle randomness between rounds from a seeded generator.
///
/// Usage: critter_sim [settings.json] [--seed N] [--rounds N] [--log-level LEVEL]

#include <critter_engine/core/core.hpp>
#include <critter_engine/game/game.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace {

struct SimOptions {
    std::filesystem::path settings_path;
    std::uint64_t seed = 2024;
    int rounds = 12;
    spdlog::level::level_enum log_level = spdlog::level::info;
};

/// Find the settings file relative to the working directory
std::filesystem::path find_settings_path() {
    std::vector<std::filesystem::path> candidates = {
        "game.json",
        "examples/critter_sim/game.json",
        "../examples/critter_sim/game.json",
    };

    for (const auto& path : candidates) {
        if (std::filesystem::exists(path)) {
            return std::filesystem::absolute(path);
        }
    }
    return std::filesystem::current_path() / "game.json";
}

critter_core::Result<SimOptions> parse_args(int argc, char** argv) {
    SimOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--seed" && has_value) {
            options.seed = std::strtoull(argv[++i], nullptr, 10);
        } else if (arg == "--rounds" && has_value) {
            options.rounds = std::atoi(argv[++i]);
        } else if (arg == "--log-level" && has_value) {
            auto level = critter_core::parse_log_level(argv[++i]);
            if (!level) {
                return critter_core::Err<SimOptions>(critter_core::Error(
                    critter_core::ErrorCode::InvalidArgument, std::string("Unknown log level: ") + argv[i]));
            }
            options.log_level = *level;
        } else if (!arg.empty() && arg[0] != '-') {
            options.settings_path = arg;
        } else {
            return critter_core::Err<SimOptions>(critter_core::Error(
                critter_core::ErrorCode::InvalidArgument, "Unknown argument: " + arg));
        }
    }
    if (options.settings_path.empty()) {
        options.settings_path = find_settings_path();
    }
    return critter_core::Ok(options);
}

/// Consume every request whose randomness is ready, routing awards to the thrower
void consume_ready(critter_game::CatchGame& game) {
    for (const auto& request : game.pending_requests()) {
        auto state = game.request_state(request.id);
        if (!state || *state != critter_game::RequestState::Ready) {
            continue;
        }

        std::vector<critter_game::TransferAccounts> transfers;
        const auto vault_account = game.config().vault_account;
        for (const auto& asset : game.vault_assets()) {
            transfers.push_back({asset, vault_account, request.requester});
        }

        auto outcome = game.consume(request.id, transfers);
        if (!outcome) {
            spdlog::warn("Request {} could not be consumed: {}",
                request.id.value, critter_core::build_error_chain(outcome.error()));
            continue;
        }
        spdlog::info("Request {} ({}) -> {}", request.id.value,
            critter_game::request_kind_name(outcome->kind),
            critter_game::consume_result_name(outcome->result));
    }
}

/// Log and discard the events published since the last call
void log_events(critter_game::CatchGame& game) {
    for (const auto& event : game.events().drain()) {
        spdlog::debug("{}", critter_game::format_game_event(event));
    }
}

void print_summary(const critter_game::CatchGame& game, const std::vector<critter_game::PlayerId>& players) {
    spdlog::info("=== Summary ===");
    spdlog::info("Active creatures: {}", game.active_count());
    spdlog::info("Vault: {}/{}", game.vault_count(), game.vault_max_size());
    spdlog::info("Treasury: {}", game.treasury_balance());
    spdlog::info("Owed awards: {}", game.owed_awards().size());
    spdlog::info("Events: {} published, {} dropped undrained",
        game.events().total_published(), game.events().dropped_count());

    for (const auto& player : players) {
        auto inventory = game.inventory(player);
        if (!inventory) {
            continue;
        }
        spdlog::info("Player {}: throws={} catches={} items=[{}, {}, {}, {}]",
            player.value, inventory->total_throws, inventory->total_catches,
            inventory->items[0], inventory->items[1], inventory->items[2], inventory->items[3]);
    }
}

int run(const SimOptions& options) {
    using namespace critter_game;

    auto settings = GameSettings::from_file(options.settings_path);
    if (!settings) {
        spdlog::error("Failed to load settings: {}", critter_core::build_error_chain(settings.error()));
        return EXIT_FAILURE;
    }

    MemoryOracle oracle;
    MemoryAssetLedger assets;
    MemoryCurrencyLedger currency;
    CatchGame game(oracle, assets, currency);

    auto initialized = game.initialize(settings->authority, *settings);
    if (!initialized) {
        spdlog::error("Failed to initialize: {}", critter_core::build_error_chain(initialized.error()));
        return EXIT_FAILURE;
    }

    const PlayerId authority = settings->authority;
    std::mt19937_64 rng(options.seed);

    // Stock the vault
    for (std::uint64_t i = 1; i <= 5; ++i) {
        AssetId asset{1000 + i};
        auto minted = assets.mint(asset, authority);
        if (!minted) {
            spdlog::error("Mint failed: {}", minted.error().message());
            return EXIT_FAILURE;
        }
        auto deposited = game.deposit_asset(authority, asset);
        if (!deposited) {
            spdlog::error("Deposit failed: {}", critter_core::build_error_chain(deposited.error()));
            return EXIT_FAILURE;
        }
    }

    // Fund players and buy items
    const std::vector<PlayerId> players = {PlayerId{100}, PlayerId{101}, PlayerId{102}};
    for (std::size_t i = 0; i < players.size(); ++i) {
        auto funded = currency.credit(players[i], 200'000'000);
        if (!funded) {
            spdlog::error("Funding failed: {}", funded.error().message());
            return EXIT_FAILURE;
        }
        auto tier = static_cast<std::uint8_t>(i + 1);
        auto bought = game.purchase_items(players[i], tier, 4);
        if (!bought) {
            spdlog::warn("Player {} could not buy items: {}", players[i].value, bought.error().message());
        }
    }

    // Initial spawns
    for (std::uint8_t slot = 0; slot < 4; ++slot) {
        auto request = game.request_spawn(authority, slot);
        if (!request) {
            spdlog::warn("Spawn request for slot {} failed: {}", slot, request.error().message());
        }
    }
    oracle.fulfill_all(rng);
    consume_ready(game);
    log_events(game);

    std::uniform_int_distribution<std::size_t> pick_player(0, players.size() - 1);
    std::uniform_int_distribution<int> pick_slot(0, 3);

    for (int round = 0; round < options.rounds; ++round) {
        CRITTER_LOG_SCOPE("round");
        PlayerId player = players[pick_player(rng)];
        auto slot = static_cast<std::uint8_t>(pick_slot(rng));

        auto inventory = game.inventory(player);
        if (!inventory) {
            continue;
        }
        for (std::uint8_t tier = 0; tier < NUM_ITEM_TIERS; ++tier) {
            if (inventory->items[tier] == 0) {
                continue;
            }
            auto request = game.request_throw(player, slot, tier);
            if (!request) {
                spdlog::debug("Player {} cannot throw at slot {}: {}", player.value, slot, request.error().message());
            }
            break;
        }

        // Refill empty slots
        for (std::uint8_t s = 0; s < 4; ++s) {
            auto current = game.slot(s);
            if (current && !current->is_active) {
                auto request = game.request_spawn(authority, s);
                if (!request) {
                    spdlog::debug("Respawn of slot {} deferred: {}", s, request.error().message());
                }
            }
        }

        oracle.fulfill_all(rng);
        consume_ready(game);
        log_events(game);
    }

    print_summary(game, players);
    spdlog::info("{}", critter_core::debug::error_stats_summary());
    return EXIT_SUCCESS;
}

} // anonymous namespace

int main(int argc, char** argv) {
    critter_core::init_logging();

    auto options = parse_args(argc, argv);
    if (!options) {
        spdlog::error("{}", options.error().message());
        return EXIT_FAILURE;
    }

    critter_core::LogConfig log_config;
    log_config.level = options->log_level;
    critter_core::configure_logging(log_config);

    spdlog::info("critter_sim: settings={} seed={} rounds={}",
        options->settings_path.string(), options->seed, options->rounds);

    try {
        int exit_code = run(*options);
        critter_core::shutdown_logging();
        return exit_code;
    } catch (const std::exception& e) {
        spdlog::error("FATAL EXCEPTION: {}", e.what());
        spdlog::default_logger()->flush();
        return EXIT_FAILURE;
    }
}
