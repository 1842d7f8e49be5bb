/// @file test_admin.cpp
/// @brief Administration and economy tests for CatchGame

#include <catch2/catch_test_macros.hpp>
#include "game_test_support.hpp"

#include <limits>

using namespace critter_test;
using namespace critter_game;
using critter_core::ErrorCode;
using critter_core::GameError;

// =============================================================================
// Creature Administration
// =============================================================================

TEST_CASE("CatchGame: force spawn", "[game][admin]") {
    GameFixture f;
    f.init();

    auto id = f.game.force_spawn(AUTHORITY, 7, 999, 0);
    REQUIRE(id.is_ok());
    REQUIRE(*id == 1);
    REQUIRE(f.game.slot(7)->position() == Position{999, 0});
    REQUIRE(f.game.slot(7)->spawn_timestamp == START_TIME);

    SECTION("coordinates beyond the map") {
        auto bad = f.game.force_spawn(AUTHORITY, 8, 1000, 5);
        REQUIRE(bad.error().is_game(GameError::Kind::InvalidCoordinate));
        REQUIRE_FALSE(f.game.slot(8)->is_active);
    }

    SECTION("occupied slot") {
        REQUIRE(f.game.force_spawn(AUTHORITY, 7, 1, 1).error().is_game(GameError::Kind::SlotOccupied));
    }

    SECTION("non-authority") {
        REQUIRE(f.game.force_spawn(PLAYER, 8, 1, 1).error().is_game(GameError::Kind::Unauthorized));
    }

    SECTION("shares the id counter with oracle spawns") {
        REQUIRE(f.spawn(8, 1, 1) == 2);
    }
}

TEST_CASE("CatchGame: reposition", "[game][admin]") {
    GameFixture f;
    f.init();
    auto creature = f.spawn(0, 5, 5);
    f.give_items(PLAYER, ItemTier::Great, 1);
    REQUIRE(f.throw_and_resolve(PLAYER, 0, ItemTier::Great, throw_blob(90))->result == ConsumeResult::Missed);
    REQUIRE(f.game.slot(0)->throw_attempts == 1);

    REQUIRE(f.game.reposition(AUTHORITY, 0, 40, 50).is_ok());

    auto slot = f.game.slot(0);
    REQUIRE(slot->creature_id == creature);
    REQUIRE(slot->position() == Position{40, 50});
    REQUIRE(slot->throw_attempts == 0);

    auto relocated = f.last_event<CreatureRelocated>();
    REQUIRE(relocated->reason == RelocationReason::Admin);
    REQUIRE(relocated->from == Position{5, 5});

    REQUIRE(f.game.reposition(AUTHORITY, 1, 1, 1).error().is_game(GameError::Kind::SlotNotActive));
    REQUIRE(f.game.reposition(AUTHORITY, 0, 1, 1000).error().is_game(GameError::Kind::InvalidCoordinate));
    REQUIRE(f.game.reposition(PLAYER, 0, 1, 1).error().is_game(GameError::Kind::Unauthorized));
}

TEST_CASE("CatchGame: despawn", "[game][admin]") {
    GameFixture f;
    f.init();
    auto creature = f.spawn(3, 5, 5);

    REQUIRE(f.game.despawn(PLAYER, 3).error().is_game(GameError::Kind::Unauthorized));
    REQUIRE(f.game.despawn(AUTHORITY, 3).is_ok());
    REQUIRE_FALSE(f.game.slot(3)->is_active);
    REQUIRE(f.game.active_count() == 0);
    REQUIRE(f.last_event<CreatureDespawned>()->creature_id == creature);

    REQUIRE(f.game.despawn(AUTHORITY, 3).error().is_game(GameError::Kind::SlotNotActive));
    REQUIRE(f.game.attempts_remaining(3).error().is_game(GameError::Kind::SlotNotActive));
}

// =============================================================================
// Vault Administration
// =============================================================================

TEST_CASE("CatchGame: deposit", "[game][admin][vault]") {
    GameFixture f;
    GameSettings settings = default_settings();
    settings.vault_capacity = 2;
    f.init(settings);
    REQUIRE(f.game.vault_max_size() == 2);

    AssetId first = f.stock(1);
    REQUIRE(f.game.vault_count() == 1);
    REQUIRE(f.last_event<AssetDeposited>()->vault_count == 1);

    SECTION("duplicate") {
        REQUIRE(f.game.deposit_asset(AUTHORITY, first).error().is_game(GameError::Kind::DuplicateAsset));
    }

    SECTION("default id") {
        REQUIRE(f.game.deposit_asset(AUTHORITY, AssetId{}).error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("full vault") {
        f.stock(2);
        REQUIRE(f.assets.mint(AssetId{3}, AUTHORITY).is_ok());
        auto full = f.game.deposit_asset(AUTHORITY, AssetId{3});
        REQUIRE(full.error().is_game(GameError::Kind::VaultFull));
        REQUIRE(f.assets.owner_of(AssetId{3}) == AUTHORITY);
    }

    SECTION("custody transfer fails") {
        REQUIRE(f.assets.mint(AssetId{4}, PLAYER).is_ok());
        auto result = f.game.deposit_asset(AUTHORITY, AssetId{4});
        REQUIRE(result.error().code() == ErrorCode::External);
        REQUIRE(f.game.vault_count() == 1);
        REQUIRE(f.assets.owner_of(AssetId{4}) == PLAYER);
    }

    SECTION("non-authority") {
        REQUIRE(f.game.deposit_asset(PLAYER, AssetId{5}).error().is_game(GameError::Kind::Unauthorized));
    }
}

TEST_CASE("CatchGame: withdraw", "[game][admin][vault]") {
    GameFixture f;
    f.init();

    REQUIRE(f.game.withdraw_asset(AUTHORITY, AssetId{1}).error().is_game(GameError::Kind::VaultEmpty));

    AssetId first = f.stock(1);
    AssetId second = f.stock(2);

    SECTION("returns custody to the caller") {
        REQUIRE(f.game.withdraw_asset(AUTHORITY, first).is_ok());
        REQUIRE(f.assets.owner_of(first) == AUTHORITY);
        REQUIRE(f.game.vault_assets() == std::vector<AssetId>{second});
        REQUIRE(f.last_event<AssetWithdrawn>()->vault_count == 1);
    }

    SECTION("asset not in vault") {
        auto missing = f.game.withdraw_asset(AUTHORITY, AssetId{99});
        REQUIRE(missing.error().is_game(GameError::Kind::AssetNotInVault));
    }

    SECTION("failed transfer keeps the asset in the vault") {
        f.assets.block(first);
        REQUIRE(f.game.withdraw_asset(AUTHORITY, first).is_err());
        REQUIRE(f.game.vault_count() == 2);
        REQUIRE(f.game.vault_consistent());
        REQUIRE(f.assets.owner_of(first) == VAULT_ACCOUNT);
    }
}

// =============================================================================
// Economy
// =============================================================================

TEST_CASE("CatchGame: purchase items", "[game][economy]") {
    GameFixture f;
    f.init();
    REQUIRE(f.currency.credit(PLAYER, 100'000'000).is_ok());

    SECTION("charges the buyer and credits the treasury") {
        auto cost = f.game.purchase_items(PLAYER, static_cast<std::uint8_t>(ItemTier::Great), 3);
        REQUIRE(cost.is_ok());
        REQUIRE(*cost == 30'000'000);
        REQUIRE(f.currency.balance(PLAYER) == 70'000'000);
        REQUIRE(f.game.treasury_balance() == 30'000'000);
        REQUIRE(f.game.config().total_revenue == 30'000'000);

        auto inventory = f.game.inventory(PLAYER);
        REQUIRE(inventory->items[1] == 3);
        REQUIRE(inventory->total_purchased == 3);

        auto purchased = f.last_event<ItemsPurchased>();
        REQUIRE(purchased->quantity == 3);
        REQUIRE(purchased->total_cost == 30'000'000);
    }

    SECTION("zero quantity") {
        REQUIRE(f.game.purchase_items(PLAYER, 0, 0).error().is_game(GameError::Kind::ZeroQuantity));
    }

    SECTION("invalid tier") {
        REQUIRE(f.game.purchase_items(PLAYER, 4, 1).error().is_game(GameError::Kind::InvalidTier));
    }

    SECTION("cost above the purchase cap") {
        REQUIRE(f.currency.credit(PLAYER, 1'000'000'000).is_ok());
        // 11 * 49.9 exceeds 500.0
        auto result = f.game.purchase_items(PLAYER, 3, 11);
        REQUIRE(result.error().is_game(GameError::Kind::PurchaseExceedsMax));
        REQUIRE(f.game.treasury_balance() == 0);
    }

    SECTION("insufficient funds") {
        auto result = f.game.purchase_items(PLAYER, 3, 3);
        REQUIRE(result.error().is_game(GameError::Kind::InsufficientFunds));
        REQUIRE(f.currency.balance(PLAYER) == 100'000'000);
        REQUIRE_FALSE(f.game.inventory(PLAYER).has_value());
    }

    SECTION("cost overflow") {
        REQUIRE(f.game.set_item_price(AUTHORITY, 0, std::numeric_limits<std::uint64_t>::max()).is_ok());
        auto result = f.game.purchase_items(PLAYER, 0, 2);
        REQUIRE(result.error().is_game(GameError::Kind::MathOverflow));
    }
}

TEST_CASE("CatchGame: admin setters", "[game][economy]") {
    GameFixture f;
    f.init();

    SECTION("item price") {
        REQUIRE(f.game.set_item_price(AUTHORITY, 2, 123).is_ok());
        REQUIRE(f.game.config().item_prices[2] == 123);
        auto updated = f.last_event<ItemPriceUpdated>();
        REQUIRE(updated->old_price == DEFAULT_ITEM_PRICES[2]);
        REQUIRE(updated->new_price == 123);

        REQUIRE(f.game.set_item_price(AUTHORITY, 2, 0).error().is_game(GameError::Kind::ZeroPrice));
        REQUIRE(f.game.set_item_price(AUTHORITY, 4, 1).error().is_game(GameError::Kind::InvalidTier));
        REQUIRE(f.game.set_item_price(PLAYER, 2, 1).error().is_game(GameError::Kind::Unauthorized));
        REQUIRE(f.game.config().item_prices[2] == 123);
    }

    SECTION("catch rate") {
        REQUIRE(f.game.set_catch_rate(AUTHORITY, 1, 100).is_ok());
        REQUIRE(f.game.config().catch_rates[1] == 100);
        REQUIRE(f.game.set_catch_rate(AUTHORITY, 1, 101).error().is_game(GameError::Kind::InvalidCatchRate));
        REQUIRE(f.game.config().catch_rates[1] == 100);
    }

    SECTION("max active") {
        REQUIRE(f.game.set_max_active(AUTHORITY, 0).error().is_game(GameError::Kind::InvalidMaxActive));
        REQUIRE(f.game.set_max_active(AUTHORITY, 21).error().is_game(GameError::Kind::InvalidMaxActive));
        REQUIRE(f.game.set_max_active(AUTHORITY, 5).is_ok());
        REQUIRE(f.game.config().max_active == 5);
        REQUIRE(f.last_event<MaxActiveUpdated>()->old_max == MAX_CREATURE_SLOTS);
    }

    SECTION("lowering max active leaves existing creatures") {
        f.spawn(0, 1, 1);
        f.spawn(1, 1, 1);
        REQUIRE(f.game.set_max_active(AUTHORITY, 1).is_ok());
        REQUIRE(f.game.active_count() == 2);
        REQUIRE(f.game.request_spawn(AUTHORITY, 2).error().is_game(GameError::Kind::MaxActiveReached));
    }
}

TEST_CASE("CatchGame: withdraw revenue", "[game][economy]") {
    GameFixture f;
    f.init();
    f.give_items(PLAYER, ItemTier::Ultra, 2);
    REQUIRE(f.game.treasury_balance() == 50'000'000);

    REQUIRE(f.game.withdraw_revenue(AUTHORITY, 0).error().is_game(GameError::Kind::InvalidWithdrawal));
    REQUIRE(f.game.withdraw_revenue(AUTHORITY, 50'000'001).error().is_game(GameError::Kind::InvalidWithdrawal));
    REQUIRE(f.game.withdraw_revenue(PLAYER, 1).error().is_game(GameError::Kind::Unauthorized));

    REQUIRE(f.game.withdraw_revenue(AUTHORITY, 20'000'000).is_ok());
    REQUIRE(f.game.treasury_balance() == 30'000'000);
    REQUIRE(f.currency.balance(AUTHORITY) == 20'000'000);
    REQUIRE(f.game.config().total_withdrawn == 20'000'000);
    REQUIRE(f.last_event<RevenueWithdrawn>()->amount == 20'000'000);
}

// =============================================================================
// Event Journal
// =============================================================================

TEST_CASE("CatchGame: event journal stays bounded", "[game][events]") {
    MemoryOracle oracle;
    MemoryAssetLedger assets;
    MemoryCurrencyLedger currency;
    CatchGame game(oracle, assets, currency, []() { return START_TIME; }, 16);

    GameSettings settings = default_settings();
    REQUIRE(game.initialize(AUTHORITY, settings).is_ok());

    constexpr int UPDATES = 1000;
    for (int i = 0; i < UPDATES; ++i) {
        auto rate = static_cast<std::uint8_t>(i % 100);
        REQUIRE(game.set_catch_rate(AUTHORITY, 1, rate).is_ok());
    }

    REQUIRE(game.events().history().size() == 16);
    REQUIRE(game.events().pending_count() == 16);
    REQUIRE(game.events().total_published() == UPDATES + 1);
    REQUIRE(game.events().dropped_count() == UPDATES + 1 - 16);

    // The newest event survives trimming
    auto history = game.events().history();
    const auto* last = std::get_if<CatchRateUpdated>(&history.back());
    REQUIRE(last != nullptr);
    REQUIRE(last->new_rate == static_cast<std::uint8_t>((UPDATES - 1) % 100));

    SECTION("draining empties the pending queue") {
        auto drained = game.events().drain();
        REQUIRE(drained.size() == 16);
        REQUIRE(game.events().pending_count() == 0);
    }
}

TEST_CASE("CatchGame: default event limit", "[game][events]") {
    GameFixture f;
    REQUIRE(f.game.events().history_limit() == DEFAULT_EVENT_LIMIT);
    REQUIRE(f.game.events().pending_limit() == DEFAULT_EVENT_LIMIT);
}
