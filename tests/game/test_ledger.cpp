/// @file test_ledger.cpp
/// @brief Tests for InventoryLedger and MemoryCurrencyLedger

#include <catch2/catch_test_macros.hpp>
#include <critter_engine/game/ledger.hpp>

#include <limits>

using namespace critter_game;
using namespace critter_core;

namespace {

constexpr PlayerId ALICE{10};
constexpr PlayerId BOB{11};

} // anonymous namespace

// =============================================================================
// InventoryLedger
// =============================================================================

TEST_CASE("InventoryLedger: credit creates inventory", "[game][ledger]") {
    InventoryLedger ledger;
    REQUIRE(ledger.find(ALICE) == nullptr);
    REQUIRE(ledger.balance(ALICE, ItemTier::Basic) == 0);

    REQUIRE(ledger.credit(ALICE, ItemTier::Great, 3).is_ok());
    REQUIRE(ledger.credit(ALICE, ItemTier::Basic, 2).is_ok());

    const PlayerInventory* inventory = ledger.find(ALICE);
    REQUIRE(inventory != nullptr);
    REQUIRE(inventory->player == ALICE);
    REQUIRE(inventory->items[1] == 3);
    REQUIRE(inventory->items[0] == 2);
    REQUIRE(inventory->total_purchased == 5);
    REQUIRE(ledger.player_count() == 1);
}

TEST_CASE("InventoryLedger: credit rejections", "[game][ledger]") {
    InventoryLedger ledger;

    SECTION("zero quantity") {
        auto result = ledger.credit(ALICE, ItemTier::Basic, 0);
        REQUIRE(result.error().is_game(GameError::Kind::ZeroQuantity));
        REQUIRE(ledger.find(ALICE) == nullptr);
    }

    SECTION("item balance overflow") {
        REQUIRE(ledger.credit(ALICE, ItemTier::Basic, std::numeric_limits<std::uint32_t>::max()).is_ok());
        auto result = ledger.credit(ALICE, ItemTier::Basic, 1);
        REQUIRE(result.error().is_game(GameError::Kind::MathOverflow));
        REQUIRE(ledger.balance(ALICE, ItemTier::Basic) == std::numeric_limits<std::uint32_t>::max());
    }
}

TEST_CASE("InventoryLedger: throws consume items", "[game][ledger]") {
    InventoryLedger ledger;

    auto none = ledger.can_throw(ALICE, ItemTier::Ultra);
    REQUIRE(none.error().is_game(GameError::Kind::InsufficientItems));

    REQUIRE(ledger.credit(ALICE, ItemTier::Ultra, 1).is_ok());
    REQUIRE(ledger.can_throw(ALICE, ItemTier::Ultra).is_ok());
    REQUIRE(ledger.record_throw(ALICE, ItemTier::Ultra).is_ok());
    REQUIRE(ledger.balance(ALICE, ItemTier::Ultra) == 0);
    REQUIRE(ledger.find(ALICE)->total_throws == 1);

    auto empty = ledger.record_throw(ALICE, ItemTier::Ultra);
    REQUIRE(empty.error().is_game(GameError::Kind::InsufficientItems));
    REQUIRE(ledger.find(ALICE)->total_throws == 1);
}

TEST_CASE("InventoryLedger: debit", "[game][ledger]") {
    InventoryLedger ledger;
    REQUIRE(ledger.credit(ALICE, ItemTier::Master, 4).is_ok());

    REQUIRE(ledger.debit(ALICE, ItemTier::Master, 3).is_ok());
    REQUIRE(ledger.balance(ALICE, ItemTier::Master) == 1);
    REQUIRE(ledger.debit(ALICE, ItemTier::Master, 2).is_err());
    REQUIRE(ledger.debit(BOB, ItemTier::Master, 1).is_err());
}

TEST_CASE("InventoryLedger: catches", "[game][ledger]") {
    InventoryLedger ledger;
    REQUIRE(ledger.record_catch(BOB).is_ok());
    REQUIRE(ledger.record_catch(BOB).is_ok());
    REQUIRE(ledger.find(BOB)->total_catches == 2);
    REQUIRE(ledger.find(BOB)->player == BOB);

    REQUIRE(ledger.credit(ALICE, ItemTier::Basic, 1).is_ok());
    auto all = ledger.all();
    REQUIRE(all.size() == 2);
    REQUIRE(all[0].player == ALICE);
    REQUIRE(all[1].player == BOB);
}

// =============================================================================
// MemoryCurrencyLedger
// =============================================================================

TEST_CASE("MemoryCurrencyLedger: transfers", "[game][ledger]") {
    MemoryCurrencyLedger currency;
    REQUIRE(currency.balance(ALICE) == 0);
    REQUIRE(currency.credit(ALICE, 1000).is_ok());

    SECTION("moves funds") {
        REQUIRE(currency.transfer(ALICE, BOB, 400).is_ok());
        REQUIRE(currency.balance(ALICE) == 600);
        REQUIRE(currency.balance(BOB) == 400);
    }

    SECTION("insufficient funds") {
        auto result = currency.transfer(ALICE, BOB, 1001);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is<CollaboratorError>());
        REQUIRE(currency.balance(ALICE) == 1000);
        REQUIRE(currency.balance(BOB) == 0);
    }

    SECTION("self transfer is a no-op") {
        REQUIRE(currency.transfer(ALICE, ALICE, 500).is_ok());
        REQUIRE(currency.balance(ALICE) == 1000);
    }

    SECTION("missing account") {
        REQUIRE(currency.transfer(ALICE, PlayerId{}, 1).is_err());
        REQUIRE(currency.credit(PlayerId{}, 1).is_err());
    }

    SECTION("overflow on receive") {
        REQUIRE(currency.credit(BOB, std::numeric_limits<std::uint64_t>::max()).is_ok());
        REQUIRE(currency.transfer(ALICE, BOB, 1).is_err());
        REQUIRE(currency.balance(ALICE) == 1000);
    }
}
