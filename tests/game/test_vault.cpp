/// @file test_vault.cpp
/// @brief Tests for Vault

#include <catch2/catch_test_macros.hpp>
#include <critter_engine/game/vault.hpp>

#include <algorithm>
#include <vector>

using namespace critter_game;
using critter_core::ErrorCode;
using critter_core::GameError;

TEST_CASE("Vault: deposit", "[game][vault]") {
    Vault vault(3);
    REQUIRE(vault.empty());
    REQUIRE(vault.max_size() == 3);

    REQUIRE(*vault.deposit(AssetId{10}) == 0);
    REQUIRE(*vault.deposit(AssetId{20}) == 1);
    REQUIRE(vault.count() == 2);
    REQUIRE(vault.contains(AssetId{20}));
    REQUIRE(vault.is_consistent());

    SECTION("duplicate rejected") {
        auto dup = vault.deposit(AssetId{10});
        REQUIRE(dup.is_err());
        REQUIRE(dup.error().is_game(GameError::Kind::DuplicateAsset));
        REQUIRE(vault.count() == 2);
    }

    SECTION("default id rejected") {
        auto bad = vault.deposit(AssetId{});
        REQUIRE(bad.is_err());
        REQUIRE(bad.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("full vault rejected") {
        REQUIRE(vault.deposit(AssetId{30}).is_ok());
        REQUIRE(vault.full());
        auto over = vault.deposit(AssetId{40});
        REQUIRE(over.is_err());
        REQUIRE(over.error().is_game(GameError::Kind::VaultFull));
        REQUIRE(vault.count() == 3);
    }
}

TEST_CASE("Vault: capacity is clamped to the hard limit", "[game][vault]") {
    Vault vault(1000);
    REQUIRE(vault.max_size() == MAX_VAULT_SIZE);
}

TEST_CASE("Vault: swap-remove", "[game][vault]") {
    Vault vault;
    REQUIRE(vault.deposit(AssetId{1}).is_ok());
    REQUIRE(vault.deposit(AssetId{2}).is_ok());
    REQUIRE(vault.deposit(AssetId{3}).is_ok());

    SECTION("removing from the middle moves the last entry") {
        auto removed = vault.remove(0);
        REQUIRE(removed.is_ok());
        REQUIRE(*removed == AssetId{1});
        REQUIRE(vault.count() == 2);
        REQUIRE(vault.entry(0) == AssetId{3});
        REQUIRE(vault.entry(1) == AssetId{2});
        REQUIRE(vault.entry(2) == AssetId{});
        REQUIRE(vault.is_consistent());
    }

    SECTION("out of range index") {
        auto bad = vault.remove(3);
        REQUIRE(bad.is_err());
        REQUIRE(bad.error().is_game(GameError::Kind::InvalidVaultIndex));
        REQUIRE(vault.count() == 3);
    }

    SECTION("remove by asset") {
        REQUIRE(vault.remove_asset(AssetId{2}).is_ok());
        REQUIRE_FALSE(vault.contains(AssetId{2}));

        auto missing = vault.remove_asset(AssetId{2});
        REQUIRE(missing.is_err());
        REQUIRE(missing.error().is_game(GameError::Kind::AssetNotInVault));
    }
}

TEST_CASE("Vault: stays consistent through churn", "[game][vault]") {
    Vault vault(5);
    std::vector<AssetId> expected;
    std::uint64_t next = 1;

    for (int round = 0; round < 50; ++round) {
        if (!vault.full() && round % 3 != 2) {
            AssetId asset{next++};
            REQUIRE(vault.deposit(asset).is_ok());
            expected.push_back(asset);
        } else if (!vault.empty()) {
            std::size_t index = static_cast<std::size_t>(round) % vault.count();
            auto removed = vault.remove(index);
            REQUIRE(removed.is_ok());
            expected.erase(std::find(expected.begin(), expected.end(), *removed));
        }

        REQUIRE(vault.is_consistent());
        REQUIRE(vault.count() == expected.size());
    }

    auto live = vault.assets();
    std::vector<AssetId> actual(live.begin(), live.end());
    std::sort(actual.begin(), actual.end());
    std::sort(expected.begin(), expected.end());
    REQUIRE(actual == expected);
}
