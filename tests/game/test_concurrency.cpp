/// @file test_concurrency.cpp
/// @brief Concurrent consumption tests for CatchGame

#include <catch2/catch_test_macros.hpp>
#include "game_test_support.hpp"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace critter_test;
using namespace critter_game;

TEST_CASE("CatchGame: racing catches award the last asset once", "[game][concurrency]") {
    GameFixture f;
    GameSettings settings = default_settings();
    settings.vault_capacity = 1;
    f.init(settings);

    AssetId prize = f.stock(42);
    f.spawn(0, 1, 1);
    f.spawn(1, 2, 2);
    f.give_items(PLAYER, ItemTier::Master, 1);
    f.give_items(RIVAL, ItemTier::Master, 1);

    auto first = f.game.request_throw(PLAYER, 0, static_cast<std::uint8_t>(ItemTier::Master));
    auto second = f.game.request_throw(RIVAL, 1, static_cast<std::uint8_t>(ItemTier::Master));
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());
    f.fulfill(*first, throw_blob(0));
    f.fulfill(*second, throw_blob(0));

    std::atomic<bool> go{false};
    std::vector<critter_core::Result<ConsumeOutcome>> outcomes;
    outcomes.reserve(2);
    outcomes.push_back(critter_core::Err<ConsumeOutcome>(critter_core::Error("not run")));
    outcomes.push_back(critter_core::Err<ConsumeOutcome>(critter_core::Error("not run")));

    std::thread a([&]() {
        while (!go.load()) {
            std::this_thread::yield();
        }
        outcomes[0] = f.game.consume(*first, {GameFixture::route(prize, PLAYER)});
    });
    std::thread b([&]() {
        while (!go.load()) {
            std::this_thread::yield();
        }
        outcomes[1] = f.game.consume(*second, {GameFixture::route(prize, RIVAL)});
    });
    go.store(true);
    a.join();
    b.join();

    REQUIRE(outcomes[0].is_ok());
    REQUIRE(outcomes[1].is_ok());
    REQUIRE(outcomes[0]->result == ConsumeResult::Caught);
    REQUIRE(outcomes[1]->result == ConsumeResult::Caught);

    // Exactly one winner holds the prize
    REQUIRE(f.count_events<AssetAwarded>() == 1);
    REQUIRE(f.count_events<CreatureCaught>() == 2);
    REQUIRE(static_cast<bool>(outcomes[0]->awarded) != static_cast<bool>(outcomes[1]->awarded));

    PlayerId winner = outcomes[0]->awarded ? PLAYER : RIVAL;
    REQUIRE(f.assets.owner_of(prize) == winner);
    REQUIRE(f.game.vault_count() == 0);
    REQUIRE(f.game.vault_consistent());
    REQUIRE(f.game.owed_awards().empty());
}

TEST_CASE("CatchGame: concurrent spawns on distinct slots", "[game][concurrency]") {
    GameFixture f;
    f.init();

    constexpr std::uint8_t SLOTS = 8;
    std::vector<RequestId> requests;
    for (std::uint8_t i = 0; i < SLOTS; ++i) {
        auto request = f.game.request_spawn(AUTHORITY, i);
        REQUIRE(request.is_ok());
        f.fulfill(*request, spawn_blob(i, i));
        requests.push_back(*request);
    }

    std::atomic<int> spawned{0};
    std::vector<std::thread> threads;
    for (RequestId id : requests) {
        threads.emplace_back([&f, &spawned, id]() {
            auto outcome = f.game.consume(id);
            if (outcome && outcome->result == ConsumeResult::Spawned) {
                spawned.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(spawned.load() == SLOTS);
    REQUIRE(f.game.active_count() == SLOTS);
    REQUIRE(f.game.config().creature_id_counter == SLOTS);

    // Every creature id is unique
    std::vector<std::uint64_t> ids;
    for (const auto& slot : f.game.slots()) {
        if (slot.is_active) {
            ids.push_back(slot.creature_id);
        }
    }
    std::sort(ids.begin(), ids.end());
    REQUIRE(std::adjacent_find(ids.begin(), ids.end()) == ids.end());
}
