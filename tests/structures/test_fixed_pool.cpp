// critter_structures FixedPool tests

#include <catch2/catch_test_macros.hpp>
#include <critter_engine/structures/structures.hpp>
#include <algorithm>
#include <cstdint>
#include <vector>

using namespace critter_structures;

// =============================================================================
// FixedPool Construction Tests
// =============================================================================

TEST_CASE("FixedPool construction", "[structures][fixedpool]") {
    SECTION("default uses hard capacity") {
        FixedPool<std::uint64_t, 8> pool;
        REQUIRE(pool.empty());
        REQUIRE(pool.size() == 0);
        REQUIRE(pool.max_size() == 8);
        REQUIRE(FixedPool<std::uint64_t, 8>::capacity() == 8);
    }

    SECTION("soft limit is clamped") {
        FixedPool<std::uint64_t, 8> small(3);
        REQUIRE(small.max_size() == 3);

        FixedPool<std::uint64_t, 8> large(100);
        REQUIRE(large.max_size() == 8);
    }
}

// =============================================================================
// FixedPool Insert and Remove Tests
// =============================================================================

TEST_CASE("FixedPool push", "[structures][fixedpool]") {
    FixedPool<std::uint64_t, 4> pool(2);

    REQUIRE(pool.push(10) == 0u);
    REQUIRE(pool.push(20) == 1u);
    REQUIRE(pool.full());
    REQUIRE_FALSE(pool.push(30).has_value());
    REQUIRE(pool.size() == 2);
}

TEST_CASE("FixedPool swap_remove", "[structures][fixedpool]") {
    FixedPool<std::uint64_t, 4> pool;
    pool.push(10);
    pool.push(20);
    pool.push(30);

    SECTION("remove middle moves last into hole") {
        auto removed = pool.swap_remove(0);
        REQUIRE(removed == 10u);
        REQUIRE(pool.size() == 2);
        REQUIRE(pool.at(0) == 30);
        REQUIRE(pool.at(1) == 20);
        REQUIRE(pool.raw(2) == 0);
    }

    SECTION("remove last") {
        auto removed = pool.swap_remove(2);
        REQUIRE(removed == 30u);
        REQUIRE(pool.size() == 2);
        REQUIRE(pool.raw(2) == 0);
    }

    SECTION("out of range leaves pool untouched") {
        REQUIRE_FALSE(pool.swap_remove(3).has_value());
        REQUIRE_FALSE(pool.swap_remove(99).has_value());
        REQUIRE(pool.size() == 3);
    }

    SECTION("remove everything") {
        while (!pool.empty()) {
            REQUIRE(pool.swap_remove(0).has_value());
        }
        for (std::size_t i = 0; i < pool.capacity(); ++i) {
            REQUIRE(pool.raw(i) == 0);
        }
    }
}

// =============================================================================
// FixedPool Lookup Tests
// =============================================================================

TEST_CASE("FixedPool lookup", "[structures][fixedpool]") {
    FixedPool<std::uint64_t, 4> pool;
    pool.push(5);
    pool.push(6);

    REQUIRE(pool.find(6) == 1u);
    REQUIRE(pool.contains(5));
    REQUIRE_FALSE(pool.contains(7));
    REQUIRE(pool.get(1) != nullptr);
    REQUIRE(*pool.get(1) == 6);
    REQUIRE(pool.get(2) == nullptr);
    REQUIRE_THROWS_AS(pool.at(2), std::out_of_range);
}

TEST_CASE("FixedPool iteration covers live values only", "[structures][fixedpool]") {
    FixedPool<std::uint64_t, 6> pool;
    pool.push(1);
    pool.push(2);
    pool.push(3);
    pool.swap_remove(1);

    std::vector<std::uint64_t> seen(pool.begin(), pool.end());
    std::sort(seen.begin(), seen.end());
    REQUIRE(seen == std::vector<std::uint64_t>{1, 3});
    REQUIRE(pool.values().size() == 2);

    pool.clear();
    REQUIRE(pool.empty());
    REQUIRE(pool.begin() == pool.end());
}
