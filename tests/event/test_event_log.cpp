/// @file test_event_log.cpp
/// @brief Tests for EventLog

#include <catch2/catch_test_macros.hpp>
#include <critter_engine/event/event.hpp>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace critter_event;

namespace {

struct TestEvent {
    int value;
};

} // anonymous namespace

TEST_CASE("EventLog: creation", "[event][log]") {
    EventLog<TestEvent> log;
    REQUIRE(log.pending_count() == 0);
    REQUIRE(log.history().empty());
    REQUIRE(log.total_published() == 0);
}

TEST_CASE("EventLog: publish and process", "[event][log]") {
    EventLog<TestEvent> log;
    std::vector<int> received;

    log.subscribe([&received](const TestEvent& e) {
        received.push_back(e.value);
    });

    log.publish(TestEvent{1});
    log.publish(TestEvent{2});
    REQUIRE(log.pending_count() == 2);
    REQUIRE(received.empty());

    REQUIRE(log.process() == 2);
    REQUIRE(received == std::vector<int>{1, 2});
    REQUIRE(log.pending_count() == 0);
    REQUIRE(log.history().size() == 2);
}

TEST_CASE("EventLog: unsubscribe", "[event][log]") {
    EventLog<TestEvent> log;
    int count = 0;

    auto id = log.subscribe([&count](const TestEvent&) { ++count; });
    REQUIRE(id.is_valid());

    log.publish(TestEvent{1});
    log.process();
    REQUIRE(count == 1);

    REQUIRE(log.unsubscribe(id));
    REQUIRE_FALSE(log.unsubscribe(id));

    log.publish(TestEvent{2});
    log.process();
    REQUIRE(count == 1);
}

TEST_CASE("EventLog: drain skips subscribers", "[event][log]") {
    EventLog<TestEvent> log;
    int count = 0;
    log.subscribe([&count](const TestEvent&) { ++count; });

    log.publish(TestEvent{7});
    auto drained = log.drain();
    REQUIRE(drained.size() == 1);
    REQUIRE(drained[0].value == 7);
    REQUIRE(log.process() == 0);
    REQUIRE(count == 0);
}

TEST_CASE("EventLog: bounded history", "[event][log]") {
    EventLog<TestEvent> log(2);
    log.publish(TestEvent{1});
    log.publish(TestEvent{2});
    log.publish(TestEvent{3});

    auto history = log.history();
    REQUIRE(history.size() == 2);
    REQUIRE(history[0].value == 2);
    REQUIRE(history[1].value == 3);
    REQUIRE(log.total_published() == 3);
    REQUIRE(log.count_if([](const TestEvent& e) { return e.value > 1; }) == 2);

    log.clear();
    REQUIRE(log.history().empty());
    REQUIRE(log.total_published() == 3);
}

TEST_CASE("EventLog: bounded pending queue", "[event][log]") {
    EventLog<TestEvent> log(3, 2);
    REQUIRE(log.history_limit() == 3);
    REQUIRE(log.pending_limit() == 2);

    for (int i = 1; i <= 5; ++i) {
        log.publish(TestEvent{i});
    }

    REQUIRE(log.pending_count() == 2);
    REQUIRE(log.dropped_count() == 3);
    REQUIRE(log.history().size() == 3);

    auto pending = log.drain();
    REQUIRE(pending.size() == 2);
    REQUIRE(pending[0].value == 4);
    REQUIRE(pending[1].value == 5);
    REQUIRE(log.total_published() == 5);
}

TEST_CASE("EventLog: concurrent publish", "[event][log]") {
    EventLog<TestEvent> log;
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 250;

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&log]() {
            for (int i = 0; i < PER_THREAD; ++i) {
                log.publish(TestEvent{i});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(log.total_published() == THREADS * PER_THREAD);
    REQUIRE(log.pending_count() == THREADS * PER_THREAD);
}
