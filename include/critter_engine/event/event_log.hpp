#pragma once

/// @file event_log.hpp
/// @brief Typed event journal for critter_event
///
/// EventLog records every published event in order. Published events are
/// also queued for subscribers, which receive them on process(). Both the
/// history and the pending queue can be bounded; when a bound is reached
/// the oldest entry is discarded. The log is safe to publish into from several threads; handlers run on the
/// thread that calls process(), outside the internal lock.

#include "fwd.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <tuple>
#include <vector>

namespace critter_event {

// =============================================================================
// SubscriberId
// =============================================================================

/// Unique identifier for a subscription
struct SubscriberId {
    std::uint64_t id = 0;

    constexpr SubscriberId() = default;
    constexpr explicit SubscriberId(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const SubscriberId&) const noexcept = default;
    constexpr bool operator==(const SubscriberId&) const noexcept = default;
};

// =============================================================================
// EventLog
// =============================================================================

/// Ordered event journal with deferred subscriber delivery
/// @tparam E Event type
template<typename E>
class EventLog {
public:
    using value_type = E;
    using size_type = std::size_t;
    using Handler = std::function<void(const E&)>;

    // =========================================================================
    // Constructors
    // =========================================================================

    /// Create a log with unbounded history
    EventLog() = default;

    /// Create a log keeping at most history_limit events (0 = unbounded)
    explicit EventLog(size_type history_limit) : m_history_limit(history_limit) {}

    /// Create a log with bounded history and a bounded pending queue (0 = unbounded)
    EventLog(size_type history_limit, size_type pending_limit)
        : m_history_limit(history_limit)
        , m_pending_limit(pending_limit) {}

    // Non-copyable, non-movable (owns a mutex)
    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    // =========================================================================
    // Publishing
    // =========================================================================

    /// Record an event and queue it for subscribers
    void publish(E event) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_history.push_back(event);
        if (m_history_limit != 0 && m_history.size() > m_history_limit) {
            m_history.pop_front();
        }
        m_pending.push_back(std::move(event));
        if (m_pending_limit != 0 && m_pending.size() > m_pending_limit) {
            m_pending.pop_front();
            ++m_dropped;
        }
        ++m_total_published;
    }

    // =========================================================================
    // Subscribing
    // =========================================================================

    /// Subscribe to every event
    template<typename F>
    SubscriberId subscribe(F&& handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        SubscriberId sub_id(m_next_subscriber_id++);
        m_handlers.emplace_back(sub_id, Handler(std::forward<F>(handler)));
        return sub_id;
    }

    /// Remove a subscription
    /// @return true if the subscription existed
    bool unsubscribe(SubscriberId id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::remove_if(m_handlers.begin(), m_handlers.end(),
            [id](const auto& entry) { return std::get<0>(entry) == id; });
        bool removed = it != m_handlers.end();
        m_handlers.erase(it, m_handlers.end());
        return removed;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// Deliver pending events to subscribers
    /// @return Number of events delivered
    size_type process() {
        std::vector<E> events;
        std::vector<Handler> handlers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            events.assign(std::make_move_iterator(m_pending.begin()),
                          std::make_move_iterator(m_pending.end()));
            m_pending.clear();
            handlers.reserve(m_handlers.size());
            for (const auto& [sub_id, handler] : m_handlers) {
                handlers.push_back(handler);
            }
        }

        for (const auto& event : events) {
            for (const auto& handler : handlers) {
                handler(event);
            }
        }
        return events.size();
    }

    /// Take pending events without delivering them
    [[nodiscard]] std::vector<E> drain() {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<E> events(std::make_move_iterator(m_pending.begin()),
                              std::make_move_iterator(m_pending.end()));
        m_pending.clear();
        return events;
    }

    // =========================================================================
    // History
    // =========================================================================

    /// Copy of the recorded history, oldest first
    [[nodiscard]] std::vector<E> history() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::vector<E>(m_history.begin(), m_history.end());
    }

    /// Count recorded events matching a predicate
    template<typename Pred>
    [[nodiscard]] size_type count_if(Pred&& pred) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<size_type>(std::count_if(m_history.begin(), m_history.end(), pred));
    }

    /// Pending (undelivered) event count
    [[nodiscard]] size_type pending_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pending.size();
    }

    /// Pending events discarded because the queue was full
    [[nodiscard]] std::uint64_t dropped_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_dropped;
    }

    [[nodiscard]] size_type history_limit() const noexcept { return m_history_limit; }
    [[nodiscard]] size_type pending_limit() const noexcept { return m_pending_limit; }

    /// Events published since construction, including ones trimmed from history
    [[nodiscard]] std::uint64_t total_published() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_total_published;
    }

    /// Forget history and pending events; subscriptions stay
    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_history.clear();
        m_pending.clear();
    }

private:
    using HandlerEntry = std::tuple<SubscriberId, Handler>;

    mutable std::mutex m_mutex;
    std::deque<E> m_history;
    std::deque<E> m_pending;
    std::vector<HandlerEntry> m_handlers;
    size_type m_history_limit = 0;
    size_type m_pending_limit = 0;
    std::uint64_t m_dropped = 0;
    std::uint64_t m_next_subscriber_id = 1;
    std::uint64_t m_total_published = 0;
};

} // namespace critter_event
