#pragma once

/// @file fixed_pool.hpp
/// @brief Fixed-capacity unordered arena for critter_structures
///
/// FixedPool stores up to N values inline with an explicit live count.
/// Insertion appends, removal swaps the last live value into the hole
/// (order is not preserved). Entries at or beyond the live count always
/// hold a default-constructed T.

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <algorithm>
#include <stdexcept>

namespace critter_structures {

/// Fixed-capacity swap-remove arena
/// @tparam T Stored value type (default-constructible, copyable)
/// @tparam N Hard capacity
template<typename T, std::size_t N>
class FixedPool {
public:
    using value_type = T;
    using size_type = std::size_t;

    static constexpr size_type hard_capacity = N;

    // =========================================================================
    // Constructors
    // =========================================================================

    /// Create an empty pool using the full hard capacity
    FixedPool() = default;

    /// Create an empty pool with a lower soft limit
    /// @param max_size Soft limit, clamped to N
    explicit FixedPool(size_type max_size)
        : max_size_(std::min(max_size, N)) {}

    // =========================================================================
    // Capacity
    // =========================================================================

    /// Number of live values
    [[nodiscard]] size_type size() const noexcept { return count_; }

    /// Check if empty
    [[nodiscard]] bool empty() const noexcept { return count_ == 0; }

    /// Check if no further insert is possible
    [[nodiscard]] bool full() const noexcept { return count_ >= max_size_; }

    /// Soft limit
    [[nodiscard]] size_type max_size() const noexcept { return max_size_; }

    /// Hard capacity
    [[nodiscard]] static constexpr size_type capacity() noexcept { return N; }

    // =========================================================================
    // Core Operations
    // =========================================================================

    /// Append a value
    /// @return Index of the new value, nullopt if full
    std::optional<size_type> push(T value) {
        if (full()) {
            return std::nullopt;
        }
        size_type index = count_;
        values_[index] = std::move(value);
        ++count_;
        return index;
    }

    /// Remove the value at index using swap-remove
    /// @return Removed value, nullopt if index is not live
    std::optional<T> swap_remove(size_type index) {
        if (index >= count_) {
            return std::nullopt;
        }

        size_type last = count_ - 1;
        T value = std::move(values_[index]);

        if (index != last) {
            values_[index] = std::move(values_[last]);
        }

        values_[last] = T{};
        --count_;
        return value;
    }

    /// Reset every entry to the default value
    void clear() {
        values_.fill(T{});
        count_ = 0;
    }

    // =========================================================================
    // Lookup
    // =========================================================================

    /// Find the index of a live value
    [[nodiscard]] std::optional<size_type> find(const T& value) const {
        for (size_type i = 0; i < count_; ++i) {
            if (values_[i] == value) {
                return i;
            }
        }
        return std::nullopt;
    }

    /// Check if a live value equals the argument
    [[nodiscard]] bool contains(const T& value) const {
        return find(value).has_value();
    }

    /// Get live value by index
    /// @return Pointer to value or nullptr
    [[nodiscard]] const T* get(size_type index) const noexcept {
        return index < count_ ? &values_[index] : nullptr;
    }

    /// Get live value (throws if not live)
    [[nodiscard]] const T& at(size_type index) const {
        if (index >= count_) {
            throw std::out_of_range("FixedPool: index not live");
        }
        return values_[index];
    }

    /// Raw access to any entry, including the default tail
    [[nodiscard]] const T& raw(size_type index) const {
        return values_.at(index);
    }

    // =========================================================================
    // Iteration
    // =========================================================================

    /// Live values
    [[nodiscard]] std::span<const T> values() const noexcept {
        return std::span<const T>(values_.data(), count_);
    }

    [[nodiscard]] auto begin() const noexcept { return values_.begin(); }
    [[nodiscard]] auto end() const noexcept { return values_.begin() + static_cast<std::ptrdiff_t>(count_); }

private:
    std::array<T, N> values_{};
    size_type count_ = 0;
    size_type max_size_ = N;
};

} // namespace critter_structures
