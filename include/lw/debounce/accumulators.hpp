#pragma once

/// @file accumulators.hpp
/// @brief Burst accumulators that shape the output of a DebounceStage.
///
/// Each accumulator declares InputType / OutputType and provides
/// start(), add(), isEmpty() and drain(). drain() returns the aggregate
/// and leaves the accumulator empty.

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace lw::debounce {

/// Unit value carried by Signal and Counted stages.
struct Pulse {
    friend bool operator==(const Pulse&, const Pulse&) = default;
};

/// Remembers only that something arrived.
class SignalAccumulator {
public:
    using InputType = Pulse;
    using OutputType = Pulse;

    void start() noexcept { pending_ = false; }
    void add(Pulse /*unused*/) noexcept { pending_ = true; }
    [[nodiscard]] bool isEmpty() const noexcept { return !pending_; }

    Pulse drain() noexcept {
        pending_ = false;
        return Pulse{};
    }

private:
    bool pending_ = false;
};

/// Collects every input of the burst in arrival order.
template <typename T>
class GroupedAccumulator {
public:
    using InputType = T;
    using OutputType = std::vector<T>;

    void start() { items_.clear(); }
    void add(T value) { items_.push_back(std::move(value)); }
    [[nodiscard]] bool isEmpty() const noexcept { return items_.empty(); }
    std::vector<T> drain() { return std::exchange(items_, {}); }

private:
    std::vector<T> items_;
};

/// Keeps the most recent input of the burst.
template <typename T>
class LastAccumulator {
public:
    using InputType = T;
    using OutputType = T;

    void start() { last_.reset(); }
    void add(T value) { last_ = std::move(value); }
    [[nodiscard]] bool isEmpty() const noexcept { return !last_.has_value(); }

    /// Precondition: !isEmpty().
    T drain() {
        T value = std::move(*last_);
        last_.reset();
        return value;
    }

private:
    std::optional<T> last_;
};

/// Counts the inputs of the burst.
class CountedAccumulator {
public:
    using InputType = Pulse;
    using OutputType = std::size_t;

    void start() noexcept { count_ = 0; }
    void add(Pulse /*unused*/) noexcept { ++count_; }
    [[nodiscard]] bool isEmpty() const noexcept { return count_ == 0; }
    std::size_t drain() noexcept { return std::exchange(count_, 0); }

private:
    std::size_t count_ = 0;
};

} // namespace lw::debounce
