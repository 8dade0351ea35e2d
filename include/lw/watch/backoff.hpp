#pragma once

/// @file backoff.hpp
/// @brief Doubling retry delay used by the watcher's recovery loop.

#include <algorithm>
#include <chrono>

namespace lw::watch {

/// Exponential backoff between an initial and a maximum delay.
///
/// current() is the delay to wait before the next retry. Each advance()
/// doubles it up to the maximum; reset() returns to the initial delay
/// after a successful attempt. The initial delay is at least 1 ms, and the
/// maximum is never below the initial delay.
class Backoff {
public:
    Backoff(std::chrono::milliseconds initial, std::chrono::milliseconds maximum)
        : initial_(std::max(initial, std::chrono::milliseconds(1))),
          maximum_(std::max(maximum, initial_)),
          current_(initial_) {}

    [[nodiscard]] std::chrono::milliseconds current() const noexcept { return current_; }

    /// Return the current delay and double it for the next failure.
    std::chrono::milliseconds advance() noexcept {
        auto delay = current_;
        current_ = std::min(current_ * 2, maximum_);
        return delay;
    }

    void reset() noexcept { current_ = initial_; }

private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds maximum_;
    std::chrono::milliseconds current_;
};

}  // namespace lw::watch
