#pragma once

/// @file debounce_stage.hpp
/// @brief Time-windowed burst coalescing over a pluggable accumulator.
///
/// A DebounceStage owns one worker thread. Inputs reset a quiet-time
/// interval; when the interval elapses with no further input the pending
/// aggregate is flushed to the output. An optional max delay, armed by the
/// first input of a burst, forces a flush so an endless stream cannot
/// starve the output. Closing the input flushes what is pending and then
/// closes the output.

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "lw/debounce/accumulators.hpp"
#include "lw/foundation/channel.hpp"
#include "lw/foundation/watch_logger.hpp"

namespace lw::debounce {

/// Timing and buffering for a DebounceStage.
struct DebounceOptions {
    /// Quiet time that ends a burst.
    std::chrono::milliseconds interval{0};

    /// Longest a burst may hold back output; zero disables the bound.
    std::chrono::milliseconds maxDelay{0};

    /// Capacity of the input and output channels.
    std::size_t inputBuffer = 1;
    std::size_t outputBuffer = 1;
};

/// Generic debounce worker.
///
/// @tparam Accumulator One of the types in accumulators.hpp, or any type
///         with the same start/add/isEmpty/drain surface.
///
/// Example:
/// @code
///   CountedDebounce stage({.interval = std::chrono::milliseconds(50)});
///   auto in = stage.input();
///   auto out = stage.output();
///   in.send(Pulse{});
///   in.send(Pulse{});
///   in.close();
///   while (auto n = out.receive()) {
///       std::cout << *n << " changes\n";  // prints "2 changes"
///   }
/// @endcode
///
/// Destroying the stage closes both channels and joins the worker; a
/// consumer that wants the final flush must drain output() first.
template <typename Accumulator>
class DebounceStage {
public:
    using InputType = typename Accumulator::InputType;
    using OutputType = typename Accumulator::OutputType;
    using Clock = std::chrono::steady_clock;

    explicit DebounceStage(DebounceOptions options, Accumulator accumulator = Accumulator{})
        : options_(options),
          input_(std::make_shared<foundation::Channel<InputType>>(options.inputBuffer)),
          output_(std::make_shared<foundation::Channel<OutputType>>(options.outputBuffer)),
          accumulator_(std::move(accumulator)) {
        worker_ = std::thread([this] { run(); });
    }

    ~DebounceStage() {
        input_->close();
        output_->close();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    DebounceStage(const DebounceStage&) = delete;
    DebounceStage& operator=(const DebounceStage&) = delete;
    DebounceStage(DebounceStage&&) = delete;
    DebounceStage& operator=(DebounceStage&&) = delete;

    /// Send-only end. Closing it is the shutdown signal.
    [[nodiscard]] foundation::Sender<InputType> input() const {
        return foundation::Sender<InputType>(input_);
    }

    /// Receive-only end, closed after the final flush.
    [[nodiscard]] foundation::Receiver<OutputType> output() const {
        return foundation::Receiver<OutputType>(output_);
    }

    [[nodiscard]] const DebounceOptions& options() const noexcept { return options_; }

private:
    void run() {
        accumulator_.start();

        while (true) {
            auto now = Clock::now();
            bool intervalDue = intervalDeadline_ && now >= *intervalDeadline_;
            bool maxDelayDue = maxDeadline_ && now >= *maxDeadline_;
            if (intervalDue || maxDelayDue) {
                if (!flush(maxDelayDue && !intervalDue ? "max delay" : "interval")) {
                    return;
                }
                intervalDeadline_.reset();
                maxDeadline_.reset();
            }

            std::optional<InputType> value;
            foundation::ReceiveStatus status;
            if (auto deadline = nextDeadline()) {
                status = input_->receiveUntil(*deadline, value);
            } else {
                value = input_->receive();
                status = value ? foundation::ReceiveStatus::Value
                               : foundation::ReceiveStatus::Closed;
            }

            switch (status) {
                case foundation::ReceiveStatus::Value:
                    onInput(std::move(*value));
                    break;
                case foundation::ReceiveStatus::Timeout:
                    break;
                case foundation::ReceiveStatus::Closed:
                    flush("input closed");
                    output_->close();
                    return;
            }
        }
    }

    void onInput(InputType value) {
        auto now = Clock::now();
        intervalDeadline_ = now + options_.interval;
        accumulator_.add(std::move(value));
        if (!maxDeadline_ && options_.maxDelay.count() > 0) {
            maxDeadline_ = now + options_.maxDelay;
        }
    }

    [[nodiscard]] std::optional<Clock::time_point> nextDeadline() const {
        if (intervalDeadline_ && maxDeadline_) {
            return std::min(*intervalDeadline_, *maxDeadline_);
        }
        return intervalDeadline_ ? intervalDeadline_ : maxDeadline_;
    }

    /// Emit the pending aggregate if there is one.
    /// @return false when the output was closed underneath the worker.
    bool flush(const char* reason) {
        if (accumulator_.isEmpty()) {
            return true;
        }
        LW_LOG_TRACE(foundation::LogCategory::Debounce, std::string("flush on ") + reason);
        return output_->send(accumulator_.drain());
    }

    const DebounceOptions options_;
    std::shared_ptr<foundation::Channel<InputType>> input_;
    std::shared_ptr<foundation::Channel<OutputType>> output_;

    // Worker-owned burst state.
    Accumulator accumulator_;
    std::optional<Clock::time_point> intervalDeadline_;
    std::optional<Clock::time_point> maxDeadline_;

    std::thread worker_;
};

using SignalDebounce = DebounceStage<SignalAccumulator>;
template <typename T>
using GroupedDebounce = DebounceStage<GroupedAccumulator<T>>;
template <typename T>
using LastDebounce = DebounceStage<LastAccumulator<T>>;
using CountedDebounce = DebounceStage<CountedAccumulator>;

/// Start a debounce stage with the given timing.
template <typename Accumulator>
std::unique_ptr<DebounceStage<Accumulator>>
makeDebounce(std::chrono::milliseconds interval, std::chrono::milliseconds maxDelay = {}) {
    DebounceOptions options;
    options.interval = interval;
    options.maxDelay = maxDelay;
    return std::make_unique<DebounceStage<Accumulator>>(options);
}

} // namespace lw::debounce
