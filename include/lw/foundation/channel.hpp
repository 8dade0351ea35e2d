#pragma once

/// @file channel.hpp
/// @brief Bounded blocking Channel<T> with send-only and receive-only handles.
///
/// Workers hand values to their consumers through a Channel. send() blocks
/// while the buffer is full, so a slow consumer throttles its producer
/// instead of growing an unbounded queue. close() is idempotent; values
/// already buffered are still delivered before receivers observe the close.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace lw::foundation {

/// Outcome of a receive with a deadline.
enum class ReceiveStatus : uint8_t {
    Value,   ///< A value was received.
    Timeout, ///< The deadline passed with the channel still open and empty.
    Closed   ///< The channel is closed and fully drained.
};

/// Bounded multi-producer multi-consumer FIFO.
///
/// @tparam T The element type. Must be move-constructible.
///
/// Example:
/// @code
///   auto ch = std::make_shared<Channel<int>>(1);
///   std::thread producer([ch] {
///       for (int i = 0; i < 3; ++i) {
///           ch->send(i);
///       }
///       ch->close();
///   });
///   while (auto v = ch->receive()) {
///       std::cout << *v << "\n";
///   }
///   producer.join();
/// @endcode
template <typename T>
class Channel {
public:
    using Clock = std::chrono::steady_clock;

    /// Construct a channel buffering at most @p capacity values (minimum 1).
    explicit Channel(std::size_t capacity = 1)
        : capacity_(capacity > 0 ? capacity : 1) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    Channel(Channel&&) = delete;
    Channel& operator=(Channel&&) = delete;

    /// Block until there is room, then enqueue @p value.
    /// @return false if the channel was closed; the value is dropped.
    bool send(T value) {
        std::unique_lock lock(mutex_);
        notFull_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(value));
        notEmpty_.notify_one();
        return true;
    }

    /// Block until a value is available or the channel is closed and drained.
    std::optional<T> receive() {
        std::unique_lock lock(mutex_);
        notEmpty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return popLocked();
    }

    /// Wait until @p deadline for a value.
    ReceiveStatus receiveUntil(Clock::time_point deadline, std::optional<T>& out) {
        std::unique_lock lock(mutex_);
        if (!notEmpty_.wait_until(lock, deadline,
                                  [this] { return closed_ || !queue_.empty(); })) {
            return ReceiveStatus::Timeout;
        }
        out = popLocked();
        return out ? ReceiveStatus::Value : ReceiveStatus::Closed;
    }

    /// Close the channel. Blocked senders fail; receivers drain then stop.
    void close() {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    [[nodiscard]] bool isClosed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    std::optional<T> popLocked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        std::optional<T> value(std::move(queue_.front()));
        queue_.pop_front();
        notFull_.notify_one();
        return value;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<T> queue_;
    bool closed_ = false;
};

/// Send-only handle to a Channel. Copies share the same channel.
template <typename T>
class Sender {
public:
    Sender() = default;
    explicit Sender(std::shared_ptr<Channel<T>> channel) : channel_(std::move(channel)) {}

    /// @copydoc Channel::send
    bool send(T value) const { return channel_ && channel_->send(std::move(value)); }

    /// Close the underlying channel (idempotent).
    void close() const {
        if (channel_) {
            channel_->close();
        }
    }

    [[nodiscard]] bool isClosed() const { return !channel_ || channel_->isClosed(); }
    [[nodiscard]] bool valid() const noexcept { return channel_ != nullptr; }

private:
    std::shared_ptr<Channel<T>> channel_;
};

/// Receive-only handle to a Channel. Copies share the same channel.
template <typename T>
class Receiver {
public:
    using Clock = typename Channel<T>::Clock;

    Receiver() = default;
    explicit Receiver(std::shared_ptr<Channel<T>> channel) : channel_(std::move(channel)) {}

    /// @copydoc Channel::receive
    std::optional<T> receive() const {
        if (!channel_) {
            return std::nullopt;
        }
        return channel_->receive();
    }

    /// @copydoc Channel::receiveUntil
    ReceiveStatus receiveUntil(typename Clock::time_point deadline, std::optional<T>& out) const {
        if (!channel_) {
            return ReceiveStatus::Closed;
        }
        return channel_->receiveUntil(deadline, out);
    }

    /// Wait at most @p timeout for a value.
    template <typename Rep, typename Period>
    ReceiveStatus receiveFor(std::chrono::duration<Rep, Period> timeout, std::optional<T>& out) const {
        return receiveUntil(Clock::now() + timeout, out);
    }

    [[nodiscard]] bool isClosed() const { return !channel_ || channel_->isClosed(); }
    [[nodiscard]] bool valid() const noexcept { return channel_ != nullptr; }

private:
    std::shared_ptr<Channel<T>> channel_;
};

/// Create a channel and return its two ends.
template <typename T>
std::pair<Sender<T>, Receiver<T>> makeChannel(std::size_t capacity = 1) {
    auto channel = std::make_shared<Channel<T>>(capacity);
    return {Sender<T>(channel), Receiver<T>(channel)};
}

} // namespace lw::foundation
