#pragma once

/// @file location_watcher.hpp
/// @brief Watches one filesystem location (a path, not an inode) for
///        Created / Updated / Deleted transitions.
///
/// The target does not need to exist. The watcher anchors itself on the
/// nearest existing ancestor directory and follows the path downward as
/// directories appear, so creating the target, renaming an ancestor into
/// place, or deleting any ancestor are all reported against the path.

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <vector>

#include "lw/foundation/channel.hpp"
#include "lw/foundation/watch_result.hpp"
#include "lw/watch/file_info.hpp"
#include "lw/watch/location.hpp"
#include "lw/watch/watch_event.hpp"

namespace lw::watch {

/// Tuning knobs for a LocationWatcher.
struct WatcherOptions {
    /// Capacity of the event stream. A full stream blocks the worker.
    std::size_t eventBuffer = 1;

    /// First delay before retrying a failed watch registration.
    std::chrono::milliseconds initialBackoff{1};

    /// Upper bound of the doubling retry delay.
    std::chrono::milliseconds maxBackoff{1000};
};

/// Single-path watcher backed by Linux inotify and one worker thread.
///
/// Usage:
/// @code
///   auto opened = LocationWatcher::open("conf/app.yaml");
///   if (!opened) {
///       return;
///   }
///   auto watcher = std::move(opened).value();
///   auto events = watcher->events();
///   while (auto ev = events.receive()) {
///       std::cout << toString(*ev) << "\n";
///   }
/// @endcode
///
/// The event stream is closed exactly once: by close(), by destruction, or
/// when the stop token passed to open() is triggered.
class LocationWatcher {
    struct ConstructionTag {
        explicit ConstructionTag() = default;
    };

public:
    /// Open a watcher on @p path.
    ///
    /// @param path    Path to watch; made absolute against the current directory.
    /// @param cancel  Optional external cancellation.
    /// @param options Buffering and retry settings.
    /// @return The running watcher, or ResolutionFailed / SubsystemUnavailable.
    [[nodiscard]] static foundation::WatchResult<std::unique_ptr<LocationWatcher>>
    open(const std::filesystem::path& path, std::stop_token cancel = {},
         WatcherOptions options = {});

    /// Use open(); the tag keeps construction private to it.
    LocationWatcher(ConstructionTag, std::filesystem::path target, int inotifyFd,
                    int wakeReadFd, int wakeWriteFd, WatcherOptions options);

    ~LocationWatcher();

    // Non-copyable, non-movable (owns a thread and file descriptors).
    LocationWatcher(const LocationWatcher&) = delete;
    LocationWatcher& operator=(const LocationWatcher&) = delete;
    LocationWatcher(LocationWatcher&&) = delete;
    LocationWatcher& operator=(LocationWatcher&&) = delete;

    /// Receive-only stream of transitions, in detection order.
    [[nodiscard]] foundation::Receiver<WatchEvent> events() const;

    /// Metadata of the target as last observed, or std::nullopt when absent.
    [[nodiscard]] std::optional<FileInfo> currentInfo() const;

    /// The absolute path being watched.
    [[nodiscard]] const std::filesystem::path& target() const noexcept { return target_; }

    /// Stop the worker, release the OS watches and close the event stream.
    /// Idempotent.
    void close();

    [[nodiscard]] bool isClosed() const noexcept;

private:
    /// How an inner dispatch loop ended.
    enum class CycleEnd : uint8_t {
        Reresolve, ///< Tree shape changed; re-resolve immediately.
        Failed,    ///< Subsystem error; re-resolve after a backoff delay.
        Terminate  ///< Cancelled or the event stream was closed.
    };


    void start(std::stop_token cancel);

    /// Request the worker to stop; safe from any thread, including stop callbacks.
    void requestStop();

    /// Outer recovery loop run on the worker thread.
    void run();

    /// Watch the anchor directory and every ancestor above it.
    foundation::WatchResult<void> registerWatches();

    void removeWatches();

    /// Emit any transition missed while watches were being re-established.
    /// @return std::nullopt to proceed with dispatching.
    std::optional<CycleEnd> reconcile();

    /// Inner loop: read raw notifications until the cycle must end.
    CycleEnd dispatchEvents();

    /// Interpret one read() worth of notifications.
    std::optional<CycleEnd> handleBatch(const char* buffer, std::size_t length);

    bool handleRemove();
    bool handleCreate(bool& created, bool& replaced);

    /// Sleep for @p delay unless woken by a stop request.
    /// @return true if a stop was requested.
    bool waitForStop(std::chrono::milliseconds delay);

    /// Hand @p event to the consumer, recording @p info as the new state.
    bool emit(WatchEvent event, std::optional<FileInfo> info);

    [[nodiscard]] bool targetResolved() const { return location_.expectedChild == target_; }

    const std::filesystem::path target_;
    const WatcherOptions options_;

    int inotifyFd_ = -1;
    int wakeReadFd_ = -1;
    int wakeWriteFd_ = -1;

    std::shared_ptr<foundation::Channel<WatchEvent>> events_;

    mutable std::mutex infoMutex_;
    std::optional<FileInfo> info_;

    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> closed_{false};
    std::optional<std::stop_callback<std::function<void()>>> cancelCallback_;
    std::thread worker_;

    // Worker-owned state; never touched from other threads.
    ResolvedLocation location_;
    std::optional<FileInfo> anchorChild_;
    std::optional<FileInfo> observed_;
    std::unordered_map<int, std::filesystem::path> watches_;
    std::vector<char> readBuffer_;
};

}  // namespace lw::watch
