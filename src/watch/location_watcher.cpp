/// @file location_watcher.cpp
/// @brief LocationWatcher implementation: inotify worker with self-healing
///        re-resolution of the watched path.

#include "lw/watch/location_watcher.hpp"

#include "lw/foundation/watch_logger.hpp"
#include "lw/watch/backoff.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;

using lw::foundation::ErrorCode;
using lw::foundation::LogCategory;
using lw::foundation::LogContext;
using lw::foundation::LogLevel;
using lw::foundation::WatchError;
using lw::foundation::WatchLogger;
using lw::foundation::WatchResult;

namespace lw::watch {

namespace {

// Anchor: everything that can change the child we are waiting for.
constexpr uint32_t kAnchorMask = IN_CREATE | IN_MOVED_TO | IN_DELETE | IN_MOVED_FROM |
                                 IN_MODIFY | IN_ATTRIB | IN_DELETE_SELF | IN_MOVE_SELF |
                                 IN_ONLYDIR;

// Ancestors: only their own disappearance matters.
constexpr uint32_t kAncestorMask = IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR | IN_MASK_ADD;

constexpr uint32_t kRemoveMask = IN_DELETE | IN_DELETE_SELF | IN_MOVED_FROM | IN_MOVE_SELF |
                                 IN_UNMOUNT;
constexpr uint32_t kCreateMask = IN_CREATE | IN_MOVED_TO;
constexpr uint32_t kModifyMask = IN_MODIFY | IN_ATTRIB;

constexpr std::size_t kReadBufferSize = 64 * (sizeof(inotify_event) + NAME_MAX + 1);

std::string errnoMessage(std::string_view what, int err) {
    std::string msg(what);
    msg += ": ";
    msg += std::strerror(err);
    return msg;
}

std::string describeMask(uint32_t mask) {
    static constexpr std::array<std::pair<uint32_t, std::string_view>, 12> kNames = {{
        {IN_CREATE, "CREATE"},
        {IN_MOVED_TO, "MOVED_TO"},
        {IN_DELETE, "DELETE"},
        {IN_MOVED_FROM, "MOVED_FROM"},
        {IN_MODIFY, "MODIFY"},
        {IN_ATTRIB, "ATTRIB"},
        {IN_DELETE_SELF, "DELETE_SELF"},
        {IN_MOVE_SELF, "MOVE_SELF"},
        {IN_UNMOUNT, "UNMOUNT"},
        {IN_Q_OVERFLOW, "Q_OVERFLOW"},
        {IN_IGNORED, "IGNORED"},
        {IN_ISDIR, "ISDIR"},
    }};

    std::string out;
    for (const auto& [bit, name] : kNames) {
        if ((mask & bit) != 0) {
            if (!out.empty()) {
                out += '|';
            }
            out += name;
        }
    }
    return out.empty() ? std::string("NONE") : out;
}

}  // namespace

// ── Construction / destruction ──────────────────────────────────────────

LocationWatcher::LocationWatcher(ConstructionTag, fs::path target, int inotifyFd,
                                 int wakeReadFd, int wakeWriteFd, WatcherOptions options)
    : target_(std::move(target)),
      options_(options),
      inotifyFd_(inotifyFd),
      wakeReadFd_(wakeReadFd),
      wakeWriteFd_(wakeWriteFd),
      events_(std::make_shared<foundation::Channel<WatchEvent>>(options.eventBuffer)),
      readBuffer_(kReadBufferSize) {}

LocationWatcher::~LocationWatcher() {
    close();
}

WatchResult<std::unique_ptr<LocationWatcher>>
LocationWatcher::open(const fs::path& path, std::stop_token cancel, WatcherOptions options) {
    using OpenResult = WatchResult<std::unique_ptr<LocationWatcher>>;

    if (path.empty()) {
        return OpenResult::err(WatchError(ErrorCode::ResolutionFailed, "watch path is empty"));
    }

    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    if (ec) {
        return OpenResult::err(WatchError(
            ErrorCode::ResolutionFailed,
            "cannot make '" + path.string() + "' absolute: " + ec.message()));
    }
    absolute = absolute.lexically_normal();
    if (!absolute.has_filename() && absolute != absolute.root_path()) {
        absolute = absolute.parent_path();
    }

    int inotifyFd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotifyFd < 0) {
        return OpenResult::err(WatchError(ErrorCode::SubsystemUnavailable,
                                          errnoMessage("inotify_init1", errno)));
    }

    std::array<int, 2> wake{-1, -1};
    if (::pipe2(wake.data(), O_NONBLOCK | O_CLOEXEC) != 0) {
        auto msg = errnoMessage("pipe2", errno);
        ::close(inotifyFd);
        return OpenResult::err(WatchError(ErrorCode::SubsystemUnavailable, std::move(msg)));
    }

    auto watcher = std::make_unique<LocationWatcher>(ConstructionTag{}, absolute, inotifyFd,
                                                     wake[0], wake[1], options);
    watcher->start(std::move(cancel));

    LW_LOG_DEBUG(LogCategory::Watch, "watching " + absolute.string());
    return OpenResult::ok(std::move(watcher));
}

void LocationWatcher::start(std::stop_token cancel) {
    // Taken before open() returns so currentInfo() is valid immediately.
    observed_ = statPath(target_);
    info_ = observed_;

    worker_ = std::thread([this] { run(); });

    if (cancel.stop_possible()) {
        // Runs requestStop() right away if the token is already triggered.
        cancelCallback_.emplace(std::move(cancel), [this] { requestStop(); });
    }
}

// ── Public API ──────────────────────────────────────────────────────────

foundation::Receiver<WatchEvent> LocationWatcher::events() const {
    return foundation::Receiver<WatchEvent>(events_);
}

std::optional<FileInfo> LocationWatcher::currentInfo() const {
    std::lock_guard lock(infoMutex_);
    return info_;
}

void LocationWatcher::close() {
    if (closed_.exchange(true)) {
        return;
    }

    // Waits for a callback already running on another thread.
    cancelCallback_.reset();
    requestStop();

    if (worker_.joinable()) {
        worker_.join();
    }

    for (int* fd : {&inotifyFd_, &wakeReadFd_, &wakeWriteFd_}) {
        if (*fd >= 0) {
            ::close(*fd);
            *fd = -1;
        }
    }
}

bool LocationWatcher::isClosed() const noexcept {
    return closed_.load() || stopRequested_.load();
}

void LocationWatcher::requestStop() {
    if (stopRequested_.exchange(true)) {
        return;
    }

    char byte = 1;
    if (::write(wakeWriteFd_, &byte, 1) < 0 && errno != EAGAIN) {
        LW_LOG_WARN(LogCategory::Watch, errnoMessage("failed to wake watcher", errno));
    }

    // Unblocks a worker stuck handing an event to a stalled consumer.
    events_->close();
}

// ── Worker: outer recovery loop ─────────────────────────────────────────

void LocationWatcher::run() {
    Backoff backoff(options_.initialBackoff, options_.maxBackoff);

    while (!stopRequested_.load()) {
        location_ = resolveLocation(target_);
        LW_LOG_DEBUG(LogCategory::Watch,
                     "resolved " + target_.string() + " -> anchor " +
                         location_.anchorDir.string() + ", expecting " +
                         location_.expectedChild.string());

        auto registered = registerWatches();
        if (registered.hasError()) {
            removeWatches();
            LW_LOG_WARN(LogCategory::Watch,
                        std::string(registered.error().message()) + "; retrying in " +
                            std::to_string(backoff.current().count()) + "ms");
            if (waitForStop(backoff.advance())) {
                break;
            }
            continue;
        }

        auto end = reconcile();
        if (!end) {
            end = dispatchEvents();
        }
        removeWatches();

        if (*end == CycleEnd::Terminate) {
            break;
        }
        if (*end == CycleEnd::Failed) {
            if (waitForStop(backoff.advance())) {
                break;
            }
            continue;
        }
        backoff.reset();
    }

    removeWatches();
    events_->close();
    LW_LOG_DEBUG(LogCategory::Watch, "stopped watching " + target_.string());
}

WatchResult<void> LocationWatcher::registerWatches() {
    int wd = ::inotify_add_watch(inotifyFd_, location_.anchorDir.c_str(), kAnchorMask);
    if (wd < 0) {
        return WatchResult<void>::err(WatchError(
            ErrorCode::WatchRegistrationFailed,
            errnoMessage("cannot watch " + location_.anchorDir.string(), errno)));
    }
    watches_.emplace(wd, location_.anchorDir);

    for (const auto& dir : ancestorsOf(location_.anchorDir)) {
        int ancestorWd = ::inotify_add_watch(inotifyFd_, dir.c_str(), kAncestorMask);
        if (ancestorWd < 0) {
            // An unwatchable ancestor only weakens detection above it.
            LW_LOG_DEBUG(LogCategory::Watch,
                         errnoMessage("cannot watch ancestor " + dir.string(), errno));
            continue;
        }
        watches_.emplace(ancestorWd, dir);
    }
    return WatchResult<void>::ok();
}

void LocationWatcher::removeWatches() {
    for (const auto& [wd, dir] : watches_) {
        // EINVAL means the kernel already dropped it (directory gone).
        if (::inotify_rm_watch(inotifyFd_, wd) != 0 && errno != EINVAL) {
            LW_LOG_DEBUG(LogCategory::Watch,
                         errnoMessage("cannot unwatch " + dir.string(), errno));
        }
    }
    watches_.clear();
}

std::optional<LocationWatcher::CycleEnd> LocationWatcher::reconcile() {
    anchorChild_ = statPath(location_.expectedChild);
    auto info = targetResolved() ? anchorChild_ : statPath(target_);

    bool delivered = true;
    if (info && !observed_) {
        delivered = emit(WatchEvent::Created, info);
    } else if (!info && observed_) {
        delivered = emit(WatchEvent::Deleted, std::nullopt);
    } else if (info && observed_ && !sameFile(info, observed_)) {
        delivered = emit(WatchEvent::Updated, info);
    } else {
        observed_ = info;
        std::lock_guard lock(infoMutex_);
        info_ = std::move(info);
    }
    if (!delivered) {
        return CycleEnd::Terminate;
    }

    // The path grew deeper while the watches were being registered.
    if (!targetResolved() && anchorChild_ && anchorChild_->isDirectory) {
        return CycleEnd::Reresolve;
    }
    return std::nullopt;
}

// ── Worker: inner dispatch loop ─────────────────────────────────────────

LocationWatcher::CycleEnd LocationWatcher::dispatchEvents() {
    std::array<pollfd, 2> fds{};
    fds[0] = pollfd{inotifyFd_, POLLIN, 0};
    fds[1] = pollfd{wakeReadFd_, POLLIN, 0};

    while (true) {
        int rc = ::poll(fds.data(), fds.size(), -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LW_LOG_WARN(LogCategory::Watch, errnoMessage("poll failed", errno));
            return CycleEnd::Failed;
        }

        if (stopRequested_.load() || (fds[1].revents & POLLIN) != 0) {
            return CycleEnd::Terminate;
        }
        if ((fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
            LW_LOG_WARN(LogCategory::Watch, "inotify descriptor reported an error");
            return CycleEnd::Failed;
        }
        if ((fds[0].revents & POLLIN) == 0) {
            continue;
        }

        auto length = ::read(inotifyFd_, readBuffer_.data(), readBuffer_.size());
        if (length < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                continue;
            }
            LW_LOG_WARN(LogCategory::Watch, errnoMessage("inotify read failed", errno));
            return CycleEnd::Failed;
        }

        if (auto end = handleBatch(readBuffer_.data(), static_cast<std::size_t>(length))) {
            return *end;
        }
    }
}

std::optional<LocationWatcher::CycleEnd>
LocationWatcher::handleBatch(const char* buffer, std::size_t length) {
    bool created = false;
    bool updated = false;

    // One Updated per batch, and none when the batch already reported Created.
    auto flushUpdate = [&]() {
        if (!updated || created) {
            return true;
        }
        updated = false;
        auto info = statPath(target_);
        if (!info) {
            return true;  // A removal event is on its way.
        }
        anchorChild_ = info;
        return emit(WatchEvent::Updated, std::move(info));
    };

    std::size_t offset = 0;
    while (offset + sizeof(inotify_event) <= length) {
        const auto* ev = reinterpret_cast<const inotify_event*>(buffer + offset);
        offset += sizeof(inotify_event) + ev->len;

        if ((ev->mask & IN_Q_OVERFLOW) != 0) {
            LW_LOG_WARN(LogCategory::Watch, "inotify queue overflow on " + target_.string());
            return flushUpdate() ? CycleEnd::Failed : CycleEnd::Terminate;
        }
        if ((ev->mask & IN_IGNORED) != 0) {
            continue;
        }
        auto it = watches_.find(ev->wd);
        if (it == watches_.end()) {
            continue;  // Left over from a previous cycle.
        }

        fs::path eventPath = it->second;
        if (ev->len > 0) {
            eventPath /= ev->name;
        }
        LW_LOG_DEBUG(LogCategory::Watch,
                     "raw " + describeMask(ev->mask) + " " + eventPath.string());

        if ((ev->mask & kRemoveMask) != 0) {
            // A named removal matters only for the child on the way to the target.
            if (ev->len > 0 && eventPath != location_.expectedChild) {
                continue;
            }
            if (!flushUpdate() || !handleRemove()) {
                return CycleEnd::Terminate;
            }
            return CycleEnd::Reresolve;
        }

        if ((ev->mask & kCreateMask) != 0) {
            bool replaced = false;
            if (!handleCreate(created, replaced)) {
                return CycleEnd::Terminate;
            }
            if (!targetResolved()) {
                return CycleEnd::Reresolve;
            }
            if (replaced) {
                updated = true;
            }
            continue;
        }

        if ((ev->mask & kModifyMask) != 0) {
            if (!sameFile(statPath(eventPath), anchorChild_)) {
                continue;
            }
            if (!targetResolved()) {
                return CycleEnd::Reresolve;
            }
            updated = true;
        }
    }

    if (!flushUpdate()) {
        return CycleEnd::Terminate;
    }
    return std::nullopt;
}

bool LocationWatcher::handleRemove() {
    auto info = statPath(target_);
    if (!info && observed_) {
        return emit(WatchEvent::Deleted, std::nullopt);
    }
    return true;
}

bool LocationWatcher::handleCreate(bool& created, bool& replaced) {
    auto info = statPath(target_);
    if (!info) {
        return true;
    }

    if (!observed_) {
        if (targetResolved()) {
            anchorChild_ = info;
        }
        created = true;
        return emit(WatchEvent::Created, std::move(info));
    }

    // Renamed over while present: same location, different file.
    if (!sameFile(info, observed_)) {
        if (targetResolved()) {
            anchorChild_ = info;
        }
        observed_ = info;
        std::lock_guard lock(infoMutex_);
        info_ = std::move(info);
        replaced = true;
    }
    return true;
}

bool LocationWatcher::waitForStop(std::chrono::milliseconds delay) {
    pollfd wake{wakeReadFd_, POLLIN, 0};
    int rc = ::poll(&wake, 1, static_cast<int>(delay.count()));
    if (rc < 0 && errno != EINTR) {
        LW_LOG_WARN(LogCategory::Watch, errnoMessage("backoff wait failed", errno));
    }
    return stopRequested_.load() || (rc > 0 && (wake.revents & POLLIN) != 0);
}

bool LocationWatcher::emit(WatchEvent event, std::optional<FileInfo> info) {
    observed_ = info;
    {
        std::lock_guard lock(infoMutex_);
        info_ = std::move(info);
    }

    auto& logger = WatchLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Watch)) {
        LogContext ctx;
        ctx.path = target_.string();
        ctx.event = std::string(toString(event));
        logger.logWithContext(LogLevel::Debug, LogCategory::Watch, "event", ctx);
    }

    return events_->send(event);
}

}  // namespace lw::watch
