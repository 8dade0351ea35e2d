#pragma once

/// @file config_loader.hpp
/// @brief ConfigLoader: keeps a YAML configuration snapshot in sync with its file.
///
/// The loader watches the configuration path with a LocationWatcher, coalesces
/// bursts of changes with a CountedDebounce and reloads once per burst:
///   1. Start from the defaults
///   2. Overlay the values read from the file
///   3. Run the validation handlers in order
///   4. Publish the new snapshot
///   5. Notify reload handlers, then per-key watchers of changed keys
///
/// A failed load is reported to the error handlers. The loader then falls
/// back to the defaults, or keeps the last valid snapshot when keepLastValid
/// is set.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include "lw/debounce/debounce_stage.hpp"
#include "lw/foundation/config_snapshot.hpp"
#include "lw/foundation/watch_result.hpp"
#include "lw/watch/location_watcher.hpp"

namespace lw::config {

/// Called with the snapshot that was just published.
using ReloadHandler = std::function<void(const foundation::ConfigSnapshot&)>;

/// Called when loading or validating the file fails.
using ErrorHandler = std::function<void(const foundation::WatchError&)>;

/// May amend the snapshot in place, or abort the load by returning an error.
using ValidationHandler =
    std::function<foundation::WatchResult<void>(foundation::ConfigSnapshot&)>;

/// Called for a watched key whose value changed in a reload.
using KeyWatchCallback =
    std::function<void(std::string_view key, const foundation::ConfigSnapshot&)>;

/// Loader behavior. Handlers run synchronously in the order they are listed.
struct ConfigLoaderOptions {
    /// Quiet time before a burst of file changes triggers a reload.
    /// Zero reloads on every change.
    std::chrono::milliseconds interval{1000};

    /// Longest a continuously changing file may postpone a reload.
    std::chrono::milliseconds maxDelay{3000};

    /// Reject files that contain keys absent from the defaults.
    bool strictParsing = false;

    /// Keep the last valid snapshot when a reload fails instead of
    /// reverting to the defaults.
    bool keepLastValid = false;

    std::vector<ReloadHandler> reloadHandlers;
    std::vector<ErrorHandler> errorHandlers;
    std::vector<ValidationHandler> validationHandlers;
};

/// Live configuration backed by a watched YAML file.
///
/// Example:
/// @code
///   ConfigSnapshot defaults;
///   defaults.set("server.port", 8080);
///
///   ConfigLoaderOptions options;
///   options.reloadHandlers.push_back([](const ConfigSnapshot& cfg) {
///       std::cout << "port: " << cfg.getOr("server.port", 0) << "\n";
///   });
///
///   auto opened = ConfigLoader::open("conf/app.yaml", defaults, std::move(options));
///   auto loader = std::move(opened).value();
///   auto port = loader->current()->getOr("server.port", 0);
/// @endcode
class ConfigLoader {
    struct ConstructionTag {
        explicit ConstructionTag() = default;
    };

public:
    /// Watch @p path and perform the initial load.
    ///
    /// A missing or invalid file is not an error here: it is reported to the
    /// error handlers and the defaults are used.
    ///
    /// @return The running loader, or the watcher's ResolutionFailed /
    ///         SubsystemUnavailable error.
    [[nodiscard]] static foundation::WatchResult<std::unique_ptr<ConfigLoader>>
    open(const std::filesystem::path& path, foundation::ConfigSnapshot defaults,
         ConfigLoaderOptions options = {});

    /// Use open(); the tag keeps construction private to it.
    ConfigLoader(ConstructionTag, std::filesystem::path path,
                 foundation::ConfigSnapshot defaults, ConfigLoaderOptions options);

    ~ConfigLoader();

    ConfigLoader(const ConfigLoader&) = delete;
    ConfigLoader& operator=(const ConfigLoader&) = delete;
    ConfigLoader(ConfigLoader&&) = delete;
    ConfigLoader& operator=(ConfigLoader&&) = delete;

    /// The snapshot currently in effect. Never null.
    [[nodiscard]] std::shared_ptr<const foundation::ConfigSnapshot> current() const;

    [[nodiscard]] const foundation::ConfigSnapshot& defaults() const noexcept { return defaults_; }

    /// Absolute path of the configuration file.
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// Number of snapshots published since open(), the initial load excluded.
    [[nodiscard]] uint64_t reloadCount() const noexcept { return reloadCount_.load(); }

    /// Register @p callback for changes of @p key.
    void watchKey(std::string_view key, KeyWatchCallback callback);

    /// Reload the file now.
    ///
    /// Applies the same failure policy as an automatic reload. Must not be
    /// called from one of the loader's own handlers.
    ///
    /// @return The load or validation error, if any; WatcherClosed after close().
    foundation::WatchResult<void> reload();

    /// Stop watching the file. Idempotent; the last snapshot stays readable
    /// but no longer changes.
    ///
    /// May be called from a reload or key-watch handler. In that case the
    /// handler's own pipeline thread is joined by the destructor, which must
    /// not run on a handler thread.
    void close();

private:

    /// Read the file and build a validated snapshot from it.
    [[nodiscard]] foundation::WatchResult<foundation::ConfigSnapshot> load() const;

    /// Run the validation handlers over @p snapshot.
    [[nodiscard]] foundation::WatchResult<void>
    applyValidations(foundation::ConfigSnapshot& snapshot) const;

    /// Defaults with validations applied; the raw defaults if a validation aborts.
    [[nodiscard]] foundation::ConfigSnapshot validatedDefaults() const;

    void reportError(const foundation::WatchError& error) const;
    void notifyKeyWatchers(const foundation::ConfigSnapshot& previous,
                           const foundation::ConfigSnapshot& next);

    void startPipeline(std::unique_ptr<watch::LocationWatcher> watcher);

    /// Join the pipeline threads other than the calling one.
    void joinPipeline();

    /// Forward watcher events to the debounce stage, or reload directly.
    void forwardEvents();

    /// Reload once per debounced burst.
    void reloadOnBursts();

    const std::filesystem::path path_;
    const foundation::ConfigSnapshot defaults_;
    const ConfigLoaderOptions options_;

    mutable std::mutex snapshotMutex_;
    std::shared_ptr<const foundation::ConfigSnapshot> current_;

    // Serializes reloads from the pipeline and from reload().
    std::mutex reloadMutex_;
    std::atomic<uint64_t> reloadCount_{0};

    std::mutex keyWatchersMutex_;
    std::unordered_map<std::string, std::vector<KeyWatchCallback>> keyWatchers_;

    std::atomic<bool> closing_{false};
    std::atomic<bool> closed_{false};
    std::mutex joinMutex_;
    std::unique_ptr<watch::LocationWatcher> watcher_;
    std::unique_ptr<debounce::CountedDebounce> debounce_;
    std::thread forwarder_;
    std::thread reloader_;
};

} // namespace lw::config
