/// @file config_loader.cpp
/// @brief ConfigLoader implementation: initial load, reload policy and the
///        watcher → debounce → reload pipeline.

#include "lw/config/config_loader.hpp"

#include <initializer_list>
#include <string>
#include <thread>
#include <utility>

#include "lw/foundation/error_code.hpp"
#include "lw/foundation/watch_logger.hpp"

namespace fs = std::filesystem;

using lw::foundation::ConfigSnapshot;
using lw::foundation::ErrorCode;
using lw::foundation::LogCategory;
using lw::foundation::WatchError;
using lw::foundation::WatchResult;

namespace lw::config {

// ── Construction / destruction ──────────────────────────────────────────

ConfigLoader::ConfigLoader(ConstructionTag, fs::path path, ConfigSnapshot defaults,
                           ConfigLoaderOptions options)
    : path_(std::move(path)), defaults_(std::move(defaults)), options_(std::move(options)) {}

ConfigLoader::~ConfigLoader() {
    close();
    // close() may have run on a pipeline thread, which cannot join itself.
    joinPipeline();
}

WatchResult<std::unique_ptr<ConfigLoader>>
ConfigLoader::open(const fs::path& path, ConfigSnapshot defaults, ConfigLoaderOptions options) {
    using OpenResult = WatchResult<std::unique_ptr<ConfigLoader>>;

    auto opened = watch::LocationWatcher::open(path);
    if (opened.hasError()) {
        return OpenResult::err(opened.error());
    }
    auto watcher = std::move(opened).value();

    auto loader = std::make_unique<ConfigLoader>(ConstructionTag{}, watcher->target(),
                                                 std::move(defaults), std::move(options));

    // Initial load: failures fall back to the defaults.
    auto loaded = loader->load();
    if (loaded.hasError()) {
        LW_LOG_WARN(LogCategory::Config,
                    "initial load of " + loader->path_.string() + " failed: " +
                        std::string(loaded.error().message()) + "; using defaults");
        loader->reportError(loaded.error());
        loader->current_ = std::make_shared<const ConfigSnapshot>(loader->validatedDefaults());
    } else {
        loader->current_ = std::make_shared<const ConfigSnapshot>(std::move(loaded).value());
        LW_LOG_INFO(LogCategory::Config, "loaded " + loader->path_.string());
    }

    loader->startPipeline(std::move(watcher));
    return OpenResult::ok(std::move(loader));
}

void ConfigLoader::close() {
    if (closing_.exchange(true)) {
        return;
    }

    closed_.store(true);

    // Closing the watcher ends the event stream, which drains the pipeline.
    if (watcher_) {
        watcher_->close();
    }
    joinPipeline();
}

void ConfigLoader::joinPipeline() {
    std::lock_guard lock(joinMutex_);

    const auto self = std::this_thread::get_id();
    for (std::thread* worker : {&forwarder_, &reloader_}) {
        if (worker->joinable() && worker->get_id() != self) {
            worker->join();
        }
    }
    if (!forwarder_.joinable() && !reloader_.joinable()) {
        debounce_.reset();
    }
}

// ── Public API ──────────────────────────────────────────────────────────

std::shared_ptr<const ConfigSnapshot> ConfigLoader::current() const {
    std::lock_guard lock(snapshotMutex_);
    return current_;
}

void ConfigLoader::watchKey(std::string_view key, KeyWatchCallback callback) {
    std::lock_guard lock(keyWatchersMutex_);
    keyWatchers_[std::string(key)].push_back(std::move(callback));
}

WatchResult<void> ConfigLoader::reload() {
    std::lock_guard reloadLock(reloadMutex_);
    if (closed_.load()) {
        return WatchResult<void>::err(
            WatchError(ErrorCode::WatcherClosed, "config loader for " + path_.string() + " is closed"));
    }

    auto result = WatchResult<void>::ok();
    ConfigSnapshot next;

    auto loaded = load();
    if (loaded.hasError()) {
        reportError(loaded.error());
        result = WatchResult<void>::err(loaded.error());
        if (options_.keepLastValid) {
            LW_LOG_WARN(LogCategory::Config,
                        "reload of " + path_.string() + " failed: " +
                            std::string(loaded.error().message()) + "; keeping last valid");
            return result;
        }
        LW_LOG_WARN(LogCategory::Config,
                    "reload of " + path_.string() + " failed: " +
                        std::string(loaded.error().message()) + "; reverting to defaults");
        next = validatedDefaults();
    } else {
        next = std::move(loaded).value();
    }

    auto published = std::make_shared<const ConfigSnapshot>(std::move(next));
    std::shared_ptr<const ConfigSnapshot> previous;
    {
        std::lock_guard lock(snapshotMutex_);
        previous = std::exchange(current_, published);
    }
    ++reloadCount_;

    if (result.hasValue()) {
        LW_LOG_INFO(LogCategory::Config, "reloaded " + path_.string());
    }

    for (const auto& handler : options_.reloadHandlers) {
        handler(*published);
    }
    notifyKeyWatchers(*previous, *published);
    return result;
}

// ── Loading ─────────────────────────────────────────────────────────────

WatchResult<ConfigSnapshot> ConfigLoader::load() const {
    auto file = ConfigSnapshot::fromFile(path_);
    if (file.hasError()) {
        return file;
    }

    if (options_.strictParsing) {
        auto unknown = file.value().unknownKeys(defaults_);
        if (!unknown.empty()) {
            std::string list;
            for (const auto& key : unknown) {
                if (!list.empty()) {
                    list += ", ";
                }
                list += key;
            }
            return WatchResult<ConfigSnapshot>::err(WatchError(
                ErrorCode::ConfigUnknownKey, "unknown config keys in " + path_.string() + ": " + list));
        }
    }

    auto merged = file.value().mergedOver(defaults_);
    auto validated = applyValidations(merged);
    if (validated.hasError()) {
        return WatchResult<ConfigSnapshot>::err(validated.error());
    }
    return WatchResult<ConfigSnapshot>::ok(std::move(merged));
}

WatchResult<void> ConfigLoader::applyValidations(ConfigSnapshot& snapshot) const {
    for (const auto& validate : options_.validationHandlers) {
        auto result = validate(snapshot);
        if (result.hasError()) {
            if (result.error().code() == ErrorCode::ConfigValidationFailed) {
                return result;
            }
            return WatchResult<void>::err(WatchError(
                ErrorCode::ConfigValidationFailed,
                "validation rejected config: " + std::string(result.error().message())));
        }
    }
    return WatchResult<void>::ok();
}

ConfigSnapshot ConfigLoader::validatedDefaults() const {
    ConfigSnapshot snapshot = defaults_;
    auto validated = applyValidations(snapshot);
    if (validated.hasError()) {
        LW_LOG_WARN(LogCategory::Config,
                    "defaults failed validation: " + std::string(validated.error().message()));
        reportError(validated.error());
        return defaults_;
    }
    return snapshot;
}

void ConfigLoader::reportError(const WatchError& error) const {
    for (const auto& handler : options_.errorHandlers) {
        handler(error);
    }
}

void ConfigLoader::notifyKeyWatchers(const ConfigSnapshot& previous, const ConfigSnapshot& next) {
    std::vector<std::pair<std::string, std::vector<KeyWatchCallback>>> pending;
    {
        std::lock_guard lock(keyWatchersMutex_);
        if (keyWatchers_.empty()) {
            return;
        }
        for (const auto& key : next.changedKeys(previous)) {
            auto it = keyWatchers_.find(key);
            if (it != keyWatchers_.end()) {
                pending.emplace_back(key, it->second);
            }
        }
    }

    for (const auto& [key, callbacks] : pending) {
        for (const auto& callback : callbacks) {
            callback(key, next);
        }
    }
}

// ── Pipeline ────────────────────────────────────────────────────────────

void ConfigLoader::startPipeline(std::unique_ptr<watch::LocationWatcher> watcher) {
    watcher_ = std::move(watcher);

    if (options_.interval.count() > 0) {
        debounce::DebounceOptions debounceOptions;
        debounceOptions.interval = options_.interval;
        debounceOptions.maxDelay = options_.maxDelay;
        debounce_ = std::make_unique<debounce::CountedDebounce>(debounceOptions);
        reloader_ = std::thread([this] { reloadOnBursts(); });
    }
    forwarder_ = std::thread([this] { forwardEvents(); });
}

void ConfigLoader::forwardEvents() {
    auto events = watcher_->events();
    foundation::Sender<debounce::Pulse> bursts;
    if (debounce_) {
        bursts = debounce_->input();
    }

    while (auto event = events.receive()) {
        LW_LOG_DEBUG(LogCategory::Config,
                     "watcher event: " + std::string(watch::toString(*event)));
        if (bursts.valid()) {
            if (!bursts.send(debounce::Pulse{})) {
                break;
            }
        } else if (!closing_.load()) {
            (void)reload();
        }
    }

    // Flushes the last burst and closes the debounce output.
    bursts.close();
}

void ConfigLoader::reloadOnBursts() {
    auto bursts = debounce_->output();
    while (auto changes = bursts.receive()) {
        if (closing_.load()) {
            continue;
        }
        LW_LOG_DEBUG(LogCategory::Config,
                     "debounced " + std::to_string(*changes) + " change(s)");
        (void)reload();
    }
}

} // namespace lw::config
