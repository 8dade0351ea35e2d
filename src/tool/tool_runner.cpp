/// @file tool_runner.cpp
/// @brief Implementation of shared command-line tool utilities.

#include "lw/tool/tool_runner.hpp"

#include <chrono>
#include <cstdlib>
#include <string>
#include <string_view>
#include <thread>

using lw::foundation::ConfigSnapshot;
using lw::foundation::ErrorCode;
using lw::foundation::WatchError;
using lw::foundation::WatchResult;

namespace lw::tool {

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);

    struct sigaction action {};
    action.sa_handler = &SignalHandler::handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    for (auto& [signo, previous] : saved_) {
        if (::sigaction(signo, &action, &previous) != 0) {
            LW_LOG_WARN(foundation::LogCategory::Core,
                        "cannot install handler for signal " + std::to_string(signo));
        }
    }
}

SignalHandler::~SignalHandler() {
    // A second signal then terminates the process as usual.
    for (const auto& [signo, previous] : saved_) {
        if (::sigaction(signo, &previous, nullptr) != 0) {
            LW_LOG_WARN(foundation::LogCategory::Core,
                        "cannot restore handler for signal " + std::to_string(signo));
        }
    }
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownRequested()) {
        std::this_thread::sleep_for(100ms);
    }
}

// -- Config loading ----------------------------------------------------------

ConfigSnapshot toolConfigDefaults() {
    ToolConfig builtin;
    ConfigSnapshot defaults;
    defaults.set("debounce.interval_ms", static_cast<int>(builtin.interval.count()));
    defaults.set("debounce.max_delay_ms", static_cast<int>(builtin.maxDelay.count()));
    defaults.set("log.level", std::string("info"));
    return defaults;
}

WatchResult<ToolConfig> toolConfigFrom(const ConfigSnapshot& snapshot) {
    ToolConfig cfg;

    auto interval = snapshot.get<int>("debounce.interval_ms");
    if (interval.hasError()) {
        return WatchResult<ToolConfig>::err(interval.error());
    }
    auto maxDelay = snapshot.get<int>("debounce.max_delay_ms");
    if (maxDelay.hasError()) {
        return WatchResult<ToolConfig>::err(maxDelay.error());
    }
    if (interval.value() < 0 || maxDelay.value() < 0) {
        return WatchResult<ToolConfig>::err(WatchError(
            ErrorCode::ConfigValidationFailed, "debounce durations must not be negative"));
    }
    cfg.interval = std::chrono::milliseconds(interval.value());
    cfg.maxDelay = std::chrono::milliseconds(maxDelay.value());

    auto levelName = snapshot.get<std::string>("log.level");
    if (levelName.hasError()) {
        return WatchResult<ToolConfig>::err(levelName.error());
    }
    auto level = foundation::parseLogLevel(levelName.value());
    if (!level) {
        return WatchResult<ToolConfig>::err(WatchError(
            ErrorCode::ConfigValidationFailed, "unknown log level: " + levelName.value()));
    }
    cfg.logLevel = *level;

    return WatchResult<ToolConfig>::ok(cfg);
}

WatchResult<ToolConfig> loadToolConfig(const std::filesystem::path& cliPath) {
    std::filesystem::path configPath = cliPath;

    // Fall back to the environment when no --config was given.
    if (configPath.empty()) {
        const char* envPath = std::getenv("LW_CONFIG_PATH");
        if (envPath != nullptr) {
            configPath = envPath;
        }
    }

    if (configPath.empty()) {
        return toolConfigFrom(toolConfigDefaults());
    }

    auto file = ConfigSnapshot::fromFile(configPath);
    if (file.hasError()) {
        return WatchResult<ToolConfig>::err(file.error());
    }
    return toolConfigFrom(file.value().mergedOver(toolConfigDefaults()));
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

std::filesystem::path parseTargetArg(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--config") {
            ++i;
            continue;
        }
        if (!arg.empty() && arg.front() != '-') {
            return std::filesystem::path(arg);
        }
    }
    return {};
}

std::string formatBurst(const std::vector<watch::WatchEvent>& burst) {
    std::string line = "burst:";
    for (auto event : burst) {
        line += ' ';
        line += watch::toString(event);
    }
    return line;
}

} // namespace lw::tool
