#pragma once

/// @file tool_runner.hpp
/// @brief Shared utilities for the locwatch command-line tools.
///
/// Provides signal handling, tool configuration loading and CLI argument
/// parsing for lw-watch.

#include <array>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <signal.h>

#include "lw/foundation/config_snapshot.hpp"
#include "lw/foundation/watch_logger.hpp"
#include "lw/foundation/watch_result.hpp"
#include "lw/watch/watch_event.hpp"

namespace lw::tool {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process. The handler
/// only sets a static atomic flag. The destructor reinstates the handlers
/// that were active before construction.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);

    std::array<std::pair<int, struct sigaction>, 2> saved_{
        {{SIGINT, {}}, {SIGTERM, {}}}};
};

/// Settings read by lw-watch.
struct ToolConfig {
    std::chrono::milliseconds interval{100};
    std::chrono::milliseconds maxDelay{1000};
    foundation::LogLevel logLevel = foundation::LogLevel::Info;
};

/// The built-in tool settings as a snapshot
/// (debounce.interval_ms, debounce.max_delay_ms, log.level).
[[nodiscard]] foundation::ConfigSnapshot toolConfigDefaults();

/// Convert a snapshot into ToolConfig.
/// @return ConfigTypeMismatch or ConfigValidationFailed on bad values.
[[nodiscard]] foundation::WatchResult<ToolConfig>
toolConfigFrom(const foundation::ConfigSnapshot& snapshot);

/// Load the tool configuration.
///
/// The config file path is resolved in order:
///   1. @p cliPath (from --config), if not empty
///   2. LW_CONFIG_PATH environment variable (if set)
///   3. none: the built-in defaults are returned
///
/// File values are overlaid on the defaults.
///
/// @return The configuration, or the load/parse/validation error.
[[nodiscard]] foundation::WatchResult<ToolConfig>
loadToolConfig(const std::filesystem::path& cliPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

/// Return the first positional argument, skipping `--config <path>`.
///
/// @return The watch target, or empty path if none was given.
[[nodiscard]] std::filesystem::path
parseTargetArg(int argc, char* argv[]);

/// Render one debounced burst as `burst: Created Updated`.
[[nodiscard]] std::string formatBurst(const std::vector<watch::WatchEvent>& burst);

} // namespace lw::tool
