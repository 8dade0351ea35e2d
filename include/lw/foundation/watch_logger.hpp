#pragma once

/// @file watch_logger.hpp
/// @brief WatchLogger wrapping kcenon logger_system for category-based logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "lw/foundation/watch_result.hpp"

namespace lw::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Library plumbing and tools
    Watch    = 1, ///< Location watcher worker
    Debounce = 2, ///< Debounce stage workers
    Config   = 3  ///< Config reload pipeline
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 4;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Watch", "Debounce", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a case-sensitive lowercase level name ("debug", "warning", ...).
/// Returns std::nullopt for unrecognized names.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.path = "/etc/app/config.yaml";
///   ctx.event = "Created";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Watch,
///                         "event emitted", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> path;
    std::optional<std::string> event;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
/// Every category defaults to Info.
///
/// Example:
/// @code
///   WatchLogger logger;
///   logger.log(LogLevel::Info, LogCategory::Config, "config reloaded");
///   logger.setCategoryLevel(LogCategory::Watch, LogLevel::Debug);
/// @endcode
class WatchLogger {
public:
    WatchLogger();
    ~WatchLogger();

    // Non-copyable, movable.
    WatchLogger(const WatchLogger&) = delete;
    WatchLogger& operator=(const WatchLogger&) = delete;
    WatchLogger(WatchLogger&&) noexcept;
    WatchLogger& operator=(WatchLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    /// Context fields are appended as key-value pairs to the log message.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Set the same minimum log level for every category.
    void setAllLevels(LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    WatchResult<void> flush();

    /// Get the global WatchLogger singleton instance.
    static WatchLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lw::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace; macros are global)
// ---------------------------------------------------------------------------

/// @name LW_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// LW_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef LW_MIN_LOG_LEVEL
    #define LW_MIN_LOG_LEVEL 0
#endif

#define LW_LOG(level, cat, msg)                                                  \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= LW_MIN_LOG_LEVEL &&                       \
            ::lw::foundation::WatchLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::lw::foundation::WatchLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define LW_LOG_TRACE(cat, msg) \
    LW_LOG(::lw::foundation::LogLevel::Trace, (cat), (msg))

#define LW_LOG_DEBUG(cat, msg) \
    LW_LOG(::lw::foundation::LogLevel::Debug, (cat), (msg))

#define LW_LOG_INFO(cat, msg) \
    LW_LOG(::lw::foundation::LogLevel::Info, (cat), (msg))

#define LW_LOG_WARN(cat, msg) \
    LW_LOG(::lw::foundation::LogLevel::Warning, (cat), (msg))

#define LW_LOG_ERROR(cat, msg) \
    LW_LOG(::lw::foundation::LogLevel::Error, (cat), (msg))

/// @}
