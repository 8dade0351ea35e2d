/// @file watch_logger.cpp
/// @brief WatchLogger implementation wrapping kcenon logger_system.

#include "lw/foundation/watch_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace lw::foundation {

// ---------------------------------------------------------------------------
// Level mapping: LW -> kcenon
// ---------------------------------------------------------------------------
static kcenon::common::interfaces::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kcenon::common::interfaces::log_level::trace;
        case LogLevel::Debug:    return kcenon::common::interfaces::log_level::debug;
        case LogLevel::Info:     return kcenon::common::interfaces::log_level::info;
        case LogLevel::Warning:  return kcenon::common::interfaces::log_level::warning;
        case LogLevel::Error:    return kcenon::common::interfaces::log_level::error;
        case LogLevel::Critical: return kcenon::common::interfaces::log_level::critical;
        case LogLevel::Off:      return kcenon::common::interfaces::log_level::off;
    }
    return kcenon::common::interfaces::log_level::info;
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Context serialization
// ---------------------------------------------------------------------------
static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.path && !ctx.path->empty()) {
        append("path", *ctx.path);
    }
    if (ctx.event && !ctx.event->empty()) {
        append("event", *ctx.event);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct WatchLogger::Impl {
    // Per-category log levels (atomic: workers read them on every event)
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers registered in GlobalLoggerRegistry, one per category
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(LogLevel::Info, std::memory_order_relaxed);
            loggerNames[i] = std::string("lw.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kcenon::common::interfaces::ILogger> getLogger(
        LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kcenon::common::interfaces::GlobalLoggerRegistry::null_logger();
        }
        // Named logger first, then the registry default
        auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        if (!logger->is_enabled(kcenon::common::interfaces::log_level::off)) {
            auto defaultLogger = registry.get_default_logger();
            if (defaultLogger->is_enabled(kcenon::common::interfaces::log_level::off)
                || defaultLogger != kcenon::common::interfaces::GlobalLoggerRegistry::null_logger()) {
                return defaultLogger;
            }
        }
        return logger;
    }

    static std::string format(LogCategory cat, std::string_view msg,
                              std::string_view ctxStr) {
        // Format: [Category] message {key=val, ...}
        std::string formatted;
        formatted.reserve(msg.size() + ctxStr.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctxStr.empty()) {
            formatted += " {";
            formatted += ctxStr;
            formatted += '}';
        }
        return formatted;
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
WatchLogger::WatchLogger() : impl_(std::make_unique<Impl>()) {}

WatchLogger::~WatchLogger() = default;

WatchLogger::WatchLogger(WatchLogger&&) noexcept = default;
WatchLogger& WatchLogger::operator=(WatchLogger&&) noexcept = default;

// ---------------------------------------------------------------------------
// log() / logWithContext()
// ---------------------------------------------------------------------------
void WatchLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }

    auto logger = impl_->getLogger(cat);
    (void)logger->log(mapLevel(level), Impl::format(cat, msg, {}));
}

void WatchLogger::logWithContext(LogLevel level, LogCategory cat,
                                 std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }

    auto logger = impl_->getLogger(cat);
    (void)logger->log(mapLevel(level), Impl::format(cat, msg, formatContext(ctx)));
}

// ---------------------------------------------------------------------------
// Category level control
// ---------------------------------------------------------------------------
void WatchLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

void WatchLogger::setAllLevels(LogLevel minLevel) {
    for (auto& level : impl_->categoryLevels) {
        level.store(minLevel, std::memory_order_release);
    }
}

LogLevel WatchLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool WatchLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

// ---------------------------------------------------------------------------
// flush()
// ---------------------------------------------------------------------------
WatchResult<void> WatchLogger::flush() {
    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return WatchResult<void>::err(
            WatchError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return WatchResult<void>::ok();
}

// ---------------------------------------------------------------------------
// instance()
// ---------------------------------------------------------------------------
WatchLogger& WatchLogger::instance() {
    static WatchLogger inst;
    return inst;
}

} // namespace lw::foundation
