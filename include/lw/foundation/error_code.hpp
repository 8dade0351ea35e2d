#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the location watch library.

#include <cstdint>
#include <string_view>

namespace lw::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone. The debounce
/// stage reports no errors, so 0x0200 is unassigned.
enum class ErrorCode : uint32_t {
    // Watch (0x0100 - 0x01FF)
    ResolutionFailed = 0x0100,
    SubsystemUnavailable = 0x0101,
    WatchRegistrationFailed = 0x0102,
    WatcherClosed = 0x0103,

    // Config (0x0300 - 0x03FF)
    ConfigLoadFailed = 0x0300,
    ConfigParseFailed = 0x0301,
    ConfigKeyNotFound = 0x0302,
    ConfigTypeMismatch = 0x0303,
    ConfigUnknownKey = 0x0304,
    ConfigValidationFailed = 0x0305,

    // Logger (0x0400 - 0x04FF)
    LoggerFlushFailed = 0x0400,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0100: return "Watch";
        case 0x0300: return "Config";
        case 0x0400: return "Logger";
        default: return "Unknown";
    }
}

} // namespace lw::foundation
