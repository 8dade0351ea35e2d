#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define LW_VERSION_MAJOR 0
#define LW_VERSION_MINOR 1
#define LW_VERSION_PATCH 0
#define LW_VERSION_STRING "0.1.0"

namespace lw {

/// Project version information at compile time.
struct Version {
    static constexpr int major = LW_VERSION_MAJOR;
    static constexpr int minor = LW_VERSION_MINOR;
    static constexpr int patch = LW_VERSION_PATCH;
    static constexpr const char* string = LW_VERSION_STRING;
};

} // namespace lw
