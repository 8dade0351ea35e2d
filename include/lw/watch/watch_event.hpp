#pragma once

/// @file watch_event.hpp
/// @brief Transitions reported by a LocationWatcher.

#include <cstdint>
#include <string_view>

namespace lw::watch {

/// A state change of the watched location.
enum class WatchEvent : uint8_t {
    Created = 1, ///< Absent -> Present.
    Updated = 2, ///< Present -> Present (content or identity changed).
    Deleted = 3  ///< Present -> Absent.
};

[[nodiscard]] constexpr std::string_view toString(WatchEvent e) {
    switch (e) {
        case WatchEvent::Created:
            return "Created";
        case WatchEvent::Updated:
            return "Updated";
        case WatchEvent::Deleted:
            return "Deleted";
    }
    return "Invalid";
}

}  // namespace lw::watch
