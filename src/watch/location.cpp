/// @file location.cpp
/// @brief Anchor resolution for watch targets that may not exist yet.

#include "lw/watch/location.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace lw::watch {

ResolvedLocation resolveLocation(const fs::path& target) {
    fs::path child = target;
    fs::path dir = target.parent_path();

    while (true) {
        std::error_code ec;
        if (fs::is_directory(dir, ec)) {
            return ResolvedLocation{dir, child};
        }
        auto next = dir.parent_path();
        if (next == dir || next.empty()) {
            // The root always exists; reaching here means it is unreadable.
            return ResolvedLocation{dir, child};
        }
        child = dir;
        dir = next;
    }
}

std::vector<fs::path> ancestorsOf(const fs::path& dir) {
    std::vector<fs::path> result;
    auto current = dir;
    while (true) {
        auto next = current.parent_path();
        if (next == current || next.empty()) {
            break;
        }
        result.push_back(next);
        current = next;
    }
    return result;
}

}  // namespace lw::watch
