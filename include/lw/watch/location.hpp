#pragma once

/// @file location.hpp
/// @brief Resolution of a watch target to its nearest existing ancestor.

#include <filesystem>
#include <vector>

namespace lw::watch {

/// Where to watch for a target that may not exist yet.
struct ResolvedLocation {
    /// Nearest existing ancestor directory of the target.
    std::filesystem::path anchorDir;

    /// Direct child of anchorDir on the way down to the target.
    /// Equals the target once the target's parent directory exists.
    std::filesystem::path expectedChild;
};

/// Walk upward from @p target's parent until an existing directory is found.
///
/// @param target Absolute, lexically normal path.
[[nodiscard]] ResolvedLocation resolveLocation(const std::filesystem::path& target);

/// Every directory above @p dir, nearest first, ending with the root.
[[nodiscard]] std::vector<std::filesystem::path> ancestorsOf(const std::filesystem::path& dir);

}  // namespace lw::watch
