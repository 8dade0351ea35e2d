#pragma once

/// @file file_info.hpp
/// @brief Metadata snapshot of a filesystem item, with a stable identity.

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace lw::watch {

/// Device + inode pair: two paths with equal identity denote the same file.
struct FileIdentity {
    uint64_t device = 0;
    uint64_t inode = 0;

    friend bool operator==(const FileIdentity&, const FileIdentity&) = default;
};

/// Result of stat-ing a path.
struct FileInfo {
    std::filesystem::path path;
    uint64_t size = 0;
    std::chrono::system_clock::time_point modified{};
    uint32_t mode = 0;
    FileIdentity identity;
    bool isDirectory = false;
};

/// Stat @p path, following symlinks.
/// @return std::nullopt when the path is absent or cannot be stat-ed.
[[nodiscard]] std::optional<FileInfo> statPath(const std::filesystem::path& path);

/// True when both snapshots exist and denote the same underlying file.
[[nodiscard]] bool sameFile(const std::optional<FileInfo>& a,
                            const std::optional<FileInfo>& b) noexcept;

}  // namespace lw::watch
