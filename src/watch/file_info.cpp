/// @file file_info.cpp
/// @brief stat(2)-based FileInfo snapshots.

#include "lw/watch/file_info.hpp"

#include <sys/stat.h>

namespace lw::watch {

std::optional<FileInfo> statPath(const std::filesystem::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }

    FileInfo info;
    info.path = path;
    info.size = static_cast<uint64_t>(st.st_size);
    info.modified = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds(st.st_mtim.tv_sec) +
            std::chrono::nanoseconds(st.st_mtim.tv_nsec)));
    info.mode = static_cast<uint32_t>(st.st_mode);
    info.identity = FileIdentity{static_cast<uint64_t>(st.st_dev),
                                 static_cast<uint64_t>(st.st_ino)};
    info.isDirectory = S_ISDIR(st.st_mode);
    return info;
}

bool sameFile(const std::optional<FileInfo>& a, const std::optional<FileInfo>& b) noexcept {
    return a.has_value() && b.has_value() && a->identity == b->identity;
}

}  // namespace lw::watch
