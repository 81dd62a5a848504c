#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace lanshare {

/**
 * @brief Result of stat(2) on a path, following symlinks
 *
 * `modified` keeps sub-second precision so repeated listings of an unchanged
 * tree encode identically.
 */
struct FileStat {
    bool is_file = false;
    bool is_directory = false;
    std::uint64_t size = 0;
    double modified = 0.0;          // Seconds since the epoch
    std::int64_t modified_seconds = 0;
};

std::optional<FileStat> stat_path(const std::filesystem::path& path);

} // namespace lanshare
