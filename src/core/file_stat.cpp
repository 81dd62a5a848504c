#include "lanshare/core/file_stat.hpp"
#include "lanshare/core/platform.hpp"

#include <sys/stat.h>
#include <sys/types.h>

namespace lanshare {

std::optional<FileStat> stat_path(const std::filesystem::path& path) {
    FileStat result;

#ifdef LANSHARE_PLATFORM_WINDOWS
    struct _stat64 st{};
    if (_wstat64(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    result.modified = static_cast<double>(st.st_mtime);
#else
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    result.modified = static_cast<double>(st.st_mtim.tv_sec) +
                      static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
#endif

    result.is_file = (st.st_mode & S_IFMT) == S_IFREG;
    result.is_directory = (st.st_mode & S_IFMT) == S_IFDIR;
    result.size = result.is_file ? static_cast<std::uint64_t>(st.st_size) : 0;
    result.modified_seconds = static_cast<std::int64_t>(st.st_mtime);
    return result;
}

} // namespace lanshare
