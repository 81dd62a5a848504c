#include "lanshare/core/platform.hpp"

namespace lanshare {

std::size_t page_size() {
#ifdef LANSHARE_PLATFORM_LINUX
    const long size = ::sysconf(_SC_PAGESIZE);
    if (size > 0) {
        return static_cast<std::size_t>(size);
    }
#endif
    return 4096;
}

} // namespace lanshare
