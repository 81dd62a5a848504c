#pragma once

#ifdef _WIN32
    #define LANSHARE_PLATFORM_WINDOWS
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
#else
    #define LANSHARE_PLATFORM_LINUX
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <unistd.h>
#endif

#include <cstddef>

namespace lanshare {

enum class Platform {
    Windows,
    Linux,
    Unknown
};

inline Platform get_platform() {
#ifdef LANSHARE_PLATFORM_WINDOWS
    return Platform::Windows;
#elif defined(LANSHARE_PLATFORM_LINUX)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

inline const char* platform_name() {
    switch(get_platform()) {
        case Platform::Windows: return "Windows";
        case Platform::Linux: return "Linux";
        default: return "Unknown";
    }
}

/**
 * @brief Whether read-only memory mapping of files is available
 *
 * The range streamer only attempts its mapped path where this is true and
 * falls back to buffered reads everywhere else.
 */
inline bool supports_memory_mapping() {
#ifdef LANSHARE_PLATFORM_LINUX
    return true;
#else
    return false;
#endif
}

/**
 * @brief Page size used to align mapped windows
 */
std::size_t page_size();

} // namespace lanshare
