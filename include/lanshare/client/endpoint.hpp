#pragma once

#include <cstdint>
#include <string>

namespace lanshare::client {

/**
 * @brief A share server as seen by the client: host plus port
 */
struct Endpoint {
    std::string host;
    uint16_t port = 8000;

    Endpoint() = default;
    Endpoint(std::string h, uint16_t p) : host(std::move(h)), port(p) {}

    /// "host:port", the key of the connection health registry
    std::string key() const { return host + ":" + std::to_string(port); }

    bool operator==(const Endpoint& other) const {
        return host == other.host && port == other.port;
    }
};

} // namespace lanshare::client
