#pragma once

#include "lanshare/client/endpoint.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace lanshare::client {

/**
 * @brief What the client last learned about an endpoint
 *
 * Advisory only: nothing in the engine refuses to talk to an endpoint
 * because it was unresponsive before.
 */
struct ConnectionHealthRecord {
    std::chrono::system_clock::time_point last_seen;
    size_t last_known_file_count = 0;
    bool responsive = false;
};

struct ConnectionHealth {
    std::optional<bool> responsive;          ///< Empty when the endpoint was never reached
    size_t last_known_file_count = 0;
    std::chrono::duration<double> age{std::chrono::duration<double>::max()};
};

/**
 * @brief Thread-safe map of endpoint key to ConnectionHealthRecord
 */
class ConnectionHealthRegistry {
public:
    void record_success(const Endpoint& endpoint, size_t file_count);

    /**
     * @brief Mark a known endpoint unresponsive
     *
     * Endpoints that never answered are not added; last_seen is left alone.
     */
    void record_failure(const Endpoint& endpoint);

    ConnectionHealth get(const Endpoint& endpoint) const;

    std::optional<ConnectionHealthRecord> record(const Endpoint& endpoint) const;

    void clear();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConnectionHealthRecord> records_;
};

} // namespace lanshare::client
