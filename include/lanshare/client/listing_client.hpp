#pragma once

#include "lanshare/client/connection_health.hpp"
#include "lanshare/client/endpoint.hpp"
#include "lanshare/core/error.hpp"
#include "lanshare/events/event_bus.hpp"
#include "lanshare/index/directory_entry.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace lanshare::client {

struct ListingOptions {
    std::chrono::milliseconds timeout{15000};
    size_t max_body_bytes = 256 * 1024 * 1024;
};

/**
 * @brief Decode a /api/files body
 *
 * A body announced as gzip is decompressed first; when that fails the raw
 * bytes are tried as plain JSON before giving up with DecompressionFailure.
 * JSON that does not describe a listing is MalformedResponse.
 */
Outcome<index::Listing> decode_listing_body(const std::vector<uint8_t>& body, bool gzip_encoded);

/**
 * @brief Fetches the directory listing of a remote share
 *
 * Every attempt updates the health registry and emits EndpointAttemptEvent,
 * which is how connection history gets recorded by whoever subscribes.
 */
class ListingClient {
public:
    ListingClient(ListingOptions options,
                  std::shared_ptr<ConnectionHealthRegistry> health,
                  events::EventBus* bus = nullptr);

    Outcome<index::Listing> list(const Endpoint& endpoint);

    const std::shared_ptr<ConnectionHealthRegistry>& health() const { return health_; }

private:
    Outcome<index::Listing> fetch(const Endpoint& endpoint, bool& compressed, uint64_t& body_bytes);
    void report(const Endpoint& endpoint, const Outcome<index::Listing>& result,
                bool compressed, uint64_t body_bytes);

    ListingOptions options_;
    std::shared_ptr<ConnectionHealthRegistry> health_;
    events::EventBus* bus_;
};

} // namespace lanshare::client
