#pragma once

#include "lanshare/client/chunk_policy.hpp"
#include "lanshare/concurrency/cancellation.hpp"
#include "lanshare/core/error.hpp"
#include "lanshare/network/http_client.hpp"

#include <cstdint>
#include <functional>
#include <ostream>

namespace lanshare::client {

/**
 * @brief Copy a response body to `out` in adaptively sized reads
 *
 * Starts with `initial_chunk` byte reads; once more than
 * policy.ramp_chunks chunks worth of bytes arrived, each read size is
 * recomputed from the observed throughput with next_chunk_size().
 * `on_bytes` sees the byte count of every write, in order.
 *
 * @return Bytes copied, or Cancelled / PartialWriteFailure / the read error
 */
Outcome<uint64_t> copy_body(network::HttpResponseStream& response,
                            std::ostream& out,
                            size_t initial_chunk,
                            const ChunkPolicy& policy,
                            const std::function<void(uint64_t)>& on_bytes,
                            const concurrency::CancellationTokenPtr& cancel);

/**
 * @brief Forwards progress only when it does not go backwards
 */
class MonotonicProgress {
public:
    explicit MonotonicProgress(std::function<void(uint64_t, uint64_t)> sink)
        : sink_(std::move(sink)) {}

    void report(uint64_t done, uint64_t total) {
        if (!sink_ || (reported_ && done < last_done_)) {
            return;
        }
        reported_ = true;
        last_done_ = done;
        sink_(done, total);
    }

private:
    std::function<void(uint64_t, uint64_t)> sink_;
    uint64_t last_done_ = 0;
    bool reported_ = false;
};

} // namespace lanshare::client
