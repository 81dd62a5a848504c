#include "lanshare/client/body_copy.hpp"

#include <algorithm>
#include <chrono>
#include <vector>

namespace lanshare::client {

Outcome<uint64_t> copy_body(network::HttpResponseStream& response,
                            std::ostream& out,
                            size_t initial_chunk,
                            const ChunkPolicy& policy,
                            const std::function<void(uint64_t)>& on_bytes,
                            const concurrency::CancellationTokenPtr& cancel) {
    size_t chunk = std::max<size_t>(initial_chunk, 1);
    std::vector<uint8_t> buffer(chunk);
    uint64_t copied = 0;
    const auto started = std::chrono::steady_clock::now();

    while (true) {
        if (concurrency::is_cancelled(cancel)) {
            return Fail<uint64_t>(ErrorCode::Cancelled, "Transfer cancelled");
        }
        if (buffer.size() < chunk) {
            buffer.resize(chunk);
        }

        auto n = response.read_some(buffer.data(), chunk);
        if (n.is_error()) {
            return Err<uint64_t>(n.error());
        }
        if (n.value() == 0) {
            break;
        }

        out.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(n.value()));
        if (!out) {
            return Fail<uint64_t>(ErrorCode::PartialWriteFailure, "Writing to disk failed");
        }

        copied += n.value();
        if (on_bytes) {
            on_bytes(n.value());
        }

        if (copied > static_cast<uint64_t>(chunk) * policy.ramp_chunks) {
            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
            if (elapsed.count() > 0.0) {
                chunk = next_chunk_size(chunk, static_cast<double>(copied) / elapsed.count(), policy);
            }
        }
    }

    out.flush();
    if (!out) {
        return Fail<uint64_t>(ErrorCode::PartialWriteFailure, "Flushing to disk failed");
    }
    return Ok(copied);
}

} // namespace lanshare::client
