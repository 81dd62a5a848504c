#pragma once

/**
 * @file download_engine.hpp
 * @brief Resumable single-file download
 *
 * WHY THIS FILE EXISTS:
 * Pulling one file over a flaky LAN link needs more than a GET: a partial
 * file should be continued, a file that changed on the server must not be
 * stitched onto stale bytes, and a dropped connection should be retried
 * without losing what already arrived.
 *
 * HOW A TRANSFER PROCEEDS (see TransferSession for the phases):
 * 1. A partial local file of size K (resume on) → "Range: bytes=K-"
 * 2. The sidecar "<local>.etag" holds the ETag of the interrupted transfer
 *    and goes out as If-None-Match
 * 3. 304 → the local copy is current if its size equals the size encoded in
 *    the ETag; if smaller, ask again without If-None-Match
 * 4. 206 with a different ETag → the remote file changed, restart from 0
 * 5. 200 → overwrite from byte 0
 * 6. 416 → discard the partial and restart, once
 * 7. Timeout / Unreachable → back off and retry, keeping the partial
 */

#include "lanshare/client/chunk_policy.hpp"
#include "lanshare/client/endpoint.hpp"
#include "lanshare/concurrency/cancellation.hpp"
#include "lanshare/core/error.hpp"
#include "lanshare/events/event_bus.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace lanshare::client {

/// (bytes_done, bytes_total); bytes_done never decreases within one call
using ByteProgressCallback = std::function<void(uint64_t done, uint64_t total)>;

struct DownloadOptions {
    std::chrono::milliseconds timeout{60000};      ///< Per network step of an attempt
    bool resume = true;
    bool verify_integrity = true;                  ///< Keep and present the .etag sidecar
    uint32_t max_retries = 3;
    BackoffPolicy backoff{std::chrono::milliseconds(1000), std::chrono::milliseconds(10000)};
    ChunkPolicy chunk_policy = file_chunk_policy();
};

struct DownloadReport {
    std::string message;
    uint64_t total_bytes = 0;
    uint64_t transferred_bytes = 0;    ///< Received in this call
    uint64_t resumed_from = 0;
    bool already_up_to_date = false;
    uint32_t retries_used = 0;
};

/**
 * @brief Size encoded in a file ETag of the form "<size>-<mtime>"
 */
std::optional<uint64_t> size_from_etag(const std::string& etag);

/**
 * @brief Start offset of a "bytes start-end/total" Content-Range value
 */
std::optional<uint64_t> content_range_start(const std::string& header);

class FileDownloader {
public:
    explicit FileDownloader(DownloadOptions options = DownloadOptions{},
                            events::EventBus* bus = nullptr);

    /**
     * @brief Download `remote_path` of the share into `local_path`
     *
     * Blocking. Parent directories are created. With resume on a partial
     * file is never deleted; with resume off it is removed on failure,
     * except after RetriesExhausted.
     */
    Outcome<DownloadReport> download(const Endpoint& endpoint,
                                     const std::string& remote_path,
                                     const std::filesystem::path& local_path,
                                     const ByteProgressCallback& progress = {},
                                     const concurrency::CancellationTokenPtr& cancel = nullptr) const;

    const DownloadOptions& options() const { return options_; }

    static std::filesystem::path sidecar_path(const std::filesystem::path& local_path);

private:
    DownloadOptions options_;
    events::EventBus* bus_;
};

/**
 * @brief Sleep for `delay` unless the token fires first
 * @return false when cancelled
 */
bool sleep_unless_cancelled(std::chrono::milliseconds delay,
                            const concurrency::CancellationTokenPtr& cancel);

} // namespace lanshare::client
