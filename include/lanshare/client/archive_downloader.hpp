#pragma once

#include "lanshare/client/chunk_policy.hpp"
#include "lanshare/client/download_engine.hpp"
#include "lanshare/client/endpoint.hpp"
#include "lanshare/concurrency/cancellation.hpp"
#include "lanshare/core/error.hpp"
#include "lanshare/events/event_bus.hpp"

#include <chrono>
#include <filesystem>

namespace lanshare::client {

struct ArchiveDownloadOptions {
    std::chrono::milliseconds timeout{180000};
    uint32_t max_retries = 3;
    BackoffPolicy backoff{std::chrono::milliseconds(1000), std::chrono::milliseconds(15000)};
    size_t initial_chunk = 4 * 1024 * 1024;
    ChunkPolicy chunk_policy = archive_chunk_policy();
};

/**
 * @brief Fetches the whole share as one ZIP from /download_all
 *
 * The server builds a fresh archive per request, so a partial archive is
 * worthless: it is deleted before every retry and on final failure.
 */
class ArchiveDownloader {
public:
    explicit ArchiveDownloader(ArchiveDownloadOptions options = ArchiveDownloadOptions{},
                               events::EventBus* bus = nullptr);

    Outcome<DownloadReport> download(const Endpoint& endpoint,
                                     const std::filesystem::path& save_path,
                                     const ByteProgressCallback& progress = {},
                                     const concurrency::CancellationTokenPtr& cancel = nullptr) const;

private:
    Outcome<DownloadReport> attempt(const Endpoint& endpoint,
                                    const std::filesystem::path& save_path,
                                    const ByteProgressCallback& progress,
                                    const concurrency::CancellationTokenPtr& cancel) const;

    ArchiveDownloadOptions options_;
    events::EventBus* bus_;
};

} // namespace lanshare::client
