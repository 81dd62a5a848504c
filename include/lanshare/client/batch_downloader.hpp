#pragma once

#include "lanshare/client/download_engine.hpp"
#include "lanshare/client/endpoint.hpp"
#include "lanshare/concurrency/cancellation.hpp"
#include "lanshare/core/error.hpp"
#include "lanshare/events/event_bus.hpp"
#include "lanshare/index/directory_entry.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace lanshare::client {

/// (files_done, files_total, current_name); called from download workers
using FileProgressCallback =
    std::function<void(size_t files_done, size_t files_total, const std::string& current_name)>;

/// Per-file settings inside a batch: resume on, two retries
inline DownloadOptions batch_file_options() {
    DownloadOptions options;
    options.resume = true;
    options.max_retries = 2;
    return options;
}

struct BatchOptions {
    size_t batch_size = 50;
    size_t max_workers = 8;                             ///< Upper bound on top of the size tier
    std::chrono::milliseconds pause{100};               ///< Between batches
    DownloadOptions file_options = batch_file_options();
};

struct FileFailure {
    std::string remote_path;
    Error error;
};

/**
 * @brief Tally of a batch run; one failed file never aborts the others
 */
struct BatchResult {
    size_t succeeded = 0;
    size_t failed = 0;
    std::vector<std::string> downloaded;
    std::vector<FileFailure> failures;
    bool cancelled = false;

    /// True when at least one file arrived
    bool success() const { return succeeded > 0; }

    /// "Downloaded X files, Y failed"
    std::string message() const;
};

/**
 * @brief Worker count for a set of entries: 8, 4 or 2 by average file size
 *        (below 1 MB, below 10 MB, otherwise), never more than the file count
 */
size_t optimal_worker_count(const index::Listing& entries);

/**
 * @brief Downloads many files of one share in bounded parallel batches
 *
 * Folders are skipped. Files are taken in batches of batch_size; each batch
 * gets its own WorkerPool and the next batch starts after the previous one
 * drained plus a short pause, which bounds the load on the server.
 */
class BatchDownloader {
public:
    explicit BatchDownloader(BatchOptions options = BatchOptions{}, events::EventBus* bus = nullptr);

    BatchResult download(const Endpoint& endpoint,
                         const index::Listing& entries,
                         const std::filesystem::path& base_dir,
                         const FileProgressCallback& progress = {},
                         const concurrency::CancellationTokenPtr& cancel = nullptr) const;

    const BatchOptions& options() const { return options_; }

private:
    BatchOptions options_;
    events::EventBus* bus_;
};

} // namespace lanshare::client
