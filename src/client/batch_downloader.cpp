#include "lanshare/client/batch_downloader.hpp"
#include "lanshare/concurrency/worker_pool.hpp"
#include "lanshare/core/shared_path.hpp"
#include "lanshare/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <thread>

namespace lanshare::client {

namespace fs = std::filesystem;

std::string BatchResult::message() const {
    return "Downloaded " + std::to_string(succeeded) + " files, " + std::to_string(failed) + " failed";
}

size_t optimal_worker_count(const index::Listing& entries) {
    size_t file_count = 0;
    uint64_t total_size = 0;
    for (const auto& entry : entries) {
        if (entry.is_file()) {
            ++file_count;
            total_size += entry.size;
        }
    }
    if (file_count == 0) {
        return 0;
    }

    const double average = static_cast<double>(total_size) / static_cast<double>(file_count);
    size_t tier = 2;
    if (average < 1024.0 * 1024.0) {
        tier = 8;
    } else if (average < 10.0 * 1024.0 * 1024.0) {
        tier = 4;
    }
    return std::min(tier, file_count);
}

BatchDownloader::BatchDownloader(BatchOptions options, events::EventBus* bus)
    : options_(options)
    , bus_(bus) {
    if (options_.batch_size == 0) {
        options_.batch_size = 50;
    }
}

BatchResult BatchDownloader::download(const Endpoint& endpoint,
                                      const index::Listing& entries,
                                      const fs::path& base_dir,
                                      const FileProgressCallback& progress,
                                      const concurrency::CancellationTokenPtr& cancel) const {
    const auto started = std::chrono::steady_clock::now();

    index::Listing files;
    std::copy_if(entries.begin(), entries.end(), std::back_inserter(files),
                 [](const index::DirectoryEntry& entry) { return entry.is_file(); });

    BatchResult result;
    std::mutex result_mutex;
    std::atomic<size_t> files_done{0};
    const size_t files_total = files.size();

    size_t workers = optimal_worker_count(files);
    if (options_.max_workers > 0) {
        workers = std::min(workers, options_.max_workers);
    }

    const FileDownloader downloader(options_.file_options, bus_);

    auto record = [&](const std::string& remote_path, const Outcome<DownloadReport>& outcome) {
        {
            std::lock_guard<std::mutex> lock(result_mutex);
            if (outcome.is_ok()) {
                ++result.succeeded;
                result.downloaded.push_back(remote_path);
            } else {
                ++result.failed;
                result.failures.push_back({remote_path, outcome.error()});
            }
        }
        const size_t done = files_done.fetch_add(1) + 1;
        if (progress) {
            progress(done, files_total, remote_path);
        }
    };

    for (size_t batch_start = 0; batch_start < files.size(); batch_start += options_.batch_size) {
        if (concurrency::is_cancelled(cancel)) {
            result.cancelled = true;
            for (size_t i = batch_start; i < files.size(); ++i) {
                ++result.failed;
                result.failures.push_back({files[i].path, Error(ErrorCode::Cancelled, "Batch cancelled")});
            }
            break;
        }

        const size_t batch_end = std::min(batch_start + options_.batch_size, files.size());
        const size_t batch_count = batch_end - batch_start;
        const size_t pool_size = std::max<size_t>(1, std::min(workers, batch_count));
        spdlog::debug("Batch {}-{} of {} with {} workers", batch_start + 1, batch_end, files_total, pool_size);

        std::vector<std::pair<std::string, std::future<void>>> pending;
        {
            concurrency::WorkerPool pool(pool_size, batch_count, "batch");
            for (size_t i = batch_start; i < batch_end; ++i) {
                const std::string remote_path = files[i].path;
                pending.emplace_back(remote_path, pool.submit([&, remote_path]() {
                    auto local = resolve_shared_path(base_dir, remote_path);
                    if (local.is_error()) {
                        record(remote_path, Err<DownloadReport>(local.error()));
                        return;
                    }
                    record(remote_path, downloader.download(endpoint, remote_path, local.value(), {}, cancel));
                }));
            }
            pool.shutdown();
        }

        for (auto& [remote_path, future] : pending) {
            try {
                future.get();
            } catch (const std::exception& e) {
                // The file was already tallied; this is the progress callback throwing
                spdlog::error("Progress callback for {} threw: {}", remote_path, e.what());
            }
        }

        if (batch_end < files.size() && !concurrency::is_cancelled(cancel)) {
            std::this_thread::sleep_for(options_.pause);
        }
    }

    for (const auto& failure : result.failures) {
        spdlog::warn("Failed to download {}: {}", failure.remote_path, failure.error.message);
    }
    spdlog::info("{}", result.message());

    events::emit_if(bus_, events::BatchCompletedEvent{result.succeeded, result.failed,
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started)});
    return result;
}

} // namespace lanshare::client
