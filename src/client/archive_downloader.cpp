#include "lanshare/client/archive_downloader.hpp"
#include "lanshare/client/body_copy.hpp"
#include "lanshare/events/events.hpp"
#include "lanshare/network/http_client.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace lanshare::client {

namespace fs = std::filesystem;

namespace {

constexpr const char* kArchiveTarget = "/download_all";

void discard(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("Could not remove partial archive {}: {}", path.string(), ec.message());
    }
}

} // namespace

ArchiveDownloader::ArchiveDownloader(ArchiveDownloadOptions options, events::EventBus* bus)
    : options_(options)
    , bus_(bus) {
}

Outcome<DownloadReport> ArchiveDownloader::download(const Endpoint& endpoint,
                                                    const fs::path& save_path,
                                                    const ByteProgressCallback& progress,
                                                    const concurrency::CancellationTokenPtr& cancel) const {
    const auto started = std::chrono::steady_clock::now();

    if (save_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(save_path.parent_path(), ec);
        if (ec) {
            return Fail<DownloadReport>(ErrorCode::PartialWriteFailure,
                "Cannot create " + save_path.parent_path().string() + ": " + ec.message());
        }
    }

    events::emit_if(bus_, events::DownloadStartedEvent{kArchiveTarget, save_path.string(), 0});

    uint32_t retries = 0;
    while (true) {
        auto result = attempt(endpoint, save_path, progress, cancel);
        if (result.is_ok()) {
            result.value().retries_used = retries;
            events::emit_if(bus_, events::FileDownloadCompletedEvent{
                kArchiveTarget, save_path.string(), result.value().total_bytes,
                result.value().transferred_bytes, false,
                std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started)});
            return result;
        }

        discard(save_path);
        Error error = result.error();

        if (is_retryable(error.code)) {
            if (retries < options_.max_retries) {
                ++retries;
                const auto delay = backoff_delay(retries, options_.backoff);
                spdlog::info("Retrying archive download in {} ms (attempt {}/{}): {}",
                             delay.count(), retries, options_.max_retries, error.message);
                events::emit_if(bus_, events::DownloadRetryEvent{kArchiveTarget, retries, delay, error.message});
                if (sleep_unless_cancelled(delay, cancel)) {
                    continue;
                }
                error = Error(ErrorCode::Cancelled, "Bulk download cancelled");
            } else {
                error = Error(ErrorCode::RetriesExhausted,
                              "Bulk download failed after " + std::to_string(options_.max_retries) +
                              " retries: " + error.message);
            }
        }

        spdlog::warn("Bulk download from {} failed ({}): {}", endpoint.key(),
                     error_code_name(error.code), error.message);
        events::emit_if(bus_, events::FileDownloadFailedEvent{kArchiveTarget, error.code, error.message});
        return Err<DownloadReport>(std::move(error));
    }
}

Outcome<DownloadReport> ArchiveDownloader::attempt(const Endpoint& endpoint,
                                                   const fs::path& save_path,
                                                   const ByteProgressCallback& progress,
                                                   const concurrency::CancellationTokenPtr& cancel) const {
    if (concurrency::is_cancelled(cancel)) {
        return Fail<DownloadReport>(ErrorCode::Cancelled, "Bulk download cancelled");
    }

    network::ClientRequest request;
    request.host = endpoint.host;
    request.port = endpoint.port;
    request.target = kArchiveTarget;
    request.timeout = options_.timeout;

    auto opened = network::HttpClient::open(request);
    if (opened.is_error()) {
        return Err<DownloadReport>(opened.error());
    }
    network::HttpResponseStream& response = *opened.value();

    if (response.status() != 200) {
        const ErrorCode code = response.status() == 404 ? ErrorCode::NotFound : ErrorCode::Unexpected;
        return Fail<DownloadReport>(code, "Server answered HTTP " + std::to_string(response.status()) +
                                          " for the archive");
    }

    const uint64_t total = response.head().content_length().value_or(0);

    std::ofstream out(save_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Fail<DownloadReport>(ErrorCode::PartialWriteFailure,
                                    "Cannot open " + save_path.string() + " for writing");
    }

    MonotonicProgress gate(progress);
    uint64_t done = 0;
    auto copied = copy_body(response, out, options_.initial_chunk, options_.chunk_policy,
        [&](uint64_t n) {
            done += n;
            gate.report(done, total);
        },
        cancel);
    out.close();

    if (copied.is_error()) {
        return Err<DownloadReport>(copied.error());
    }

    DownloadReport report;
    report.message = "Bulk download complete";
    report.total_bytes = copied.value();
    report.transferred_bytes = copied.value();
    return Ok(std::move(report));
}

} // namespace lanshare::client
