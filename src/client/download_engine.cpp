#include "lanshare/client/download_engine.hpp"
#include "lanshare/client/body_copy.hpp"
#include "lanshare/client/transfer_session.hpp"
#include "lanshare/events/events.hpp"
#include "lanshare/network/http_client.hpp"
#include "lanshare/network/url.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <thread>

namespace lanshare::client {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string read_sidecar(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return "";
    }
    std::string line;
    std::getline(in, line);
    return trim(line);
}

void write_sidecar(const fs::path& path, const std::string& etag) {
    std::ofstream out(path, std::ios::trunc);
    out << etag;
    if (!out) {
        spdlog::warn("Could not write {}", path.string());
    }
}

void remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::debug("Could not remove {}: {}", path.string(), ec.message());
    }
}

uint64_t local_size(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return 0;
    }
    const auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

ErrorCode code_for_status(int status) {
    switch (status) {
        case 403: return ErrorCode::Forbidden;
        case 404: return ErrorCode::NotFound;
        default: return ErrorCode::Unexpected;
    }
}

} // namespace

std::optional<uint64_t> size_from_etag(const std::string& etag) {
    std::string value = trim(etag);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    const auto dash = value.find('-');
    if (dash == std::string::npos || dash == 0) {
        return std::nullopt;
    }
    const std::string digits = value.substr(0, dash);
    char* end = nullptr;
    const unsigned long long size = std::strtoull(digits.c_str(), &end, 10);
    if (end != digits.c_str() + digits.size()) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(size);
}

std::optional<uint64_t> content_range_start(const std::string& header) {
    const std::string value = trim(header);
    const std::string prefix = "bytes ";
    if (value.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    const std::string rest = value.substr(prefix.size());
    const auto dash = rest.find('-');
    if (dash == std::string::npos || dash == 0) {
        return std::nullopt;
    }
    const std::string digits = rest.substr(0, dash);
    char* end = nullptr;
    const unsigned long long start = std::strtoull(digits.c_str(), &end, 10);
    if (end != digits.c_str() + digits.size()) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(start);
}

bool sleep_unless_cancelled(std::chrono::milliseconds delay,
                            const concurrency::CancellationTokenPtr& cancel) {
    const auto deadline = std::chrono::steady_clock::now() + delay;
    const auto slice = std::chrono::milliseconds(50);
    while (true) {
        if (concurrency::is_cancelled(cancel)) {
            return false;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, deadline - now));
    }
}

FileDownloader::FileDownloader(DownloadOptions options, events::EventBus* bus)
    : options_(options)
    , bus_(bus) {
}

fs::path FileDownloader::sidecar_path(const fs::path& local_path) {
    return fs::path(local_path.string() + ".etag");
}

Outcome<DownloadReport> FileDownloader::download(const Endpoint& endpoint,
                                                 const std::string& remote_path,
                                                 const fs::path& local_path,
                                                 const ByteProgressCallback& progress,
                                                 const concurrency::CancellationTokenPtr& cancel) const {
    TransferSession session(remote_path, local_path.string());
    MonotonicProgress gate(progress);
    const fs::path sidecar = sidecar_path(local_path);
    uint64_t transferred = 0;

    auto fail = [&](Error error) -> Outcome<DownloadReport> {
        auto marked = session.mark_failed(error.message);
        if (marked.is_error()) {
            spdlog::debug("{}: {}", remote_path, marked.error());
        }
        // Bytes of a transfer that ran out of retries stay for a later resume
        if (!options_.resume && error.code != ErrorCode::RetriesExhausted) {
            remove_quietly(local_path);
        }
        spdlog::warn("Download of {} failed ({}): {}", remote_path, error_code_name(error.code), error.message);
        events::emit_if(bus_, events::FileDownloadFailedEvent{remote_path, error.code, error.message});
        return Err<DownloadReport>(std::move(error));
    };

    auto enter = [&](TransferPhase phase) -> Result<void> {
        auto moved = session.transition_to(phase);
        if (moved.is_error()) {
            spdlog::error("{}: {}", remote_path, moved.error());
        }
        return moved;
    };

    // Returns an error when the failure is terminal, nothing when a retry should follow
    auto retry_or_stop = [&](const Error& error) -> std::optional<Error> {
        if (!is_retryable(error.code)) {
            return error;
        }
        if (session.state().retries_used >= options_.max_retries) {
            return Error(ErrorCode::RetriesExhausted,
                         "Download failed after " + std::to_string(options_.max_retries) +
                         " retries: " + error.message);
        }
        session.note_retry(error.message);
        if (enter(TransferPhase::Retrying).is_error()) {
            return Error(ErrorCode::Unexpected, session.state().last_error);
        }
        const auto delay = backoff_delay(session.state().retries_used, options_.backoff);
        spdlog::info("Retrying {} in {} ms (attempt {}/{}): {}", remote_path, delay.count(),
                     session.state().retries_used, options_.max_retries, error.message);
        events::emit_if(bus_, events::DownloadRetryEvent{remote_path, session.state().retries_used,
                                                         delay, error.message});
        if (!sleep_unless_cancelled(delay, cancel)) {
            return Error(ErrorCode::Cancelled, "Download cancelled");
        }
        return std::nullopt;
    };

    if (local_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(local_path.parent_path(), ec);
        if (ec) {
            return fail(Error(ErrorCode::PartialWriteFailure,
                              "Cannot create " + local_path.parent_path().string() + ": " + ec.message()));
        }
    }

    const std::string target = "/download?file=" + network::url_encode(remote_path);
    bool send_validator = true;
    bool range_restarted = false;
    bool announced = false;

    while (true) {
        if (concurrency::is_cancelled(cancel)) {
            return fail(Error(ErrorCode::Cancelled, "Download cancelled"));
        }

        const uint64_t resume_pos = options_.resume ? local_size(local_path) : 0;
        if (enter(resume_pos > 0 ? TransferPhase::ResumeCheck : TransferPhase::Streaming).is_error()) {
            return fail(Error(ErrorCode::Unexpected, "Transfer state machine rejected a transition"));
        }

        network::ClientRequest request;
        request.host = endpoint.host;
        request.port = endpoint.port;
        request.target = target;
        request.timeout = options_.timeout;
        if (resume_pos > 0) {
            request.headers["Range"] = "bytes=" + std::to_string(resume_pos) + "-";
        }
        const std::string stored_etag = options_.verify_integrity ? read_sidecar(sidecar) : "";
        if (!stored_etag.empty() && send_validator) {
            request.headers["If-None-Match"] = stored_etag;
        }

        auto opened = network::HttpClient::open(request);
        if (opened.is_error()) {
            if (auto terminal = retry_or_stop(opened.error())) {
                return fail(*terminal);
            }
            continue;
        }

        network::HttpResponseStream& response = *opened.value();
        const int status = response.status();
        const std::string etag = response.head().get_header("ETag");

        if (status == 304) {
            const uint64_t have = local_size(local_path);
            const auto expected = size_from_etag(stored_etag);
            if (!expected || have == *expected) {
                if (enter(TransferPhase::Complete).is_error()) {
                    return fail(Error(ErrorCode::Unexpected, "Transfer state machine rejected completion"));
                }
                remove_quietly(sidecar);
                gate.report(have, have);

                DownloadReport report;
                report.message = "File already up to date";
                report.total_bytes = have;
                report.already_up_to_date = true;
                report.retries_used = session.state().retries_used;
                events::emit_if(bus_, events::FileDownloadCompletedEvent{
                    remote_path, local_path.string(), have, 0, true,
                    std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - session.started_at())});
                return Ok(std::move(report));
            }
            if (have > *expected) {
                spdlog::info("Local copy of {} is larger than the remote file, starting over", remote_path);
                remove_quietly(local_path);
            }
            send_validator = false;
            continue;
        }

        if (status == 416) {
            if (range_restarted) {
                return fail(Error(ErrorCode::Unexpected, "Server rejected the resume range of " + remote_path));
            }
            spdlog::info("Resume range for {} not satisfiable, starting over", remote_path);
            range_restarted = true;
            remove_quietly(local_path);
            remove_quietly(sidecar);
            continue;
        }

        if (status != 200 && status != 206) {
            return fail(Error(code_for_status(status),
                              "Server answered HTTP " + std::to_string(status) + " for " + remote_path));
        }

        uint64_t offset = 0;
        if (status == 206) {
            if (resume_pos == 0) {
                return fail(Error(ErrorCode::MalformedResponse, "Unrequested partial content for " + remote_path));
            }
            if (!stored_etag.empty() && !etag.empty() && etag != stored_etag) {
                spdlog::info("{} changed on the server, restarting from byte 0", remote_path);
                remove_quietly(local_path);
                remove_quietly(sidecar);
                continue;
            }
            const auto start = content_range_start(response.head().get_header("Content-Range"));
            if (!start || *start != resume_pos) {
                spdlog::warn("Server resumed {} at the wrong offset, restarting from byte 0", remote_path);
                remove_quietly(local_path);
                remove_quietly(sidecar);
                continue;
            }
            offset = resume_pos;
        }

        const auto declared = response.head().content_length();
        if (!declared) {
            return fail(Error(ErrorCode::MalformedResponse, "Response for " + remote_path + " has no Content-Length"));
        }

        if (enter(TransferPhase::Streaming).is_error()) {
            return fail(Error(ErrorCode::Unexpected, "Transfer state machine rejected streaming"));
        }
        session.begin_stream(offset, *declared, etag);
        const uint64_t total = session.state().total_bytes;

        if (!announced) {
            announced = true;
            events::emit_if(bus_, events::DownloadStartedEvent{remote_path, local_path.string(), offset});
        }
        if (options_.verify_integrity && !etag.empty()) {
            write_sidecar(sidecar, etag);
        }

        std::ofstream out(local_path, std::ios::binary | (offset > 0 ? std::ios::app : std::ios::trunc));
        if (!out) {
            return fail(Error(ErrorCode::PartialWriteFailure, "Cannot open " + local_path.string() + " for writing"));
        }
        gate.report(offset, total);

        auto copied = copy_body(response, out, initial_chunk_size(total), options_.chunk_policy,
            [&](uint64_t n) {
                session.add_bytes(n);
                transferred += n;
                gate.report(session.state().bytes_done, total);
            },
            cancel);
        out.close();

        if (copied.is_error()) {
            const Error& error = copied.error();
            if (error.code == ErrorCode::Cancelled || error.code == ErrorCode::PartialWriteFailure) {
                return fail(error);
            }
            if (auto terminal = retry_or_stop(error)) {
                return fail(*terminal);
            }
            continue;
        }

        if (enter(TransferPhase::Complete).is_error()) {
            return fail(Error(ErrorCode::Unexpected, "Transfer state machine rejected completion"));
        }
        remove_quietly(sidecar);

        DownloadReport report;
        report.message = "Download complete";
        report.total_bytes = total;
        report.transferred_bytes = transferred;
        report.resumed_from = offset;
        report.retries_used = session.state().retries_used;

        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - session.started_at());
        spdlog::debug("Downloaded {} ({} bytes, {} resumed) in {} ms", remote_path, total, offset, duration.count());
        events::emit_if(bus_, events::FileDownloadCompletedEvent{
            remote_path, local_path.string(), total, transferred, false, duration});
        return Ok(std::move(report));
    }
}

} // namespace lanshare::client
