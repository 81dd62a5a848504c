#include "lanshare/server/range_file_streamer.hpp"
#include "lanshare/core/file_stat.hpp"
#include "lanshare/core/platform.hpp"
#include "lanshare/core/shared_path.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <regex>
#include <vector>

#ifdef LANSHARE_PLATFORM_LINUX
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace lanshare::server {

namespace fs = std::filesystem;
using network::HttpResponse;
using network::HttpStatus;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

bool etag_matches(const std::string& presented, const std::string& etag) {
    const std::string candidate = trim(presented);
    if (candidate.empty()) {
        return false;
    }
    if (candidate == etag) {
        return true;
    }
    // Some clients strip the quotes
    return etag.size() > 2 && candidate == etag.substr(1, etag.size() - 2);
}

HttpResponse error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body(message);
    response.set_header("Content-Type", "text/plain; charset=utf-8");
    return response;
}

#ifdef LANSHARE_PLATFORM_LINUX
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};
#endif

} // namespace

std::optional<ByteRange> parse_range_header(const std::string& header) {
    static const std::regex pattern(R"(^\s*bytes=(\d+)-(\d*)\s*$)");
    std::smatch match;
    if (!std::regex_match(header, match, pattern)) {
        return std::nullopt;
    }

    ByteRange range;
    try {
        range.start = std::stoull(match[1].str());
        if (match[2].length() > 0) {
            range.end = std::stoull(match[2].str());
        }
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    if (range.end && *range.end < range.start) {
        return std::nullopt;
    }
    return range;
}

std::string make_file_etag(uint64_t size, int64_t mtime_seconds) {
    return "\"" + std::to_string(size) + "-" + std::to_string(mtime_seconds) + "\"";
}

size_t chunk_size_for(uint64_t file_size) {
    if (file_size < 1024ull * 1024) {
        return 64 * 1024;
    }
    if (file_size < 100ull * 1024 * 1024) {
        return 1024 * 1024;
    }
    return 4 * 1024 * 1024;
}

RangeFileStreamer::RangeFileStreamer(fs::path root, StreamerOptions options)
    : root_(std::move(root))
    , options_(options) {
}

Outcome<FilePlan> RangeFileStreamer::plan(const std::string& relative_path,
                                          const std::string& range_header,
                                          const std::string& if_none_match) const {
    auto resolved = resolve_shared_path(root_, relative_path);
    if (resolved.is_error()) {
        return Err<FilePlan>(resolved.error());
    }
    return plan_for(resolved.value(), range_header, if_none_match);
}

Outcome<FilePlan> RangeFileStreamer::plan_for(const fs::path& absolute,
                                              const std::string& range_header,
                                              const std::string& if_none_match) const {
    auto info = stat_path(absolute);
    if (!info || !info->is_file) {
        return Fail<FilePlan>(ErrorCode::NotFound, "File not found: " + absolute.filename().string());
    }

    FilePlan plan;
    plan.absolute_path = absolute;
    plan.filename = absolute.filename().string();
    plan.file_size = info->size;
    plan.etag = make_file_etag(info->size, info->modified_seconds);
    plan.length = info->size;

    if (!if_none_match.empty() && etag_matches(if_none_match, plan.etag)) {
        plan.status = HttpStatus::NOT_MODIFIED;
        plan.length = 0;
        return Ok(std::move(plan));
    }

    if (!range_header.empty()) {
        if (auto range = parse_range_header(range_header)) {
            if (range->start >= plan.file_size) {
                plan.status = HttpStatus::RANGE_NOT_SATISFIABLE;
                plan.length = 0;
                return Ok(std::move(plan));
            }
            const uint64_t last = std::min<uint64_t>(range->end.value_or(plan.file_size - 1),
                                                     plan.file_size - 1);
            plan.status = HttpStatus::PARTIAL_CONTENT;
            plan.start = range->start;
            plan.length = last - range->start + 1;
        }
    }

    return Ok(std::move(plan));
}

Result<void> RangeFileStreamer::stream(const FilePlan& plan,
                                       const network::ChunkSink& sink,
                                       StreamReport* report) const {
    StreamReport local;
    StreamReport& out = report ? *report : local;

    if (plan.length == 0) {
        return Ok();
    }

    if (plan.file_size > options_.mmap_threshold && supports_memory_mapping()) {
        return stream_mapped(plan, sink, out);
    }
    return stream_buffered(plan, plan.start, sink, out);
}

Result<void> RangeFileStreamer::stream_buffered(const FilePlan& plan, uint64_t offset,
                                                const network::ChunkSink& sink,
                                                StreamReport& report) const {
    std::ifstream input(plan.absolute_path, std::ios::binary);
    if (!input) {
        return Err<void>("Cannot open " + plan.absolute_path.string());
    }
    input.seekg(static_cast<std::streamoff>(offset));
    if (!input) {
        return Err<void>("Cannot seek in " + plan.absolute_path.string());
    }

    const uint64_t end = plan.start + plan.length;
    std::vector<uint8_t> buffer(std::min<uint64_t>(chunk_size_for(plan.file_size), plan.length));

    while (offset < end) {
        const size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), end - offset));
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        const auto got = static_cast<size_t>(input.gcount());
        if (got == 0) {
            return Err<void>(plan.absolute_path.string() + " ended at byte " + std::to_string(offset) +
                             ", expected " + std::to_string(end));
        }

        auto sent = sink(buffer.data(), got);
        if (sent.is_error()) {
            return sent;
        }
        offset += got;
        report.bytes_sent += got;
    }
    return Ok();
}

Result<void> RangeFileStreamer::stream_mapped(const FilePlan& plan,
                                              const network::ChunkSink& sink,
                                              StreamReport& report) const {
#ifdef LANSHARE_PLATFORM_LINUX
    FileDescriptor fd(::open(plan.absolute_path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        return Err<void>("Cannot open " + plan.absolute_path.string());
    }

    const uint64_t page = page_size();
    const uint64_t end = plan.start + plan.length;
    const size_t slice = chunk_size_for(plan.file_size);
    uint64_t offset = plan.start;

    while (offset < end) {
        struct stat st{};
        if (::fstat(fd.get(), &st) != 0 || static_cast<uint64_t>(st.st_size) < end) {
            return Err<void>(plan.absolute_path.string() + " shrank while streaming");
        }

        const uint64_t aligned = offset - (offset % page);
        const uint64_t map_length = std::min<uint64_t>(options_.mmap_window, end - aligned);
        void* mapped = map_length == 0
            ? MAP_FAILED
            : ::mmap(nullptr, static_cast<size_t>(map_length), PROT_READ, MAP_PRIVATE,
                     fd.get(), static_cast<off_t>(aligned));
        if (mapped == MAP_FAILED) {
            spdlog::debug("mmap of {} at {} failed, continuing with buffered reads",
                          plan.absolute_path.string(), aligned);
            report.fell_back_to_buffered = true;
            return stream_buffered(plan, offset, sink, report);
        }
        ++report.mapped_windows;
        ::madvise(mapped, static_cast<size_t>(map_length), MADV_SEQUENTIAL);

        const auto* base = static_cast<const uint8_t*>(mapped);
        const uint64_t window_end = aligned + map_length;
        Result<void> sent;
        while (offset < window_end) {
            const size_t n = static_cast<size_t>(std::min<uint64_t>(slice, window_end - offset));
            sent = sink(base + (offset - aligned), n);
            if (sent.is_error()) {
                break;
            }
            offset += n;
            report.bytes_sent += n;
        }
        ::munmap(mapped, static_cast<size_t>(map_length));
        if (sent.is_error()) {
            return sent;
        }
    }
    return Ok();
#else
    report.fell_back_to_buffered = true;
    return stream_buffered(plan, plan.start, sink, report);
#endif
}

HttpResponse RangeFileStreamer::respond(const Outcome<FilePlan>& planned) const {
    if (planned.is_error()) {
        const Error& error = planned.error();
        switch (error.code) {
            case ErrorCode::Forbidden:
                spdlog::warn("Refused download: {}", error.message);
                return error_response(HttpStatus::FORBIDDEN, "Forbidden");
            case ErrorCode::NotFound:
                return error_response(HttpStatus::NOT_FOUND, "File not found");
            default:
                return error_response(HttpStatus::INTERNAL_SERVER_ERROR, error.message);
        }
    }

    const FilePlan& plan = planned.value();
    HttpResponse response(plan.status);
    response.set_header("ETag", plan.etag);
    response.set_header("Cache-Control", "max-age=3600");

    if (plan.status == HttpStatus::NOT_MODIFIED) {
        return response;
    }
    if (plan.status == HttpStatus::RANGE_NOT_SATISFIABLE) {
        response.set_header("Content-Range", "bytes */" + std::to_string(plan.file_size));
        response.set_header("Content-Length", "0");
        return response;
    }

    if (plan.status == HttpStatus::PARTIAL_CONTENT) {
        response.set_header("Content-Range",
            "bytes " + std::to_string(plan.start) + "-" + std::to_string(plan.start + plan.length - 1) +
            "/" + std::to_string(plan.file_size));
    }
    response.set_header("Content-Type", "application/octet-stream");
    response.set_header("Content-Disposition", "attachment; filename=\"" + plan.filename + "\"");
    response.set_header("Accept-Ranges", "bytes");

    RangeFileStreamer self = *this;
    response.set_body_writer(plan.length, [self, plan](const network::ChunkSink& sink) {
        auto result = self.stream(plan, sink);
        if (result.is_error()) {
            spdlog::warn("Streaming {} aborted: {}", plan.filename, result.error());
        }
        return result;
    });
    return response;
}

HttpResponse RangeFileStreamer::serve(const std::string& relative_path,
                                      const network::HttpRequest& request) const {
    return respond(plan(relative_path, request.get_header("Range"), request.get_header("If-None-Match")));
}

HttpResponse RangeFileStreamer::serve_absolute(const fs::path& path,
                                               const network::HttpRequest& request) const {
    return respond(plan_for(path, request.get_header("Range"), request.get_header("If-None-Match")));
}

} // namespace lanshare::server
