#pragma once

#include "lanshare/core/error.hpp"
#include "lanshare/network/http_types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace lanshare::server {

/**
 * @brief A parsed "Range: bytes=start-[end]" header
 */
struct ByteRange {
    uint64_t start = 0;
    std::optional<uint64_t> end;    ///< Inclusive; absent means to end of file
};

/**
 * @brief Parse a single byte range; std::nullopt for anything else
 *
 * Multi-range, suffix ("bytes=-500") and reversed ranges are not honoured;
 * such requests get the whole file.
 */
std::optional<ByteRange> parse_range_header(const std::string& header);

/**
 * @brief ETag of a file version: "<size>-<mtime seconds>" including the quotes
 */
std::string make_file_etag(uint64_t size, int64_t mtime_seconds);

/**
 * @brief Buffered read size for a file of `file_size` bytes
 *
 * Below 1 MiB: 64 KiB; below 100 MiB: 1 MiB; otherwise 4 MiB.
 */
size_t chunk_size_for(uint64_t file_size);

struct StreamerOptions {
    uint64_t mmap_threshold = 50ull * 1024 * 1024;   ///< Files strictly larger are memory mapped
    size_t mmap_window = 16 * 1024 * 1024;           ///< Bytes mapped at a time
};

/**
 * @brief What a download request resolved to, before any body byte is read
 */
struct FilePlan {
    network::HttpStatus status = network::HttpStatus::OK;
    std::filesystem::path absolute_path;
    std::string filename;
    uint64_t file_size = 0;
    uint64_t start = 0;
    uint64_t length = 0;
    std::string etag;
};

/**
 * @brief How stream() delivered the bytes
 */
struct StreamReport {
    uint64_t bytes_sent = 0;
    size_t mapped_windows = 0;
    bool fell_back_to_buffered = false;
};

/**
 * @brief Serves single files of a shared root with ranges, ETags and 304s
 *
 * Large files are sent from sliding read-only memory-mapped windows; when a
 * window cannot be mapped, the rest of the range is read with buffered I/O
 * from the same offset. A read error or a file that shrinks mid-stream ends
 * the stream with an error, which makes the server drop the connection.
 */
class RangeFileStreamer {
public:
    explicit RangeFileStreamer(std::filesystem::path root, StreamerOptions options = StreamerOptions{});

    /**
     * @brief Validate the path and work out status, range and headers
     *
     * Errors: Forbidden (path escapes the root), NotFound (absent or not a
     * regular file).
     */
    Outcome<FilePlan> plan(const std::string& relative_path,
                           const std::string& range_header,
                           const std::string& if_none_match) const;

    /**
     * @brief Push the planned byte range into `sink`
     */
    Result<void> stream(const FilePlan& plan,
                        const network::ChunkSink& sink,
                        StreamReport* report = nullptr) const;

    /**
     * @brief Full HTTP handling of GET /download?file=<relative_path>
     */
    network::HttpResponse serve(const std::string& relative_path, const network::HttpRequest& request) const;

    /**
     * @brief Same as serve() for a path already inside the root (static fallback)
     */
    network::HttpResponse serve_absolute(const std::filesystem::path& path,
                                         const network::HttpRequest& request) const;

    const std::filesystem::path& root() const { return root_; }

private:
    Outcome<FilePlan> plan_for(const std::filesystem::path& absolute,
                               const std::string& range_header,
                               const std::string& if_none_match) const;
    network::HttpResponse respond(const Outcome<FilePlan>& planned) const;

    Result<void> stream_buffered(const FilePlan& plan, uint64_t offset,
                                 const network::ChunkSink& sink, StreamReport& report) const;
    Result<void> stream_mapped(const FilePlan& plan,
                               const network::ChunkSink& sink, StreamReport& report) const;

    std::filesystem::path root_;
    StreamerOptions options_;
};

} // namespace lanshare::server
