#pragma once

#include "lanshare/core/result.hpp"
#include "lanshare/network/http_types.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace lanshare::server {

/**
 * @brief A uniquely named file that is deleted when the object goes away
 */
class TempFile {
    struct Key {
        explicit Key() = default;
    };

public:
    TempFile(Key, std::filesystem::path path) : path_(std::move(path)) {}

    static Result<std::shared_ptr<TempFile>> create(const std::filesystem::path& directory,
                                                    const std::string& prefix);
    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

struct ArchiveOptions {
    int compression_level = 6;
    size_t chunk_size = 2 * 1024 * 1024;       ///< Read and send granularity
    std::filesystem::path temp_directory;       ///< Empty: the system temp directory
};

struct ArchiveReport {
    size_t files_added = 0;
    size_t directories_added = 0;
    size_t files_skipped = 0;
    uint64_t archive_size = 0;
};

/**
 * @brief Serves the whole shared root as one ZIP archive
 *
 * The archive is built in a temporary file before the response starts so
 * Content-Length is known and memory stays bounded. Entries are named
 * "<root name>/<relative path>"; empty directories are kept as directory
 * entries; files that cannot be read are left out. The temporary file lives
 * exactly as long as the response that streams it.
 */
class ArchiveStreamer {
public:
    explicit ArchiveStreamer(std::filesystem::path root, ArchiveOptions options = ArchiveOptions{});

    /**
     * @brief Build the archive into a new temporary file
     */
    Result<std::shared_ptr<TempFile>> build(ArchiveReport* report = nullptr) const;

    /**
     * @brief Send a built archive through `sink` in chunk_size pieces
     */
    Result<void> stream(const TempFile& archive, const network::ChunkSink& sink) const;

    /**
     * @brief Full HTTP handling of GET /download_all
     */
    network::HttpResponse serve() const;

    /**
     * @brief Last component of the shared root, used for entry names and the file name
     */
    std::string root_name() const;

private:
    std::filesystem::path root_;
    ArchiveOptions options_;
};

} // namespace lanshare::server
