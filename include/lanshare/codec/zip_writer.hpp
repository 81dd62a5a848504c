#pragma once

#include "lanshare/core/result.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace lanshare::codec {

/**
 * @brief Streaming writer for deflate-compressed ZIP archives
 *
 * Files are read and compressed in bounded chunks, so archive size is not
 * limited by memory. Entries are switched to ZIP64 records automatically when
 * sizes or offsets do not fit the classic 32-bit fields, and the end of
 * central directory gains ZIP64 records when needed.
 *
 * Entry names are stored as UTF-8 with general purpose flag bit 11 set.
 * A file that fails while being read is dropped from the archive; its partial
 * data is overwritten by the next entry and trimmed at finish().
 *
 * Usage:
 * ```cpp
 * auto writer = ZipWriter::create("/tmp/out.zip");
 * writer.value()->add_directory("photos/empty");
 * writer.value()->add_file("photos/a.jpg", root / "a.jpg");
 * writer.value()->finish();
 * ```
 */
class ZipWriter {
    struct Key {
        explicit Key() = default;
    };

public:
    /// Uncompressed size from which an entry is written with ZIP64 fields
    static constexpr uint64_t kZip64EntryThreshold = 0xF0000000ull;

    static Result<std::unique_ptr<ZipWriter>> create(const std::filesystem::path& path,
                                                     int level = 6,
                                                     size_t chunk_size = 2 * 1024 * 1024);

    ZipWriter(Key, std::filesystem::path path, int level, size_t chunk_size);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * @brief Add an empty directory entry; a trailing '/' is appended if missing
     */
    Result<void> add_directory(const std::string& name, std::time_t modified = 0);

    /**
     * @brief Compress `source` into the archive under `name`
     *
     * On error nothing of the entry remains in the archive and further
     * entries may still be added.
     */
    Result<void> add_file(const std::string& name, const std::filesystem::path& source);

    /**
     * @brief Write the central directory and close the file
     */
    Result<void> finish();

    size_t entry_count() const { return entries_.size(); }
    bool finished() const { return finished_; }

private:
    struct Entry {
        std::string name;
        uint32_t crc = 0;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint64_t local_offset = 0;
        uint16_t method = 0;
        uint16_t flags = 0;               // General purpose bits
        uint16_t dos_time = 0;
        uint16_t dos_date = 0;
        uint32_t external_attributes = 0;
        bool zip64 = false;
    };

    Result<void> write_local_header(const Entry& entry);
    Result<void> patch_local_header(const Entry& entry);
    Result<void> write_central_directory();
    Result<void> write_bytes(const std::string& bytes);
    void rollback(uint64_t offset);

    std::filesystem::path path_;
    int level_;
    size_t chunk_size_;
    std::fstream out_;
    uint64_t offset_ = 0;
    std::vector<Entry> entries_;
    bool finished_ = false;
};

} // namespace lanshare::codec
