#pragma once

#include "lanshare/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lanshare::index {

enum class EntryType {
    File,
    Folder
};

/**
 * @brief One file or folder of a shared tree
 *
 * JSON form (files carry "extension", folders do not):
 * {"name":"a.txt","path":"docs/a.txt","type":"file","size":10,"modified":1700000000.25,"extension":".txt"}
 */
struct DirectoryEntry {
    std::string name;
    std::string path;          ///< Slash-separated, relative to the shared root, unique per listing
    EntryType type = EntryType::File;
    std::uint64_t size = 0;    ///< 0 for folders
    double modified = 0.0;     ///< Seconds since the epoch
    std::string extension;     ///< Lowercased suffix with dot, files only

    bool is_file() const { return type == EntryType::File; }
    bool is_folder() const { return type == EntryType::Folder; }

    bool operator==(const DirectoryEntry& other) const {
        return name == other.name && path == other.path && type == other.type &&
               size == other.size && modified == other.modified && extension == other.extension;
    }
    bool operator!=(const DirectoryEntry& other) const { return !(*this == other); }
};

using Listing = std::vector<DirectoryEntry>;

const char* entry_type_name(EntryType type);

/**
 * @brief Order folders first, then by lowercased path, ties by exact path
 */
void sort_listing(Listing& entries);

/**
 * @brief Compact JSON array, byte-identical for identical listings
 */
std::string encode_listing(const Listing& entries);

/**
 * @brief Parse a JSON array of entries
 *
 * "size" and "modified" default to 0 when absent; anything that is not an
 * array of objects with string "name", "path" and "type" is an error.
 */
Result<Listing> decode_listing(const std::string& json);

/**
 * @brief FNV-1a 64-bit digest as 16 lowercase hex digits
 */
std::string fingerprint(const std::string& bytes);

} // namespace lanshare::index
