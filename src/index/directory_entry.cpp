#include "lanshare/index/directory_entry.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace lanshare::index {

using json = nlohmann::json;

namespace {

std::string to_lower(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

json to_json(const DirectoryEntry& entry) {
    json j;
    j["name"] = entry.name;
    j["path"] = entry.path;
    j["type"] = entry_type_name(entry.type);
    j["size"] = entry.size;
    j["modified"] = entry.modified;
    if (entry.is_file()) {
        j["extension"] = entry.extension;
    }
    return j;
}

} // namespace

const char* entry_type_name(EntryType type) {
    return type == EntryType::Folder ? "folder" : "file";
}

void sort_listing(Listing& entries) {
    std::stable_sort(entries.begin(), entries.end(),
        [](const DirectoryEntry& a, const DirectoryEntry& b) {
            if (a.type != b.type) {
                return a.is_folder();
            }
            const std::string la = to_lower(a.path);
            const std::string lb = to_lower(b.path);
            if (la != lb) {
                return la < lb;
            }
            return a.path < b.path;
        });
}

std::string encode_listing(const Listing& entries) {
    json array = json::array();
    for (const auto& entry : entries) {
        array.push_back(to_json(entry));
    }
    // Names are raw filesystem bytes; invalid UTF-8 becomes U+FFFD
    return array.dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<Listing> decode_listing(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return Err<Listing>(std::string("Listing is not valid JSON"));
    }
    if (!parsed.is_array()) {
        return Err<Listing>(std::string("Listing is not a JSON array"));
    }

    Listing entries;
    entries.reserve(parsed.size());
    try {
        for (const auto& item : parsed) {
            if (!item.is_object()) {
                return Err<Listing>(std::string("Listing item is not an object"));
            }
            DirectoryEntry entry;
            entry.name = item.at("name").get<std::string>();
            entry.path = item.at("path").get<std::string>();

            const std::string type = item.at("type").get<std::string>();
            if (type == "file") {
                entry.type = EntryType::File;
            } else if (type == "folder") {
                entry.type = EntryType::Folder;
            } else {
                return Err<Listing>("Unknown entry type '" + type + "' for " + entry.path);
            }

            entry.size = item.value("size", std::uint64_t{0});
            entry.modified = item.value("modified", 0.0);
            if (entry.is_file()) {
                entry.extension = item.value("extension", std::string());
            }
            entries.push_back(std::move(entry));
        }
    } catch (const json::exception& e) {
        return Err<Listing>(std::string("Malformed listing entry: ") + e.what());
    }

    return Ok(std::move(entries));
}

std::string fingerprint(const std::string& bytes) {
    const std::uint64_t offset = 0xcbf29ce484222325ULL;
    const std::uint64_t prime  = 0x100000001b3ULL;
    std::uint64_t hash = offset;
    for (unsigned char byte : bytes) {
        hash ^= static_cast<std::uint64_t>(byte);
        hash *= prime;
    }
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash;
    return oss.str();
}

} // namespace lanshare::index
