#include "lanshare/index/directory_indexer.hpp"
#include "lanshare/core/file_stat.hpp"
#include "lanshare/events/events.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <system_error>
#include <vector>

namespace lanshare::index {

namespace fs = std::filesystem;

namespace {

std::string lowercase_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

/**
 * @brief Stat one walked path and append it; false when it had to be skipped
 */
bool append_entry(const fs::path& root, const fs::path& path, Listing& entries) {
    auto info = stat_path(path);
    if (!info) {
        return false;
    }
    if (!info->is_file && !info->is_directory) {
        return true;   // Sockets, fifos, dangling links: not listed, not an error
    }

    DirectoryEntry entry;
    entry.name = path.filename().string();
    entry.path = path.lexically_relative(root).generic_string();
    entry.modified = info->modified;
    if (info->is_file) {
        entry.type = EntryType::File;
        entry.size = info->size;
        entry.extension = lowercase_extension(path);
    } else {
        entry.type = EntryType::Folder;
    }

    if (entry.path.empty() || entry.path == ".") {
        return false;
    }
    entries.push_back(std::move(entry));
    return true;
}

} // namespace

WalkResult walk_tree_fallback(const fs::path& root) {
    WalkResult result;
    result.used_fallback = true;

    std::vector<fs::path> pending{root};
    while (!pending.empty()) {
        fs::path dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            ++result.skipped;
            continue;
        }

        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                ++result.skipped;
                break;
            }
            const fs::path& path = it->path();
            if (!append_entry(root, path, result.entries)) {
                ++result.skipped;
                continue;
            }

            std::error_code type_ec;
            if (it->is_directory(type_ec) && !it->is_symlink(type_ec)) {
                pending.push_back(path);
            }
        }
    }

    sort_listing(result.entries);
    return result;
}

WalkResult walk_tree(const fs::path& root) {
    WalkResult result;

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Recursive walk of {} failed to start ({}), using fallback walk", root.string(), ec.message());
        return walk_tree_fallback(root);
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("Recursive walk of {} failed ({}), using fallback walk", root.string(), ec.message());
            return walk_tree_fallback(root);
        }
        if (!append_entry(root, it->path(), result.entries)) {
            ++result.skipped;
        }
    }

    sort_listing(result.entries);
    return result;
}

DirectoryIndexer::DirectoryIndexer(IndexerOptions options, events::EventBus* bus)
    : options_(options)
    , bus_(bus) {
    if (options_.capacity == 0) {
        options_.capacity = 1;
    }
}

std::string DirectoryIndexer::cache_key(const fs::path& root) {
    std::error_code ec;
    fs::path absolute = fs::absolute(root, ec);
    return (ec ? root : absolute).lexically_normal().generic_string();
}

Outcome<SnapshotPtr> DirectoryIndexer::get_index(const fs::path& root) {
    auto root_info = stat_path(root);
    if (!root_info || !root_info->is_directory) {
        return Fail<SnapshotPtr>(ErrorCode::NotFound, "Shared directory not found: " + root.string());
    }

    const std::string key = cache_key(root);
    const auto now = std::chrono::steady_clock::now();
    SnapshotPtr rebuilt;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_.find(key);
        if (it != cache_.end()) {
            CacheRecord& record = it->second;
            const bool fresh = now - record.timestamp < options_.ttl;
            if (fresh || record.source_mtime == root_info->modified) {
                if (!fresh) {
                    record.timestamp = now;
                }
                ++record.hits;
                return Ok(record.snapshot);
            }
        }

        // Root readable at all? A directory we cannot open is not an empty one.
        std::error_code ec;
        fs::directory_iterator probe(root, ec);
        if (ec) {
            return Fail<SnapshotPtr>(ErrorCode::Unexpected,
                                     "Cannot open " + root.string() + ": " + ec.message());
        }

        auto built = build_snapshot(root, root_info->modified);
        if (built.is_error()) {
            return Err<SnapshotPtr>(built.error());
        }
        rebuilt = built.value();

        CacheRecord record;
        record.snapshot = rebuilt;
        record.timestamp = now;
        record.source_mtime = root_info->modified;
        cache_[key] = std::move(record);

        while (cache_.size() > options_.capacity) {
            evict_oldest();
        }
    }

    return Ok(rebuilt);
}

Outcome<SnapshotPtr> DirectoryIndexer::build_snapshot(const fs::path& root, double root_mtime) {
    const auto started = std::chrono::steady_clock::now();
    WalkResult walk = walk_tree(root);

    auto snapshot = std::make_shared<IndexSnapshot>();
    snapshot->entries = std::move(walk.entries);
    snapshot->built_at = std::chrono::system_clock::now();
    snapshot->source_mtime = root_mtime;
    try {
        snapshot->encoded_json = encode_listing(snapshot->entries);
    } catch (const nlohmann::json::exception& e) {
        return Fail<SnapshotPtr>(ErrorCode::Unexpected,
                                 "Cannot encode listing of " + root.string() + ": " + e.what());
    }
    snapshot->fingerprint = fingerprint(snapshot->encoded_json);
    snapshot->skipped = walk.skipped;
    snapshot->used_fallback_walk = walk.used_fallback;

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    events::IndexRebuiltEvent event;
    event.root = root.string();
    event.entry_count = snapshot->entries.size();
    event.skipped = walk.skipped;
    event.used_fallback_walk = walk.used_fallback;
    event.duration = elapsed;
    events::emit_if(bus_, event);

    spdlog::debug("Indexed {}: {} entries, {} skipped in {}ms",
                  root.string(), snapshot->entries.size(), walk.skipped, elapsed.count());
    return Ok(SnapshotPtr(std::move(snapshot)));
}

void DirectoryIndexer::evict_oldest() {
    auto oldest = std::min_element(cache_.begin(), cache_.end(),
        [](const auto& a, const auto& b) {
            return a.second.timestamp < b.second.timestamp;
        });
    if (oldest != cache_.end()) {
        spdlog::debug("Evicting index snapshot for {}", oldest->first);
        cache_.erase(oldest);
    }
}

void DirectoryIndexer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

size_t DirectoryIndexer::cached_roots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

uint64_t DirectoryIndexer::hits(const fs::path& root) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(cache_key(root));
    return it != cache_.end() ? it->second.hits : 0;
}

} // namespace lanshare::index
