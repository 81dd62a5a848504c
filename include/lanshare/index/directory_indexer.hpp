#pragma once

#include "lanshare/core/error.hpp"
#include "lanshare/events/event_bus.hpp"
#include "lanshare/index/directory_entry.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace lanshare::index {

/**
 * @brief Immutable listing of one shared root at one point in time
 */
struct IndexSnapshot {
    Listing entries;
    std::chrono::system_clock::time_point built_at;
    double source_mtime = 0.0;       ///< Root directory mtime when walked
    std::string fingerprint;         ///< FNV-1a hex of encoded_json
    std::string encoded_json;        ///< Compact JSON served by the list endpoint
    size_t skipped = 0;              ///< Entries dropped by permission or I/O errors
    bool used_fallback_walk = false;
};

using SnapshotPtr = std::shared_ptr<const IndexSnapshot>;

/**
 * @brief Outcome of one walk over a tree
 */
struct WalkResult {
    Listing entries;
    size_t skipped = 0;
    bool used_fallback = false;
};

/**
 * @brief Walk `root` and produce its sorted listing
 *
 * The recursive iterator is tried first. Entries that cannot be stat'ed are
 * skipped and counted; if the iterator itself fails, the tree is walked again
 * with an explicit stack of plain directory iterators.
 */
WalkResult walk_tree(const std::filesystem::path& root);

/**
 * @brief Second strategy of walk_tree(), exposed for tests
 */
WalkResult walk_tree_fallback(const std::filesystem::path& root);

struct IndexerOptions {
    std::chrono::seconds ttl{120};
    size_t capacity = 5;
};

/**
 * @brief Cached directory listings keyed by shared root
 *
 * A snapshot is reused while it is younger than the TTL or while the root
 * directory's mtime is unchanged; reuse by mtime refreshes its timestamp.
 * Only changes that touch the root's own entries alter its mtime, so an edit
 * deep in the tree is picked up once the TTL has passed and the root changed,
 * or after clear().
 *
 * Rebuilds run under the cache lock: concurrent callers for the same root
 * wait for one walk instead of walking in parallel. At most `capacity` roots
 * are kept; the one with the oldest timestamp is evicted.
 */
class DirectoryIndexer {
public:
    explicit DirectoryIndexer(IndexerOptions options = IndexerOptions{},
                              events::EventBus* bus = nullptr);

    /**
     * @brief Current listing of `root`
     *
     * Fails with NotFound when the root is missing or not a directory, and
     * with Unexpected when it cannot be opened.
     */
    Outcome<SnapshotPtr> get_index(const std::filesystem::path& root);

    /**
     * @brief Drop every cached snapshot
     */
    void clear();

    size_t cached_roots() const;

    /**
     * @brief Number of times `root` was served from cache
     */
    uint64_t hits(const std::filesystem::path& root) const;

private:
    struct CacheRecord {
        SnapshotPtr snapshot;
        std::chrono::steady_clock::time_point timestamp;
        double source_mtime = 0.0;
        uint64_t hits = 0;
    };

    static std::string cache_key(const std::filesystem::path& root);
    Outcome<SnapshotPtr> build_snapshot(const std::filesystem::path& root, double root_mtime);
    void evict_oldest();

    IndexerOptions options_;
    events::EventBus* bus_;
    mutable std::mutex mutex_;
    std::map<std::string, CacheRecord> cache_;
};

} // namespace lanshare::index
