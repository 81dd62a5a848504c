#include "lanshare/events/event_bus.hpp"
#include "lanshare/events/events.hpp"
#include "lanshare/index/directory_indexer.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace lanshare::index;
using namespace lanshare::testing;
using lanshare::ErrorCode;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> paths_of(const Listing& entries) {
    std::vector<std::string> paths;
    for (const auto& entry : entries) {
        paths.push_back(entry.path);
    }
    return paths;
}

void touch_later(const fs::path& path) {
    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(5));
}

} // namespace

TEST(WalkTreeTest, ListsNestedEntriesRelativeToRoot) {
    TempDir dir("lanshare_index");
    write_file(dir / "docs/a.txt", "hello");
    write_file(dir / "docs/sub/B.MD", "# b");
    write_file(dir / "top.bin", "xyz");

    WalkResult walk = walk_tree(dir.path());
    EXPECT_FALSE(walk.used_fallback);
    EXPECT_EQ(walk.skipped, 0u);

    const std::vector<std::string> expected = {"docs", "docs/sub", "docs/a.txt", "docs/sub/B.MD", "top.bin"};
    EXPECT_EQ(paths_of(walk.entries), expected);

    auto md = std::find_if(walk.entries.begin(), walk.entries.end(),
                           [](const DirectoryEntry& e) { return e.name == "B.MD"; });
    ASSERT_NE(md, walk.entries.end());
    EXPECT_EQ(md->extension, ".md");
    EXPECT_EQ(md->size, 3u);
    EXPECT_GT(md->modified, 0.0);
}

TEST(WalkTreeTest, FallbackWalkAgreesWithRecursiveWalk) {
    TempDir dir("lanshare_index");
    write_file(dir / "a/b/c.txt", "c");
    write_file(dir / "a/d.txt", "dd");
    write_file(dir / "e.txt", "eee");

    WalkResult primary = walk_tree(dir.path());
    WalkResult fallback = walk_tree_fallback(dir.path());
    EXPECT_TRUE(fallback.used_fallback);
    EXPECT_EQ(primary.entries, fallback.entries);
}

TEST(DirectoryIndexerTest, MissingRootIsNotFound) {
    TempDir dir("lanshare_index");
    DirectoryIndexer indexer;
    auto result = indexer.get_index(dir / "missing");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST(DirectoryIndexerTest, SecondCallHitsCache) {
    TempDir dir("lanshare_index");
    write_file(dir / "docs/a.txt", "hello");

    lanshare::events::EventBus bus;
    int rebuilds = 0;
    bus.subscribe<lanshare::events::IndexRebuiltEvent>(
        [&rebuilds](const lanshare::events::IndexRebuiltEvent&) { ++rebuilds; });

    DirectoryIndexer indexer(IndexerOptions{}, &bus);
    auto first = indexer.get_index(dir.path());
    auto second = indexer.get_index(dir.path());
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(first.value()->entries.size(), 2u);
    EXPECT_EQ(first.value()->fingerprint, fingerprint(first.value()->encoded_json));
    EXPECT_EQ(indexer.hits(dir.path()), 1u);
    EXPECT_EQ(rebuilds, 1);
}

TEST(DirectoryIndexerTest, ExpiredEntryWithSameMtimeIsReused) {
    TempDir dir("lanshare_index");
    write_file(dir / "a.txt", "a");

    IndexerOptions options;
    options.ttl = std::chrono::seconds(0);
    DirectoryIndexer indexer(options);

    auto first = indexer.get_index(dir.path());
    auto second = indexer.get_index(dir.path());
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value(), second.value());
}

TEST(DirectoryIndexerTest, ExpiredEntryIsRebuiltWhenRootChanges) {
    TempDir dir("lanshare_index");
    write_file(dir / "a.txt", "a");

    IndexerOptions options;
    options.ttl = std::chrono::seconds(0);
    DirectoryIndexer indexer(options);

    auto first = indexer.get_index(dir.path());
    ASSERT_TRUE(first.is_ok());

    write_file(dir / "b.txt", "b");
    touch_later(dir.path());

    auto second = indexer.get_index(dir.path());
    ASSERT_TRUE(second.is_ok());
    EXPECT_NE(first.value(), second.value());
    EXPECT_EQ(second.value()->entries.size(), 2u);
    EXPECT_NE(first.value()->fingerprint, second.value()->fingerprint);
}

TEST(DirectoryIndexerTest, FreshEntryIgnoresRootChanges) {
    TempDir dir("lanshare_index");
    write_file(dir / "a.txt", "a");

    DirectoryIndexer indexer;
    auto first = indexer.get_index(dir.path());
    write_file(dir / "b.txt", "b");
    auto second = indexer.get_index(dir.path());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value(), second.value());

    indexer.clear();
    auto third = indexer.get_index(dir.path());
    ASSERT_TRUE(third.is_ok());
    EXPECT_EQ(third.value()->entries.size(), 2u);
}

TEST(DirectoryIndexerTest, EvictsOldestBeyondCapacity) {
    TempDir dir("lanshare_index");
    DirectoryIndexer indexer;   // capacity 5

    for (int i = 0; i < 7; ++i) {
        const fs::path root = dir / ("root" + std::to_string(i));
        write_file(root / "f.txt", std::to_string(i));
        ASSERT_TRUE(indexer.get_index(root).is_ok());
    }
    EXPECT_EQ(indexer.cached_roots(), 5u);

    // Oldest two are gone: asking again rebuilds instead of hitting
    ASSERT_TRUE(indexer.get_index(dir / "root6").is_ok());
    EXPECT_EQ(indexer.hits(dir / "root6"), 1u);
    EXPECT_EQ(indexer.hits(dir / "root0"), 0u);
}

TEST(DirectoryIndexerTest, NonUtf8NameDoesNotBreakListing) {
    TempDir dir("lanshare_index");
    write_file(dir / "good.txt", "ok");
    write_file(dir / std::string("bad\xff\xfe.txt"), "raw bytes");

    DirectoryIndexer indexer;
    auto result = indexer.get_index(dir.path());
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(result.value()->entries.size(), 2u);

    // The encoded listing is still valid JSON a client can decode
    auto decoded = decode_listing(result.value()->encoded_json);
    ASSERT_TRUE(decoded.is_ok()) << decoded.error();
    ASSERT_EQ(decoded.value().size(), 2u);

    const auto paths = paths_of(decoded.value());
    EXPECT_NE(std::find(paths.begin(), paths.end(), "good.txt"), paths.end());
    auto replaced = std::find_if(paths.begin(), paths.end(), [](const std::string& p) {
        return p.rfind("bad", 0) == 0 && p.find("\xEF\xBF\xBD") != std::string::npos;
    });
    EXPECT_NE(replaced, paths.end());
}

TEST(DirectoryIndexerTest, ConcurrentColdCallersShareOneRebuild) {
    TempDir dir("lanshare_index");
    for (int i = 0; i < 50; ++i) {
        write_file(dir / ("d" + std::to_string(i % 5)) / ("f" + std::to_string(i) + ".txt"), "x");
    }

    lanshare::events::EventBus bus;
    std::atomic<int> rebuilds{0};
    bus.subscribe<lanshare::events::IndexRebuiltEvent>(
        [&rebuilds](const lanshare::events::IndexRebuiltEvent&) { ++rebuilds; });

    DirectoryIndexer indexer(IndexerOptions{}, &bus);
    std::vector<SnapshotPtr> snapshots(8);
    std::vector<std::thread> callers;
    for (size_t i = 0; i < snapshots.size(); ++i) {
        callers.emplace_back([&, i] {
            auto result = indexer.get_index(dir.path());
            if (result.is_ok()) {
                snapshots[i] = result.value();
            }
        });
    }
    for (auto& t : callers) {
        t.join();
    }

    EXPECT_EQ(rebuilds.load(), 1);
    for (const auto& snapshot : snapshots) {
        ASSERT_NE(snapshot, nullptr);
        EXPECT_EQ(snapshot, snapshots.front());
    }
    EXPECT_EQ(indexer.hits(dir.path()), snapshots.size() - 1);
}
