#include "lanshare/client/share_client.hpp"
#include "lanshare/events/event_bus.hpp"
#include "lanshare/events/events.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <map>

using namespace lanshare::client;
using namespace lanshare::testing;
using lanshare::ErrorCode;
namespace fs = std::filesystem;

namespace {

ClientOptions fast_client_options() {
    ClientOptions options;
    options.listing.timeout = std::chrono::milliseconds(5000);
    options.download.timeout = std::chrono::milliseconds(5000);
    options.download.max_retries = 1;
    options.download.backoff.base = std::chrono::milliseconds(10);
    options.download.backoff.cap = std::chrono::milliseconds(20);
    options.archive.timeout = std::chrono::milliseconds(10000);
    options.archive.max_retries = 1;
    options.archive.backoff.base = std::chrono::milliseconds(10);
    options.archive.backoff.cap = std::chrono::milliseconds(20);
    return options;
}

// Nothing listens on the discard port of the loopback interface
const Endpoint kDeadEndpoint{"127.0.0.1", 9};

} // namespace

class ShareRoundTripTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_file(dir_ / "share/docs/a.txt", "hello");
        fs::create_directories(dir_ / "share/docs/sub");
        write_file(dir_ / "outside.txt", "not shared");
        server_ = std::make_unique<RunningServer>(dir_ / "share");
        endpoint_ = Endpoint{"127.0.0.1", server_->port()};
    }

    TempDir dir_{"lanshare_roundtrip"};
    std::unique_ptr<RunningServer> server_;
    Endpoint endpoint_;
};

TEST_F(ShareRoundTripTest, ListsExampleTree) {
    ShareClient client(fast_client_options());
    auto listing = client.list_files(endpoint_);
    ASSERT_TRUE(listing.is_ok()) << listing.error().message;

    const auto& entries = listing.value();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].path, "docs");
    EXPECT_TRUE(entries[0].is_folder());
    EXPECT_EQ(entries[1].path, "docs/sub");
    EXPECT_EQ(entries[2].path, "docs/a.txt");
    EXPECT_EQ(entries[2].size, 5u);
    EXPECT_EQ(entries[2].extension, ".txt");

    const ConnectionHealth health = client.get_connection_health(endpoint_);
    ASSERT_TRUE(health.responsive.has_value());
    EXPECT_TRUE(*health.responsive);
    EXPECT_EQ(health.last_known_file_count, 3u);
}

TEST_F(ShareRoundTripTest, ListingIsIdempotent) {
    ShareClient client(fast_client_options());
    auto first = client.list_files(endpoint_);
    auto second = client.list_files(endpoint_);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value(), second.value());
    EXPECT_GE(server_->server().service().indexer().hits(dir_ / "share"), 1u);
}

TEST_F(ShareRoundTripTest, LargeListingTravelsCompressed) {
    for (int i = 0; i < 80; ++i) {
        write_file(dir_ / ("share/bulk/item_" + std::to_string(i) + ".dat"), "x");
    }
    server_->server().clear_cache();

    lanshare::events::EventBus bus;
    bool compressed = false;
    bus.subscribe<lanshare::events::ListingFetchedEvent>(
        [&compressed](const lanshare::events::ListingFetchedEvent& e) { compressed = e.compressed; });

    ShareClient client(fast_client_options(), &bus);
    auto listing = client.list_files(endpoint_);
    ASSERT_TRUE(listing.is_ok());
    EXPECT_EQ(listing.value().size(), 3u + 81u);
    EXPECT_TRUE(compressed);
}

TEST_F(ShareRoundTripTest, DownloadsSingleFile) {
    ShareClient client(fast_client_options());
    const fs::path local = dir_ / "downloads/nested/a.txt";

    std::vector<std::pair<uint64_t, uint64_t>> updates;
    auto report = client.download_file(endpoint_, "docs/a.txt", local,
        [&updates](uint64_t done, uint64_t total) { updates.emplace_back(done, total); });
    ASSERT_TRUE(report.is_ok()) << report.error().message;

    EXPECT_EQ(report.value().message, "Download complete");
    EXPECT_EQ(report.value().total_bytes, 5u);
    EXPECT_EQ(report.value().transferred_bytes, 5u);
    EXPECT_EQ(read_file(local), "hello");
    EXPECT_FALSE(fs::exists(FileDownloader::sidecar_path(local)));

    ASSERT_FALSE(updates.empty());
    EXPECT_EQ(updates.back().first, 5u);
    EXPECT_EQ(updates.back().second, 5u);
    for (size_t i = 1; i < updates.size(); ++i) {
        EXPECT_GE(updates[i].first, updates[i - 1].first);
    }
}

TEST_F(ShareRoundTripTest, DownloadsNamesNeedingEncoding) {
    write_file(dir_ / "share/my docs/r&d #1.txt", "encoded");
    ShareClient client(fast_client_options());
    auto report = client.download_file(endpoint_, "my docs/r&d #1.txt", dir_ / "out.txt");
    ASSERT_TRUE(report.is_ok()) << report.error().message;
    EXPECT_EQ(read_file(dir_ / "out.txt"), "encoded");
}

TEST_F(ShareRoundTripTest, EscapingPathIsForbidden) {
    ShareClient client(fast_client_options());
    auto report = client.download_file(endpoint_, "../../etc/passwd", dir_ / "passwd");
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().code, ErrorCode::Forbidden);
    EXPECT_FALSE(fs::exists(dir_ / "passwd"));

    auto sibling = client.download_file(endpoint_, "../outside.txt", dir_ / "outside_copy.txt");
    ASSERT_TRUE(sibling.is_error());
    EXPECT_EQ(sibling.error().code, ErrorCode::Forbidden);
}

TEST_F(ShareRoundTripTest, MissingFileIsNotFoundWithoutRetries) {
    lanshare::events::EventBus bus;
    std::atomic<int> retries{0};
    bus.subscribe<lanshare::events::DownloadRetryEvent>(
        [&retries](const lanshare::events::DownloadRetryEvent&) { ++retries; });

    ShareClient client(fast_client_options(), &bus);
    auto report = client.download_file(endpoint_, "docs/nope.txt", dir_ / "nope.txt");
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().code, ErrorCode::NotFound);
    EXPECT_EQ(retries.load(), 0);
}

TEST_F(ShareRoundTripTest, DownloadsWholeShareAsZip) {
    write_file(dir_ / "share/big.bin", pattern_bytes(2 * 1024 * 1024 + 3));
    ShareClient client(fast_client_options());

    uint64_t last_done = 0;
    auto report = client.download_all(endpoint_, dir_ / "all.zip",
        [&last_done](uint64_t done, uint64_t) { last_done = done; });
    ASSERT_TRUE(report.is_ok()) << report.error().message;
    EXPECT_EQ(report.value().message, "Bulk download complete");
    EXPECT_EQ(report.value().total_bytes, fs::file_size(dir_ / "all.zip"));
    EXPECT_EQ(last_done, report.value().total_bytes);

    std::map<std::string, std::string> entries;
    for (auto& entry : read_zip(dir_ / "all.zip")) {
        entries[entry.name] = entry.data;
    }
    EXPECT_EQ(entries["share/docs/a.txt"], "hello");
    EXPECT_EQ(entries["share/big.bin"], pattern_bytes(2 * 1024 * 1024 + 3));
    EXPECT_EQ(entries.count("share/docs/sub/"), 1u);
}

TEST_F(ShareRoundTripTest, StoppedServerTurnsEndpointUnresponsive) {
    ShareClient client(fast_client_options());
    ASSERT_TRUE(client.list_files(endpoint_).is_ok());

    server_.reset();
    auto again = client.list_files(endpoint_);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, ErrorCode::Unreachable);

    const ConnectionHealth health = client.get_connection_health(endpoint_);
    ASSERT_TRUE(health.responsive.has_value());
    EXPECT_FALSE(*health.responsive);
    EXPECT_EQ(health.last_known_file_count, 3u);

    client.clear_connection_cache();
    EXPECT_FALSE(client.get_connection_health(endpoint_).responsive.has_value());
}

TEST(UnreachableEndpointTest, ListingAndDownloadsFailCleanly) {
    TempDir dir("lanshare_unreachable");
    ShareClient client(fast_client_options());

    auto listing = client.list_files(kDeadEndpoint);
    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().code, ErrorCode::Unreachable);
    EXPECT_FALSE(client.get_connection_health(kDeadEndpoint).responsive.has_value());

    auto file = client.download_file(kDeadEndpoint, "a.txt", dir / "a.txt");
    ASSERT_TRUE(file.is_error());
    EXPECT_EQ(file.error().code, ErrorCode::RetriesExhausted);

    auto archive = client.download_all(kDeadEndpoint, dir / "all.zip");
    ASSERT_TRUE(archive.is_error());
    EXPECT_EQ(archive.error().code, ErrorCode::RetriesExhausted);
    EXPECT_FALSE(fs::exists(dir / "all.zip"));
}
