#include "lanshare/server/archive_streamer.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>

using namespace lanshare::server;
using namespace lanshare::testing;
namespace fs = std::filesystem;

namespace {

std::map<std::string, std::string> by_name(const std::vector<ZipEntry>& entries) {
    std::map<std::string, std::string> out;
    for (const auto& entry : entries) {
        out[entry.name] = entry.data;
    }
    return out;
}

} // namespace

TEST(ArchiveStreamerTest, ArchivesTreeUnderRootName) {
    TempDir dir("lanshare_archive");
    const fs::path root = dir / "photos";
    write_file(root / "a.txt", "alpha");
    write_file(root / "trip/b.bin", pattern_bytes(100 * 1024));
    fs::create_directories(root / "empty");

    ArchiveOptions options;
    options.temp_directory = dir / "tmp";
    fs::create_directories(options.temp_directory);
    ArchiveStreamer streamer(root, options);

    ArchiveReport report;
    auto built = streamer.build(&report);
    ASSERT_TRUE(built.is_ok()) << built.error();
    EXPECT_EQ(report.files_added, 2u);
    EXPECT_EQ(report.directories_added, 1u);
    EXPECT_EQ(report.files_skipped, 0u);
    EXPECT_EQ(report.archive_size, fs::file_size(built.value()->path()));

    auto entries = by_name(read_zip(built.value()->path()));
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries["photos/a.txt"], "alpha");
    EXPECT_EQ(entries["photos/trip/b.bin"], pattern_bytes(100 * 1024));
    EXPECT_EQ(entries.count("photos/empty/"), 1u);
    EXPECT_EQ(entries.count("photos/trip/"), 0u);
}

TEST(ArchiveStreamerTest, TempFileIsRemovedWithLastReference) {
    TempDir dir("lanshare_archive");
    write_file(dir / "root/a.txt", "a");

    ArchiveOptions options;
    options.temp_directory = dir / "tmp";
    fs::create_directories(options.temp_directory);
    ArchiveStreamer streamer(dir / "root", options);

    fs::path archive_path;
    {
        auto built = streamer.build();
        ASSERT_TRUE(built.is_ok());
        archive_path = built.value()->path();
        EXPECT_TRUE(fs::exists(archive_path));
    }
    EXPECT_FALSE(fs::exists(archive_path));
    EXPECT_TRUE(fs::is_empty(options.temp_directory));
}

TEST(ArchiveStreamerTest, ServeStreamsArchiveAndCleansUp) {
    TempDir dir("lanshare_archive");
    write_file(dir / "share/docs/a.txt", "hello");

    ArchiveOptions options;
    options.temp_directory = dir / "tmp";
    options.chunk_size = 1024;
    fs::create_directories(options.temp_directory);
    ArchiveStreamer streamer(dir / "share", options);

    {
        auto response = streamer.serve();
        EXPECT_EQ(response.status_code, 200);
        EXPECT_EQ(response.get_header("Content-Type"), "application/zip");
        EXPECT_EQ(response.get_header("Content-Disposition"), "attachment; filename=\"share.zip\"");

        const std::string body = collect_body(response);
        EXPECT_EQ(response.get_header("Content-Length"), std::to_string(body.size()));

        write_file(dir / "copy.zip", body);
        auto entries = by_name(read_zip(dir / "copy.zip"));
        EXPECT_EQ(entries["share/docs/a.txt"], "hello");
    }
    EXPECT_TRUE(fs::is_empty(options.temp_directory));
}

TEST(ArchiveStreamerTest, MissingRootFails) {
    TempDir dir("lanshare_archive");
    ArchiveStreamer streamer(dir / "missing");
    EXPECT_TRUE(streamer.build().is_error());
    EXPECT_EQ(streamer.serve().status_code, 500);
}
