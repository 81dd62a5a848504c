#include "lanshare/codec/zip_writer.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using lanshare::codec::ZipWriter;
using namespace lanshare::testing;

TEST(ZipWriterTest, WritesReadableArchive) {
    TempDir dir("lanshare_zip");
    write_file(dir / "src/a.txt", "hello archive");
    write_file(dir / "src/big.bin", pattern_bytes(300 * 1024));

    auto created = ZipWriter::create(dir / "out.zip", 6, 64 * 1024);
    ASSERT_TRUE(created.is_ok());
    auto& zip = created.value();

    ASSERT_TRUE(zip->add_directory("docs").is_ok());
    ASSERT_TRUE(zip->add_file("docs/a.txt", dir / "src/a.txt").is_ok());
    ASSERT_TRUE(zip->add_file("big.bin", dir / "src/big.bin").is_ok());
    EXPECT_EQ(zip->entry_count(), 3u);
    ASSERT_TRUE(zip->finish().is_ok());
    EXPECT_TRUE(zip->finished());

    auto entries = read_zip(dir / "out.zip");
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "docs/");
    EXPECT_TRUE(entries[0].data.empty());
    EXPECT_EQ(entries[1].name, "docs/a.txt");
    EXPECT_EQ(entries[1].data, "hello archive");
    EXPECT_EQ(entries[2].name, "big.bin");
    EXPECT_EQ(entries[2].data, pattern_bytes(300 * 1024));
}

TEST(ZipWriterTest, MarksOnlyUtf8NamesAsUtf8) {
    TempDir dir("lanshare_zip");
    write_file(dir / "src/a.txt", "a");

    auto created = ZipWriter::create(dir / "out.zip");
    ASSERT_TRUE(created.is_ok());
    auto& zip = created.value();

    ASSERT_TRUE(zip->add_file("caf\xC3\xA9.txt", dir / "src/a.txt").is_ok());
    ASSERT_TRUE(zip->add_file("bad\xFF\xFE.txt", dir / "src/a.txt").is_ok());
    ASSERT_TRUE(zip->add_directory("over\xC0\xAFlong").is_ok());
    ASSERT_TRUE(zip->finish().is_ok());

    auto entries = read_zip(dir / "out.zip");
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].flags & 0x0800, 0x0800);
    EXPECT_EQ(entries[1].flags & 0x0800, 0);
    EXPECT_EQ(entries[1].name, "bad\xFF\xFE.txt");
    EXPECT_EQ(entries[2].flags & 0x0800, 0);
}

TEST(ZipWriterTest, MissingSourceLeavesArchiveUsable) {
    TempDir dir("lanshare_zip");
    write_file(dir / "kept.txt", "kept");

    auto created = ZipWriter::create(dir / "out.zip");
    ASSERT_TRUE(created.is_ok());
    auto& zip = created.value();

    EXPECT_TRUE(zip->add_file("gone.txt", dir / "gone.txt").is_error());
    ASSERT_TRUE(zip->add_file("kept.txt", dir / "kept.txt").is_ok());
    ASSERT_TRUE(zip->finish().is_ok());

    auto entries = read_zip(dir / "out.zip");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].data, "kept");
}

TEST(ZipWriterTest, RejectsEntriesAfterFinish) {
    TempDir dir("lanshare_zip");
    write_file(dir / "a.txt", "a");

    auto created = ZipWriter::create(dir / "out.zip");
    ASSERT_TRUE(created.is_ok());
    ASSERT_TRUE(created.value()->finish().is_ok());
    EXPECT_TRUE(created.value()->add_file("a.txt", dir / "a.txt").is_error());
    EXPECT_TRUE(read_zip(dir / "out.zip").empty());
}

TEST(ZipWriterTest, CreateFailsForMissingDirectory) {
    TempDir dir("lanshare_zip");
    EXPECT_TRUE(ZipWriter::create(dir / "no/such/dir/out.zip").is_error());
}
