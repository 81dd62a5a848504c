#include "lanshare/codec/gzip.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace lanshare::codec;

TEST(GzipTest, CompressesRepetitiveJson) {
    std::string json = "[";
    for (int i = 0; i < 200; ++i) {
        json += R"({"path":"docs/file_)" + std::to_string(i) + R"(.txt","size":1024,"is_dir":false},)";
    }
    json.back() = ']';

    auto compressed = gzip_compress(json);
    ASSERT_TRUE(compressed.is_ok());
    EXPECT_LT(compressed.value().size(), json.size() / 4);
    EXPECT_TRUE(looks_like_gzip(compressed.value().data(), compressed.value().size()));

    auto restored = gzip_decompress(compressed.value());
    ASSERT_TRUE(restored.is_ok());
    EXPECT_EQ(std::string(restored.value().begin(), restored.value().end()), json);
}

TEST(GzipTest, OutOfRangeLevelFallsBackToDefault) {
    auto compressed = gzip_compress(std::string(4096, 'x'), 42);
    ASSERT_TRUE(compressed.is_ok());
    EXPECT_TRUE(gzip_decompress(compressed.value()).is_ok());
}

TEST(GzipTest, RejectsCorruptInput) {
    const std::string plain = R"([{"path":"a.txt"}])";
    auto not_gzip = gzip_decompress(reinterpret_cast<const uint8_t*>(plain.data()), plain.size());
    EXPECT_TRUE(not_gzip.is_error());
    EXPECT_FALSE(looks_like_gzip(reinterpret_cast<const uint8_t*>(plain.data()), plain.size()));
}

TEST(GzipTest, RejectsTruncatedStream) {
    auto compressed = gzip_compress(lanshare::testing::pattern_bytes(64 * 1024));
    ASSERT_TRUE(compressed.is_ok());
    auto bytes = compressed.value();
    bytes.resize(bytes.size() / 2);
    EXPECT_TRUE(gzip_decompress(bytes).is_error());
}

TEST(GzipTest, EnforcesOutputLimit) {
    auto compressed = gzip_compress(std::string(100000, 'a'));
    ASSERT_TRUE(compressed.is_ok());
    auto limited = gzip_decompress(compressed.value().data(), compressed.value().size(), 1000);
    EXPECT_TRUE(limited.is_error());
}
