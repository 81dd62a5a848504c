#include "lanshare/network/url.hpp"

#include <gtest/gtest.h>

using namespace lanshare::network;

TEST(UrlTest, EncodeKeepsSlashesAndUnreserved) {
    EXPECT_EQ(url_encode("docs/a-b_c.d~e.txt"), "docs/a-b_c.d~e.txt");
    EXPECT_EQ(url_encode("my notes&more.txt"), "my%20notes%26more.txt");
    EXPECT_EQ(url_encode("caf\xC3\xA9"), "caf%C3%A9");
}

TEST(UrlTest, DecodeHandlesPlusAndMalformedEscapes) {
    EXPECT_EQ(url_decode("a+b%20c"), "a b c");
    EXPECT_EQ(url_decode("a+b", false), "a+b");
    EXPECT_EQ(url_decode("100%zz"), "100%zz");
    EXPECT_EQ(url_decode("%"), "%");
}

TEST(UrlTest, EncodeDecodeKeepsArbitraryNames) {
    const std::string name = "dir with space/#hash?.txt";
    EXPECT_EQ(url_decode(url_encode(name)), name);
}

TEST(UrlTest, SplitTargetSeparatesQuery) {
    std::string path;
    std::string query;
    split_target("/docs/a%20b?file=x&y=1", path, query);
    EXPECT_EQ(path, "/docs/a b");
    EXPECT_EQ(query, "file=x&y=1");

    split_target("/plain", path, query);
    EXPECT_EQ(path, "/plain");
    EXPECT_TRUE(query.empty());
}

TEST(UrlTest, ParseQueryDecodesPairs) {
    auto params = parse_query("file=docs%2Fa.txt&flag&&empty=");
    EXPECT_EQ(params["file"], "docs/a.txt");
    EXPECT_EQ(params.count("flag"), 1u);
    EXPECT_EQ(params["empty"], "");
    EXPECT_EQ(params.size(), 3u);
}
