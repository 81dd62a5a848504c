#include "lanshare/network/http_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace lanshare::network;

namespace {

lanshare::Result<bool> feed(HttpParser& parser, const std::string& raw) {
    return parser.parse(raw.data(), raw.size());
}

} // namespace

TEST(HttpParserTest, ParsesGetWithHeaders) {
    HttpParser parser;
    auto result = feed(parser,
        "GET /download?file=docs%2Fa.txt HTTP/1.1\r\n"
        "Host: 127.0.0.1:8000\r\n"
        "Range:   bytes=100-  \r\n"
        "\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_TRUE(parser.is_complete());

    const HttpRequest request = parser.get_request();
    EXPECT_EQ(request.method, HttpMethod::GET);
    EXPECT_EQ(request.url, "/download?file=docs%2Fa.txt");
    EXPECT_EQ(request.version, HttpVersion::HTTP_1_1);
    EXPECT_EQ(request.get_header("range"), "bytes=100-");
}

TEST(HttpParserTest, HandlesPartialInput) {
    HttpParser parser;
    auto first = feed(parser, "GET /api/files HTTP/1.0\r\nAccept-Enc");
    ASSERT_TRUE(first.is_ok());
    EXPECT_FALSE(first.value());

    auto second = feed(parser, "oding: gzip\r\n\r\n");
    ASSERT_TRUE(second.is_ok());
    EXPECT_TRUE(second.value());
    EXPECT_EQ(parser.get_request().version, HttpVersion::HTTP_1_0);
    EXPECT_EQ(parser.get_request().get_header("Accept-Encoding"), "gzip");
}

TEST(HttpParserTest, ReadsBodyByContentLength) {
    HttpParser parser;
    auto result = feed(parser, "POST /x HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.get_request().body_as_string(), "hello");
}

TEST(HttpParserTest, RejectsGarbage) {
    HttpParser lowercase;
    EXPECT_TRUE(feed(lowercase, "get / HTTP/1.1\r\n\r\n").is_error());

    HttpParser unknown_version;
    EXPECT_TRUE(feed(unknown_version, "GET / HTTP/2.0\r\n\r\n").is_error());

    HttpParser bad_length;
    EXPECT_TRUE(feed(bad_length, "POST / HTTP/1.1\r\nContent-Length: abc\r\n\r\n").is_error());
}

TEST(HttpParserTest, ResetAllowsReuse) {
    HttpParser parser;
    ASSERT_TRUE(feed(parser, "GET /one HTTP/1.1\r\n\r\n").is_ok());
    parser.reset();
    ASSERT_TRUE(feed(parser, "HEAD /two HTTP/1.1\r\n\r\n").is_ok());
    EXPECT_EQ(parser.get_request().method, HttpMethod::HEAD);
    EXPECT_EQ(parser.get_request().url, "/two");
}

TEST(ResponseHeadTest, ParsesStatusAndHeaders) {
    auto head = parse_response_head(
        "HTTP/1.1 206 Partial Content\r\n"
        "Content-Range: bytes 10-19/20\r\n"
        "Content-Length: 10\r\n"
        "ETag: \"20-1700000000\"\r\n"
        "\r\n");
    ASSERT_TRUE(head.is_ok());
    EXPECT_EQ(head.value().status_code, 206);
    EXPECT_EQ(head.value().reason_phrase, "Partial Content");
    EXPECT_EQ(head.value().get_header("content-range"), "bytes 10-19/20");
    ASSERT_TRUE(head.value().content_length().has_value());
    EXPECT_EQ(*head.value().content_length(), 10u);
}

TEST(ResponseHeadTest, RejectsMalformedStatusLine) {
    EXPECT_TRUE(parse_response_head("SSH-2.0-OpenSSH\r\n\r\n").is_error());
    EXPECT_TRUE(parse_response_head("HTTP/1.1 abc Nope\r\n\r\n").is_error());
    EXPECT_TRUE(parse_response_head("HTTP/1.1 200 OK\r\nbroken header\r\n\r\n").is_error());
}

TEST(ResponseHeadTest, MissingContentLength) {
    auto head = parse_response_head("HTTP/1.1 304 Not Modified\r\n\r\n");
    ASSERT_TRUE(head.is_ok());
    EXPECT_FALSE(head.value().content_length().has_value());
}
