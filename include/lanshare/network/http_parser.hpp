#pragma once

#include "lanshare/network/http_types.hpp"
#include "lanshare/core/result.hpp"

#include <string>

namespace lanshare {
namespace network {

/**
 * @brief Where the request parser is in the message
 *
 *   METHOD SP TARGET SP VERSION CRLF   <- REQUEST_LINE
 *   Name: value CRLF                   <- HEADERS (repeated)
 *   CRLF                               <- end of head
 *   [Content-Length bytes]             <- BODY
 */
enum class ParseState {
    REQUEST_LINE,
    HEADERS,
    BODY,
    COMPLETE,
    PARSE_ERROR      // Not ERROR: clashes with a Windows macro
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Bytes are fed as they arrive from the socket. Head lines are buffered until
 * CRLF and handled one at a time. The head is capped at kMaxHeadBytes and the
 * body at kMaxBodyBytes; anything larger is an error, not a longer wait.
 *
 * ```cpp
 * HttpParser parser;
 * auto result = parser.parse(data.data(), data.size());
 * if (result.is_ok() && result.value()) {
 *     HttpRequest request = parser.get_request();
 * }
 * ```
 */
class HttpParser {
public:
    static constexpr size_t kMaxHeadBytes = 64 * 1024;
    static constexpr size_t kMaxBodyBytes = 1024 * 1024;

    HttpParser() { reset(); }

    /**
     * @return true once a full request is available, false if more bytes are
     *         needed, an error for malformed or oversized input
     */
    Result<bool> parse(const char* data, size_t len);

    HttpRequest get_request() const { return request_; }
    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    void reset();

private:
    ParseState state_;
    HttpRequest request_;
    std::string line_;                  // Current head line, without CRLF
    size_t head_bytes_;
    size_t body_remaining_;
    size_t line_number_;

    Result<bool> fail(const std::string& what);

    bool on_request_line(const std::string& line);
    bool on_header_line(const std::string& line);
    bool on_head_complete();
};

/**
 * @brief Parse a response status line and headers
 *
 * @param head Raw bytes up to and including the blank line ("\r\n\r\n")
 */
Result<HttpResponseHead> parse_response_head(const std::string& head);

} // namespace network
} // namespace lanshare
