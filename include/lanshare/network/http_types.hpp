#pragma once

#include "lanshare/core/result.hpp"

#include <cstdint>
#include <cstring>  // For _stricmp on Windows, strcasecmp on Unix
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

// For strcasecmp on Unix/Linux
#ifndef _WIN32
#include <strings.h>
#endif

namespace lanshare {
namespace network {

/**
 * @brief HTTP request methods as defined in RFC 7231
 *
 * The share service only answers GET, but the parser accepts the common
 * methods so that other verbs get a clean 404/405 instead of a parse error.
 */
enum class HttpMethod {
    GET,     // Retrieve a resource
    POST,    // Submit data to be processed
    PUT,     // Update/create a resource
    DELETE_METHOD,  // Delete a resource (renamed to avoid Windows macro conflict)
    HEAD,    // Like GET but only returns headers
    OPTIONS, // Describe communication options
    UNKNOWN  // Fallback for unsupported methods
};

/**
 * @brief HTTP version enumeration
 */
enum class HttpVersion {
    HTTP_1_0,  // HTTP/1.0 - Simple, no keep-alive by default
    HTTP_1_1,  // HTTP/1.1 - Keep-alive by default, chunked encoding
    UNKNOWN
};

/**
 * @brief HTTP status codes used by the share protocol
 */
enum class HttpStatus {
    OK = 200,                     // Request succeeded
    PARTIAL_CONTENT = 206,        // Range request honoured
    MOVED_PERMANENTLY = 301,      // Directory requested without trailing slash
    NOT_MODIFIED = 304,           // If-None-Match matched the current ETag
    BAD_REQUEST = 400,            // Client error - malformed request
    FORBIDDEN = 403,              // Path escapes the shared root
    NOT_FOUND = 404,              // Resource not found
    METHOD_NOT_ALLOWED = 405,     // Method not supported for resource
    RANGE_NOT_SATISFIABLE = 416,  // Range start beyond end of file
    INTERNAL_SERVER_ERROR = 500,  // Server error
    NOT_IMPLEMENTED = 501,        // Method not implemented
    SERVICE_UNAVAILABLE = 503     // Server overloaded or down
};

// Cross-platform case-insensitive string comparison
inline int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
    return _stricmp(s1, s2);
#else
    return strcasecmp(s1, s2);
#endif
}

using HeaderMap = std::unordered_map<std::string, std::string>;

/**
 * @brief Case-insensitive header lookup (RFC 7230 header names are case-insensitive)
 *
 * @return Header value if found, empty string otherwise
 */
inline std::string find_header(const HeaderMap& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

/**
 * @brief Represents an HTTP request
 *
 * Structure follows the HTTP/1.1 request format:
 * Request-Line = Method SP Request-URI SP HTTP-Version CRLF
 * Headers = *(header-field CRLF)
 * CRLF
 * [ message-body ]
 *
 * Example:
 * GET /download?file=docs%2Fa.txt HTTP/1.1
 * Host: 192.168.1.20:8000
 * Range: bytes=1024-
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;                                      // Request target including query
    HttpVersion version = HttpVersion::HTTP_1_1;
    HeaderMap headers;                                    // Stored as received
    std::vector<uint8_t> body;                           // Request body (optional)

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    /**
     * @brief Get the body as a string (for text content)
     */
    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief Receives successive slices of a streamed response body
 *
 * Returns an error when the peer can no longer be written to; the writer
 * must stop and propagate it.
 */
using ChunkSink = std::function<Result<void>(const uint8_t* data, size_t length)>;

/**
 * @brief Produces a response body incrementally
 *
 * Used for file and archive downloads, where the body is far too large to
 * hold in memory. The handler must set Content-Length itself. A writer that
 * returns an error makes the server abort the connection, so the client sees
 * a short body instead of a silent success.
 */
using BodyWriter = std::function<Result<void>(const ChunkSink& sink)>;

/**
 * @brief Represents an HTTP response
 *
 * Structure follows the HTTP/1.1 response format:
 * Status-Line = HTTP-Version SP Status-Code SP Reason-Phrase CRLF
 * Headers = *(header-field CRLF)
 * CRLF
 * [ message-body ]
 *
 * The body is either held in `body` or produced by `body_writer`.
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;                            // e.g., "OK", "Not Found"
    HeaderMap headers;
    std::vector<uint8_t> body;
    BodyWriter body_writer;                               // Streamed body (optional)

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    /**
     * @brief Set response body from a string
     *
     * Automatically sets Content-Length header.
     */
    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_body(const std::vector<uint8_t>& data) {
        body = data;
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_body(std::vector<uint8_t>&& data) {
        body = std::move(data);
        headers["Content-Length"] = std::to_string(body.size());
    }

    /**
     * @brief Stream the body through a writer instead of buffering it
     *
     * @param content_length Exact number of bytes the writer will produce
     */
    void set_body_writer(uint64_t content_length, BodyWriter writer) {
        body.clear();
        body_writer = std::move(writer);
        headers["Content-Length"] = std::to_string(content_length);
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    bool is_streamed() const { return static_cast<bool>(body_writer); }

    /**
     * @brief Serialize the status line and headers, including the blank line
     */
    std::vector<uint8_t> serialize_head() const {
        std::ostringstream oss;

        // Status line
        oss << version_to_string(version) << " "
            << status_code << " "
            << reason_phrase << "\r\n";

        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }

        // Empty line separates headers from body
        oss << "\r\n";

        std::string header_str = oss.str();
        return std::vector<uint8_t>(header_str.begin(), header_str.end());
    }

    /**
     * @brief Serialize head plus in-memory body for transmission
     *
     * Streamed bodies are not included; the server drives body_writer itself.
     */
    std::vector<uint8_t> serialize() const {
        std::vector<uint8_t> result = serialize_head();
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::PARTIAL_CONTENT: return "Partial Content";
            case HttpStatus::MOVED_PERMANENTLY: return "Moved Permanently";
            case HttpStatus::NOT_MODIFIED: return "Not Modified";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::FORBIDDEN: return "Forbidden";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::RANGE_NOT_SATISFIABLE: return "Range Not Satisfiable";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
            default: return "Unknown";
        }
    }

    static std::string version_to_string(HttpVersion version) {
        switch (version) {
            case HttpVersion::HTTP_1_0: return "HTTP/1.0";
            case HttpVersion::HTTP_1_1: return "HTTP/1.1";
            default: return "HTTP/1.1";
        }
    }
};

/**
 * @brief Status line and headers of a response read by the client
 */
struct HttpResponseHead {
    int status_code = 0;
    std::string reason_phrase;
    HeaderMap headers;

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    /**
     * @brief Declared body length, if the peer sent a valid Content-Length
     */
    std::optional<uint64_t> content_length() const;
};

/**
 * @brief Helper functions for HTTP method conversions
 */
class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

} // namespace network
} // namespace lanshare
