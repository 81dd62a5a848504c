#pragma once

#include "lanshare/core/error.hpp"
#include "lanshare/network/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lanshare {
namespace network {

struct ClientRequest {
    std::string host;
    uint16_t port = 0;
    std::string target = "/";                       // Already percent-encoded
    HeaderMap headers;
    std::chrono::milliseconds timeout{15000};       // Applies to each network step
};

/**
 * @brief An open response whose body has not been read yet
 *
 * Each read waits at most the request timeout. When the server declared a
 * Content-Length, a connection that ends early is reported as Unreachable so
 * callers can retry or resume.
 */
class HttpResponseStream {
public:
    struct Impl;

    explicit HttpResponseStream(std::unique_ptr<Impl> impl);
    ~HttpResponseStream();

    HttpResponseStream(const HttpResponseStream&) = delete;
    HttpResponseStream& operator=(const HttpResponseStream&) = delete;

    const HttpResponseHead& head() const;
    int status() const { return head().status_code; }

    /**
     * @brief Read the next slice of the body
     * @return Bytes placed in buffer; 0 once the body is complete
     */
    Outcome<size_t> read_some(uint8_t* buffer, size_t capacity);

    /**
     * @brief Read the rest of the body into memory
     * @param limit Largest body accepted, MalformedResponse beyond it
     */
    Outcome<std::vector<uint8_t>> read_all(size_t limit = 512 * 1024 * 1024);

    uint64_t bytes_read() const;

    void close();

private:
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Minimal blocking HTTP/1.1 GET client built on Boost.Asio
 *
 * Every step (resolve, connect, send, read) runs the io_context for at most
 * the request timeout; a step that does not finish in time closes the socket
 * and yields ErrorCode::Timeout. Only "Connection: close" identity bodies are
 * supported, which is what the share server sends.
 *
 * Error mapping:
 * - deadline expired                           → Timeout
 * - refused / unreachable / lookup failed      → Unreachable
 * - connection dropped, 503 Service Unavailable→ Unreachable
 * - unparsable head, chunked encoding          → MalformedResponse
 */
class HttpClient {
public:
    /**
     * @brief Send a GET and read the response head
     */
    static Outcome<std::unique_ptr<HttpResponseStream>> open(const ClientRequest& request);

    /**
     * @brief Build the request bytes; exposed for tests
     */
    static std::string format_request(const ClientRequest& request);
};

} // namespace network
} // namespace lanshare
