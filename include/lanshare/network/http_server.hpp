#pragma once

#include "lanshare/concurrency/worker_pool.hpp"
#include "lanshare/core/result.hpp"
#include "lanshare/network/http_parser.hpp"
#include "lanshare/network/http_types.hpp"
#include "lanshare/network/socket.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace lanshare {
namespace network {

/**
 * @brief HTTP request handler function type
 *
 * May be called concurrently from multiple worker threads.
 */
using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

struct HttpServerOptions {
    size_t worker_threads = 0;                 // 0 = WorkerPool::default_thread_count()
    size_t queue_limit = 100;                  // Accepted connections waiting for a worker
    std::chrono::seconds io_timeout{30};       // Per-connection send/receive timeout
};

/**
 * @brief Multi-threaded HTTP/1.1 server with a bounded worker pool
 *
 * Architecture:
 * - Accept thread (the caller of serve_forever) accepts connections
 * - Each connection becomes one task on a WorkerPool
 * - When the pool's queue is full the connection gets 503 immediately
 *
 * One request per connection; every response carries "Connection: close".
 * Responses with a body_writer are streamed: the head goes out first, then
 * the writer pushes the body straight to the socket. If the writer fails the
 * connection is closed early and the client sees a truncated body.
 *
 * Usage:
 * ```cpp
 * HttpServer server;
 * server.set_handler([&](const HttpRequest& req) { return router.handle_request(req); });
 * auto result = server.listen(0, "127.0.0.1");   // 0 = ephemeral port
 * if (result.is_ok()) {
 *     std::thread loop([&] { server.serve_forever(); });
 *     ...
 *     server.stop();
 *     loop.join();
 * }
 * ```
 */
class HttpServer {
public:
    explicit HttpServer(HttpServerOptions options = HttpServerOptions{});
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void set_handler(HttpRequestHandler handler);

    /**
     * @brief Bind and start listening
     *
     * @param port Port to listen on; 0 picks a free port, see get_port()
     * @param address Address to bind to (default: all interfaces)
     */
    Result<void> listen(uint16_t port, const std::string& address = "0.0.0.0");

    /**
     * @brief Run the accept loop until stop() is called (blocking)
     */
    Result<void> serve_forever();

    /**
     * @brief Stop accepting; serve_forever() returns after in-flight work drains
     */
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }

    uint16_t get_port() const { return port_; }

    size_t get_active_connections() const {
        return active_connections_.load(std::memory_order_relaxed);
    }

    size_t get_total_processed() const {
        return total_processed_.load(std::memory_order_relaxed);
    }

    size_t get_total_rejected() const {
        return total_rejected_.load(std::memory_order_relaxed);
    }

private:
    void handle_connection(Socket& client);
    Result<HttpRequest> read_request(Socket& socket, HttpParser& parser);
    Result<void> send_response(Socket& socket, const HttpResponse& response);
    void reject_busy(Socket& client);

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    HttpServerOptions options_;
    HttpRequestHandler handler_;
    Socket listener_;
    std::unique_ptr<concurrency::WorkerPool> pool_;
    std::atomic<bool> running_{false};
    uint16_t port_ = 0;

    std::atomic<size_t> active_connections_{0};
    std::atomic<size_t> total_processed_{0};
    std::atomic<size_t> total_rejected_{0};
};

/**
 * @brief Pause before accepting again after `consecutive_failures` errors
 *
 * Zero for no failures, then 10 ms doubling up to 1 s. Keeps a persistent
 * error such as EMFILE from spinning the accept thread.
 */
std::chrono::milliseconds accept_retry_delay(unsigned consecutive_failures);

} // namespace network
} // namespace lanshare
