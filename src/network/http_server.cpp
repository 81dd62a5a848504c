#include "lanshare/network/http_server.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace lanshare {
namespace network {

std::chrono::milliseconds accept_retry_delay(unsigned consecutive_failures) {
    if (consecutive_failures == 0) {
        return std::chrono::milliseconds(0);
    }
    const unsigned shift = std::min(consecutive_failures - 1, 7u);
    return std::min(std::chrono::milliseconds(10 << shift), std::chrono::milliseconds(1000));
}

HttpServer::HttpServer(HttpServerOptions options)
    : options_(options) {
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

Result<void> HttpServer::listen(uint16_t port, const std::string& address) {
    auto create_result = listener_.create();
    if (create_result.is_error()) {
        return Err<void, std::string>("Failed to create listener socket: " + create_result.error());
    }

    auto reuse_result = listener_.set_reuse_address(true);
    if (reuse_result.is_error()) {
        spdlog::warn("Failed to set SO_REUSEADDR: {}", reuse_result.error());
    }

    auto bind_result = listener_.bind(address, port);
    if (bind_result.is_error()) {
        listener_.close();
        return Err<void, std::string>(bind_result.error());
    }

    auto listen_result = listener_.listen(128);
    if (listen_result.is_error()) {
        listener_.close();
        return Err<void, std::string>(listen_result.error());
    }

    auto bound_port = listener_.local_port();
    if (bound_port.is_error()) {
        listener_.close();
        return Err<void, std::string>(bound_port.error());
    }

    port_ = bound_port.value();
    running_ = true;
    spdlog::info("HTTP server listening on {}:{}", address, port_);
    return Ok();
}

Result<void> HttpServer::serve_forever() {
    if (!listener_.is_valid()) {
        return Err<void, std::string>("Server not initialized. Call listen() first.");
    }

    if (!handler_) {
        return Err<void, std::string>("No request handler set. Call set_handler() first.");
    }

    const size_t threads = options_.worker_threads > 0
        ? options_.worker_threads
        : concurrency::WorkerPool::default_thread_count();
    pool_ = std::make_unique<concurrency::WorkerPool>(threads, options_.queue_limit, "http");

    spdlog::info("Server started with {} workers", threads);

    unsigned accept_failures = 0;
    while (running_) {
        auto accept_result = listener_.accept();
        if (accept_result.is_error()) {
            if (!running_) {
                break;
            }
            ++accept_failures;
            const auto delay = accept_retry_delay(accept_failures);
            if (accept_failures == 1 || delay.count() >= 1000) {
                spdlog::error("Failed to accept connection: {} (retrying in {}ms)",
                              accept_result.error(), delay.count());
            }
            std::this_thread::sleep_for(delay);
            continue;
        }
        accept_failures = 0;

        std::shared_ptr<Socket> client = std::move(accept_result.value());
        auto timeout_result = client->set_timeouts(options_.io_timeout);
        if (timeout_result.is_error()) {
            spdlog::warn("Connection from {}: {}", client->peer(), timeout_result.error());
        }

        bool queued = pool_->try_post([this, client]() {
            handle_connection(*client);
        });
        if (!queued) {
            reject_busy(*client);
        }
    }

    // Finish connections already queued before tearing down
    pool_->shutdown();
    listener_.close();
    spdlog::info("Server stopped");
    return Ok();
}

void HttpServer::stop() {
    if (running_.exchange(false)) {
        spdlog::info("Stopping server...");
        listener_.shutdown_both();
    }
}

void HttpServer::reject_busy(Socket& client) {
    total_rejected_.fetch_add(1, std::memory_order_relaxed);
    spdlog::warn("Worker queue full, rejecting {}", client.peer());
    auto response = create_error_response(HttpStatus::SERVICE_UNAVAILABLE, "Server busy");
    auto send_result = send_response(client, response);
    if (send_result.is_error()) {
        spdlog::debug("503 to {} not delivered: {}", client.peer(), send_result.error());
    }
    client.close();
}

void HttpServer::handle_connection(Socket& client) {
    active_connections_.fetch_add(1, std::memory_order_relaxed);
    HttpParser parser;

    auto request_result = read_request(client, parser);
    if (request_result.is_error()) {
        spdlog::debug("Bad request from {}: {}", client.peer(), request_result.error());
        auto error_response = create_error_response(
            HttpStatus::BAD_REQUEST,
            "Failed to parse request: " + request_result.error()
        );
        auto send_result = send_response(client, error_response);
        if (send_result.is_error()) {
            spdlog::debug("Error response to {} not delivered: {}", client.peer(), send_result.error());
        }
        client.close();
        active_connections_.fetch_sub(1, std::memory_order_relaxed);
        return;
    }

    const HttpRequest& request = request_result.value();

    HttpResponse response;
    try {
        response = handler_(request);
    } catch (const std::exception& e) {
        spdlog::error("Handler threw exception: {}", e.what());
        response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
    }

    spdlog::info("{} {} {} -> {}",
                 client.peer(),
                 HttpMethodUtils::to_string(request.method),
                 request.url,
                 response.status_code);

    auto send_result = send_response(client, response);
    if (send_result.is_error()) {
        spdlog::warn("Response to {} aborted: {}", client.peer(), send_result.error());
    }

    client.close();
    total_processed_.fetch_add(1, std::memory_order_relaxed);
    active_connections_.fetch_sub(1, std::memory_order_relaxed);
}

Result<HttpRequest> HttpServer::read_request(Socket& socket, HttpParser& parser) {
    constexpr size_t BUFFER_SIZE = 4096;

    while (!parser.is_complete()) {
        auto recv_result = socket.receive(BUFFER_SIZE);
        if (recv_result.is_error()) {
            return Err<HttpRequest, std::string>("Failed to read from socket: " + recv_result.error());
        }

        const auto& data = recv_result.value();
        if (data.empty()) {
            return Err<HttpRequest, std::string>("Client closed connection before sending complete request");
        }

        auto parse_result = parser.parse(reinterpret_cast<const char*>(data.data()), data.size());
        if (parse_result.is_error()) {
            return Err<HttpRequest, std::string>(parse_result.error());
        }

        if (parse_result.value()) {
            break;
        }
    }

    return Ok(parser.get_request());
}

Result<void> HttpServer::send_response(Socket& socket, const HttpResponse& response) {
    HttpResponse outgoing = response;
    outgoing.set_header("Connection", "close");

    if (!outgoing.is_streamed()) {
        return socket.send_all(outgoing.serialize());
    }

    auto head_result = socket.send_all(outgoing.serialize_head());
    if (head_result.is_error()) {
        return head_result;
    }

    ChunkSink sink = [&socket](const uint8_t* data, size_t length) {
        return socket.send_all(data, length);
    };
    return outgoing.body_writer(sink);
}

HttpResponse HttpServer::create_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body(message);
    response.set_header("Content-Type", "text/plain; charset=utf-8");
    return response;
}

} // namespace network
} // namespace lanshare
