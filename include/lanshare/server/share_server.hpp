#pragma once

/**
 * @file share_server.hpp
 * @brief Shares one directory over HTTP on the local network
 *
 * WHY THIS FILE EXISTS:
 * ShareService knows how to answer requests; something still has to own the
 * listener, the router and the accept thread, and turn Settings into the
 * options those pieces take. ShareServer is that owner.
 *
 * LIFECYCLE:
 *   ShareServer server(make_server_options(settings, "/srv/share"), &bus);
 *   server.start();          // binds, then accepts on a background thread
 *   ...
 *   server.stop();           // closes the listener, drains queued connections
 */

#include "lanshare/core/config.hpp"
#include "lanshare/core/result.hpp"
#include "lanshare/events/event_bus.hpp"
#include "lanshare/network/http_router.hpp"
#include "lanshare/network/http_server.hpp"
#include "lanshare/server/share_service.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

namespace lanshare::server {

struct ServerOptions {
    std::filesystem::path root;
    uint16_t port = 8000;                 ///< 0 binds an ephemeral port
    std::string address = "0.0.0.0";
    network::HttpServerOptions http;
    ServiceOptions service;
};

ServerOptions make_server_options(const Settings& settings, const std::filesystem::path& root);

class ShareServer {
public:
    explicit ShareServer(ServerOptions options, events::EventBus* bus = nullptr);
    ~ShareServer();

    ShareServer(const ShareServer&) = delete;
    ShareServer& operator=(const ShareServer&) = delete;

    /**
     * @brief Bind and start accepting on a background thread
     *
     * Fails when the root is not a directory or the port cannot be bound
     * (the message carries the OS reason, e.g. "Address already in use").
     */
    Result<void> start();

    /**
     * @brief Start on an explicit port and address, overriding the options
     */
    Result<void> start(uint16_t port, const std::string& address);

    /**
     * @brief Stop accepting and join the accept thread. Idempotent.
     */
    void stop(const std::string& reason = "normal shutdown");

    bool is_running() const { return running_.load(std::memory_order_acquire); }

    /// Port actually bound; meaningful after start()
    uint16_t port() const { return http_ ? http_->get_port() : 0; }

    /// Connections currently held by a worker
    size_t active_connections() const { return http_ ? http_->get_active_connections() : 0; }

    /// Connections answered 503 because the worker queue was full
    size_t rejected_connections() const { return http_ ? http_->get_total_rejected() : 0; }

    /// Drop every cached directory snapshot
    void clear_cache() { service_.indexer().clear(); }

    ShareService& service() { return service_; }
    const network::HttpRouter& router() const { return router_; }
    const ServerOptions& options() const { return options_; }

private:
    ServerOptions options_;
    events::EventBus* bus_;
    ShareService service_;
    network::HttpRouter router_;
    std::unique_ptr<network::HttpServer> http_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};
};

} // namespace lanshare::server
