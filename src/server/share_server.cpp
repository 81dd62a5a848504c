#include "lanshare/server/share_server.hpp"
#include "lanshare/core/file_stat.hpp"
#include "lanshare/events/events.hpp"

#include <spdlog/spdlog.h>

namespace lanshare::server {

namespace fs = std::filesystem;

ServerOptions make_server_options(const Settings& settings, const fs::path& root) {
    ServerOptions options;
    options.root = root;
    options.port = settings.default_port;
    options.address = settings.bind_address;

    options.http.worker_threads = settings.worker_threads;
    options.http.queue_limit = settings.accept_queue_limit;

    options.service.use_compression = settings.use_compression;
    options.service.compression_level = settings.compression_level;
    options.service.indexer.ttl = std::chrono::seconds(settings.index_cache_ttl_seconds);
    options.service.indexer.capacity = settings.index_cache_capacity;
    options.service.streamer.mmap_threshold = settings.mmap_threshold_bytes;
    options.service.archive.compression_level = settings.compression_level;
    return options;
}

ShareServer::ShareServer(ServerOptions options, events::EventBus* bus)
    : options_(std::move(options))
    , bus_(bus)
    , service_(options_.root, options_.service, bus) {
    service_.register_routes(router_);
}

ShareServer::~ShareServer() {
    stop();
}

Result<void> ShareServer::start() {
    return start(options_.port, options_.address);
}

Result<void> ShareServer::start(uint16_t port, const std::string& address) {
    if (running_.load()) {
        return Err<void, std::string>("Server already running on port " + std::to_string(this->port()));
    }

    auto root_info = stat_path(options_.root);
    if (!root_info || !root_info->is_directory) {
        return Err<void, std::string>("Shared directory not found: " + options_.root.string());
    }

    http_ = std::make_unique<network::HttpServer>(options_.http);
    http_->set_handler([this](const network::HttpRequest& request) {
        return router_.handle_request(request);
    });

    auto listened = http_->listen(port, address);
    if (listened.is_error()) {
        spdlog::error("Cannot share on {}:{}: {}", address, port, listened.error());
        http_.reset();
        return listened;
    }

    options_.port = http_->get_port();
    options_.address = address;
    running_ = true;

    accept_thread_ = std::thread([this]() {
        auto served = http_->serve_forever();
        if (served.is_error()) {
            spdlog::error("Accept loop ended: {}", served.error());
        }
    });

    spdlog::debug("Accept thread running for {}:{}", address, options_.port);
    events::emit_if(bus_, events::ServerStartedEvent(options_.port, address, options_.root.string()));
    return Ok();
}

void ShareServer::stop(const std::string& reason) {
    if (!running_.exchange(false)) {
        return;
    }

    events::emit_if(bus_, events::ServerShuttingDownEvent(reason));
    http_->stop();
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    spdlog::info("Stopped sharing {}", options_.root.string());
}

} // namespace lanshare::server
