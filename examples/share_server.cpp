/**
 * @file share_server.cpp
 * @brief Share a directory on the LAN
 *
 * USAGE:
 *   share_server [-d DIR] [-p PORT] [-b ADDRESS] [-c CONFIG.json]
 *
 * Then, from another machine:
 *   curl http://<host>:<port>/api/files
 *   curl -O "http://<host>:<port>/download?file=docs/a.txt"
 *   curl -o all.zip http://<host>:<port>/download_all
 *
 * Press Ctrl+C to stop.
 */

#include "lanshare/core/config.hpp"
#include "lanshare/events/components.hpp"
#include "lanshare/events/event_bus.hpp"
#include "lanshare/server/share_server.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>

namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_stop_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_requested = true;
    }
}

void print_usage(const char* program) {
    spdlog::info("Usage: {} [-d DIR] [-p PORT] [-b ADDRESS] [-c CONFIG.json]", program);
}

} // namespace

int main(int argc, char* argv[]) {
    lanshare::Settings settings = lanshare::default_settings();
    fs::path root = fs::current_path();
    std::optional<uint16_t> port;
    std::string address;

    // Config first so explicit flags override it
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            auto loaded = lanshare::load_settings(argv[++i]);
            if (loaded.is_error()) {
                spdlog::warn("Using default settings: {}", loaded.error());
            } else {
                settings = loaded.value();
            }
        }
    }
    lanshare::configure_logging(settings);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-d" || arg == "--dir") && i + 1 < argc) {
            root = fs::path(argv[++i]);
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            char* end = nullptr;
            const unsigned long value = std::strtoul(argv[++i], &end, 10);
            if (*end != '\0' || value > 65535) {
                spdlog::error("Invalid port: {}", argv[i]);
                return 1;
            }
            port = static_cast<uint16_t>(value);
        } else if ((arg == "-b" || arg == "--bind") && i + 1 < argc) {
            address = argv[++i];
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            ++i;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            spdlog::error("Unknown argument: {}", arg);
            print_usage(argv[0]);
            return 1;
        }
    }

    lanshare::events::EventBus bus;
    lanshare::events::LoggerComponent logger(bus);
    lanshare::events::MetricsComponent metrics(bus);

    lanshare::server::ShareServer server(lanshare::server::make_server_options(settings, root), &bus);
    auto started = server.start(port.value_or(settings.default_port),
                                address.empty() ? settings.bind_address : address);
    if (started.is_error()) {
        spdlog::error("Failed to start: {}", started.error());
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    while (!g_stop_requested.load() && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.stop("signal received");
    metrics.print_stats();
    return 0;
}
