/**
 * @file share_client.cpp
 * @brief List and download from a LAN share
 *
 * USAGE:
 *   share_client HOST[:PORT] list
 *   share_client HOST[:PORT] get REMOTE_PATH [LOCAL_PATH]
 *   share_client HOST[:PORT] mirror [DEST_DIR]
 *   share_client HOST[:PORT] zip [ARCHIVE.zip]
 *
 * Options (before the host): -c CONFIG.json
 */

#include "lanshare/client/share_client.hpp"
#include "lanshare/core/config.hpp"
#include "lanshare/events/components.hpp"
#include "lanshare/events/event_bus.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using lanshare::client::Endpoint;

namespace {

void print_usage(const char* program) {
    spdlog::info("Usage: {} [-c CONFIG.json] HOST[:PORT] list|get PATH [DEST]|mirror [DIR]|zip [FILE]", program);
}

std::optional<Endpoint> parse_endpoint(const std::string& text, uint16_t default_port) {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos) {
        return Endpoint(text, default_port);
    }
    char* end = nullptr;
    const std::string port_text = text.substr(colon + 1);
    const unsigned long port = std::strtoul(port_text.c_str(), &end, 10);
    if (colon == 0 || port_text.empty() || *end != '\0' || port > 65535) {
        return std::nullopt;
    }
    return Endpoint(text.substr(0, colon), static_cast<uint16_t>(port));
}

lanshare::client::ByteProgressCallback percent_logger(const std::string& label) {
    auto last = std::make_shared<int>(-1);
    return [label, last](uint64_t done, uint64_t total) {
        if (total == 0) {
            return;
        }
        const int percent = static_cast<int>(done * 100 / total);
        if (percent / 10 != *last / 10) {
            *last = percent;
            spdlog::info("{}: {}% ({}/{} bytes)", label, percent, done, total);
        }
    };
}

} // namespace

int main(int argc, char* argv[]) {
    lanshare::Settings settings = lanshare::default_settings();
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            auto loaded = lanshare::load_settings(argv[++i]);
            if (loaded.is_error()) {
                spdlog::warn("Using default settings: {}", loaded.error());
            } else {
                settings = loaded.value();
            }
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }
    lanshare::configure_logging(settings);

    if (args.size() < 2) {
        print_usage(argv[0]);
        return 1;
    }

    auto endpoint = parse_endpoint(args[0], settings.default_port);
    if (!endpoint) {
        spdlog::error("Invalid endpoint: {}", args[0]);
        return 1;
    }

    lanshare::events::EventBus bus;
    lanshare::events::LoggerComponent logger(bus);
    lanshare::events::MetricsComponent metrics(bus);
    lanshare::client::ShareClient client(lanshare::client::make_client_options(settings), &bus);

    const std::string& command = args[1];
    int status = 0;

    if (command == "list") {
        auto listing = client.list_files(*endpoint);
        if (listing.is_error()) {
            spdlog::error("{}", listing.error().message);
            return 1;
        }
        for (const auto& entry : listing.value()) {
            spdlog::info("{:6} {:>12} {}", lanshare::index::entry_type_name(entry.type), entry.size, entry.path);
        }
        spdlog::info("{} entries", listing.value().size());
    } else if (command == "get" && args.size() >= 3) {
        const std::string& remote = args[2];
        const fs::path local = args.size() >= 4 ? fs::path(args[3]) : fs::path(remote).filename();
        auto result = client.download_file(*endpoint, remote, local, percent_logger(remote));
        if (result.is_error()) {
            spdlog::error("{}", result.error().message);
            status = 1;
        } else {
            spdlog::info("{}: {}", local.string(), result.value().message);
        }
    } else if (command == "mirror") {
        const fs::path dest = args.size() >= 3 ? fs::path(args[2]) : fs::current_path();
        auto listing = client.list_files(*endpoint);
        if (listing.is_error()) {
            spdlog::error("{}", listing.error().message);
            return 1;
        }
        auto batch = client.download_files(*endpoint, listing.value(), dest,
            [](size_t done, size_t total, const std::string& name) {
                spdlog::info("[{}/{}] {}", done, total, name);
            });
        spdlog::info("{}", batch.message());
        status = batch.success() ? 0 : 1;
    } else if (command == "zip") {
        const fs::path archive = args.size() >= 3 ? fs::path(args[2]) : fs::path("share.zip");
        auto result = client.download_all(*endpoint, archive, percent_logger(archive.string()));
        if (result.is_error()) {
            spdlog::error("{}", result.error().message);
            status = 1;
        } else {
            spdlog::info("{}: {}", archive.string(), result.value().message);
        }
    } else {
        print_usage(argv[0]);
        return 1;
    }

    metrics.print_stats();
    return status;
}
