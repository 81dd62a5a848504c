#pragma once

/**
 * @file share_client.hpp
 * @brief Everything a receiver does against a share, behind one object
 *
 * EXAMPLE:
 *   lanshare::client::ShareClient client(lanshare::client::make_client_options(settings), &bus);
 *   auto listing = client.list_files({"192.168.1.20", 8000});
 *   if (listing.is_ok()) {
 *       auto batch = client.download_files({"192.168.1.20", 8000}, listing.value(), "incoming");
 *       spdlog::info("{}", batch.message());
 *   }
 *
 * All calls block; run them off any thread that must stay responsive.
 */

#include "lanshare/client/archive_downloader.hpp"
#include "lanshare/client/batch_downloader.hpp"
#include "lanshare/client/connection_health.hpp"
#include "lanshare/client/download_engine.hpp"
#include "lanshare/client/listing_client.hpp"
#include "lanshare/core/config.hpp"

#include <memory>

namespace lanshare::client {

struct ClientOptions {
    ListingOptions listing;
    DownloadOptions download;
    ArchiveDownloadOptions archive;
    BatchOptions batch;
};

ClientOptions make_client_options(const Settings& settings);

class ShareClient {
public:
    explicit ShareClient(ClientOptions options = ClientOptions{}, events::EventBus* bus = nullptr);

    Outcome<index::Listing> list_files(const Endpoint& endpoint);

    Outcome<DownloadReport> download_file(const Endpoint& endpoint,
                                          const std::string& remote_path,
                                          const std::filesystem::path& local_path,
                                          const ByteProgressCallback& progress = {},
                                          const concurrency::CancellationTokenPtr& cancel = nullptr) const;

    Outcome<DownloadReport> download_all(const Endpoint& endpoint,
                                         const std::filesystem::path& save_path,
                                         const ByteProgressCallback& progress = {},
                                         const concurrency::CancellationTokenPtr& cancel = nullptr) const;

    BatchResult download_files(const Endpoint& endpoint,
                               const index::Listing& entries,
                               const std::filesystem::path& base_dir,
                               const FileProgressCallback& progress = {},
                               const concurrency::CancellationTokenPtr& cancel = nullptr) const;

    ConnectionHealth get_connection_health(const Endpoint& endpoint) const;
    void clear_connection_cache();

    const ClientOptions& options() const { return options_; }

private:
    ClientOptions options_;
    std::shared_ptr<ConnectionHealthRegistry> health_;
    ListingClient listing_;
    FileDownloader files_;
    ArchiveDownloader archive_;
    BatchDownloader batch_;
};

} // namespace lanshare::client
