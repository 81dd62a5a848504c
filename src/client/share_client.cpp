#include "lanshare/client/share_client.hpp"

namespace lanshare::client {

namespace fs = std::filesystem;

ClientOptions make_client_options(const Settings& settings) {
    using std::chrono::seconds;

    ClientOptions options;
    options.listing.timeout = seconds(settings.listing_timeout_seconds);

    options.download.timeout = seconds(settings.download_timeout_seconds);
    options.download.resume = settings.resume_downloads;
    options.download.verify_integrity = settings.verify_integrity;
    options.download.max_retries = settings.max_retries;

    options.archive.timeout = seconds(settings.archive_timeout_seconds);
    options.archive.max_retries = settings.max_retries;

    options.batch.batch_size = settings.batch_size;
    options.batch.max_workers = settings.max_parallel_downloads;
    options.batch.file_options.timeout = seconds(settings.download_timeout_seconds);
    options.batch.file_options.verify_integrity = settings.verify_integrity;
    return options;
}

ShareClient::ShareClient(ClientOptions options, events::EventBus* bus)
    : options_(std::move(options))
    , health_(std::make_shared<ConnectionHealthRegistry>())
    , listing_(options_.listing, health_, bus)
    , files_(options_.download, bus)
    , archive_(options_.archive, bus)
    , batch_(options_.batch, bus) {
}

Outcome<index::Listing> ShareClient::list_files(const Endpoint& endpoint) {
    return listing_.list(endpoint);
}

Outcome<DownloadReport> ShareClient::download_file(const Endpoint& endpoint,
                                                   const std::string& remote_path,
                                                   const fs::path& local_path,
                                                   const ByteProgressCallback& progress,
                                                   const concurrency::CancellationTokenPtr& cancel) const {
    return files_.download(endpoint, remote_path, local_path, progress, cancel);
}

Outcome<DownloadReport> ShareClient::download_all(const Endpoint& endpoint,
                                                  const fs::path& save_path,
                                                  const ByteProgressCallback& progress,
                                                  const concurrency::CancellationTokenPtr& cancel) const {
    return archive_.download(endpoint, save_path, progress, cancel);
}

BatchResult ShareClient::download_files(const Endpoint& endpoint,
                                        const index::Listing& entries,
                                        const fs::path& base_dir,
                                        const FileProgressCallback& progress,
                                        const concurrency::CancellationTokenPtr& cancel) const {
    return batch_.download(endpoint, entries, base_dir, progress, cancel);
}

ConnectionHealth ShareClient::get_connection_health(const Endpoint& endpoint) const {
    return health_->get(endpoint);
}

void ShareClient::clear_connection_cache() {
    health_->clear();
}

} // namespace lanshare::client
