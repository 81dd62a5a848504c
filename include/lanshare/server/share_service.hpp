#pragma once

#include "lanshare/events/event_bus.hpp"
#include "lanshare/index/directory_indexer.hpp"
#include "lanshare/network/http_router.hpp"
#include "lanshare/server/archive_streamer.hpp"
#include "lanshare/server/range_file_streamer.hpp"

#include <filesystem>

namespace lanshare::server {

struct ServiceOptions {
    bool use_compression = true;
    int compression_level = 6;
    size_t compression_min_bytes = 1024;     ///< Listings at or below this are sent as-is
    index::IndexerOptions indexer;
    StreamerOptions streamer;
    ArchiveOptions archive;
};

/**
 * @brief HTTP endpoints of one shared directory
 *
 * - GET /api/files          JSON listing (ETag, optional gzip, 304)
 * - GET /download?file=...  single file, ranges honoured
 * - GET /download_all       whole tree as a ZIP archive
 * - anything else           static serving of the shared root
 *
 * Handlers only read shared state through the indexer, whose cache has its
 * own lock; everything else is per request.
 */
class ShareService {
public:
    ShareService(std::filesystem::path root, ServiceOptions options = ServiceOptions{},
                 events::EventBus* bus = nullptr);

    /**
     * @brief Add the share routes and the static fallback to `router`
     */
    void register_routes(network::HttpRouter& router);

    network::HttpResponse handle_list(const network::HttpContext& ctx);
    network::HttpResponse handle_download(const network::HttpContext& ctx);
    network::HttpResponse handle_download_all(const network::HttpContext& ctx);
    network::HttpResponse handle_static(const network::HttpContext& ctx);

    index::DirectoryIndexer& indexer() { return indexer_; }
    const std::filesystem::path& root() const { return root_; }

private:
    network::HttpResponse directory_listing_page(const std::filesystem::path& dir,
                                                 const std::string& request_path) const;

    std::filesystem::path root_;
    ServiceOptions options_;
    index::DirectoryIndexer indexer_;
    RangeFileStreamer file_streamer_;
    ArchiveStreamer archive_streamer_;
};

} // namespace lanshare::server
