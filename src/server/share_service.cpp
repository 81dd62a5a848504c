#include "lanshare/server/share_service.hpp"
#include "lanshare/codec/gzip.hpp"
#include "lanshare/core/file_stat.hpp"
#include "lanshare/core/shared_path.hpp"
#include "lanshare/network/url.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <system_error>
#include <vector>

namespace lanshare::server {

namespace fs = std::filesystem;
using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;

namespace {

constexpr const char* kListingCacheControl = "max-age=60";

HttpResponse text_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body(message);
    response.set_header("Content-Type", "text/plain; charset=utf-8");
    return response;
}

HttpResponse error_for(const Error& error) {
    switch (error.code) {
        case ErrorCode::Forbidden:
            return text_response(HttpStatus::FORBIDDEN, "Access denied");
        case ErrorCode::NotFound:
            return text_response(HttpStatus::NOT_FOUND, error.message);
        default:
            return text_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal Server Error");
    }
}

bool accepts_gzip(const network::HttpRequest& request) {
    std::string accepted = request.get_header("Accept-Encoding");
    std::transform(accepted.begin(), accepted.end(), accepted.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return accepted.find("gzip") != std::string::npos;
}

std::string html_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default: out += c;
        }
    }
    return out;
}

} // namespace

ShareService::ShareService(fs::path root, ServiceOptions options, events::EventBus* bus)
    : root_(std::move(root))
    , options_(std::move(options))
    , indexer_(options_.indexer, bus)
    , file_streamer_(root_, options_.streamer)
    , archive_streamer_(root_, options_.archive) {
}

void ShareService::register_routes(network::HttpRouter& router) {
    router.get("/api/files", [this](const HttpContext& ctx) { return handle_list(ctx); });
    router.get("/download", [this](const HttpContext& ctx) { return handle_download(ctx); });
    router.get("/download_all", [this](const HttpContext& ctx) { return handle_download_all(ctx); });
    router.set_not_found_handler([this](const HttpContext& ctx) { return handle_static(ctx); });
}

HttpResponse ShareService::handle_list(const HttpContext& ctx) {
    auto indexed = indexer_.get_index(root_);
    if (indexed.is_error()) {
        spdlog::error("Listing {} failed: {}", root_.string(), indexed.error().message);
        return error_for(indexed.error());
    }

    const index::SnapshotPtr snapshot = indexed.value();
    const std::string etag = "\"" + snapshot->fingerprint + "\"";

    if (ctx.request.get_header("If-None-Match") == etag) {
        HttpResponse response(HttpStatus::NOT_MODIFIED);
        response.set_header("ETag", etag);
        response.set_header("Cache-Control", kListingCacheControl);
        return response;
    }

    HttpResponse response(HttpStatus::OK);
    response.set_header("Content-Type", "application/json");
    response.set_header("ETag", etag);
    response.set_header("Access-Control-Allow-Origin", "*");
    response.set_header("Cache-Control", kListingCacheControl);

    const std::string& json = snapshot->encoded_json;
    if (options_.use_compression && json.size() > options_.compression_min_bytes && accepts_gzip(ctx.request)) {
        auto compressed = codec::gzip_compress(json, options_.compression_level);
        if (compressed.is_error()) {
            spdlog::warn("Listing compression failed, sending plain JSON: {}", compressed.error());
        } else if (static_cast<double>(compressed.value().size()) < 0.9 * static_cast<double>(json.size())) {
            response.set_header("Content-Encoding", "gzip");
            response.set_body(std::move(compressed.value()));
            return response;
        }
    }

    response.set_body(json);
    return response;
}

HttpResponse ShareService::handle_download(const HttpContext& ctx) {
    if (!ctx.has_query("file") || ctx.get_query("file").empty()) {
        return text_response(HttpStatus::BAD_REQUEST, "Missing file parameter");
    }
    return file_streamer_.serve(ctx.get_query("file"), ctx.request);
}

HttpResponse ShareService::handle_download_all(const HttpContext&) {
    auto info = stat_path(root_);
    if (!info || !info->is_directory) {
        return text_response(HttpStatus::NOT_FOUND, "Shared directory not found");
    }
    return archive_streamer_.serve();
}

HttpResponse ShareService::handle_static(const HttpContext& ctx) {
    if (ctx.request.method != network::HttpMethod::GET && ctx.request.method != network::HttpMethod::HEAD) {
        return text_response(HttpStatus::NOT_FOUND, "Not found: " + ctx.path);
    }

    std::string relative = ctx.path;
    while (!relative.empty() && relative.front() == '/') {
        relative.erase(relative.begin());
    }

    fs::path target = root_;
    if (!relative.empty() && relative != "/") {
        auto resolved = resolve_shared_path(root_, relative);
        if (resolved.is_error()) {
            return error_for(resolved.error());
        }
        target = resolved.value();
    }

    auto info = stat_path(target);
    if (!info) {
        return text_response(HttpStatus::NOT_FOUND, "Not found: " + ctx.path);
    }

    if (info->is_directory) {
        if (ctx.path.empty() || ctx.path.back() != '/') {
            HttpResponse response(HttpStatus::MOVED_PERMANENTLY);
            response.set_header("Location", network::url_encode(ctx.path) + "/");
            response.set_header("Content-Length", "0");
            return response;
        }
        const fs::path index_page = target / "index.html";
        auto index_info = stat_path(index_page);
        if (index_info && index_info->is_file) {
            return file_streamer_.serve_absolute(index_page, ctx.request);
        }
        return directory_listing_page(target, ctx.path);
    }

    return file_streamer_.serve_absolute(target, ctx.request);
}

HttpResponse ShareService::directory_listing_page(const fs::path& dir, const std::string& request_path) const {
    struct Item {
        std::string name;
        bool is_directory;
    };
    std::vector<Item> items;

    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot list {}: {}", dir.string(), ec.message());
        return text_response(HttpStatus::FORBIDDEN, "No permission to list directory");
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code type_ec;
        items.push_back({it->path().filename().string(), it->is_directory(type_ec)});
    }
    std::sort(items.begin(), items.end(), [](const Item& a, const Item& b) {
        return a.name < b.name;
    });

    const std::string title = "Directory listing for " + html_escape(request_path);
    std::ostringstream html;
    html << "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n"
         << "<title>" << title << "</title>\n</head>\n<body>\n"
         << "<h1>" << title << "</h1>\n<hr>\n<ul>\n";
    for (const auto& item : items) {
        const std::string suffix = item.is_directory ? "/" : "";
        html << "<li><a href=\"" << html_escape(network::url_encode(item.name)) << suffix << "\">"
             << html_escape(item.name) << suffix << "</a></li>\n";
    }
    html << "</ul>\n<hr>\n</body>\n</html>\n";

    HttpResponse response(HttpStatus::OK);
    response.set_header("Content-Type", "text/html; charset=utf-8");
    response.set_body(html.str());
    return response;
}

} // namespace lanshare::server
