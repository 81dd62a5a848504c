#include "lanshare/network/http_router.hpp"

#include <spdlog/spdlog.h>

namespace lanshare {
namespace network {

HttpContext::HttpContext(const HttpRequest& req)
    : request(req) {
    std::string raw_query;
    split_target(req.url, path, raw_query);
    query = parse_query(raw_query);
}

HttpRouter::HttpRouter()
    : not_found_handler_(default_not_found_handler) {
}

void HttpRouter::get(const std::string& path, RouteHandler handler) {
    routes_.push_back(Route{HttpMethod::GET, path, std::move(handler)});
    spdlog::debug("Registered route: GET {}", path);
}

void HttpRouter::set_not_found_handler(RouteHandler handler) {
    not_found_handler_ = std::move(handler);
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) const {
    HttpContext ctx(request);
    HttpResponse response;

    const Route* route = find_route(request.method, ctx.path);

    try {
        response = route ? route->handler(ctx) : not_found_handler_(ctx);
    } catch (const std::exception& e) {
        spdlog::error("Handler for {} threw: {}", ctx.path, e.what());

        response = HttpResponse(HttpStatus::INTERNAL_SERVER_ERROR);
        response.set_body("Internal Server Error");
        response.set_header("Content-Type", "text/plain");
    }

    return response;
}

HttpResponse HttpRouter::default_not_found_handler(const HttpContext& ctx) {
    HttpResponse response(HttpStatus::NOT_FOUND);
    response.set_body("Not found: " + ctx.path);
    response.set_header("Content-Type", "text/plain; charset=utf-8");
    return response;
}

const Route* HttpRouter::find_route(HttpMethod method, const std::string& path) const {
    for (const auto& route : routes_) {
        if (route.method == method && route.path == path) {
            return &route;
        }
    }
    return nullptr;
}

} // namespace network
} // namespace lanshare
