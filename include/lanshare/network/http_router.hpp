#pragma once

#include "lanshare/network/http_types.hpp"
#include "lanshare/network/url.hpp"

#include <functional>
#include <string>
#include <vector>

namespace lanshare {
namespace network {

/**
 * @brief Request context with the decoded path and query
 */
struct HttpContext {
    const HttpRequest& request;
    std::string path;                                     // Decoded path without query
    QueryMap query;                                       // Decoded query parameters

    explicit HttpContext(const HttpRequest& req);

    std::string get_query(const std::string& name, const std::string& default_value = "") const {
        auto it = query.find(name);
        return (it != query.end()) ? it->second : default_value;
    }

    bool has_query(const std::string& name) const {
        return query.find(name) != query.end();
    }
};

/**
 * @brief Route handler function type
 */
using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

struct Route {
    HttpMethod method;
    std::string path;                 // Exact decoded path, e.g. "/api/files"
    RouteHandler handler;
};

/**
 * @brief HTTP Router for the share service
 *
 * Routes match the decoded path exactly; the query string is parsed into
 * HttpContext::query. Requests no route claims go to the not-found handler,
 * which the share service replaces with its static file fallback.
 *
 * Example usage:
 * @code
 * HttpRouter router;
 *
 * router.get("/download", [](const HttpContext& ctx) {
 *     if (!ctx.has_query("file")) {
 *         return HttpResponse(HttpStatus::BAD_REQUEST);
 *     }
 *     ...
 * });
 *
 * router.set_not_found_handler(serve_static);
 * @endcode
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& path, RouteHandler handler);

    /**
     * @brief Replace the handler for requests no route matches
     */
    void set_not_found_handler(RouteHandler handler);

    /**
     * @brief Dispatch a request to the matching route
     *
     * Exceptions from handlers become 500 responses.
     */
    HttpResponse handle_request(const HttpRequest& request) const;

private:
    std::vector<Route> routes_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);

    const Route* find_route(HttpMethod method, const std::string& path) const;
};

} // namespace network
} // namespace lanshare
