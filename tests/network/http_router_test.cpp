#include "lanshare/network/http_router.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace lanshare::network;

namespace {

HttpRequest make_request(HttpMethod method, const std::string& url) {
    HttpRequest request;
    request.method = method;
    request.url = url;
    return request;
}

HttpResponse text(const std::string& body) {
    HttpResponse response(HttpStatus::OK);
    response.set_body(body);
    return response;
}

std::string body_of(const HttpResponse& response) {
    return std::string(response.body.begin(), response.body.end());
}

} // namespace

TEST(HttpRouterTest, MatchesExactRoutes) {
    HttpRouter router;
    router.get("/api/files", [](const HttpContext&) { return text("listing"); });

    auto ok = router.handle_request(make_request(HttpMethod::GET, "/api/files"));
    EXPECT_EQ(ok.status_code, 200);
    EXPECT_EQ(body_of(ok), "listing");

    auto missing = router.handle_request(make_request(HttpMethod::GET, "/api/files/extra"));
    EXPECT_EQ(missing.status_code, 404);

    auto wrong_method = router.handle_request(make_request(HttpMethod::POST, "/api/files"));
    EXPECT_EQ(wrong_method.status_code, 404);
}

TEST(HttpRouterTest, MatchesPathAndDecodesQuery) {
    HttpRouter router;
    router.get("/download", [](const HttpContext& ctx) { return text(ctx.get_query("file")); });

    auto download = router.handle_request(
        make_request(HttpMethod::GET, "/download?file=docs%2Fmy+notes.txt"));
    EXPECT_EQ(download.status_code, 200);
    EXPECT_EQ(body_of(download), "docs/my notes.txt");
}

TEST(HttpRouterTest, NotFoundHandlerSeesDecodedPath) {
    HttpRouter router;
    router.set_not_found_handler([](const HttpContext& ctx) { return text("fallback:" + ctx.path); });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/docs/a%20b.txt?x=1"));
    EXPECT_EQ(body_of(response), "fallback:/docs/a b.txt");
}

TEST(HttpRouterTest, ThrowingHandlerBecomes500) {
    HttpRouter router;
    router.get("/boom", [](const HttpContext&) -> HttpResponse { throw std::runtime_error("boom"); });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/boom"));
    EXPECT_EQ(response.status_code, 500);
}
