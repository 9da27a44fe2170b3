#include "guestdrop/network/http_router.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using guestdrop::network::HttpContext;
using guestdrop::network::HttpMethod;
using guestdrop::network::HttpRequest;
using guestdrop::network::HttpResponse;
using guestdrop::network::HttpRouter;
using guestdrop::network::HttpStatus;
using guestdrop::network::pattern_to_regex;

namespace {

HttpRequest make_request(HttpMethod method, const std::string& url) {
    HttpRequest request;
    request.method = method;
    request.url = url;
    return request;
}

HttpResponse text_response(const std::string& text) {
    HttpResponse response(HttpStatus::OK);
    response.set_body(text);
    return response;
}

std::string body_of(const HttpResponse& response) {
    return std::string(response.body.begin(), response.body.end());
}

} // namespace

TEST(HttpRouterTest, PatternToRegex) {
    std::vector<std::string> names;
    EXPECT_EQ(pattern_to_regex("/api/upload/chunk/:upload_id", names), "^/api/upload/chunk/([^/]+)$");
    EXPECT_EQ(names, std::vector<std::string>{"upload_id"});

    names.clear();
    EXPECT_EQ(pattern_to_regex("/api/health", names), "^/api/health$");
    EXPECT_TRUE(names.empty());
}

TEST(HttpRouterTest, ExtractsParamsAndIgnoresQuery) {
    HttpRouter router;
    router.post("/api/upload/chunk/:upload_id", [](const HttpContext& ctx) {
        return text_response("chunk for " + ctx.get_param("upload_id"));
    });

    auto response = router.handle_request(make_request(HttpMethod::POST, "/api/upload/chunk/abc123?retry=1"));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(body_of(response), "chunk for abc123");
}

TEST(HttpRouterTest, ParamDoesNotSpanSegments) {
    HttpRouter router;
    router.get("/api/upload/status/:upload_id", [](const HttpContext&) { return text_response("ok"); });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/api/upload/status/a/b"));
    EXPECT_EQ(response.status_code, 404);
}

TEST(HttpRouterTest, WrongMethodIs405) {
    HttpRouter router;
    router.post("/api/upload/start", [](const HttpContext&) { return text_response("started"); });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/api/upload/start"));
    EXPECT_EQ(response.status_code, 405);
}

TEST(HttpRouterTest, CustomNotFoundHandler) {
    HttpRouter router;
    router.set_not_found_handler([](const HttpContext& ctx) {
        HttpResponse response(HttpStatus::NOT_FOUND);
        response.set_body("nothing at " + ctx.request.path());
        return response;
    });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/nowhere?x=1"));
    EXPECT_EQ(response.status_code, 404);
    EXPECT_EQ(body_of(response), "nothing at /nowhere");
}

TEST(HttpRouterTest, HandlerExceptionBecomes500) {
    HttpRouter router;
    router.get("/boom", [](const HttpContext&) -> HttpResponse {
        throw std::runtime_error("exploded");
    });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/boom"));
    EXPECT_EQ(response.status_code, 500);

    router.set_exception_handler([](const HttpContext&, const std::exception& e) {
        HttpResponse response(HttpStatus::SERVICE_UNAVAILABLE);
        response.set_body(e.what());
        return response;
    });
    response = router.handle_request(make_request(HttpMethod::GET, "/boom"));
    EXPECT_EQ(response.status_code, 503);
    EXPECT_EQ(body_of(response), "exploded");
}
