#include "rus/network/http_router.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace rus::network;

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

} // namespace

TEST(HttpRouterTest, ExtractsPathParameters) {
    HttpRouter router;
    router.head("/files/:id", [](const HttpContext& ctx) {
        return text(ctx.get_param("id"));
    });

    auto response = router.handle_request(make_request(HttpMethod::HEAD, "/files/0a1b2c"));

    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(std::string(response.body.begin(), response.body.end()), "0a1b2c");
}

TEST(HttpRouterTest, IgnoresQueryString) {
    HttpRouter router;
    router.get("/files/:id", [](const HttpContext& ctx) {
        return text(ctx.get_param("id"));
    });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/files/abc?download=1"));

    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(std::string(response.body.begin(), response.body.end()), "abc");
}

TEST(HttpRouterTest, ParameterDoesNotSpanSegments) {
    HttpRouter router;
    router.get("/files/:id", [](const HttpContext&) { return text("hit"); });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/files/a/b"));
    EXPECT_EQ(response.status_code, 404);
}

TEST(HttpRouterTest, WrongMethodGives405WithAllow) {
    HttpRouter router;
    router.head("/files/:id", [](const HttpContext&) { return text(""); });
    router.patch("/files/:id", [](const HttpContext&) { return text(""); });

    auto response = router.handle_request(make_request(HttpMethod::PUT, "/files/abc"));

    EXPECT_EQ(response.status_code, 405);
    EXPECT_EQ(response.get_header("Allow"), "HEAD, PATCH");
}

TEST(HttpRouterTest, UnknownPathUsesNotFoundHandler) {
    HttpRouter router;
    router.post("/files", [](const HttpContext&) { return text(""); });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/other"));
    EXPECT_EQ(response.status_code, 404);

    router.set_not_found_handler([](const HttpContext&) {
        HttpResponse custom(HttpStatus::NOT_FOUND);
        custom.set_body("custom");
        return custom;
    });
    response = router.handle_request(make_request(HttpMethod::GET, "/other"));
    EXPECT_EQ(std::string(response.body.begin(), response.body.end()), "custom");
}

TEST(HttpRouterTest, MiddlewareCanShortCircuit) {
    HttpRouter router;
    bool handler_ran = false;

    router.use([](const HttpContext& ctx, HttpResponse& response) {
        if (ctx.request.get_header("Tus-Resumable") != "1.0.0") {
            response = HttpResponse(HttpStatus::PRECONDITION_FAILED);
            return false;
        }
        return true;
    });
    router.post("/files", [&handler_ran](const HttpContext&) {
        handler_ran = true;
        return HttpResponse(HttpStatus::CREATED);
    });

    auto rejected = router.handle_request(make_request(HttpMethod::POST, "/files"));
    EXPECT_EQ(rejected.status_code, 412);
    EXPECT_FALSE(handler_ran);

    auto request = make_request(HttpMethod::POST, "/files");
    request.headers["tus-resumable"] = "1.0.0";
    auto accepted = router.handle_request(request);
    EXPECT_EQ(accepted.status_code, 201);
    EXPECT_TRUE(handler_ran);
}

TEST(HttpRouterTest, HandlerExceptionBecomes500) {
    HttpRouter router;
    router.patch("/files/:id", [](const HttpContext&) -> HttpResponse {
        throw std::runtime_error("disk on fire");
    });

    auto response = router.handle_request(make_request(HttpMethod::PATCH, "/files/abc"));
    EXPECT_EQ(response.status_code, 500);
}

TEST(HttpRouterTest, ListsRegisteredRoutes) {
    HttpRouter router;
    router.options("/files", [](const HttpContext&) { return text(""); });
    router.delete_("/files/:id", [](const HttpContext&) { return text(""); });

    EXPECT_EQ(router.route_count(), 2u);
    auto routes = router.list_routes();
    ASSERT_EQ(routes.size(), 2u);
    EXPECT_EQ(routes[0], "OPTIONS /files");
    EXPECT_EQ(routes[1], "DELETE /files/:id");
}

TEST(HttpRouterTest, PatternToRegexEscapesLiterals) {
    std::vector<std::string> names;
    EXPECT_EQ(pattern_to_regex("/files/:id", names), "^/files/([^/]+)$");
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "id");

    names.clear();
    EXPECT_EQ(pattern_to_regex("/v1.0/files", names), "^/v1\\.0/files$");
    EXPECT_TRUE(names.empty());
}
