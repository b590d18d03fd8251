#pragma once

#include "rus/network/http_types.hpp"

#include <functional>
#include <memory>
#include <regex>
#include <unordered_map>
#include <vector>

namespace rus {
namespace network {

/**
 * @brief Request context with URL parameters extracted from route
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // URL parameters like :id

    explicit HttpContext(const HttpRequest& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    bool has_param(const std::string& name) const {
        return params.find(name) != params.end();
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Middleware function type (return false to short-circuit with `res`)
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;              // Original pattern like "/files/:id"
    std::regex regex;
    std::vector<std::string> param_names;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches_path(const std::string& path) const;

    bool matches(HttpMethod method, const std::string& path) const;

    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief HTTP Router for organizing request handlers
 *
 * Features:
 * - Method-based routing (GET, POST, PATCH, HEAD, DELETE, OPTIONS)
 * - URL parameter extraction (/files/:id)
 * - Middleware run before every handler (logging, protocol checks)
 * - 405 with an Allow header when the path exists under another method
 * - Custom 404 handler
 *
 * Routing looks at the request path only; the query string is ignored.
 *
 * Example usage:
 * @code
 * HttpRouter router;
 * router.head("/files/:id", [](const HttpContext& ctx) {
 *     HttpResponse res(HttpStatus::OK);
 *     res.set_header("Upload-Offset", lookup(ctx.get_param("id")));
 *     return res;
 * });
 * @endcode
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);
    void patch(const std::string& pattern, RouteHandler handler);
    void delete_(const std::string& pattern, RouteHandler handler);
    void head(const std::string& pattern, RouteHandler handler);
    void options(const std::string& pattern, RouteHandler handler);

    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    /**
     * @brief Add middleware to run before route handlers
     *
     * Middleware is executed in the order it's added. If middleware returns
     * false, request handling stops and the response it filled in is sent.
     */
    void use(Middleware middleware);

    void set_not_found_handler(RouteHandler handler);

    /**
     * @brief Dispatch a request to the matching route
     *
     * Exceptions escaping a route handler are logged and turned into a 500.
     */
    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;

    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);

    const Route* find_route(HttpMethod method, const std::string& path) const;

    std::vector<HttpMethod> allowed_methods(const std::string& path) const;
};

/**
 * @brief Convert URL pattern to regex
 *
 * Converts:
 *   "/files/:id"           → "^/files/([^/]+)$"
 *   "/files/:id/parts"     → "^/files/([^/]+)/parts$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

} // namespace network
} // namespace rus
