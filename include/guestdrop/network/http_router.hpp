#pragma once

#include "guestdrop/network/http_types.hpp"

#include <exception>
#include <functional>
#include <regex>
#include <unordered_map>
#include <vector>

namespace guestdrop {
namespace network {

/**
 * @brief Request plus the URL parameters captured by the matched route
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // URL parameters like :upload_id

    explicit HttpContext(const HttpRequest& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;
using ExceptionHandler = std::function<HttpResponse(const HttpContext&, const std::exception&)>;

struct Route {
    HttpMethod method;
    std::string pattern;              // e.g. "/api/upload/chunk/:upload_id"
    std::regex regex;
    std::vector<std::string> param_names;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches(HttpMethod method, const std::string& path) const;

    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Method + path dispatch with `:name` parameters
 *
 * Matching ignores the query string. Routes are tried in registration order.
 * A path that matches some route under a different method is answered with
 * 405 instead of 404.
 *
 * Example:
 * @code
 * HttpRouter router;
 * router.post("/api/upload/complete/:upload_id", [](const HttpContext& ctx) {
 *     auto id = ctx.get_param("upload_id");
 *     ...
 * });
 * @endcode
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);

    void set_not_found_handler(RouteHandler handler);

    /// Converts an exception escaping a handler into a response.
    void set_exception_handler(ExceptionHandler handler);

    /// Dispatch; safe to call concurrently once routes are registered.
    HttpResponse handle_request(const HttpRequest& request) const;

private:
    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    std::vector<Route> routes_;
    RouteHandler not_found_handler_;
    ExceptionHandler exception_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);
    static HttpResponse default_exception_handler(const HttpContext& ctx, const std::exception& e);

    const Route* find_route(HttpMethod method, const std::string& path) const;
    bool path_known(const std::string& path) const;
};

/**
 * @brief Convert a route pattern to an anchored regex
 *
 *   "/api/upload/status/:upload_id" -> "^/api/upload/status/([^/]+)$"
 *
 * A parameter matches exactly one non-empty path segment.
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

} // namespace network
} // namespace guestdrop
