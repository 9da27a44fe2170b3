#include "guestdrop/network/http_router.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace guestdrop {
namespace network {

std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names) {
    std::string regex_pattern = "^";
    size_t i = 0;

    while (i < pattern.length()) {
        if (pattern[i] == ':') {
            ++i;
            std::string param_name;
            while (i < pattern.length() &&
                   (std::isalnum(static_cast<unsigned char>(pattern[i])) || pattern[i] == '_')) {
                param_name += pattern[i];
                ++i;
            }

            if (!param_name.empty()) {
                param_names.push_back(param_name);
                regex_pattern += "([^/]+)";
            }
        } else {
            char c = pattern[i];
            if (c == '.' || c == '+' || c == '?' || c == '^' || c == '$' || c == '*' ||
                c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' ||
                c == '|' || c == '\\') {
                regex_pattern += '\\';
            }
            regex_pattern += c;
            ++i;
        }
    }

    regex_pattern += "$";
    return regex_pattern;
}

// Route patterns are fixed at startup, so a bad one is a programming error
// and std::regex_error propagates to the caller of add_route.
Route::Route(HttpMethod m, const std::string& pat, RouteHandler h)
    : method(m), pattern(pat), handler(std::move(h)) {
    regex = std::regex(pattern_to_regex(pattern, param_names));
}

bool Route::matches(HttpMethod req_method, const std::string& path) const {
    return method == req_method && std::regex_match(path, regex);
}

std::unordered_map<std::string, std::string> Route::extract_params(const std::string& path) const {
    std::unordered_map<std::string, std::string> params;
    std::smatch match;

    if (std::regex_match(path, match, regex)) {
        for (size_t i = 0; i < param_names.size() && i + 1 < match.size(); ++i) {
            params[param_names[i]] = match[i + 1].str();
        }
    }

    return params;
}

HttpRouter::HttpRouter()
    : not_found_handler_(default_not_found_handler)
    , exception_handler_(default_exception_handler) {
}

void HttpRouter::get(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::GET, pattern, std::move(handler));
}

void HttpRouter::post(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::POST, pattern, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& pattern, RouteHandler handler) {
    routes_.emplace_back(method, pattern, std::move(handler));
    spdlog::debug("Registered route: {} {}", HttpMethodUtils::to_string(method), pattern);
}

void HttpRouter::set_not_found_handler(RouteHandler handler) {
    not_found_handler_ = std::move(handler);
}

void HttpRouter::set_exception_handler(ExceptionHandler handler) {
    exception_handler_ = std::move(handler);
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) const {
    HttpContext ctx(request);
    HttpResponse response(HttpStatus::OK);

    const std::string path = request.path();
    const Route* route = find_route(request.method, path);

    if (!route) {
        if (path_known(path)) {
            response = HttpResponse(HttpStatus::METHOD_NOT_ALLOWED);
            response.set_header("Content-Type", "text/plain");
            response.set_body("Method Not Allowed");
            return response;
        }
        return not_found_handler_(ctx);
    }

    ctx.params = route->extract_params(path);
    try {
        response = route->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("Route handler for {} {} threw: {}",
                      HttpMethodUtils::to_string(request.method), route->pattern, e.what());
        response = exception_handler_(ctx, e);
    }

    return response;
}

HttpResponse HttpRouter::default_not_found_handler(const HttpContext& ctx) {
    HttpResponse response(HttpStatus::NOT_FOUND);
    response.set_header("Content-Type", "text/plain");
    response.set_body("No route for " + ctx.request.path());
    return response;
}

HttpResponse HttpRouter::default_exception_handler(const HttpContext&, const std::exception&) {
    HttpResponse response(HttpStatus::INTERNAL_SERVER_ERROR);
    response.set_header("Content-Type", "text/plain");
    response.set_body("Internal Server Error");
    return response;
}

const Route* HttpRouter::find_route(HttpMethod method, const std::string& path) const {
    for (const auto& route : routes_) {
        if (route.matches(method, path)) {
            return &route;
        }
    }
    return nullptr;
}

bool HttpRouter::path_known(const std::string& path) const {
    for (const auto& route : routes_) {
        if (std::regex_match(path, route.regex)) {
            return true;
        }
    }
    return false;
}

} // namespace network
} // namespace guestdrop
