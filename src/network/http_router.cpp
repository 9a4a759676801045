#include "vidup/network/http_router.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <sstream>

namespace vidup {
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
        } else if (pattern[i] == '*') {
            regex_pattern += "(.*)";
            ++i;
        } else {
            char c = pattern[i];
            if (c == '.' || c == '+' || c == '?' || c == '^' || c == '$' ||
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

HttpResponse make_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(nlohmann::json{{"error", message}}.dump());
    return response;
}

// ────────────────────────────────────────────────────────────
// Route
// ────────────────────────────────────────────────────────────

Route::Route(HttpMethod m, const std::string& pat, RouteHandler h)
    : method(m), pattern(pat), handler(std::move(h)) {
    // Patterns are escaped by pattern_to_regex, so construction cannot throw
    regex = std::regex(pattern_to_regex(pattern, param_names));
}

bool Route::matches_path(const std::string& path) const {
    return std::regex_match(path, regex);
}

bool Route::matches(HttpMethod req_method, const std::string& path) const {
    return method == req_method && matches_path(path);
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

// ────────────────────────────────────────────────────────────
// HttpRouter
// ────────────────────────────────────────────────────────────

HttpRouter::HttpRouter()
    : not_found_handler_(default_not_found_handler) {
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

void HttpRouter::use(Middleware middleware) {
    middlewares_.push_back(std::move(middleware));
}

void HttpRouter::set_not_found_handler(RouteHandler handler) {
    not_found_handler_ = std::move(handler);
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) {
    HttpContext ctx(request);
    HttpResponse response(HttpStatus::OK);

    for (const auto& middleware : middlewares_) {
        if (!middleware(ctx, response)) {
            return response;
        }
    }

    const std::string path = request.path();
    const Route* route = find_route(request.method, path);
    if (!route) {
        for (const auto& candidate : routes_) {
            if (candidate.matches_path(path)) {
                return method_not_allowed(path);
            }
        }
        return not_found_handler_(ctx);
    }

    ctx.params = route->extract_params(path);
    try {
        response = route->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("Handler for {} {} threw: {}",
                      HttpMethodUtils::to_string(request.method), path, e.what());
        response = make_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal Server Error");
    }
    return response;
}

std::vector<std::string> HttpRouter::list_routes() const {
    std::vector<std::string> route_list;
    for (const auto& route : routes_) {
        route_list.push_back(HttpMethodUtils::to_string(route.method) + " " + route.pattern);
    }
    return route_list;
}

HttpResponse HttpRouter::default_not_found_handler(const HttpContext& ctx) {
    return make_error_response(HttpStatus::NOT_FOUND, "No route for " + ctx.request.path());
}

HttpResponse HttpRouter::method_not_allowed(const std::string& path) const {
    std::ostringstream allow;
    bool first = true;
    for (const auto& route : routes_) {
        if (route.matches_path(path)) {
            allow << (first ? "" : ", ") << HttpMethodUtils::to_string(route.method);
            first = false;
        }
    }

    auto response = make_error_response(HttpStatus::METHOD_NOT_ALLOWED, "Method not allowed for " + path);
    response.set_header("Allow", allow.str());
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

} // namespace network
} // namespace vidup
