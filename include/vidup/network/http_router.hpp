#pragma once

#include "vidup/network/http_types.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vidup {
namespace network {

/**
 * @brief Request plus the parameters captured by the matched route
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // e.g. :id

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
 * @brief Runs before the route handler; return false to answer with `res` directly
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;                   // e.g. "/api/uploads/:id"
    std::regex regex;
    std::vector<std::string> param_names;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches_path(const std::string& path) const;
    bool matches(HttpMethod method, const std::string& path) const;

    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Method and path based dispatch
 *
 * Routes match against the request path with the query string removed.
 * A path that matches some route under a different method gets 405 with
 * an Allow header; a path that matches nothing gets the not-found handler.
 * Handler exceptions become a 500 JSON error.
 *
 * @code
 * HttpRouter router;
 * router.post("/upload_chunk", handle_chunk);
 * router.get("/api/uploads/:id", [](const HttpContext& ctx) {
 *     auto id = ctx.get_param("id");
 *     ...
 * });
 * @endcode
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    /// Middleware runs in registration order
    void use(Middleware middleware);

    void set_not_found_handler(RouteHandler handler);

    HttpResponse handle_request(const HttpRequest& request);

    /// "METHOD pattern" for every route, for startup logging
    std::vector<std::string> list_routes() const;

    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);
    HttpResponse method_not_allowed(const std::string& path) const;

    const Route* find_route(HttpMethod method, const std::string& path) const;
};

/**
 * @brief Convert a URL pattern to an anchored regex
 *
 *   "/api/uploads/:id" -> "^/api/uploads/([^/]+)$"
 *   "/static/*"        -> "^/static/(.*)$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

/**
 * @brief JSON body {"error": message} with the given status
 */
HttpResponse make_error_response(HttpStatus status, const std::string& message);

} // namespace network
} // namespace vidup
