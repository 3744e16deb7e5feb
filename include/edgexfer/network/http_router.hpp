#pragma once

#include "edgexfer/network/http_types.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace edgexfer::network {

/**
 * @brief Request context with path parameters, query string and caller identity
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // Path parameters like :id
    std::unordered_map<std::string, std::string> query;
    std::string user_id;  // Set by authentication middleware

    explicit HttpContext(const HttpRequest& req) : request(req), query(req.query()) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    bool has_param(const std::string& name) const {
        return params.find(name) != params.end();
    }

    std::string get_query(const std::string& name, const std::string& default_value = "") const {
        auto it = query.find(name);
        return (it != query.end()) ? it->second : default_value;
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Runs before the route handler
 *
 * Returning false short-circuits and sends `response` as is. Middleware may
 * fill in the context (for example the authenticated user).
 */
using Middleware = std::function<bool(HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;
    std::vector<std::string> param_names;  // Filled while the regex is built
    std::regex regex;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches(HttpMethod method, const std::string& path) const;
    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Method and path based dispatch
 *
 * Patterns match the path only; the query string is parsed separately into
 * HttpContext::query. A path that matches with the wrong method answers 405.
 *
 * @code
 * HttpRouter router;
 * router.put("/chunks/:sessionId/:index", [](const HttpContext& ctx) {
 *     auto index = ctx.get_param("index");
 *     ...
 * });
 * @endcode
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);
    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    /// Middleware runs in registration order.
    void use(Middleware middleware);

    void set_not_found_handler(RouteHandler handler);

    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;
    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);
    static HttpResponse method_not_allowed(const HttpContext& ctx);

    const Route* find_route(HttpMethod method, const std::string& path) const;
    bool path_known(const std::string& path) const;
};

/**
 * @brief Convert a route pattern to a regex
 *
 *   "/users/:id"          -> "^/users/([^/]+)$"
 *   "/chunks/:id/:index"  -> "^/chunks/([^/]+)/([^/]+)$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

} // namespace edgexfer::network
