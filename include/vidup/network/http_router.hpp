#pragma once

#include "vidup/network/http_types.hpp"
#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vidup::network {

/**
 * @brief Request context with URL parameters extracted from the route
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // Captures like :id

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
 * @brief Runs before the handler; returning false sends `response` as is
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;                   // "/api/uploads/:id/chunk"
    std::vector<std::string> param_names;  // ["id"]; filled while building regex
    std::regex regex;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches_path(const std::string& path) const;
    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Method + pattern dispatch with `:param` captures
 *
 * Matching ignores the query string. A path that matches some route under
 * a different method yields 405; no match at all yields 404. Error bodies
 * are JSON objects of the form {"error": "..."}.
 *
 * Example usage:
 * @code
 * HttpRouter router;
 * router.get("/api/uploads/:id", [&](const HttpContext& ctx) {
 *     return json_response(HttpStatus::OK, status_of(ctx.get_param("id")));
 * });
 * HttpResponse res = router.handle_request(request);
 * @endcode
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);
    void delete_(const std::string& pattern, RouteHandler handler);

    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    /**
     * @brief Add middleware to run before route handlers
     *
     * Executed in registration order; the first one returning false ends
     * request handling.
     */
    void use(Middleware middleware);

    void set_not_found_handler(RouteHandler handler);

    /**
     * @brief Dispatch a request to the first matching route
     *
     * A handler that throws produces a 500 response; the exception is
     * logged and not propagated to the server loop.
     */
    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;

    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);
};

/**
 * @brief Build a response with a JSON body
 */
HttpResponse json_response(HttpStatus status, const std::string& json_body);

/**
 * @brief Build a {"error": message} response
 */
HttpResponse error_response(HttpStatus status, const std::string& message);

/**
 * @brief Path part of a request target ("/a/b?x=1" -> "/a/b")
 */
std::string strip_query(const std::string& url);

/**
 * @brief Convert URL pattern to regex
 *
 * Converts:
 *   "/api/uploads/:id"        -> "^/api/uploads/([^/]+)$"
 *   "/api/uploads/:id/chunk"  -> "^/api/uploads/([^/]+)/chunk$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

} // namespace vidup::network
