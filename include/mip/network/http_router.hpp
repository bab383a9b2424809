#pragma once

#include "mip/network/http_types.hpp"

#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mip {
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
 * @brief Handler that answers later through the Responder
 *
 * Everything it needs from the context must be copied out before it
 * returns; the context does not outlive the call.
 */
using DeferredRouteHandler = std::function<void(const HttpContext&, Responder)>;

struct Route {
    HttpMethod method;
    std::string pattern;                   // "/api/records/:id/approve"
    std::vector<std::string> param_names;  // ["id"], filled before regex is built
    std::regex regex;
    DeferredRouteHandler handler;

    Route(HttpMethod m, const std::string& pat, DeferredRouteHandler h);

    bool matches_path(const std::string& path) const;
    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Method + path router with ":name" parameters
 *
 * Routes match against the request path (query string stripped), first
 * registered wins. A path that matches some route under another method
 * gets 405 instead of 404.
 *
 * Example:
 * @code
 * HttpRouter router;
 * router.get("/api/records/:id", [](const HttpContext& ctx) {
 *     HttpResponse res(HttpStatus::OK);
 *     res.set_body("record " + ctx.get_param("id"));
 *     return res;
 * });
 * @endcode
 */
class HttpRouter {
public:
    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);

    /// POST route whose handler hands the work to another executor
    void post_deferred(const std::string& pattern, DeferredRouteHandler handler);

    void add_route(HttpMethod method, const std::string& pattern, DeferredRouteHandler handler);

    /**
     * @brief Dispatch one request; respond is called exactly once
     *
     * Plain handlers answer before dispatch() returns. Exceptions thrown
     * by a handler on the calling thread become a 500.
     */
    void dispatch(const HttpRequest& request, Responder respond) const;

    /**
     * @brief Dispatch and wait for the response
     *
     * Blocks until a deferred handler answers, so it must not be called
     * from the executor that handler posts to.
     */
    HttpResponse handle_request(const HttpRequest& request) const;

private:
    std::vector<Route> routes_;

    static HttpResponse not_found(const HttpContext& ctx);
};

/**
 * @brief Convert URL pattern to regex
 *
 * "/records/:id"          → "^/records/([^/]+)$"
 * "/records/:id/approve"  → "^/records/([^/]+)/approve$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

/**
 * @brief JSON response with Content-Type set
 */
HttpResponse json_response(HttpStatus status, const std::string& body);

} // namespace network
} // namespace mip
