#include "mip/network/http_router.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <future>
#include <memory>

namespace mip {
namespace network {

std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names) {
    static const std::string special = ".+?^$()[]{}|\\";
    std::string regex_pattern = "^";

    for (size_t i = 0; i < pattern.length();) {
        const char c = pattern[i];
        if (c == ':') {
            ++i;
            std::string name;
            while (i < pattern.length() &&
                   (std::isalnum(static_cast<unsigned char>(pattern[i])) || pattern[i] == '_')) {
                name += pattern[i++];
            }
            if (!name.empty()) {
                param_names.push_back(name);
                regex_pattern += "([^/]+)";
            }
            continue;
        }
        if (c == '*') {
            regex_pattern += "(.*)";
        } else {
            if (special.find(c) != std::string::npos) {
                regex_pattern += '\\';
            }
            regex_pattern += c;
        }
        ++i;
    }

    regex_pattern += "$";
    return regex_pattern;
}

HttpResponse json_response(HttpStatus status, const std::string& body) {
    HttpResponse response(status);
    response.set_body(body);
    response.set_header("Content-Type", "application/json");
    return response;
}

Route::Route(HttpMethod m, const std::string& pat, DeferredRouteHandler h)
    : method(m), pattern(pat), param_names(), regex(pattern_to_regex(pat, param_names)), handler(std::move(h)) {}

bool Route::matches_path(const std::string& path) const {
    return std::regex_match(path, regex);
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

namespace {

DeferredRouteHandler immediate(RouteHandler handler) {
    return [handler = std::move(handler)](const HttpContext& ctx, Responder respond) {
        respond(handler(ctx));
    };
}

} // namespace

void HttpRouter::get(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::GET, pattern, immediate(std::move(handler)));
}

void HttpRouter::post(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::POST, pattern, immediate(std::move(handler)));
}

void HttpRouter::post_deferred(const std::string& pattern, DeferredRouteHandler handler) {
    add_route(HttpMethod::POST, pattern, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& pattern, DeferredRouteHandler handler) {
    routes_.emplace_back(method, pattern, std::move(handler));
    spdlog::debug("Registered route: {} {}", HttpMethodUtils::to_string(method), pattern);
}

void HttpRouter::dispatch(const HttpRequest& request, Responder respond) const {
    HttpContext ctx(request);
    const std::string path = request.path();
    bool path_known = false;

    for (const auto& route : routes_) {
        if (!route.matches_path(path)) {
            continue;
        }
        if (route.method != request.method) {
            path_known = true;
            continue;
        }

        ctx.params = route.extract_params(path);
        try {
            route.handler(ctx, respond);
        } catch (const std::exception& e) {
            spdlog::error("Route handler threw exception: {}", e.what());
            nlohmann::json body{{"success", false}, {"error", "Internal server error"}};
            respond(json_response(HttpStatus::INTERNAL_SERVER_ERROR, body.dump()));
        }
        return;
    }

    if (path_known) {
        nlohmann::json body{{"success", false}, {"error", "Method not allowed"}};
        respond(json_response(HttpStatus::METHOD_NOT_ALLOWED, body.dump()));
        return;
    }
    respond(not_found(ctx));
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) const {
    auto answer = std::make_shared<std::promise<HttpResponse>>();
    auto future = answer->get_future();
    dispatch(request, [answer](HttpResponse response) { answer->set_value(std::move(response)); });
    return future.get();
}

HttpResponse HttpRouter::not_found(const HttpContext& ctx) {
    nlohmann::json body{{"success", false}, {"error", "No route for " + ctx.request.path()}};
    return json_response(HttpStatus::NOT_FOUND, body.dump());
}

} // namespace network
} // namespace mip
