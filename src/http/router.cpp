#include "vidingest/http/router.h"

#include <algorithm>
#include <sstream>

#include "vidingest/core/logger.h"

namespace vidingest::http {

void Router::Add(const std::string& method, const std::string& pattern, Handler handler) {
    routes_.push_back(RouteEntry{method, pattern, std::move(handler)});
}

core::Result<HttpResponse> Router::Route(const RequestContext& ctx,
                                        const HttpRequest& request) const {
    const auto target = std::string(request.target());
    const auto path = target.substr(0, target.find('?'));

    std::vector<std::string> allowed;
    for (const auto& route : routes_) {
        RouteParams params;
        if (!Match(route.pattern, path, &params)) {
            continue;
        }
        if (route.method == request.method_string()) {
            return route.handler(ctx, request, params);
        }
        if (std::find(allowed.begin(), allowed.end(), route.method) == allowed.end()) {
            allowed.push_back(route.method);
        }
    }
    return Unrouted(ctx, request, allowed);
}

HttpResponse Router::Unrouted(const RequestContext& ctx, const HttpRequest& request,
                              const std::vector<std::string>& allowed) {
    namespace bhttp = boost::beast::http;
    const bool wrong_method = !allowed.empty();
    HttpResponse response{wrong_method ? bhttp::status::method_not_allowed
                                       : bhttp::status::not_found,
                          request.version()};
    response.set(bhttp::field::content_type, "application/json");
    if (wrong_method) {
        std::string allow;
        for (const auto& method : allowed) {
            allow += allow.empty() ? method : ", " + method;
        }
        response.set(bhttp::field::allow, allow);
    }
    response.body() = std::string("{\"error\":{\"code\":\"") +
                      (wrong_method ? "METHOD_NOT_ALLOWED" : "NOT_FOUND") + "\",\"message\":\"" +
                      (wrong_method ? "method not allowed" : "route not found") +
                      "\",\"request_id\":\"" + core::EscapeJson(ctx.request_id) + "\"}}";
    response.prepare_payload();
    return response;
}

std::vector<std::string> Router::SplitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string item;
    while (std::getline(ss, item, '/')) {
        if (!item.empty()) {
            parts.push_back(item);
        }
    }
    return parts;
}

bool Router::Match(const std::string& pattern, const std::string& path, RouteParams* out_params) {
    const auto pattern_parts = SplitPath(pattern);
    const auto path_parts = SplitPath(path);
    if (pattern_parts.size() != path_parts.size()) {
        return false;
    }

    RouteParams captured;
    for (size_t i = 0; i < pattern_parts.size(); ++i) {
        const auto& expected = pattern_parts[i];
        const auto& actual = path_parts[i];
        if (expected.size() >= 2 && expected.front() == '{' && expected.back() == '}') {
            captured[expected.substr(1, expected.size() - 2)] = actual;
        } else if (expected != actual) {
            return false;
        }
    }
    if (out_params) {
        *out_params = std::move(captured);
    }
    return true;
}

}  // namespace vidingest::http
