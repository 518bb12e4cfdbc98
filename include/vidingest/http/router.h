#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/beast/http.hpp>

#include "vidingest/core/result.h"
#include "vidingest/http/request_context.h"

namespace vidingest::http {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
using RouteParams = std::unordered_map<std::string, std::string>;
using Handler = std::function<core::Result<HttpResponse>(const RequestContext&, const HttpRequest&,
                                                         const RouteParams&)>;

/// @brief Route table keyed by method and a path template such as "/upload/{upload_id}/status".
///
/// Routes are tried in registration order. A path that matches some route but
/// not the request method yields 405 with an Allow header; anything else 404.
class Router {
public:
    void Add(const std::string& method, const std::string& pattern, Handler handler);
    core::Result<HttpResponse> Route(const RequestContext& ctx, const HttpRequest& request) const;

    /// @brief Match a path (query already stripped) and capture {name} segments.
    static bool Match(const std::string& pattern, const std::string& path, RouteParams* out_params);

private:
    struct RouteEntry {
        std::string method;
        std::string pattern;
        Handler handler;
    };

    static std::vector<std::string> SplitPath(const std::string& path);
    static HttpResponse Unrouted(const RequestContext& ctx, const HttpRequest& request,
                                 const std::vector<std::string>& allowed);

    std::vector<RouteEntry> routes_;
};

}  // namespace vidingest::http
