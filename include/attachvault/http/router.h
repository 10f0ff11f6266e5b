#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/beast/http.hpp>

#include "attachvault/core/result.h"
#include "attachvault/http/request_context.h"

namespace attachvault::http {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
using RouteParams = std::unordered_map<std::string, std::string>;
/// Handlers return an error value instead of a response; the server renders the envelope.
using Handler = std::function<core::Result<HttpResponse>(const RequestContext&, const HttpRequest&, const RouteParams&)>;
using Middleware = std::function<std::optional<HttpResponse>(RequestContext&, HttpRequest&, RouteParams&)>;

/// @brief Route table with `{param}` path-template matching.
class Router {
public:
    void Add(const std::string& method, const std::string& pattern, Handler handler);
    /// @brief Middleware runs in registration order before a matched handler;
    /// returning a response short-circuits the handler.
    void Use(Middleware middleware);
    /// @brief 404 when no pattern matches the path, 405 when only other methods do.
    core::Result<HttpResponse> Route(const RequestContext& ctx, const HttpRequest& request) const;

    static bool Match(const std::string& pattern, const std::string& path, RouteParams* out_params);

private:
    struct RouteEntry {
        std::string method;
        std::string pattern;
        Handler handler;
    };

    static std::vector<std::string> SplitPath(const std::string& path);

    std::vector<RouteEntry> routes_;
    std::vector<Middleware> middleware_;
};

}  // namespace attachvault::http
