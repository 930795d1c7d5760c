#pragma once

#include <boost/beast/http.hpp>

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace directup::net {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

struct RouteContext {
    const Request& request;
    std::string path;                                     // Target without the query string
    std::string query;
    std::unordered_map<std::string, std::string> params;  // ":name" segments, "*" for the wildcard

    explicit RouteContext(const Request& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    /// First value of `name` in the query string, percent-decoded.
    std::string query_param(const std::string& name) const;
};

using RouteHandler = std::function<Response(const RouteContext&)>;

/**
 * @brief Method + path pattern dispatch for Beast requests
 *
 * Patterns use ":name" for one path segment and a trailing "*" for the
 * rest of the path. Captured values are percent-decoded. Routes are tried
 * in registration order.
 *
 * EXAMPLE:
 * Router router;
 * router.get("/api/collections/:id/manifest", [](const RouteContext& ctx) {
 *     return make_json_response(ctx.request, http::status::ok, {{"id", ctx.get_param("id")}});
 * });
 */
class Router {
public:
    Router();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);

    void add_route(http::verb method, const std::string& pattern, RouteHandler handler);

    void set_not_found_handler(RouteHandler handler);

    /// Never throws; handler exceptions become 500 responses.
    Response handle(const Request& request) const;

    std::vector<std::string> list_routes() const;

private:
    struct Route {
        http::verb method;
        std::string pattern;
        std::regex regex;
        std::vector<std::string> param_names;
        RouteHandler handler;
    };

    static Response default_not_found_handler(const RouteContext& ctx);

    std::vector<Route> routes_;
    RouteHandler not_found_handler_;
};

} // namespace directup::net
