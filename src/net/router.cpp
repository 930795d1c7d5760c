#include "directup/net/router.hpp"

#include "directup/net/url.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace directup::net {
namespace {

std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names) {
    std::string regex_pattern = "^";
    std::size_t i = 0;

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
            param_names.emplace_back("*");
            regex_pattern += "(.+)";
            ++i;
        } else {
            const char c = pattern[i];
            if (c == '.' || c == '+' || c == '?' || c == '^' || c == '$' || c == '(' || c == ')' ||
                c == '[' || c == ']' || c == '{' || c == '}' || c == '|' || c == '\\') {
                regex_pattern += '\\';
            }
            regex_pattern += c;
            ++i;
        }
    }

    regex_pattern += "$";
    return regex_pattern;
}

std::string verb_name(http::verb method) {
    const auto name = http::to_string(method);
    return std::string(name.data(), name.size());
}

} // namespace

std::string RouteContext::query_param(const std::string& name) const {
    std::size_t pos = 0;
    while (pos <= query.size()) {
        auto end = query.find('&', pos);
        if (end == std::string::npos) {
            end = query.size();
        }
        const auto pair = query.substr(pos, end - pos);
        const auto eq = pair.find('=');
        if (decode_path_segment(pair.substr(0, eq)) == name) {
            return eq == std::string::npos ? std::string{} : decode_path_segment(pair.substr(eq + 1));
        }
        pos = end + 1;
    }
    return {};
}

Router::Router() : not_found_handler_(default_not_found_handler) {}

void Router::get(const std::string& pattern, RouteHandler handler) {
    add_route(http::verb::get, pattern, std::move(handler));
}

void Router::post(const std::string& pattern, RouteHandler handler) {
    add_route(http::verb::post, pattern, std::move(handler));
}

void Router::put(const std::string& pattern, RouteHandler handler) {
    add_route(http::verb::put, pattern, std::move(handler));
}

void Router::add_route(http::verb method, const std::string& pattern, RouteHandler handler) {
    Route route{method, pattern, std::regex(), {}, std::move(handler)};
    route.regex = std::regex(pattern_to_regex(pattern, route.param_names));
    routes_.push_back(std::move(route));
    spdlog::debug("Registered route: {} {}", verb_name(method), pattern);
}

void Router::set_not_found_handler(RouteHandler handler) {
    not_found_handler_ = std::move(handler);
}

Response Router::handle(const Request& request) const {
    RouteContext ctx(request);
    const std::string target(request.target().data(), request.target().size());
    const auto question = target.find('?');
    ctx.path = target.substr(0, question);
    ctx.query = question == std::string::npos ? std::string{} : target.substr(question + 1);

    for (const auto& route : routes_) {
        std::smatch match;
        if (route.method != request.method() || !std::regex_match(ctx.path, match, route.regex)) {
            continue;
        }
        for (std::size_t i = 0; i < route.param_names.size() && i + 1 < match.size(); ++i) {
            ctx.params[route.param_names[i]] = decode_path_segment(match[i + 1].str());
        }

        try {
            return route.handler(ctx);
        } catch (const std::exception& e) {
            spdlog::error("Route handler for {} {} threw: {}", verb_name(route.method), route.pattern, e.what());
            Response response{http::status::internal_server_error, request.version()};
            response.set(http::field::content_type, "text/plain");
            response.body() = "Internal Server Error";
            response.prepare_payload();
            return response;
        }
    }
    return not_found_handler_(ctx);
}

std::vector<std::string> Router::list_routes() const {
    std::vector<std::string> route_list;
    route_list.reserve(routes_.size());
    for (const auto& route : routes_) {
        route_list.push_back(verb_name(route.method) + " " + route.pattern);
    }
    return route_list;
}

Response Router::default_not_found_handler(const RouteContext& ctx) {
    spdlog::debug("No route for {} {}", verb_name(ctx.request.method()), ctx.path);
    Response response{http::status::not_found, ctx.request.version()};
    response.set(http::field::content_type, "application/json");
    response.body() = R"({"success":false,"error":"Not found"})";
    response.prepare_payload();
    return response;
}

} // namespace directup::net
