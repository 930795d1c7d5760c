#include "directup/authority/authority_server.hpp"

#include "directup/authority/json_codec.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>

namespace directup::authority {
namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;
using json = codec::json;

constexpr std::chrono::minutes kRequestTimeout{10};

net::Response make_json_response(const net::Request& request, http::status status, const json& body) {
    net::Response response{status, request.version()};
    response.set(http::field::server, "directup-authority");
    response.set(http::field::content_type, "application/json");
    response.keep_alive(request.keep_alive());
    response.body() = body.dump();
    response.prepare_payload();
    return response;
}

net::Response make_error(const net::Request& request, http::status status, const std::string& message) {
    return make_json_response(request, status, codec::encode_error(message));
}

http::status status_for(const directup::Error& error) {
    switch (error.kind) {
        case ErrorKind::Validation:
        case ErrorKind::Parse:
            return http::status::bad_request;
        case ErrorKind::NotFound:
            return http::status::not_found;
        case ErrorKind::Credential:
        case ErrorKind::CredentialExpired:
        case ErrorKind::Security:
            return http::status::forbidden;
        default:
            return http::status::internal_server_error;
    }
}

net::Response make_error(const net::Request& request, const directup::Error& error) {
    return make_error(request, status_for(error), error.message);
}

/// Parses the JSON body; the caller returns the error response when set.
std::optional<json> parse_body(const net::Request& request, net::Response& error_response) {
    auto parsed = codec::parse(request.body());
    if (parsed.is_error()) {
        error_response = make_error(request, http::status::bad_request, "Invalid JSON");
        return std::nullopt;
    }
    return std::move(parsed.value());
}

/**
 * One accepted connection. Keeps itself alive through the handlers it
 * hands to Beast and serves requests until the peer closes or errs.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, const net::Router& router, std::uint64_t body_limit)
        : stream_(std::move(socket)), router_(router), body_limit_(body_limit) {}

    void start() {
        asio::dispatch(stream_.get_executor(), [self = shared_from_this()] { self->do_read(); });
    }

private:
    void do_read() {
        parser_.emplace();
        parser_->body_limit(body_limit_);
        stream_.expires_after(kRequestTimeout);
        http::async_read(stream_, buffer_, *parser_,
                         [self = shared_from_this()](beast::error_code ec, std::size_t) { self->on_read(ec); });
    }

    void on_read(beast::error_code ec) {
        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                spdlog::debug("[Server] read failed: {}", ec.message());
            }
            return;
        }

        net::Request request = parser_->release();
        spdlog::info("[Server] {} {}", std::string(http::to_string(request.method()).data(),
                                                   http::to_string(request.method()).size()),
                     std::string(request.target().data(), request.target().size()));

        auto response = std::make_shared<net::Response>(router_.handle(request));
        http::async_write(stream_, *response,
                          [self = shared_from_this(), response](beast::error_code write_ec, std::size_t) {
                              self->on_write(write_ec, response->need_eof());
                          });
    }

    void on_write(beast::error_code ec, bool close) {
        if (ec) {
            spdlog::debug("[Server] write failed: {}", ec.message());
            return;
        }
        if (close) {
            do_close();
            return;
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    const net::Router& router_;
    std::uint64_t body_limit_;
};

} // namespace

AuthorityServer::AuthorityServer(asio::io_context& io_context,
                                 config::ServerConfig config,
                                 UploadAuthority& authority,
                                 std::shared_ptr<storage::MemoryObjectStore> store)
    : io_context_(io_context),
      config_(std::move(config)),
      authority_(authority),
      store_(std::move(store)),
      acceptor_(io_context) {
    const auto& limits = authority_.config().limits;
    body_limit_ = std::max({limits.raw_image, limits.gallery_image, limits.video, limits.audio,
                            limits.document, limits.design_file, limits.other});
    register_routes();
}

void AuthorityServer::register_routes() {
    router_.get("/health", [](const net::RouteContext& ctx) {
        return make_json_response(ctx.request, http::status::ok,
                                  json{{"status", "ok"}, {"service", "directup-authority"}});
    });

    router_.post("/api/collections/:id/upload-urls", [this](const net::RouteContext& ctx) {
        net::Response error;
        const auto body = parse_body(ctx.request, error);
        if (!body) {
            return error;
        }
        auto files = codec::decode_credential_request(*body);
        if (files.is_error()) {
            return make_error(ctx.request, files.error());
        }
        auto credentials = authority_.issue_credentials(ctx.get_param("id"), files.value());
        if (credentials.is_error()) {
            return make_error(ctx.request, credentials.error());
        }
        return make_json_response(ctx.request, http::status::ok,
                                  codec::encode_credentials(files.value(), credentials.value()));
    });

    router_.post("/api/collections/:id/refresh-url", [this](const net::RouteContext& ctx) {
        net::Response error;
        const auto body = parse_body(ctx.request, error);
        if (!body) {
            return error;
        }
        auto key = codec::decode_refresh_request(*body);
        if (key.is_error()) {
            return make_error(ctx.request, key.error());
        }
        auto credential = authority_.refresh_credential(ctx.get_param("id"), key.value());
        if (credential.is_error()) {
            return make_error(ctx.request, credential.error());
        }
        return make_json_response(ctx.request, http::status::ok, codec::encode_credential(credential.value()));
    });

    router_.post("/api/collections/:id/confirm-uploads", [this](const net::RouteContext& ctx) {
        net::Response error;
        const auto body = parse_body(ctx.request, error);
        if (!body) {
            return error;
        }
        auto uploads = codec::decode_confirmation_request(*body);
        if (uploads.is_error()) {
            return make_error(ctx.request, uploads.error());
        }
        auto result = authority_.confirm_uploads(ctx.get_param("id"), uploads.value());
        if (result.is_error()) {
            return make_error(ctx.request, result.error());
        }
        return make_json_response(ctx.request, http::status::ok, codec::encode_confirmation(result.value()));
    });

    router_.post("/api/collections/:id/discard-uploads", [this](const net::RouteContext& ctx) {
        net::Response error;
        const auto body = parse_body(ctx.request, error);
        if (!body) {
            return error;
        }
        auto keys = codec::decode_discard_request(*body);
        if (keys.is_error()) {
            return make_error(ctx.request, keys.error());
        }
        auto discarded = authority_.discard_uploads(ctx.get_param("id"), keys.value());
        if (discarded.is_error()) {
            return make_error(ctx.request, discarded.error());
        }
        return make_json_response(ctx.request, http::status::ok, codec::encode_discard_result(discarded.value()));
    });

    router_.get("/api/collections/:id/manifest", [this](const net::RouteContext& ctx) {
        const auto id = ctx.get_param("id");
        return make_json_response(ctx.request, http::status::ok, codec::encode_manifest(id, authority_.manifest(id)));
    });

    if (!store_) {
        return;
    }

    router_.put("/objects/*", [this](const net::RouteContext& ctx) {
        std::int64_t expires = 0;
        try {
            expires = std::stoll(ctx.query_param("expires"));
        } catch (const std::exception&) {
            return make_error(ctx.request, http::status::forbidden, "Missing or invalid expiry");
        }
        const auto content_type = ctx.request[http::field::content_type];
        auto stored = store_->put(ctx.get_param("*"), ctx.query_param("token"), expires, ctx.request.body(),
                                  std::string(content_type.data(), content_type.size()));
        if (stored.is_error()) {
            return make_error(ctx.request, stored.error());
        }
        return make_json_response(ctx.request, http::status::ok,
                                  json{{"success", true}, {"key", stored.value().key}, {"size", stored.value().size}});
    });
}

directup::Result<void> AuthorityServer::start() {
    beast::error_code ec;
    const auto address = asio::ip::make_address(config_.address, ec);
    if (ec) {
        return directup::Fail<void>(ErrorKind::Parse, "Invalid bind address " + config_.address + ": " + ec.message());
    }
    const tcp::endpoint endpoint{address, config_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        return directup::Fail<void>(ErrorKind::Io, "Cannot listen on " + config_.address + ":" +
                                                  std::to_string(config_.port) + ": " + ec.message());
    }

    port_ = acceptor_.local_endpoint().port();
    spdlog::info("[Server] Authority listening on {}:{}", config_.address, port_);
    for (const auto& route : router_.list_routes()) {
        spdlog::debug("[Server]   {}", route);
    }
    do_accept();
    return directup::Ok();
}

void AuthorityServer::stop() {
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("[Server] close failed: {}", ec.message());
    }
}

void AuthorityServer::do_accept() {
    acceptor_.async_accept(asio::make_strand(io_context_), [this](beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            spdlog::warn("[Server] accept failed: {}", ec.message());
        } else {
            std::make_shared<Session>(std::move(socket), router_, body_limit_)->start();
        }
        if (acceptor_.is_open()) {
            do_accept();
        }
    });
}

} // namespace directup::authority
