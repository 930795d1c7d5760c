/**
 * @file http_connection.hpp
 * @brief One HTTP/1.1 connection, plain or TLS, with a deadline and abort
 *
 * Every operation is started asynchronously and driven to completion on a
 * private io_context owned by the connection, so the calling thread blocks
 * as with synchronous I/O while Beast's stream timeout still applies. The
 * deadline set by expires_after() covers all operations that follow,
 * name resolution included.
 *
 * cancel() may be called from any thread; it aborts the pending operation
 * and makes every later one fail with operation_aborted.
 *
 * EXAMPLE:
 * auto conn = std::make_shared<HttpConnection>(url);
 * conn->expires_after(std::chrono::seconds(30));
 * if (auto ec = conn->connect()) { ... }
 * http::request<http::string_body> req{http::verb::get, url.target, 11};
 * conn->write(req);
 * http::response<http::string_body> res;
 * conn->read(res);
 */

#pragma once

#include "directup/net/url.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <atomic>
#include <chrono>
#include <optional>
#include <utility>

namespace directup::net {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

class HttpConnection {
public:
    explicit HttpConnection(Url url);
    ~HttpConnection();

    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;

    [[nodiscard]] const Url& url() const noexcept { return url_; }

    void expires_after(std::chrono::milliseconds timeout);

    /// Resolves the host, connects, and for https performs the TLS handshake.
    beast::error_code connect();

    template<class Serializer>
    beast::error_code write_header(Serializer& serializer) {
        return drive([&](auto&& handler) {
            with_stream([&](auto& stream) {
                http::async_write_header(stream, serializer, std::forward<decltype(handler)>(handler));
            });
        });
    }

    /// Writes whatever the serializer has; need_buffer means "give me more body".
    template<class Serializer>
    beast::error_code write_some(Serializer& serializer) {
        return drive([&](auto&& handler) {
            with_stream([&](auto& stream) {
                http::async_write(stream, serializer, std::forward<decltype(handler)>(handler));
            });
        });
    }

    template<class Message>
    beast::error_code write(Message& message) {
        return drive([&](auto&& handler) {
            with_stream([&](auto& stream) {
                http::async_write(stream, message, std::forward<decltype(handler)>(handler));
            });
        });
    }

    template<class Body>
    beast::error_code read(http::response<Body>& response) {
        return drive([&](auto&& handler) {
            with_stream([&](auto& stream) {
                http::async_read(stream, buffer_, response, std::forward<decltype(handler)>(handler));
            });
        });
    }

    /// Thread-safe abort of current and future operations.
    void cancel();

    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    void close();

private:
    beast::tcp_stream& lowest();

    template<class Fn>
    void with_stream(Fn&& fn) {
        if (tls_) {
            fn(*tls_);
        } else {
            fn(*plain_);
        }
    }

    template<class Start>
    beast::error_code drive(Start&& start) {
        if (cancelled()) {
            return asio::error::operation_aborted;
        }
        beast::error_code result = asio::error::operation_aborted;
        bool finished = false;
        start([&result, &finished](beast::error_code ec, auto&&...) {
            result = ec;
            finished = true;
        });
        // Stop at our completion; an armed stream timer may still be queued.
        ioc_.restart();
        while (!finished && ioc_.run_one() > 0) {
        }
        return result;
    }

    Url url_;
    asio::io_context ioc_;
    asio::ssl::context ssl_ctx_;
    tcp::resolver resolver_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    std::optional<beast::tcp_stream> plain_;
    std::optional<beast::ssl_stream<beast::tcp_stream>> tls_;
    beast::flat_buffer buffer_;
    std::atomic<bool> cancelled_{false};
};

} // namespace directup::net
