#include "directup/net/http_connection.hpp"

#include <spdlog/spdlog.h>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <memory>

namespace directup::net {

HttpConnection::HttpConnection(Url url)
    : url_(std::move(url)), ssl_ctx_(asio::ssl::context::tls_client), resolver_(ioc_) {
    if (url_.tls()) {
        ssl_ctx_.set_default_verify_paths();
        tls_.emplace(ioc_, ssl_ctx_);
        tls_->set_verify_mode(asio::ssl::verify_peer);
        tls_->set_verify_callback(asio::ssl::host_name_verification(url_.host));
    } else {
        plain_.emplace(ioc_);
    }
}

HttpConnection::~HttpConnection() {
    close();
}

beast::tcp_stream& HttpConnection::lowest() {
    return tls_ ? beast::get_lowest_layer(*tls_) : *plain_;
}

void HttpConnection::expires_after(std::chrono::milliseconds timeout) {
    lowest().expires_after(timeout);
    deadline_ = std::chrono::steady_clock::now() + timeout;
}

beast::error_code HttpConnection::connect() {
    // The stream timer does not cover the resolver, so it gets its own.
    asio::steady_timer resolve_timer(ioc_);
    // Shared: a timer that fired just as the lookup finished still runs later.
    auto timed_out = std::make_shared<bool>(false);
    if (deadline_) {
        resolve_timer.expires_at(*deadline_);
        resolve_timer.async_wait([this, timed_out](beast::error_code wait_ec) {
            if (!wait_ec) {
                *timed_out = true;
                resolver_.cancel();
            }
        });
    }

    tcp::resolver::results_type endpoints;
    auto ec = drive([&](auto&& handler) {
        resolver_.async_resolve(url_.host, url_.port,
                                [&endpoints, h = std::forward<decltype(handler)>(handler)](
                                    beast::error_code resolve_ec, tcp::resolver::results_type results) mutable {
                                    endpoints = std::move(results);
                                    h(resolve_ec);
                                });
    });
    resolve_timer.cancel();
    if (*timed_out && ec) {
        return beast::error::timeout;
    }
    if (ec) {
        return ec;
    }

    ec = drive([&](auto&& handler) {
        lowest().async_connect(endpoints, std::forward<decltype(handler)>(handler));
    });
    if (ec || !tls_) {
        return ec;
    }

    if (!SSL_set_tlsext_host_name(tls_->native_handle(), url_.host.c_str())) {
        return beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
    }
    return drive([&](auto&& handler) {
        tls_->async_handshake(asio::ssl::stream_base::client, std::forward<decltype(handler)>(handler));
    });
}

void HttpConnection::cancel() {
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    asio::post(ioc_, [this] {
        resolver_.cancel();
        lowest().cancel();
    });
}

void HttpConnection::close() {
    beast::error_code ec;
    lowest().socket().shutdown(tcp::socket::shutdown_both, ec);
    lowest().socket().close(ec);
    if (ec && ec != asio::error::not_connected && ec != asio::error::bad_descriptor) {
        spdlog::debug("[Http] close {}: {}", url_.host, ec.message());
    }
}

} // namespace directup::net
