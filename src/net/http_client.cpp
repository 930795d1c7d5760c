#include "directup/net/http_client.hpp"

#include "directup/net/http_connection.hpp"

#include <boost/beast/version.hpp>
#include <spdlog/spdlog.h>

#include <memory>

namespace directup::net {
namespace {

directup::Error io_error(const beast::error_code& ec, const Url& url, bool cancelled) {
    if (cancelled || ec == asio::error::operation_aborted) {
        return directup::Error{ErrorKind::Cancelled, "Request to " + url.host + " cancelled"};
    }
    if (ec == beast::error::timeout) {
        return directup::Error{ErrorKind::Transfer, "Request to " + url.host + " timed out"};
    }
    return directup::Error{ErrorKind::Transfer, "Request to " + url.host + " failed: " + ec.message()};
}

std::string verb_name(http::verb method) {
    const auto name = http::to_string(method);
    return std::string(name.data(), name.size());
}

} // namespace

directup::Result<HttpResponse> HttpClient::request(http::verb method,
                                                   const std::string& path,
                                                   const std::string& body,
                                                   std::chrono::milliseconds timeout,
                                                   const CancellationToken& cancel) const {
    auto connection = std::make_shared<HttpConnection>(base_);
    const auto callback_id = cancel.on_cancel([connection] { connection->cancel(); });

    const auto finish = [&](directup::Result<HttpResponse> result) {
        cancel.remove_callback(callback_id);
        return result;
    };

    connection->expires_after(timeout);
    if (auto ec = connection->connect()) {
        return finish(directup::Err<HttpResponse>(io_error(ec, base_, connection->cancelled())));
    }

    http::request<http::string_body> req{method, path, 11};
    req.set(http::field::host, base_.host_header());
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::accept, "application/json");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();

    spdlog::debug("[Http] {} {}{}", verb_name(method), base_.host_header(), path);
    if (auto ec = connection->write(req)) {
        return finish(directup::Err<HttpResponse>(io_error(ec, base_, connection->cancelled())));
    }

    http::response<http::string_body> res;
    if (auto ec = connection->read(res)) {
        return finish(directup::Err<HttpResponse>(io_error(ec, base_, connection->cancelled())));
    }

    connection->close();
    return finish(directup::Ok(HttpResponse{static_cast<int>(res.result_int()), std::move(res.body())}));
}

} // namespace directup::net
