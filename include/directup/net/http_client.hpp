#pragma once

#include "directup/core/cancellation.hpp"
#include "directup/core/result.hpp"
#include "directup/net/url.hpp"

#include <boost/beast/http/verb.hpp>

#include <chrono>
#include <string>

namespace directup::net {

struct HttpResponse {
    int status = 0;
    std::string body;

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
};

/// One request per connection; no keep-alive.
class HttpClient {
public:
    explicit HttpClient(Url base) : base_(std::move(base)) {}

    directup::Result<HttpResponse> request(boost::beast::http::verb method,
                                           const std::string& path,
                                           const std::string& body,
                                           std::chrono::milliseconds timeout,
                                           const CancellationToken& cancel = {}) const;

    [[nodiscard]] const Url& base() const noexcept { return base_; }

private:
    Url base_;
};

} // namespace directup::net
