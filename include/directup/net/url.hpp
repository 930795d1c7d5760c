#pragma once

#include "directup/core/result.hpp"

#include <string>

namespace directup::net {

struct Url {
    std::string scheme;   ///< "http" or "https"
    std::string host;
    std::string port;
    std::string target;   ///< Path plus query, always starting with '/'

    [[nodiscard]] bool tls() const noexcept { return scheme == "https"; }

    /// Value for the Host header; omits default ports.
    [[nodiscard]] std::string host_header() const;
};

directup::Result<Url> parse_url(const std::string& text);

/// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string encode_path_segment(const std::string& segment);

/// Inverse of encode_path_segment(); malformed escapes are kept verbatim.
std::string decode_path_segment(const std::string& segment);

} // namespace directup::net
