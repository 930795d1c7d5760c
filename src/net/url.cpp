#include "directup/net/url.hpp"

#include <algorithm>
#include <cctype>

namespace directup::net {

std::string Url::host_header() const {
    const bool default_port = (scheme == "http" && port == "80") || (scheme == "https" && port == "443");
    return default_port ? host : host + ":" + port;
}

directup::Result<Url> parse_url(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return directup::Fail<Url>(ErrorKind::Parse, "URL has no scheme: " + text);
    }

    Url url;
    url.scheme = text.substr(0, scheme_end);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme != "http" && url.scheme != "https") {
        return directup::Fail<Url>(ErrorKind::Parse, "Unsupported URL scheme: " + url.scheme);
    }

    const auto authority_start = scheme_end + 3;
    const auto path_start = text.find_first_of("/?", authority_start);
    const auto authority = text.substr(authority_start, path_start == std::string::npos
                                                            ? std::string::npos
                                                            : path_start - authority_start);
    if (authority.empty()) {
        return directup::Fail<Url>(ErrorKind::Parse, "URL has no host: " + text);
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        url.host = authority.substr(0, colon);
        url.port = authority.substr(colon + 1);
        if (url.port.empty() || !std::all_of(url.port.begin(), url.port.end(),
                                             [](unsigned char c) { return std::isdigit(c); })) {
            return directup::Fail<Url>(ErrorKind::Parse, "Invalid port in URL: " + text);
        }
    } else {
        url.host = authority;
        url.port = url.tls() ? "443" : "80";
    }

    url.target = path_start == std::string::npos ? "/" : text.substr(path_start);
    if (url.target.front() == '?') {
        url.target.insert(url.target.begin(), '/');
    }
    return directup::Ok(std::move(url));
}

std::string encode_path_segment(const std::string& segment) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(segment.size());
    for (const char c : segment) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(c);
        } else {
            out.push_back('%');
            out.push_back(hex[uc >> 4]);
            out.push_back(hex[uc & 0x0F]);
        }
    }
    return out;
}

std::string decode_path_segment(const std::string& segment) {
    const auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(segment.size());
    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '%' && i + 2 < segment.size()) {
            const int hi = nibble(segment[i + 1]);
            const int lo = nibble(segment[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(segment[i]);
    }
    return out;
}

} // namespace directup::net
