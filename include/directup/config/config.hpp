/**
 * @file config.hpp
 * @brief Runtime configuration for the uploader, the authority and the server
 *
 * Every section is optional in the JSON file; absent keys keep the
 * defaults below. Durations are written in seconds (`*_seconds`) or
 * milliseconds (`*_ms`), sizes in bytes.
 *
 * EXAMPLE:
 * {
 *   "uploader": { "max_concurrent": 8, "attempt_timeout_seconds": 300 },
 *   "authority": { "public_base_url": "http://127.0.0.1:8080" },
 *   "server": { "port": 8080 },
 *   "logging": { "level": "debug" }
 * }
 */

#pragma once

#include "directup/core/logging.hpp"
#include "directup/core/result.hpp"
#include "directup/upload/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace directup::config {

struct UploaderConfig {
    std::size_t max_concurrent = 4;
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds attempt_timeout{std::chrono::minutes(10)};
    std::chrono::milliseconds confirmation_timeout{std::chrono::minutes(2)};
    bool refresh_expired_credentials = true;
    std::chrono::seconds credential_expiry_skew{30};
    std::size_t chunk_size = 1024 * 1024;
    upload::CategoryLimits limits;
};

struct AuthorityConfig {
    std::chrono::seconds credential_ttl{3600};
    std::chrono::seconds unconfirmed_grace{3600};  ///< After expiry, before an unconfirmed key is swept
    std::size_t max_files_per_request = 500;
    std::uint64_t size_tolerance_bytes = 0;
    std::string public_base_url = "http://127.0.0.1:8080";
    upload::CategoryLimits limits;
};

struct ServerConfig {
    std::string address = "0.0.0.0";
    unsigned short port = 8080;
    std::size_t threads = 2;
};

struct AppConfig {
    UploaderConfig uploader;
    AuthorityConfig authority;
    ServerConfig server;
    LoggingConfig logging;
};

/// Parses a JSON document; missing keys keep their defaults.
directup::Result<AppConfig> parse_config(const std::string& json_text);

/// Reads and parses a JSON file.
directup::Result<AppConfig> load_config(const std::string& path);

} // namespace directup::config
