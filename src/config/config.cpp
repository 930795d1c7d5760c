#include "directup/config/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <sstream>

namespace directup::config {
namespace {

using json = nlohmann::json;

/// Non-negative integer at `key`, or `fallback` when absent. Negative or
/// out-of-range values throw instead of wrapping into the unsigned field.
template<typename T>
T read_unsigned(const json& j, const char* key, T fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& node = j.at(key);
    if (!node.is_number_unsigned()) {
        throw std::invalid_argument(std::string("\"") + key + "\" must be a non-negative integer");
    }
    const auto value = node.get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        throw std::invalid_argument(std::string("\"") + key + "\" is out of range");
    }
    return static_cast<T>(value);
}

template<typename Duration>
Duration read_seconds(const json& j, const char* key, Duration fallback) {
    const auto fallback_seconds = std::chrono::duration_cast<std::chrono::seconds>(fallback).count();
    return std::chrono::seconds(read_unsigned<std::int64_t>(j, key, fallback_seconds));
}

void read_limits(const json& j, upload::CategoryLimits& limits) {
    if (!j.is_object()) {
        throw std::invalid_argument("\"limits\" must be an object");
    }
    limits.raw_image = read_unsigned(j, "raw_image", limits.raw_image);
    limits.gallery_image = read_unsigned(j, "gallery_image", limits.gallery_image);
    limits.video = read_unsigned(j, "video", limits.video);
    limits.audio = read_unsigned(j, "audio", limits.audio);
    limits.document = read_unsigned(j, "document", limits.document);
    limits.design_file = read_unsigned(j, "design_file", limits.design_file);
    limits.other = read_unsigned(j, "other", limits.other);
}

void read_uploader(const json& j, UploaderConfig& cfg) {
    cfg.max_concurrent = read_unsigned(j, "max_concurrent", cfg.max_concurrent);
    cfg.max_retries = read_unsigned(j, "max_retries", cfg.max_retries);
    cfg.attempt_timeout = read_seconds(j, "attempt_timeout_seconds", cfg.attempt_timeout);
    cfg.confirmation_timeout = read_seconds(j, "confirmation_timeout_seconds", cfg.confirmation_timeout);
    cfg.refresh_expired_credentials = j.value("refresh_expired_credentials", cfg.refresh_expired_credentials);
    cfg.credential_expiry_skew = read_seconds(j, "credential_expiry_skew_seconds", cfg.credential_expiry_skew);
    cfg.chunk_size = read_unsigned(j, "chunk_size", cfg.chunk_size);
    if (j.contains("limits")) {
        read_limits(j.at("limits"), cfg.limits);
    }

    if (cfg.max_concurrent == 0) {
        throw std::invalid_argument("uploader.max_concurrent must be at least 1");
    }
    if (cfg.chunk_size == 0) {
        throw std::invalid_argument("uploader.chunk_size must be at least 1");
    }
    if (cfg.attempt_timeout.count() == 0 || cfg.confirmation_timeout.count() == 0) {
        throw std::invalid_argument("uploader timeouts must be positive");
    }
}

void read_authority(const json& j, AuthorityConfig& cfg) {
    cfg.credential_ttl = read_seconds(j, "credential_ttl_seconds", cfg.credential_ttl);
    cfg.unconfirmed_grace = read_seconds(j, "unconfirmed_grace_seconds", cfg.unconfirmed_grace);
    cfg.max_files_per_request = read_unsigned(j, "max_files_per_request", cfg.max_files_per_request);
    cfg.size_tolerance_bytes = read_unsigned(j, "size_tolerance_bytes", cfg.size_tolerance_bytes);
    cfg.public_base_url = j.value("public_base_url", cfg.public_base_url);
    if (j.contains("limits")) {
        read_limits(j.at("limits"), cfg.limits);
    }
    if (cfg.credential_ttl.count() <= 0) {
        throw std::invalid_argument("authority.credential_ttl_seconds must be positive");
    }
}

void read_server(const json& j, ServerConfig& cfg) {
    cfg.address = j.value("address", cfg.address);
    cfg.port = read_unsigned(j, "port", cfg.port);
    cfg.threads = read_unsigned(j, "threads", cfg.threads);
    if (cfg.threads == 0) {
        cfg.threads = 1;
    }
}

void read_logging(const json& j, LoggingConfig& cfg) {
    cfg.level = j.value("level", cfg.level);
    cfg.pattern = j.value("pattern", cfg.pattern);
}

template<typename Section, typename Reader>
void read_section(const json& root, const char* name, Section& section, Reader reader) {
    if (!root.contains(name)) {
        return;
    }
    const auto& node = root.at(name);
    if (!node.is_object()) {
        throw std::invalid_argument(std::string("\"") + name + "\" must be an object");
    }
    reader(node, section);
}

} // namespace

directup::Result<AppConfig> parse_config(const std::string& json_text) {
    AppConfig config;
    try {
        const auto root = json::parse(json_text);
        if (!root.is_object()) {
            return directup::Fail<AppConfig>(ErrorKind::Parse, "Configuration must be a JSON object");
        }
        read_section(root, "uploader", config.uploader, read_uploader);
        read_section(root, "authority", config.authority, read_authority);
        read_section(root, "server", config.server, read_server);
        read_section(root, "logging", config.logging, read_logging);
    } catch (const json::exception& e) {
        return directup::Fail<AppConfig>(ErrorKind::Parse, std::string("Invalid configuration: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return directup::Fail<AppConfig>(ErrorKind::Parse, std::string("Invalid configuration: ") + e.what());
    }
    return directup::Ok(std::move(config));
}

directup::Result<AppConfig> load_config(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        return directup::Fail<AppConfig>(ErrorKind::Io, "Cannot open configuration file " + path);
    }
    std::ostringstream contents;
    contents << input.rdbuf();
    return parse_config(contents.str());
}

} // namespace directup::config
