#include "directup/config/config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using directup::ErrorKind;
using directup::config::load_config;
using directup::config::parse_config;

TEST(ConfigTest, EmptyDocumentKeepsDefaults) {
    auto config = parse_config("{}");

    ASSERT_TRUE(config.is_ok());
    const auto& app = config.value();
    EXPECT_EQ(app.uploader.max_concurrent, 4u);
    EXPECT_EQ(app.uploader.max_retries, 3u);
    EXPECT_EQ(app.uploader.attempt_timeout, std::chrono::minutes(10));
    EXPECT_TRUE(app.uploader.refresh_expired_credentials);
    EXPECT_EQ(app.authority.credential_ttl, std::chrono::hours(1));
    EXPECT_EQ(app.authority.max_files_per_request, 500u);
    EXPECT_EQ(app.authority.size_tolerance_bytes, 0u);
    EXPECT_EQ(app.server.port, 8080);
    EXPECT_EQ(app.logging.level, "info");
    EXPECT_EQ(app.uploader.limits.video, 5 * directup::upload::CategoryLimits::kGiB);
}

TEST(ConfigTest, ReadsEverySection) {
    auto config = parse_config(R"({
        "uploader": {
            "max_concurrent": 8,
            "max_retries": 5,
            "attempt_timeout_seconds": 30,
            "confirmation_timeout_seconds": 15,
            "refresh_expired_credentials": false,
            "credential_expiry_skew_seconds": 5,
            "chunk_size": 65536,
            "limits": { "audio": 1048576 }
        },
        "authority": {
            "credential_ttl_seconds": 600,
            "max_files_per_request": 50,
            "size_tolerance_bytes": 16,
            "unconfirmed_grace_seconds": 120,
            "public_base_url": "https://uploads.example.com"
        },
        "server": { "address": "127.0.0.1", "port": 9090, "threads": 0 },
        "logging": { "level": "debug" }
    })");

    ASSERT_TRUE(config.is_ok()) << config.error().message;
    const auto& app = config.value();
    EXPECT_EQ(app.uploader.max_concurrent, 8u);
    EXPECT_EQ(app.uploader.max_retries, 5u);
    EXPECT_EQ(app.uploader.attempt_timeout, std::chrono::seconds(30));
    EXPECT_EQ(app.uploader.confirmation_timeout, std::chrono::seconds(15));
    EXPECT_FALSE(app.uploader.refresh_expired_credentials);
    EXPECT_EQ(app.uploader.credential_expiry_skew, std::chrono::seconds(5));
    EXPECT_EQ(app.uploader.chunk_size, 65536u);
    EXPECT_EQ(app.uploader.limits.audio, 1048576u);
    EXPECT_EQ(app.uploader.limits.document, 100 * directup::upload::CategoryLimits::kMiB);
    EXPECT_EQ(app.authority.credential_ttl, std::chrono::minutes(10));
    EXPECT_EQ(app.authority.max_files_per_request, 50u);
    EXPECT_EQ(app.authority.size_tolerance_bytes, 16u);
    EXPECT_EQ(app.authority.unconfirmed_grace, std::chrono::minutes(2));
    EXPECT_EQ(app.authority.public_base_url, "https://uploads.example.com");
    EXPECT_EQ(app.server.address, "127.0.0.1");
    EXPECT_EQ(app.server.port, 9090);
    EXPECT_EQ(app.server.threads, 1u);
    EXPECT_EQ(app.logging.level, "debug");
}

TEST(ConfigTest, RejectsInvalidValues) {
    auto zero_workers = parse_config(R"({"uploader":{"max_concurrent":0}})");
    ASSERT_TRUE(zero_workers.is_error());
    EXPECT_EQ(zero_workers.error().kind, ErrorKind::Parse);

    auto zero_ttl = parse_config(R"({"authority":{"credential_ttl_seconds":0}})");
    ASSERT_TRUE(zero_ttl.is_error());

    auto wrong_type = parse_config(R"({"uploader":{"max_retries":"many"}})");
    ASSERT_TRUE(wrong_type.is_error());
    EXPECT_EQ(wrong_type.error().kind, ErrorKind::Parse);

    auto negative_retries = parse_config(R"({"uploader":{"max_retries":-1}})");
    ASSERT_TRUE(negative_retries.is_error());
    EXPECT_EQ(negative_retries.error().kind, ErrorKind::Parse);
    EXPECT_NE(negative_retries.error().message.find("max_retries"), std::string::npos);

    auto negative_workers = parse_config(R"({"uploader":{"max_concurrent":-1}})");
    ASSERT_TRUE(negative_workers.is_error());
    EXPECT_EQ(negative_workers.error().kind, ErrorKind::Parse);

    auto negative_limit = parse_config(R"({"authority":{"limits":{"video":-5}}})");
    ASSERT_TRUE(negative_limit.is_error());

    auto port_too_large = parse_config(R"({"server":{"port":70000}})");
    ASSERT_TRUE(port_too_large.is_error());
    EXPECT_EQ(port_too_large.error().kind, ErrorKind::Parse);

    auto fractional = parse_config(R"({"uploader":{"max_retries":2.5}})");
    ASSERT_TRUE(fractional.is_error());

    auto not_object = parse_config(R"({"server":[]})");
    ASSERT_TRUE(not_object.is_error());

    auto array_root = parse_config("[1,2]");
    ASSERT_TRUE(array_root.is_error());
    EXPECT_EQ(array_root.error().message, "Configuration must be a JSON object");

    EXPECT_TRUE(parse_config("{ nope").is_error());
}

TEST(ConfigTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "directup_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"server":{"port":7000}})";
    }

    auto config = load_config(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().server.port, 7000);
}

TEST(ConfigTest, MissingFileIsIoError) {
    auto config = load_config("/nonexistent/directup/config.json");
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().kind, ErrorKind::Io);
}
