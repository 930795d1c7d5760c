#include "directup/net/http_connection.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using directup::net::HttpConnection;
using directup::net::parse_url;

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

TEST(HttpConnectionTest, ConnectsToLocalListener) {
    asio::io_context server_ioc;
    tcp::acceptor acceptor(server_ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    const auto port = acceptor.local_endpoint().port();

    auto url = parse_url("http://127.0.0.1:" + std::to_string(port) + "/health");
    ASSERT_TRUE(url.is_ok());
    HttpConnection conn(url.value());
    conn.expires_after(std::chrono::seconds(5));

    // The kernel completes the handshake from the listen backlog.
    const auto ec = conn.connect();
    EXPECT_FALSE(ec) << ec.message();
}

TEST(HttpConnectionTest, CancelledConnectionNeverResolves) {
    auto url = parse_url("http://storage.test/objects/k");
    ASSERT_TRUE(url.is_ok());
    HttpConnection conn(url.value());
    conn.cancel();

    EXPECT_TRUE(conn.cancelled());
    EXPECT_EQ(conn.connect(), asio::error::operation_aborted);
}

TEST(HttpConnectionTest, ResolvesHostNames) {
    asio::io_context server_ioc;
    tcp::acceptor acceptor(server_ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    auto url = parse_url("http://localhost:" + std::to_string(acceptor.local_endpoint().port()) + "/");
    ASSERT_TRUE(url.is_ok());
    HttpConnection conn(url.value());
    conn.expires_after(std::chrono::seconds(5));

    const auto ec = conn.connect();
    EXPECT_FALSE(ec) << ec.message();
}
