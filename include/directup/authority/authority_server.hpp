/**
 * @file authority_server.hpp
 * @brief HTTP front of UploadAuthority (and of the in-memory bucket)
 *
 * ROUTES:
 * GET  /health
 * POST /api/collections/:id/upload-urls
 * POST /api/collections/:id/refresh-url
 * POST /api/collections/:id/confirm-uploads
 * GET  /api/collections/:id/manifest
 * PUT  /objects/<key>?expires=..&token=..   (only with a MemoryObjectStore)
 *
 * THREAD SAFETY:
 * io_context.run() may be called from several threads; each connection
 * runs on its own strand and the authority and store are thread-safe.
 *
 * EXAMPLE:
 * asio::io_context ioc;
 * AuthorityServer server(ioc, config.server, authority, store);
 * server.start();
 * ioc.run();
 */

#pragma once

#include "directup/authority/upload_authority.hpp"
#include "directup/config/config.hpp"
#include "directup/core/result.hpp"
#include "directup/net/router.hpp"
#include "directup/storage/memory_object_store.hpp"

#include <boost/asio.hpp>

#include <memory>

namespace directup::authority {

class AuthorityServer {
public:
    AuthorityServer(boost::asio::io_context& io_context,
                    config::ServerConfig config,
                    UploadAuthority& authority,
                    std::shared_ptr<storage::MemoryObjectStore> store = nullptr);

    /// Binds and starts accepting. Port 0 picks an ephemeral port.
    directup::Result<void> start();

    void stop();

    /// Bound port after start().
    [[nodiscard]] unsigned short port() const noexcept { return port_; }

    /// Dispatches one request without any socket involved.
    net::Response handle_request(const net::Request& request) const { return router_.handle(request); }

    [[nodiscard]] const net::Router& router() const noexcept { return router_; }

private:
    void register_routes();
    void do_accept();

    boost::asio::io_context& io_context_;
    config::ServerConfig config_;
    UploadAuthority& authority_;
    std::shared_ptr<storage::MemoryObjectStore> store_;
    net::Router router_;
    boost::asio::ip::tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    std::uint64_t body_limit_ = 0;
};

} // namespace directup::authority
