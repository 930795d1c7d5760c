/**
 * directup-authority: upload authority over an in-memory bucket
 *
 * Usage: directup-authority [--config file.json] [-p port] [--public-url url]
 *
 * Write URLs point back at this server's PUT /objects/<key> route, so one
 * process plays both the authority and the storage backend.
 */

#include "directup/authority/authority_server.hpp"
#include "directup/authority/upload_authority.hpp"
#include "directup/config/config.hpp"
#include "directup/core/logging.hpp"
#include "directup/events/components.hpp"
#include "directup/events/event_bus.hpp"
#include "directup/storage/memory_object_store.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace asio = boost::asio;

int main(int argc, char* argv[]) {
    directup::config::AppConfig config;
    std::string config_path;
    std::string public_url;
    int port = -1;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            port = std::atoi(argv[++i]);
        } else if (arg == "--public-url" && i + 1 < argc) {
            public_url = argv[++i];
        } else {
            spdlog::error("Unknown argument: {}", arg);
            return 2;
        }
    }

    if (!config_path.empty()) {
        auto loaded = directup::config::load_config(config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().message);
            return 2;
        }
        config = std::move(loaded.value());
    }
    if (port >= 0) {
        config.server.port = static_cast<unsigned short>(port);
        if (public_url.empty() && config_path.empty()) {
            public_url = "http://127.0.0.1:" + std::to_string(port);
        }
    }
    if (!public_url.empty()) {
        config.authority.public_base_url = public_url;
    }

    if (auto logging = directup::configure_logging(config.logging); logging.is_error()) {
        spdlog::error("{}", logging.error().message);
        return 2;
    }

    directup::events::EventBus event_bus;
    directup::events::LoggerComponent logger(event_bus);
    directup::events::MetricsComponent metrics(event_bus);

    auto store = std::make_shared<directup::storage::MemoryObjectStore>(config.authority.public_base_url);
    directup::authority::UploadAuthority authority(config.authority, store, event_bus);

    asio::io_context io_context;
    directup::authority::AuthorityServer server(io_context, config.server, authority, store);
    if (auto started = server.start(); started.is_error()) {
        spdlog::error("{}", started.error().message);
        return 1;
    }

    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, shutting down", signal);
        server.stop();
        io_context.stop();
    });

    spdlog::info("Public object URL base: {}", config.authority.public_base_url);

    std::vector<std::thread> workers;
    for (std::size_t i = 1; i < config.server.threads; ++i) {
        workers.emplace_back([&io_context] { io_context.run(); });
    }
    io_context.run();
    for (auto& worker : workers) {
        worker.join();
    }

    metrics.print_stats();
    return 0;
}
