/**
 * directup-upload: push local files into a collection through an authority
 *
 * Usage: directup-upload --authority <url> --collection <id>
 *                        [--config file.json] [-c concurrency] [-r retries] FILE...
 *
 * Exit code 0 only when every file was uploaded and confirmed by the server.
 * Ctrl-C cancels the batch; files already written are still confirmed.
 */

#include "directup/authority/json_codec.hpp"
#include "directup/config/config.hpp"
#include "directup/core/cancellation.hpp"
#include "directup/core/logging.hpp"
#include "directup/events/components.hpp"
#include "directup/events/dispatcher.hpp"
#include "directup/events/event_bus.hpp"
#include "directup/net/beast_transport.hpp"
#include "directup/net/http_broker.hpp"
#include "directup/upload/uploader.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace asio = boost::asio;

namespace {

void print_usage() {
    spdlog::info("Usage: directup-upload --authority <url> --collection <id> [--config file.json] "
                 "[-c concurrency] [-r retries] FILE...");
}

/// Logs what the authority now holds for the collection.
void report_manifest(directup::net::HttpCredentialBroker& broker, const std::string& collection_id) {
    auto manifest = broker.fetch_manifest(collection_id);
    if (manifest.is_error()) {
        spdlog::warn("Could not fetch manifest for {}: {}", collection_id, manifest.error().message);
        return;
    }
    auto parsed = directup::authority::codec::parse(manifest.value());
    if (parsed.is_error() || !parsed.value().contains("objects") || !parsed.value().at("objects").is_array()) {
        spdlog::warn("Manifest for {} is malformed", collection_id);
        return;
    }
    spdlog::info("Collection {} now holds {} confirmed objects", collection_id,
                 parsed.value().at("objects").size());
}

} // namespace

int main(int argc, char* argv[]) {
    directup::config::AppConfig config;
    std::string config_path;
    std::string authority_url;
    std::string collection_id;
    int concurrency = -1;
    int retries = -1;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--authority" && i + 1 < argc) {
            authority_url = argv[++i];
        } else if (arg == "--collection" && i + 1 < argc) {
            collection_id = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-c" || arg == "--concurrency") && i + 1 < argc) {
            concurrency = std::atoi(argv[++i]);
        } else if ((arg == "-r" || arg == "--retries") && i + 1 < argc) {
            retries = std::atoi(argv[++i]);
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else {
            paths.push_back(arg);
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
    if (concurrency > 0) {
        config.uploader.max_concurrent = static_cast<std::size_t>(concurrency);
    }
    if (retries >= 0) {
        config.uploader.max_retries = static_cast<std::uint32_t>(retries);
    }
    if (auto logging = directup::configure_logging(config.logging); logging.is_error()) {
        spdlog::error("{}", logging.error().message);
        return 2;
    }
    if (authority_url.empty() || collection_id.empty() || paths.empty()) {
        print_usage();
        return 2;
    }

    auto authority = directup::net::parse_url(authority_url);
    if (authority.is_error()) {
        spdlog::error("{}", authority.error().message);
        return 2;
    }

    std::vector<directup::upload::UploadFile> files;
    for (const auto& path : paths) {
        try {
            files.push_back(directup::upload::UploadFile::from_path(path));
        } catch (const std::exception& e) {
            spdlog::error("Cannot read {}: {}", path, e.what());
            return 2;
        }
    }

    directup::events::EventBus event_bus;
    directup::events::MetricsComponent metrics(event_bus);
    directup::events::EventDispatcher dispatcher(event_bus);

    directup::upload::UploadObserver observer;
    observer.on_progress = [](const std::string& filename, double percent, std::uint64_t, std::uint64_t) {
        spdlog::debug("{}: {:.1f}%", filename, percent);
    };
    observer.on_file_complete = [](const std::string& filename, const std::optional<std::string>& key,
                                   bool success, const std::string& error) {
        if (success) {
            spdlog::info("Uploaded {} -> {}", filename, key.value_or(""));
        } else {
            spdlog::warn("Failed {}: {}", filename, error);
        }
    };
    observer.on_error = [](const std::string& source, const std::string& message) {
        if (source == directup::upload::kSecuritySource) {
            spdlog::error("SECURITY: {}", message);
        }
    };
    directup::events::ObserverBridge bridge(event_bus, observer, collection_id);

    directup::CancellationSource cancel_source;
    asio::io_context signal_context;
    asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (!ec) {
            spdlog::warn("Cancelling upload...");
            cancel_source.cancel();
        }
    });
    std::thread signal_thread([&signal_context] { signal_context.run(); });

    directup::net::HttpCredentialBroker broker(authority.value());
    directup::net::BeastObjectTransport transport(config.uploader.chunk_size);
    directup::upload::DirectUploader uploader(config.uploader, broker, transport, dispatcher);

    const auto summary = uploader.upload_files(files, collection_id, cancel_source.token());

    signal_context.stop();
    signal_thread.join();
    dispatcher.flush();

    spdlog::info("Collection {}: {} of {} files stored, {} failed", summary.collection_id,
                 summary.completed.size(), summary.total, summary.failed.size());
    for (const auto& failure : summary.failed) {
        spdlog::warn("  {} [{}]: {}", failure.filename, directup::upload::to_string(failure.kind), failure.error);
    }
    if (summary.confirmation && summary.confirmation->size_mismatch) {
        spdlog::warn("Size mismatch: declared {} bytes, stored {} bytes",
                     summary.confirmation->total_declared_size, summary.confirmation->total_actual_size);
    }
    if (summary.security_violation) {
        spdlog::error("The server deleted files that failed verification");
    }
    if (!summary.error.empty()) {
        spdlog::error("{}", summary.error);
    }
    if (summary.confirmation) {
        report_manifest(broker, collection_id);
    }
    metrics.print_stats();

    return summary.success ? 0 : 1;
}
