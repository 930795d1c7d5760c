#include "directup/net/beast_transport.hpp"

#include "directup/net/http_connection.hpp"

#include <boost/beast/version.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <vector>

namespace directup::net {
namespace {

using upload::TransferOutcome;
using upload::TransferStatus;

TransferOutcome io_failure(const beast::error_code& ec, const HttpConnection& connection, const char* stage) {
    if (connection.cancelled()) {
        return TransferOutcome::failure(TransferStatus::Aborted, "Upload cancelled");
    }
    if (ec == beast::error::timeout) {
        return TransferOutcome::failure(TransferStatus::TimedOut, std::string("Upload timed out during ") + stage);
    }
    return TransferOutcome::failure(TransferStatus::Transient,
                                    std::string("Network error during ") + stage + ": " + ec.message());
}

} // namespace

TransferOutcome BeastObjectTransport::put(const upload::WriteCredential& credential,
                                          const upload::UploadFile& file,
                                          const upload::ProgressCallback& on_progress,
                                          const CancellationToken& cancel,
                                          std::chrono::milliseconds timeout) {
    auto url = parse_url(credential.url);
    if (url.is_error()) {
        return TransferOutcome::failure(TransferStatus::Transient, url.error().message);
    }
    if (!file.data) {
        return TransferOutcome::failure(TransferStatus::Transient, "No data source for " + file.name);
    }

    auto connection = std::make_shared<HttpConnection>(url.value());
    const auto callback_id = cancel.on_cancel([connection] { connection->cancel(); });
    const auto finish = [&](TransferOutcome outcome) {
        cancel.remove_callback(callback_id);
        return outcome;
    };

    connection->expires_after(timeout);
    if (auto ec = connection->connect()) {
        return finish(io_failure(ec, *connection, "connect"));
    }

    http::request<http::buffer_body> req{http::verb::put, url.value().target, 11};
    req.set(http::field::host, url.value().host_header());
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::content_type, file.content_type);
    req.content_length(file.size);
    req.body().data = nullptr;
    req.body().more = true;

    http::request_serializer<http::buffer_body> serializer{req};
    if (auto ec = connection->write_header(serializer)) {
        return finish(io_failure(ec, *connection, "header"));
    }

    const auto buffer_size = std::min<std::uint64_t>(chunk_size_, std::max<std::uint64_t>(file.size, 1));
    std::vector<std::uint8_t> chunk(static_cast<std::size_t>(buffer_size));
    std::uint64_t offset = 0;
    do {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(chunk.size(), file.size - offset));
        std::size_t got = 0;
        if (want > 0) {
            try {
                got = file.data->read(offset, chunk.data(), want);
            } catch (const std::exception& e) {
                return finish(TransferOutcome::failure(TransferStatus::Transient,
                                                       "Read failed for " + file.name + ": " + e.what()));
            }
            if (got == 0) {
                return finish(TransferOutcome::failure(TransferStatus::Transient,
                                                       "Unexpected end of data for " + file.name));
            }
        }

        req.body().data = got > 0 ? chunk.data() : nullptr;
        req.body().size = got;
        req.body().more = offset + got < file.size;

        auto ec = connection->write_some(serializer);
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        if (ec) {
            return finish(io_failure(ec, *connection, "body"));
        }

        offset += got;
        if (on_progress) {
            on_progress(offset, file.size);
        }
    } while (!serializer.is_done());

    http::response<http::string_body> res;
    if (auto ec = connection->read(res)) {
        return finish(io_failure(ec, *connection, "response"));
    }
    connection->close();

    auto outcome = upload::classify_http_status(static_cast<int>(res.result_int()), res.body());
    spdlog::debug("[Transport] PUT {} -> {} ({} bytes)", credential.key, res.result_int(), file.size);
    return finish(std::move(outcome));
}

} // namespace directup::net
