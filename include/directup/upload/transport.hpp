#pragma once

#include "directup/core/cancellation.hpp"
#include "directup/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace directup::upload {

enum class TransferStatus {
    Ok,
    Transient,          ///< Network error or non-2xx status
    CredentialExpired,  ///< 401/403 from storage
    Aborted,            ///< Cancellation signal
    TimedOut            ///< Per-attempt deadline elapsed
};

const char* to_string(TransferStatus status);

struct TransferOutcome {
    TransferStatus status = TransferStatus::Ok;
    int http_status = 0;
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return status == TransferStatus::Ok; }

    static TransferOutcome success(int http_status = 200) { return {TransferStatus::Ok, http_status, {}}; }
    static TransferOutcome failure(TransferStatus status, std::string message, int http_status = 0) {
        return {status, http_status, std::move(message)};
    }
};

/// Maps an HTTP status of a storage write onto a transfer outcome.
TransferOutcome classify_http_status(int http_status, const std::string& body = {});

/// Called with (bytes_loaded, bytes_total) as the body is written.
using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

/**
 * @brief Performs one authenticated object write
 *
 * Must return (never throw) once the write settles, the timeout elapses or
 * the token is cancelled.
 */
class ObjectTransport {
public:
    virtual ~ObjectTransport() = default;

    virtual TransferOutcome put(const WriteCredential& credential,
                                const UploadFile& file,
                                const ProgressCallback& on_progress,
                                const CancellationToken& cancel,
                                std::chrono::milliseconds timeout) = 0;
};

} // namespace directup::upload
