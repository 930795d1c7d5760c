#include "directup/upload/transport.hpp"

namespace directup::upload {

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Ok: return "ok";
        case TransferStatus::Transient: return "transient";
        case TransferStatus::CredentialExpired: return "credential_expired";
        case TransferStatus::Aborted: return "aborted";
        case TransferStatus::TimedOut: return "timed_out";
    }
    return "unknown";
}

TransferOutcome classify_http_status(int http_status, const std::string& body) {
    if (http_status >= 200 && http_status < 300) {
        return TransferOutcome::success(http_status);
    }

    std::string message = "Upload failed with status " + std::to_string(http_status);
    if (!body.empty()) {
        message += ": " + body.substr(0, 200);
    }

    if (http_status == 401 || http_status == 403) {
        return TransferOutcome::failure(TransferStatus::CredentialExpired, std::move(message), http_status);
    }
    return TransferOutcome::failure(TransferStatus::Transient, std::move(message), http_status);
}

} // namespace directup::upload
