#pragma once

#include "directup/core/result.hpp"
#include "directup/upload/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace directup::upload {

struct CredentialRequestItem {
    std::string filename;
    std::string content_type;
    std::uint64_t size = 0;
};

/**
 * @brief Server-side authority consumed by the pipeline
 *
 * Implementations: LocalCredentialBroker (in-process UploadAuthority) and
 * HttpCredentialBroker (remote authority over HTTP).
 */
class CredentialBroker {
public:
    virtual ~CredentialBroker() = default;

    /**
     * Issues one credential per item, index-aligned with `files`.
     * Called once per batch so the authority can reject the batch atomically.
     */
    virtual directup::Result<std::vector<WriteCredential>>
    request_credentials(const std::string& collection_id, const std::vector<CredentialRequestItem>& files) = 0;

    /// Re-issues a credential for a key the authority already handed out.
    virtual directup::Result<WriteCredential>
    refresh_credential(const std::string& collection_id, const std::string& key) = 0;

    /**
     * Asks the authority to verify each claimed upload against storage.
     * An error means the call itself failed; rejections are reported inside
     * the ConfirmationResult.
     */
    virtual directup::Result<ConfirmationResult>
    confirm_uploads(const std::string& collection_id,
                    const std::vector<ConfirmationItem>& uploads,
                    std::chrono::milliseconds timeout) = 0;

    /// Gives up on keys that will never be confirmed so the authority can delete their objects.
    virtual directup::Result<std::size_t> discard_uploads(const std::string& collection_id,
                                                          const std::vector<std::string>& keys) = 0;
};

} // namespace directup::upload
