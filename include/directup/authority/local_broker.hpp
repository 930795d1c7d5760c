#pragma once

#include "directup/authority/upload_authority.hpp"
#include "directup/upload/broker.hpp"

namespace directup::authority {

/// In-process CredentialBroker calling an UploadAuthority directly.
class LocalCredentialBroker : public upload::CredentialBroker {
public:
    explicit LocalCredentialBroker(UploadAuthority& authority) : authority_(authority) {}

    directup::Result<std::vector<upload::WriteCredential>>
    request_credentials(const std::string& collection_id,
                        const std::vector<upload::CredentialRequestItem>& files) override {
        return authority_.issue_credentials(collection_id, files);
    }

    directup::Result<upload::WriteCredential>
    refresh_credential(const std::string& collection_id, const std::string& key) override {
        return authority_.refresh_credential(collection_id, key);
    }

    directup::Result<upload::ConfirmationResult>
    confirm_uploads(const std::string& collection_id,
                    const std::vector<upload::ConfirmationItem>& uploads,
                    std::chrono::milliseconds /*timeout*/) override {
        return authority_.confirm_uploads(collection_id, uploads);
    }

    directup::Result<std::size_t> discard_uploads(const std::string& collection_id,
                                                  const std::vector<std::string>& keys) override {
        return authority_.discard_uploads(collection_id, keys);
    }

private:
    UploadAuthority& authority_;
};

} // namespace directup::authority
