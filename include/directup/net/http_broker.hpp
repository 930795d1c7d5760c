#pragma once

#include "directup/net/http_client.hpp"
#include "directup/upload/broker.hpp"

#include <chrono>
#include <string>

namespace directup::net {

/**
 * @brief CredentialBroker talking to a remote AuthorityServer
 *
 * A non-2xx status or a body that does not decode is an error; the
 * server's `error` field becomes the message when present.
 */
class HttpCredentialBroker : public upload::CredentialBroker {
public:
    explicit HttpCredentialBroker(Url authority,
                                  std::chrono::milliseconds request_timeout = std::chrono::seconds(30))
        : client_(std::move(authority)), request_timeout_(request_timeout) {}

    directup::Result<std::vector<upload::WriteCredential>>
    request_credentials(const std::string& collection_id,
                        const std::vector<upload::CredentialRequestItem>& files) override;

    directup::Result<upload::WriteCredential>
    refresh_credential(const std::string& collection_id, const std::string& key) override;

    directup::Result<upload::ConfirmationResult>
    confirm_uploads(const std::string& collection_id,
                    const std::vector<upload::ConfirmationItem>& uploads,
                    std::chrono::milliseconds timeout) override;

    directup::Result<std::size_t> discard_uploads(const std::string& collection_id,
                                                  const std::vector<std::string>& keys) override;

    /// Raw manifest document of a collection, as served by the authority.
    directup::Result<std::string> fetch_manifest(const std::string& collection_id);

private:
    directup::Result<HttpResponse> post(const std::string& collection_id, const std::string& action,
                                        const std::string& body, std::chrono::milliseconds timeout);

    HttpClient client_;
    std::chrono::milliseconds request_timeout_;
};

} // namespace directup::net
