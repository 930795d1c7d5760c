#pragma once

#include "directup/upload/broker.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace directup::testing {

/// CredentialBroker returning canned answers and recording what it was asked.
class ScriptedBroker : public upload::CredentialBroker {
public:
    std::optional<directup::Error> credentials_error;
    std::vector<upload::WriteCredential> credentials;   ///< Returned as-is when set
    std::optional<directup::Error> refresh_error;
    std::optional<directup::Error> confirm_error;
    upload::ConfirmationResult confirmation;
    bool echo_confirmation = true;                      ///< Confirm everything submitted

    directup::Result<std::vector<upload::WriteCredential>>
    request_credentials(const std::string& /*collection_id*/,
                        const std::vector<upload::CredentialRequestItem>& files) override {
        std::lock_guard lock(mutex_);
        ++credential_calls;
        if (credentials_error) {
            return directup::Err<std::vector<upload::WriteCredential>>(*credentials_error);
        }
        if (!credentials.empty()) {
            return directup::Ok(credentials);
        }
        std::vector<upload::WriteCredential> issued;
        for (std::size_t i = 0; i < files.size(); ++i) {
            const auto key = "k/" + std::to_string(i) + "-" + files[i].filename;
            issued.push_back({key, "http://storage.test/objects/" + key,
                              std::chrono::system_clock::now() + std::chrono::hours(1)});
        }
        return directup::Ok(std::move(issued));
    }

    directup::Result<upload::WriteCredential> refresh_credential(const std::string& /*collection_id*/,
                                                                 const std::string& key) override {
        std::lock_guard lock(mutex_);
        refreshed_keys.push_back(key);
        if (refresh_error) {
            return directup::Err<upload::WriteCredential>(*refresh_error);
        }
        return directup::Ok(upload::WriteCredential{key, "http://storage.test/objects/" + key + "?fresh",
                                               std::chrono::system_clock::now() + std::chrono::hours(1)});
    }

    directup::Result<upload::ConfirmationResult>
    confirm_uploads(const std::string& /*collection_id*/,
                    const std::vector<upload::ConfirmationItem>& uploads,
                    std::chrono::milliseconds /*timeout*/) override {
        std::lock_guard lock(mutex_);
        submitted = uploads;
        ++confirm_calls;
        if (confirm_error) {
            return directup::Err<upload::ConfirmationResult>(*confirm_error);
        }
        if (echo_confirmation) {
            upload::ConfirmationResult all;
            all.success = true;
            all.confirmed_count = uploads.size();
            return directup::Ok(all);
        }
        return directup::Ok(confirmation);
    }

    directup::Result<std::size_t> discard_uploads(const std::string& /*collection_id*/,
                                                  const std::vector<std::string>& keys) override {
        std::lock_guard lock(mutex_);
        ++discard_calls;
        discarded.insert(discarded.end(), keys.begin(), keys.end());
        return directup::Ok(keys.size());
    }

    int credential_calls = 0;
    int confirm_calls = 0;
    int discard_calls = 0;
    std::vector<std::string> refreshed_keys;
    std::vector<upload::ConfirmationItem> submitted;
    std::vector<std::string> discarded;

private:
    std::mutex mutex_;
};

} // namespace directup::testing
