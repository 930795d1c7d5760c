/**
 * @file upload_authority.hpp
 * @brief Server-side issuer and verifier of direct upload credentials
 *
 * The authority never sees file bytes. It hands out one write URL per
 * declared file, remembers what it issued, and on confirmation checks the
 * store for what actually arrived. Anything that fails verification is
 * deleted from the store and never reaches the manifest. Keys that are
 * never confirmed are deleted too, either when the uploader discards them
 * or once they have been expired for `unconfirmed_grace`.
 *
 * WHO EMITS: UploadAuthority
 * EVENTS: CredentialsIssuedEvent, ObjectConfirmedEvent, ObjectRejectedEvent,
 *         ObjectDiscardedEvent
 *
 * THREAD SAFETY: all public methods are safe to call concurrently.
 */

#pragma once

#include "directup/config/config.hpp"
#include "directup/core/result.hpp"
#include "directup/events/event_bus.hpp"
#include "directup/storage/object_store.hpp"
#include "directup/upload/broker.hpp"
#include "directup/upload/classifier.hpp"
#include "directup/upload/types.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace directup::authority {

struct ManifestEntry {
    std::string key;
    std::string filename;
    std::string content_type;
    std::uint64_t size = 0;
    upload::FileCategory category = upload::FileCategory::Other;
    std::chrono::system_clock::time_point confirmed_at{};
};

/// Replaces every character outside [A-Za-z0-9.-] with '_'.
std::string sanitize_filename(const std::string& filename);

/// Lowercase [a-z0-9-] slug of a collection id.
std::string collection_slug(const std::string& collection_id);

class UploadAuthority {
public:
    UploadAuthority(config::AuthorityConfig config,
                    std::shared_ptr<storage::ObjectStore> store,
                    events::EventBus& bus);

    /// All-or-nothing: one invalid item rejects the whole request.
    directup::Result<std::vector<upload::WriteCredential>>
    issue_credentials(const std::string& collection_id, const std::vector<upload::CredentialRequestItem>& files);

    directup::Result<upload::WriteCredential> refresh_credential(const std::string& collection_id,
                                                                 const std::string& key);

    /**
     * Verifies each claimed upload against the store. Safe to repeat: keys
     * already in the manifest are re-verified but never recorded twice.
     */
    directup::Result<upload::ConfirmationResult>
    confirm_uploads(const std::string& collection_id, const std::vector<upload::ConfirmationItem>& uploads);

    /**
     * Deletes whatever reached storage under keys the uploader gave up on
     * and forgets them. Confirmed keys and keys issued to other
     * collections are left alone. Returns how many keys were discarded.
     */
    directup::Result<std::size_t> discard_uploads(const std::string& collection_id,
                                                  const std::vector<std::string>& keys);

    /// Drops unconfirmed keys whose credential expired more than `unconfirmed_grace` before `now`.
    std::size_t purge_unconfirmed(std::chrono::system_clock::time_point now);

    [[nodiscard]] std::vector<ManifestEntry> manifest(const std::string& collection_id) const;

    [[nodiscard]] const config::AuthorityConfig& config() const noexcept { return config_; }

private:
    struct IssuedObject {
        std::string filename;
        std::string content_type;
        std::uint64_t declared_size = 0;
        upload::FileCategory category = upload::FileCategory::Other;
        std::chrono::system_clock::time_point expires_at{};
    };

    struct Collection {
        std::unordered_map<std::string, IssuedObject> issued;
        std::map<std::string, ManifestEntry> manifest;
    };

    std::string make_key_locked(const std::string& collection_id,
                                upload::FileCategory category,
                                const std::string& filename);

    /// Deletes the object behind an unconfirmed key and forgets the key.
    void discard_locked(const std::string& collection_id, const std::string& key, const std::string& reason);

    std::size_t purge_unconfirmed_locked(std::chrono::system_clock::time_point now);

    /// Returns the rejection reason, empty when the object checks out.
    std::string verify_locked(const std::string& key, const IssuedObject& issued,
                              const upload::ConfirmationItem& claim, std::uint64_t& actual_size,
                              bool& size_mismatch);

    config::AuthorityConfig config_;
    upload::FileClassifier classifier_;
    std::shared_ptr<storage::ObjectStore> store_;
    events::EventBus& event_bus_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Collection> collections_;
    std::mt19937_64 rng_;
};

} // namespace directup::authority
