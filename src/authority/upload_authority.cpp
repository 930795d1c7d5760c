#include "directup/authority/upload_authority.hpp"

#include "directup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace directup::authority {
namespace {

void revoke_logged(storage::ObjectStore& store, const std::string& key) {
    auto revoked = store.revoke_write(key);
    if (revoked.is_error()) {
        spdlog::error("[Authority] could not revoke write URL for {}: {}", key, revoked.error().message);
    }
}

} // namespace

std::string sanitize_filename(const std::string& filename) {
    std::string out = filename;
    for (auto& c : out) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '.' && c != '-') {
            c = '_';
        }
    }
    return out;
}

std::string collection_slug(const std::string& collection_id) {
    std::string slug;
    slug.reserve(collection_id.size());
    for (char c : collection_id) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            slug.push_back(static_cast<char>(std::tolower(uc)));
        } else if (!slug.empty() && slug.back() != '-') {
            slug.push_back('-');
        }
    }
    while (!slug.empty() && slug.back() == '-') {
        slug.pop_back();
    }
    return slug.empty() ? "collection" : slug;
}

UploadAuthority::UploadAuthority(config::AuthorityConfig config,
                                 std::shared_ptr<storage::ObjectStore> store,
                                 events::EventBus& bus)
    : config_(std::move(config)),
      classifier_(config_.limits),
      store_(std::move(store)),
      event_bus_(bus),
      rng_(std::random_device{}()) {}

std::string UploadAuthority::make_key_locked(const std::string& collection_id,
                                             upload::FileCategory category,
                                             const std::string& filename) {
    const std::string prefix =
        "collections/" + collection_slug(collection_id) + "/" + upload::to_string(category) + "/";
    const std::string name = sanitize_filename(filename);
    const auto& issued = collections_[collection_id].issued;
    for (;;) {
        std::ostringstream nonce;
        nonce << std::hex << std::setw(12) << std::setfill('0') << (rng_() & 0xffffffffffffULL);
        std::string key = prefix + nonce.str() + "-" + name;
        if (issued.count(key) == 0) {
            return key;
        }
    }
}

directup::Result<std::vector<upload::WriteCredential>>
UploadAuthority::issue_credentials(const std::string& collection_id,
                                   const std::vector<upload::CredentialRequestItem>& files) {
    using Credentials = std::vector<upload::WriteCredential>;

    if (collection_id.empty()) {
        return directup::Fail<Credentials>(ErrorKind::Validation, "Collection id is required");
    }
    if (files.empty()) {
        return directup::Fail<Credentials>(ErrorKind::Validation, "No files provided");
    }
    if (files.size() > config_.max_files_per_request) {
        return directup::Fail<Credentials>(ErrorKind::Validation,
                                           "Too many files: " + std::to_string(files.size()) + " (max " +
                                               std::to_string(config_.max_files_per_request) + ")");
    }

    std::vector<upload::Classification> classes;
    classes.reserve(files.size());
    for (const auto& file : files) {
        auto classified = classifier_.validate(file.filename, file.size);
        if (classified.is_error()) {
            spdlog::warn("[Authority] collection={} request rejected: {}", collection_id,
                         classified.error().message);
            return directup::Err<Credentials>(classified.error());
        }
        classes.push_back(classified.value());
    }

    std::lock_guard lock(mutex_);
    purge_unconfirmed_locked(std::chrono::system_clock::now());

    Credentials credentials;
    std::vector<std::pair<std::string, IssuedObject>> pending;
    credentials.reserve(files.size());
    pending.reserve(files.size());
    std::unordered_set<std::string> batch_keys;
    std::uint64_t declared = 0;

    for (std::size_t i = 0; i < files.size(); ++i) {
        const auto& file = files[i];
        std::string key;
        do {
            key = make_key_locked(collection_id, classes[i].category, file.filename);
        } while (!batch_keys.insert(key).second);

        const auto content_type = file.content_type.empty()
                                      ? upload::FileClassifier::guess_content_type(file.filename)
                                      : file.content_type;
        auto grant = store_->issue_write_url(key, content_type, config_.credential_ttl);
        if (grant.is_error()) {
            spdlog::error("[Authority] collection={} could not issue URL for {}: {}", collection_id, key,
                          grant.error().message);
            return directup::Err<Credentials>(grant.error());
        }

        credentials.push_back(upload::WriteCredential{key, grant.value().url, grant.value().expires_at});
        pending.emplace_back(key, IssuedObject{file.filename, content_type, file.size, classes[i].category,
                                               grant.value().expires_at});
        declared += file.size;
    }

    auto& collection = collections_[collection_id];
    for (auto& [key, issued] : pending) {
        collection.issued.emplace(key, std::move(issued));
    }

    spdlog::info("[Authority] collection={} issued {} credentials ({} bytes declared)",
                 collection_id, credentials.size(), declared);
    event_bus_.emit(events::CredentialsIssuedEvent{collection_id, credentials.size(), declared});
    return directup::Ok(std::move(credentials));
}

directup::Result<upload::WriteCredential> UploadAuthority::refresh_credential(const std::string& collection_id,
                                                                              const std::string& key) {
    std::lock_guard lock(mutex_);
    const auto collection = collections_.find(collection_id);
    if (collection == collections_.end()) {
        return directup::Fail<upload::WriteCredential>(ErrorKind::NotFound, "Unknown collection " + collection_id);
    }
    const auto issued = collection->second.issued.find(key);
    if (issued == collection->second.issued.end()) {
        return directup::Fail<upload::WriteCredential>(ErrorKind::NotFound,
                                                       "Key was not issued to this collection: " + key);
    }
    if (collection->second.manifest.count(key) > 0) {
        return directup::Fail<upload::WriteCredential>(ErrorKind::Credential, "Object already confirmed: " + key);
    }

    auto grant = store_->issue_write_url(key, issued->second.content_type, config_.credential_ttl);
    if (grant.is_error()) {
        return directup::Err<upload::WriteCredential>(grant.error());
    }
    issued->second.expires_at = grant.value().expires_at;
    spdlog::info("[Authority] collection={} refreshed credential for {}", collection_id, key);
    return directup::Ok(upload::WriteCredential{key, grant.value().url, grant.value().expires_at});
}

std::string UploadAuthority::verify_locked(const std::string& key, const IssuedObject& issued,
                                           const upload::ConfirmationItem& claim, std::uint64_t& actual_size,
                                           bool& size_mismatch) {
    auto head = store_->head(key);
    if (head.is_error()) {
        if (head.error().kind == ErrorKind::NotFound) {
            return "File not found in storage";
        }
        return "Storage check failed: " + head.error().message;
    }

    actual_size = head.value().size;
    const auto distance = [](std::uint64_t a, std::uint64_t b) { return a > b ? a - b : b - a; };
    if (distance(actual_size, issued.declared_size) > config_.size_tolerance_bytes ||
        distance(claim.size, issued.declared_size) > config_.size_tolerance_bytes) {
        size_mismatch = true;
        return "Size mismatch: declared " + std::to_string(issued.declared_size) + " bytes, stored " +
               std::to_string(actual_size) + " bytes";
    }

    const auto limit = config_.limits.limit_for(issued.category);
    if (actual_size > limit) {
        return "File exceeds " + std::string(upload::to_string(issued.category)) + " limit of " +
               upload::format_megabytes(limit, 0) + "MB";
    }
    return {};
}

directup::Result<upload::ConfirmationResult>
UploadAuthority::confirm_uploads(const std::string& collection_id,
                                 const std::vector<upload::ConfirmationItem>& uploads) {
    if (collection_id.empty()) {
        return directup::Fail<upload::ConfirmationResult>(ErrorKind::Validation, "Collection id is required");
    }
    if (uploads.empty()) {
        return directup::Fail<upload::ConfirmationResult>(ErrorKind::Validation, "No uploads to confirm");
    }

    std::lock_guard lock(mutex_);
    auto& collection = collections_[collection_id];
    upload::ConfirmationResult result;
    std::unordered_set<std::string> seen;

    for (const auto& claim : uploads) {
        if (!seen.insert(claim.key).second) {
            continue;
        }

        const auto issued = collection.issued.find(claim.key);
        if (issued == collection.issued.end()) {
            // Not ours to delete: the key may belong to another collection.
            const std::string reason = "Key was not issued to this collection";
            spdlog::warn("[Authority] collection={} rejected {}: {}", collection_id, claim.key, reason);
            result.deleted_files.push_back(upload::DeletedFile{claim.key, claim.filename, reason});
            event_bus_.emit(events::ObjectRejectedEvent{collection_id, claim.key, claim.filename, reason, false});
            continue;
        }

        result.total_declared_size += issued->second.declared_size;
        std::uint64_t actual = 0;
        const auto reason = verify_locked(claim.key, issued->second, claim, actual, result.size_mismatch);
        result.total_actual_size += actual;

        if (!reason.empty()) {
            bool deleted = false;
            auto removed = store_->remove(claim.key);
            if (removed.is_error()) {
                spdlog::error("[Authority] collection={} could not delete {}: {}", collection_id, claim.key,
                              removed.error().message);
                revoke_logged(*store_, claim.key);
            } else {
                deleted = true;
            }
            spdlog::warn("[Authority] collection={} rejected {}: {}", collection_id, claim.key, reason);
            result.deleted_files.push_back(upload::DeletedFile{claim.key, issued->second.filename, reason});
            event_bus_.emit(
                events::ObjectRejectedEvent{collection_id, claim.key, issued->second.filename, reason, deleted});
            collection.manifest.erase(claim.key);
            collection.issued.erase(issued);
            continue;
        }

        // Confirmed bytes are final: the write URL must not be replayed over them.
        revoke_logged(*store_, claim.key);
        ++result.confirmed_count;
        const bool newly_recorded = collection.manifest.count(claim.key) == 0;
        if (newly_recorded) {
            collection.manifest.emplace(
                claim.key, ManifestEntry{claim.key, issued->second.filename, issued->second.content_type, actual,
                                         issued->second.category, std::chrono::system_clock::now()});
        }
        event_bus_.emit(events::ObjectConfirmedEvent{collection_id, claim.key, actual, newly_recorded});
    }

    result.deleted_count = result.deleted_files.size();
    result.success = result.deleted_count == 0;
    if (!result.success) {
        result.error = std::to_string(result.deleted_count) + " file(s) failed verification";
    }

    spdlog::info("[Authority] collection={} confirmation: confirmed={} deleted={} declared={} actual={}",
                 collection_id, result.confirmed_count, result.deleted_count, result.total_declared_size,
                 result.total_actual_size);
    return directup::Ok(std::move(result));
}

directup::Result<std::size_t> UploadAuthority::discard_uploads(const std::string& collection_id,
                                                              const std::vector<std::string>& keys) {
    if (collection_id.empty()) {
        return directup::Fail<std::size_t>(ErrorKind::Validation, "Collection id is required");
    }

    std::lock_guard lock(mutex_);
    const auto collection = collections_.find(collection_id);
    if (collection == collections_.end()) {
        return directup::Ok<std::size_t>(0);
    }

    std::size_t discarded = 0;
    for (const auto& key : keys) {
        const auto& state = collection->second;
        if (state.issued.count(key) == 0 || state.manifest.count(key) > 0) {
            spdlog::debug("[Authority] collection={} ignoring discard of {}", collection_id, key);
            continue;
        }
        discard_locked(collection_id, key, "Discarded by uploader");
        ++discarded;
    }
    spdlog::info("[Authority] collection={} discarded {} of {} keys", collection_id, discarded, keys.size());
    return directup::Ok(discarded);
}

std::size_t UploadAuthority::purge_unconfirmed(std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    return purge_unconfirmed_locked(now);
}

std::size_t UploadAuthority::purge_unconfirmed_locked(std::chrono::system_clock::time_point now) {
    std::vector<std::pair<std::string, std::string>> stale;
    for (const auto& [collection_id, collection] : collections_) {
        for (const auto& [key, issued] : collection.issued) {
            if (collection.manifest.count(key) == 0 && issued.expires_at + config_.unconfirmed_grace < now) {
                stale.emplace_back(collection_id, key);
            }
        }
    }
    for (const auto& [collection_id, key] : stale) {
        discard_locked(collection_id, key, "Expired without confirmation");
    }
    if (!stale.empty()) {
        spdlog::info("[Authority] purged {} unconfirmed keys", stale.size());
    }
    return stale.size();
}

void UploadAuthority::discard_locked(const std::string& collection_id, const std::string& key,
                                     const std::string& reason) {
    bool deleted = false;
    auto removed = store_->remove(key);
    if (removed.is_error()) {
        spdlog::error("[Authority] collection={} could not delete {}: {}", collection_id, key,
                      removed.error().message);
        revoke_logged(*store_, key);
    } else {
        deleted = true;
    }
    collections_[collection_id].issued.erase(key);
    event_bus_.emit(events::ObjectDiscardedEvent{collection_id, key, reason, deleted});
}

std::vector<ManifestEntry> UploadAuthority::manifest(const std::string& collection_id) const {
    std::lock_guard lock(mutex_);
    std::vector<ManifestEntry> entries;
    const auto it = collections_.find(collection_id);
    if (it == collections_.end()) {
        return entries;
    }
    entries.reserve(it->second.manifest.size());
    for (const auto& [key, entry] : it->second.manifest) {
        entries.push_back(entry);
    }
    return entries;
}

} // namespace directup::authority
