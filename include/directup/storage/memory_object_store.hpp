#pragma once

#include "directup/storage/object_store.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

namespace directup::storage {

/**
 * @brief Thread-safe in-memory bucket with tokenized write URLs
 *
 * URLs have the form `<base>/objects/<key>?expires=<unix>&token=<hex>`.
 * A write is accepted only with the token most recently issued for the
 * key, before its expiry, and only once; anything else is a Credential
 * error that the HTTP layer reports as 403.
 */
class MemoryObjectStore : public ObjectStore {
public:
    explicit MemoryObjectStore(std::string base_url);

    directup::Result<WriteGrant> issue_write_url(const std::string& key,
                                                 const std::string& content_type,
                                                 std::chrono::seconds ttl) override;
    directup::Result<ObjectInfo> head(const std::string& key) override;
    directup::Result<void> remove(const std::string& key) override;
    directup::Result<void> revoke_write(const std::string& key) override;

    /// Authenticated write, as performed by `PUT /objects/<key>`.
    directup::Result<ObjectInfo> put(const std::string& key,
                                     const std::string& token,
                                     std::int64_t expires,
                                     std::string body,
                                     const std::string& content_type = {});

    /// Parses a URL previously returned by issue_write_url() and writes through it.
    directup::Result<ObjectInfo> put_url(const std::string& url, std::string body,
                                         const std::string& content_type = {});

    /// Stores bytes without any credential check.
    void put_object(const std::string& key, std::string body, const std::string& content_type = {});

    [[nodiscard]] std::optional<std::string> read(const std::string& key) const;
    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] bool has_write_grant(const std::string& key) const;
    [[nodiscard]] std::size_t object_count() const;
    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }

private:
    struct Grant {
        std::string token;
        std::string content_type;
        std::chrono::system_clock::time_point expires_at;
    };

    struct StoredObject {
        std::string body;
        std::string content_type;
        std::chrono::system_clock::time_point stored_at;
    };

    std::string make_token();

    std::string base_url_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Grant> grants_;
    std::unordered_map<std::string, StoredObject> objects_;
    std::mt19937_64 rng_;
};

} // namespace directup::storage
