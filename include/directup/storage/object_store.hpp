#pragma once

#include "directup/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace directup::storage {

struct ObjectInfo {
    std::string key;
    std::uint64_t size = 0;
    std::string content_type;
    std::chrono::system_clock::time_point stored_at{};
};

struct WriteGrant {
    std::string url;
    std::chrono::system_clock::time_point expires_at{};
};

/**
 * @brief The two primitives the authority needs from object storage
 *
 * Issue a time-limited write URL for a key, then check what actually
 * landed there. head() fails with ErrorKind::NotFound for missing keys.
 * A write URL is good for one successful write; revoke_write() withdraws
 * it early.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual directup::Result<WriteGrant> issue_write_url(const std::string& key,
                                                         const std::string& content_type,
                                                         std::chrono::seconds ttl) = 0;

    virtual directup::Result<ObjectInfo> head(const std::string& key) = 0;

    /// Removing a missing key is not an error.
    virtual directup::Result<void> remove(const std::string& key) = 0;

    /// Invalidates any outstanding write URL for `key`; the object stays.
    virtual directup::Result<void> revoke_write(const std::string& key) = 0;
};

} // namespace directup::storage
