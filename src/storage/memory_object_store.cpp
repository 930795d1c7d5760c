#include "directup/storage/memory_object_store.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <sstream>

namespace directup::storage {
namespace {

std::int64_t to_unix(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::string query_param(const std::string& query, const std::string& name) {
    std::size_t pos = 0;
    while (pos < query.size()) {
        auto end = query.find('&', pos);
        if (end == std::string::npos) {
            end = query.size();
        }
        const auto pair = query.substr(pos, end - pos);
        const auto eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == name) {
            return pair.substr(eq + 1);
        }
        pos = end + 1;
    }
    return {};
}

} // namespace

MemoryObjectStore::MemoryObjectStore(std::string base_url)
    : base_url_(std::move(base_url)), rng_(std::random_device{}()) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string MemoryObjectStore::make_token() {
    std::ostringstream oss;
    for (int i = 0; i < 2; ++i) {
        oss << std::hex << std::setw(16) << std::setfill('0') << rng_();
    }
    return oss.str();
}

directup::Result<WriteGrant> MemoryObjectStore::issue_write_url(const std::string& key,
                                                                const std::string& content_type,
                                                                std::chrono::seconds ttl) {
    if (key.empty()) {
        return directup::Fail<WriteGrant>(ErrorKind::Validation, "Object key must not be empty");
    }

    std::lock_guard lock(mutex_);
    const auto expires_at = std::chrono::system_clock::now() + ttl;
    Grant grant{make_token(), content_type, expires_at};

    WriteGrant issued;
    issued.expires_at = expires_at;
    issued.url = base_url_ + "/objects/" + key + "?expires=" + std::to_string(to_unix(expires_at)) +
                 "&token=" + grant.token;
    grants_[key] = std::move(grant);
    return directup::Ok(std::move(issued));
}

directup::Result<ObjectInfo> MemoryObjectStore::head(const std::string& key) {
    std::lock_guard lock(mutex_);
    const auto it = objects_.find(key);
    if (it == objects_.end()) {
        return directup::Fail<ObjectInfo>(ErrorKind::NotFound, "Object not found: " + key);
    }
    return directup::Ok(ObjectInfo{key, it->second.body.size(), it->second.content_type, it->second.stored_at});
}

directup::Result<void> MemoryObjectStore::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    objects_.erase(key);
    grants_.erase(key);
    return directup::Ok();
}

directup::Result<void> MemoryObjectStore::revoke_write(const std::string& key) {
    std::lock_guard lock(mutex_);
    grants_.erase(key);
    return directup::Ok();
}

directup::Result<ObjectInfo> MemoryObjectStore::put(const std::string& key,
                                                    const std::string& token,
                                                    std::int64_t expires,
                                                    std::string body,
                                                    const std::string& content_type) {
    std::lock_guard lock(mutex_);
    const auto grant = grants_.find(key);
    if (grant == grants_.end() || token.empty() || grant->second.token != token) {
        spdlog::warn("[Storage] Rejected write to {}: invalid token", key);
        return directup::Fail<ObjectInfo>(ErrorKind::Credential, "Invalid write token for " + key);
    }
    const auto now = std::chrono::system_clock::now();
    if (now >= grant->second.expires_at || to_unix(grant->second.expires_at) != expires) {
        spdlog::warn("[Storage] Rejected write to {}: credential expired", key);
        return directup::Fail<ObjectInfo>(ErrorKind::Credential, "Write credential expired for " + key);
    }

    StoredObject object{std::move(body), content_type.empty() ? grant->second.content_type : content_type, now};
    ObjectInfo info{key, object.body.size(), object.content_type, now};
    objects_[key] = std::move(object);
    // Write URLs are single use.
    grants_.erase(grant);
    spdlog::debug("[Storage] Stored {} ({} bytes)", key, info.size);
    return directup::Ok(std::move(info));
}

directup::Result<ObjectInfo> MemoryObjectStore::put_url(const std::string& url, std::string body,
                                                        const std::string& content_type) {
    const std::string marker = "/objects/";
    const auto start = url.find(marker);
    if (start == std::string::npos) {
        return directup::Fail<ObjectInfo>(ErrorKind::Parse, "Not an object URL: " + url);
    }
    const auto query_start = url.find('?', start);
    const auto key = url.substr(start + marker.size(),
                                query_start == std::string::npos ? std::string::npos
                                                                 : query_start - start - marker.size());
    const auto query = query_start == std::string::npos ? std::string{} : url.substr(query_start + 1);

    std::int64_t expires = 0;
    try {
        expires = std::stoll(query_param(query, "expires"));
    } catch (const std::exception&) {
        return directup::Fail<ObjectInfo>(ErrorKind::Credential, "Missing expiry in " + url);
    }
    return put(key, query_param(query, "token"), expires, std::move(body), content_type);
}

void MemoryObjectStore::put_object(const std::string& key, std::string body, const std::string& content_type) {
    std::lock_guard lock(mutex_);
    objects_[key] = StoredObject{std::move(body), content_type, std::chrono::system_clock::now()};
}

std::optional<std::string> MemoryObjectStore::read(const std::string& key) const {
    std::lock_guard lock(mutex_);
    const auto it = objects_.find(key);
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second.body;
}

bool MemoryObjectStore::contains(const std::string& key) const {
    std::lock_guard lock(mutex_);
    return objects_.count(key) > 0;
}

bool MemoryObjectStore::has_write_grant(const std::string& key) const {
    std::lock_guard lock(mutex_);
    return grants_.count(key) > 0;
}

std::size_t MemoryObjectStore::object_count() const {
    std::lock_guard lock(mutex_);
    return objects_.size();
}

} // namespace directup::storage
