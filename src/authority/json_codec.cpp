#include "directup/authority/json_codec.hpp"

#include <stdexcept>

namespace directup::authority::codec {
namespace {

std::int64_t to_unix(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_unix(std::int64_t seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

const json& require_array(const json& body, const char* field) {
    if (!body.is_object() || !body.contains(field) || !body.at(field).is_array()) {
        throw std::invalid_argument(std::string("\"") + field + "\" must be an array");
    }
    return body.at(field);
}

/// Runs a decoder, turning JSON access errors into Parse errors.
template<typename T, typename Fn>
directup::Result<T> decode(const char* what, Fn&& fn) {
    try {
        return directup::Ok(fn());
    } catch (const json::exception& e) {
        return directup::Fail<T>(ErrorKind::Parse, std::string("Malformed ") + what + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        return directup::Fail<T>(ErrorKind::Parse, std::string("Malformed ") + what + ": " + e.what());
    }
}

std::string remote_error(const json& body, const char* fallback) {
    if (body.is_object() && body.contains("error") && body.at("error").is_string()) {
        return body.at("error").get<std::string>();
    }
    return fallback;
}

} // namespace

json encode_credential_request(const std::vector<upload::CredentialRequestItem>& files) {
    json list = json::array();
    for (const auto& file : files) {
        list.push_back({{"filename", file.filename}, {"contentType", file.content_type}, {"size", file.size}});
    }
    return json{{"files", list}};
}

directup::Result<std::vector<upload::CredentialRequestItem>> decode_credential_request(const json& body) {
    return decode<std::vector<upload::CredentialRequestItem>>("credential request", [&] {
        std::vector<upload::CredentialRequestItem> files;
        for (const auto& entry : require_array(body, "files")) {
            files.push_back(upload::CredentialRequestItem{
                entry.at("filename").get<std::string>(),
                entry.value("contentType", std::string{}),
                entry.at("size").get<std::uint64_t>()});
        }
        return files;
    });
}

json encode_credentials(const std::vector<upload::CredentialRequestItem>& files,
                        const std::vector<upload::WriteCredential>& credentials) {
    json urls = json::array();
    for (std::size_t i = 0; i < credentials.size(); ++i) {
        json entry = encode_credential(credentials[i]);
        entry.erase("success");
        if (i < files.size()) {
            entry["filename"] = files[i].filename;
        }
        urls.push_back(std::move(entry));
    }
    return json{{"success", true}, {"urls", urls}};
}

directup::Result<std::vector<upload::WriteCredential>> decode_credentials(const json& body) {
    if (body.is_object() && !body.value("success", false)) {
        return directup::Fail<std::vector<upload::WriteCredential>>(
            ErrorKind::Credential, remote_error(body, "Failed to get upload URLs"));
    }
    return decode<std::vector<upload::WriteCredential>>("credential response", [&] {
        std::vector<upload::WriteCredential> credentials;
        for (const auto& entry : require_array(body, "urls")) {
            credentials.push_back(upload::WriteCredential{entry.at("key").get<std::string>(),
                                                          entry.at("url").get<std::string>(),
                                                          from_unix(entry.at("expiresAt").get<std::int64_t>())});
        }
        return credentials;
    });
}

json encode_refresh_request(const std::string& key) {
    return json{{"key", key}};
}

directup::Result<std::string> decode_refresh_request(const json& body) {
    return decode<std::string>("refresh request", [&] { return body.at("key").get<std::string>(); });
}

json encode_credential(const upload::WriteCredential& credential) {
    return json{{"success", true},
                {"key", credential.key},
                {"url", credential.url},
                {"expiresAt", to_unix(credential.expires_at)}};
}

directup::Result<upload::WriteCredential> decode_credential(const json& body) {
    if (body.is_object() && !body.value("success", false)) {
        return directup::Fail<upload::WriteCredential>(ErrorKind::Credential,
                                                       remote_error(body, "Credential refresh failed"));
    }
    return decode<upload::WriteCredential>("refresh response", [&] {
        return upload::WriteCredential{body.at("key").get<std::string>(), body.at("url").get<std::string>(),
                                       from_unix(body.at("expiresAt").get<std::int64_t>())};
    });
}

json encode_confirmation_request(const std::vector<upload::ConfirmationItem>& uploads) {
    json list = json::array();
    for (const auto& item : uploads) {
        list.push_back({{"filename", item.filename}, {"key", item.key}, {"size", item.size}});
    }
    return json{{"uploadedFiles", list}};
}

directup::Result<std::vector<upload::ConfirmationItem>> decode_confirmation_request(const json& body) {
    return decode<std::vector<upload::ConfirmationItem>>("confirmation request", [&] {
        std::vector<upload::ConfirmationItem> items;
        for (const auto& entry : require_array(body, "uploadedFiles")) {
            items.push_back(upload::ConfirmationItem{entry.value("filename", std::string{}),
                                                     entry.at("key").get<std::string>(),
                                                     entry.at("size").get<std::uint64_t>()});
        }
        return items;
    });
}

json encode_confirmation(const upload::ConfirmationResult& result) {
    json deleted = json::array();
    for (const auto& file : result.deleted_files) {
        deleted.push_back({{"key", file.key}, {"filename", file.filename}, {"reason", file.reason}});
    }
    json body{{"success", result.success},
              {"confirmedCount", result.confirmed_count},
              {"deletedCount", result.deleted_count},
              {"deletedFiles", deleted},
              {"sizeMismatch", result.size_mismatch},
              {"totalDeclaredSize", result.total_declared_size},
              {"totalActualSize", result.total_actual_size}};
    if (!result.error.empty()) {
        body["error"] = result.error;
    }
    return body;
}

directup::Result<upload::ConfirmationResult> decode_confirmation(const json& body) {
    return decode<upload::ConfirmationResult>("confirmation response", [&] {
        if (!body.is_object() || !body.contains("confirmedCount")) {
            throw std::invalid_argument(remote_error(body, "missing \"confirmedCount\""));
        }
        upload::ConfirmationResult result;
        result.success = body.at("success").get<bool>();
        result.confirmed_count = body.at("confirmedCount").get<std::size_t>();
        result.deleted_count = body.value("deletedCount", std::size_t{0});
        result.size_mismatch = body.value("sizeMismatch", false);
        result.total_declared_size = body.value("totalDeclaredSize", std::uint64_t{0});
        result.total_actual_size = body.value("totalActualSize", std::uint64_t{0});
        result.error = body.value("error", std::string{});
        if (body.contains("deletedFiles")) {
            for (const auto& entry : require_array(body, "deletedFiles")) {
                result.deleted_files.push_back(upload::DeletedFile{entry.at("key").get<std::string>(),
                                                                   entry.value("filename", std::string{}),
                                                                   entry.value("reason", std::string{})});
            }
        }
        return result;
    });
}

json encode_discard_request(const std::vector<std::string>& keys) {
    return json{{"keys", keys}};
}

directup::Result<std::vector<std::string>> decode_discard_request(const json& body) {
    return decode<std::vector<std::string>>("discard request", [&] {
        return require_array(body, "keys").get<std::vector<std::string>>();
    });
}

json encode_discard_result(std::size_t discarded) {
    return json{{"success", true}, {"discardedCount", discarded}};
}

directup::Result<std::size_t> decode_discard_result(const json& body) {
    if (body.is_object() && !body.value("success", false)) {
        return directup::Fail<std::size_t>(ErrorKind::Confirmation, remote_error(body, "Discard failed"));
    }
    return decode<std::size_t>("discard response", [&] { return body.at("discardedCount").get<std::size_t>(); });
}

json encode_manifest(const std::string& collection_id, const std::vector<ManifestEntry>& entries) {
    json objects = json::array();
    for (const auto& entry : entries) {
        objects.push_back({{"key", entry.key},
                           {"filename", entry.filename},
                           {"contentType", entry.content_type},
                           {"size", entry.size},
                           {"category", upload::to_string(entry.category)},
                           {"confirmedAt", to_unix(entry.confirmed_at)}});
    }
    return json{{"success", true}, {"collectionId", collection_id}, {"objects", objects}};
}

json encode_error(const std::string& message) {
    return json{{"success", false}, {"error", message}};
}

directup::Result<json> parse(const std::string& text) {
    try {
        return directup::Ok(json::parse(text));
    } catch (const json::parse_error& e) {
        return directup::Fail<json>(ErrorKind::Parse, std::string("Invalid JSON: ") + e.what());
    }
}

} // namespace directup::authority::codec
