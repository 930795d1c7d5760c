#include "directup/net/http_broker.hpp"

#include "directup/authority/json_codec.hpp"

#include <spdlog/spdlog.h>

namespace directup::net {
namespace {

namespace codec = authority::codec;
namespace http = boost::beast::http;

std::string collection_path(const std::string& collection_id, const std::string& action) {
    return "/api/collections/" + encode_path_segment(collection_id) + "/" + action;
}

/// Decodes a response body; non-2xx statuses become errors of `kind`.
directup::Result<codec::json> decode_body(const HttpResponse& response, ErrorKind kind, const char* what) {
    auto parsed = codec::parse(response.body);
    if (!response.ok()) {
        std::string message = std::string(what) + " failed with status " + std::to_string(response.status);
        if (parsed.is_ok() && parsed.value().is_object() && parsed.value().contains("error") &&
            parsed.value().at("error").is_string()) {
            message = parsed.value().at("error").get<std::string>();
        }
        return directup::Fail<codec::json>(kind, message);
    }
    return parsed;
}

} // namespace

directup::Result<HttpResponse> HttpCredentialBroker::post(const std::string& collection_id,
                                                          const std::string& action,
                                                          const std::string& body,
                                                          std::chrono::milliseconds timeout) {
    return client_.request(http::verb::post, collection_path(collection_id, action), body, timeout);
}

directup::Result<std::vector<upload::WriteCredential>>
HttpCredentialBroker::request_credentials(const std::string& collection_id,
                                          const std::vector<upload::CredentialRequestItem>& files) {
    using Credentials = std::vector<upload::WriteCredential>;

    auto response = post(collection_id, "upload-urls", codec::encode_credential_request(files).dump(),
                         request_timeout_);
    if (response.is_error()) {
        return directup::Err<Credentials>(response.error());
    }
    auto body = decode_body(response.value(), ErrorKind::Credential, "Credential request");
    if (body.is_error()) {
        return directup::Err<Credentials>(body.error());
    }
    return codec::decode_credentials(body.value());
}

directup::Result<upload::WriteCredential>
HttpCredentialBroker::refresh_credential(const std::string& collection_id, const std::string& key) {
    auto response = post(collection_id, "refresh-url", codec::encode_refresh_request(key).dump(),
                         request_timeout_);
    if (response.is_error()) {
        return directup::Err<upload::WriteCredential>(response.error());
    }
    auto body = decode_body(response.value(), ErrorKind::Credential, "Credential refresh");
    if (body.is_error()) {
        return directup::Err<upload::WriteCredential>(body.error());
    }
    return codec::decode_credential(body.value());
}

directup::Result<upload::ConfirmationResult>
HttpCredentialBroker::confirm_uploads(const std::string& collection_id,
                                      const std::vector<upload::ConfirmationItem>& uploads,
                                      std::chrono::milliseconds timeout) {
    auto response = post(collection_id, "confirm-uploads", codec::encode_confirmation_request(uploads).dump(),
                         timeout);
    if (response.is_error()) {
        spdlog::error("[Broker] confirm-uploads for {} failed: {}", collection_id, response.error().message);
        return directup::Err<upload::ConfirmationResult>(response.error());
    }
    auto body = decode_body(response.value(), ErrorKind::Confirmation, "Upload confirmation");
    if (body.is_error()) {
        return directup::Err<upload::ConfirmationResult>(body.error());
    }
    return codec::decode_confirmation(body.value());
}

directup::Result<std::size_t> HttpCredentialBroker::discard_uploads(const std::string& collection_id,
                                                                    const std::vector<std::string>& keys) {
    auto response = post(collection_id, "discard-uploads", codec::encode_discard_request(keys).dump(),
                         request_timeout_);
    if (response.is_error()) {
        return directup::Err<std::size_t>(response.error());
    }
    auto body = decode_body(response.value(), ErrorKind::Confirmation, "Discard");
    if (body.is_error()) {
        return directup::Err<std::size_t>(body.error());
    }
    return codec::decode_discard_result(body.value());
}

directup::Result<std::string> HttpCredentialBroker::fetch_manifest(const std::string& collection_id) {
    auto response = client_.request(http::verb::get, collection_path(collection_id, "manifest"), {},
                                    request_timeout_);
    if (response.is_error()) {
        return directup::Err<std::string>(response.error());
    }
    if (!response.value().ok()) {
        return directup::Fail<std::string>(ErrorKind::NotFound,
                                           "Manifest request failed with status " +
                                               std::to_string(response.value().status));
    }
    return directup::Ok(std::move(response.value().body));
}

} // namespace directup::net
