/**
 * @file json_codec.hpp
 * @brief JSON bodies exchanged between the uploader and the authority
 *
 * POST /api/collections/<id>/upload-urls
 *   request  {"files":[{"filename","contentType","size"}]}
 *   response {"success":true,"urls":[{"filename","key","url","expiresAt"}]}
 * POST /api/collections/<id>/refresh-url
 *   request  {"key"}
 *   response {"success":true,"key","url","expiresAt"}
 * POST /api/collections/<id>/confirm-uploads
 *   request  {"uploadedFiles":[{"filename","key","size"}]}
 *   response {"success","confirmedCount","deletedCount","deletedFiles":[{"key","filename","reason"}],
 *             "sizeMismatch","totalDeclaredSize","totalActualSize","error"}
 * POST /api/collections/<id>/discard-uploads
 *   request  {"keys":["..."]}
 *   response {"success":true,"discardedCount"}
 *
 * Errors on any endpoint: {"success":false,"error":"..."}.
 * `expiresAt` is seconds since the Unix epoch.
 */

#pragma once

#include "directup/authority/upload_authority.hpp"
#include "directup/core/result.hpp"
#include "directup/upload/broker.hpp"
#include "directup/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace directup::authority::codec {

using json = nlohmann::json;

json encode_credential_request(const std::vector<upload::CredentialRequestItem>& files);
directup::Result<std::vector<upload::CredentialRequestItem>> decode_credential_request(const json& body);

json encode_credentials(const std::vector<upload::CredentialRequestItem>& files,
                        const std::vector<upload::WriteCredential>& credentials);
directup::Result<std::vector<upload::WriteCredential>> decode_credentials(const json& body);

json encode_refresh_request(const std::string& key);
directup::Result<std::string> decode_refresh_request(const json& body);

json encode_credential(const upload::WriteCredential& credential);
directup::Result<upload::WriteCredential> decode_credential(const json& body);

json encode_confirmation_request(const std::vector<upload::ConfirmationItem>& uploads);
directup::Result<std::vector<upload::ConfirmationItem>> decode_confirmation_request(const json& body);

json encode_confirmation(const upload::ConfirmationResult& result);
directup::Result<upload::ConfirmationResult> decode_confirmation(const json& body);

json encode_discard_request(const std::vector<std::string>& keys);
directup::Result<std::vector<std::string>> decode_discard_request(const json& body);

json encode_discard_result(std::size_t discarded);
directup::Result<std::size_t> decode_discard_result(const json& body);

json encode_manifest(const std::string& collection_id, const std::vector<ManifestEntry>& entries);

json encode_error(const std::string& message);

/// Parses text into JSON, mapping syntax errors onto ErrorKind::Parse.
directup::Result<json> parse(const std::string& text);

} // namespace directup::authority::codec
