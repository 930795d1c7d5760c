#include "directup/authority/json_codec.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

namespace codec = directup::authority::codec;
using codec::json;
using directup::ErrorKind;

TEST(JsonCodecTest, CredentialRequestUsesCamelCase) {
    auto body = codec::encode_credential_request({{"a.jpg", "image/jpeg", 12}});

    ASSERT_TRUE(body["files"].is_array());
    EXPECT_EQ(body["files"][0]["filename"], "a.jpg");
    EXPECT_EQ(body["files"][0]["contentType"], "image/jpeg");
    EXPECT_EQ(body["files"][0]["size"], 12);
}

TEST(JsonCodecTest, DecodesCredentialRequestWithoutContentType) {
    auto decoded = codec::decode_credential_request(json::parse(R"({"files":[{"filename":"a.nef","size":7}]})"));

    ASSERT_TRUE(decoded.is_ok());
    ASSERT_EQ(decoded.value().size(), 1u);
    EXPECT_EQ(decoded.value()[0].filename, "a.nef");
    EXPECT_EQ(decoded.value()[0].content_type, "");
    EXPECT_EQ(decoded.value()[0].size, 7u);
}

TEST(JsonCodecTest, MalformedRequestIsParseError) {
    auto missing = codec::decode_credential_request(json::parse(R"({"files":[{"size":7}]})"));
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::Parse);

    auto wrong_type = codec::decode_credential_request(json::parse(R"({"files":{}})"));
    ASSERT_TRUE(wrong_type.is_error());
    EXPECT_EQ(wrong_type.error().kind, ErrorKind::Parse);

    auto negative = codec::decode_confirmation_request(
        json::parse(R"({"uploadedFiles":[{"key":"k","size":"ten"}]})"));
    ASSERT_TRUE(negative.is_error());
    EXPECT_EQ(negative.error().kind, ErrorKind::Parse);
}

TEST(JsonCodecTest, CredentialsCarryFilenameAndUnixExpiry) {
    const auto expires = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    auto body = codec::encode_credentials({{"a.jpg", "", 1}}, {{"k/a", "http://s/k/a?token=t", expires}});

    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["urls"][0]["filename"], "a.jpg");
    EXPECT_EQ(body["urls"][0]["expiresAt"], 1700000000);
    EXPECT_FALSE(body["urls"][0].contains("success"));

    auto decoded = codec::decode_credentials(body);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value()[0].key, "k/a");
    EXPECT_EQ(decoded.value()[0].expires_at, expires);
}

TEST(JsonCodecTest, UnsuccessfulCredentialResponseIsCredentialError) {
    auto decoded = codec::decode_credentials(codec::encode_error("Too many files: 600 (max 500)"));

    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().kind, ErrorKind::Credential);
    EXPECT_EQ(decoded.error().message, "Too many files: 600 (max 500)");

    auto no_flag = codec::decode_credential(json::parse(R"({"key":"k","url":"u","expiresAt":1})"));
    ASSERT_TRUE(no_flag.is_error());
    EXPECT_EQ(no_flag.error().message, "Credential refresh failed");
}

TEST(JsonCodecTest, ConfirmationResponseCarriesDeletedFiles) {
    directup::upload::ConfirmationResult result;
    result.success = false;
    result.confirmed_count = 1;
    result.deleted_count = 1;
    result.deleted_files.push_back({"k/b", "b.jpg", "File not found in storage"});
    result.size_mismatch = true;
    result.total_declared_size = 30;
    result.total_actual_size = 10;
    result.error = "1 file(s) failed verification";

    auto body = codec::encode_confirmation(result);
    EXPECT_EQ(body["confirmedCount"], 1);
    EXPECT_EQ(body["deletedFiles"][0]["reason"], "File not found in storage");
    EXPECT_EQ(body["sizeMismatch"], true);

    auto decoded = codec::decode_confirmation(body);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_FALSE(decoded.value().success);
    EXPECT_EQ(decoded.value().deleted_count, 1u);
    ASSERT_EQ(decoded.value().deleted_files.size(), 1u);
    EXPECT_EQ(decoded.value().deleted_files[0].filename, "b.jpg");
    EXPECT_EQ(decoded.value().total_actual_size, 10u);
    EXPECT_EQ(decoded.value().error, "1 file(s) failed verification");
}

TEST(JsonCodecTest, ErrorBodyIsNotAConfirmation) {
    auto decoded = codec::decode_confirmation(codec::encode_error("Collection id is required"));

    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().kind, ErrorKind::Parse);
    EXPECT_NE(decoded.error().message.find("Collection id is required"), std::string::npos);
}

TEST(JsonCodecTest, ParseReportsSyntaxErrors) {
    auto ok = codec::parse(R"({"key":"k"})");
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(codec::decode_refresh_request(ok.value()).value(), "k");

    auto bad = codec::parse("{not json");
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().kind, ErrorKind::Parse);
}

TEST(JsonCodecTest, ManifestListsObjects) {
    directup::authority::ManifestEntry entry;
    entry.key = "collections/c/gallery/1-a.jpg";
    entry.filename = "a.jpg";
    entry.content_type = "image/jpeg";
    entry.size = 4;
    entry.category = directup::upload::FileCategory::GalleryImage;

    auto body = codec::encode_manifest("c", {entry});

    EXPECT_EQ(body["collectionId"], "c");
    ASSERT_EQ(body["objects"].size(), 1u);
    EXPECT_EQ(body["objects"][0]["category"], "gallery");
    EXPECT_EQ(body["objects"][0]["size"], 4);
}

TEST(JsonCodecTest, DiscardBodies) {
    auto request = codec::decode_discard_request(json::parse(R"({"keys":["k/1","k/2"]})"));
    ASSERT_TRUE(request.is_ok());
    EXPECT_EQ(request.value(), (std::vector<std::string>{"k/1", "k/2"}));
    EXPECT_EQ(codec::decode_discard_request(json::parse(R"({"keys":[1]})")).error().kind, ErrorKind::Parse);

    EXPECT_EQ(codec::encode_discard_result(2)["discardedCount"], 2);
    EXPECT_EQ(codec::decode_discard_result(codec::encode_discard_result(2)).value(), 2u);
    EXPECT_EQ(codec::decode_discard_result(codec::encode_error("nope")).error().message, "nope");
}
