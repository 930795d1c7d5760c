#include "directup/storage/memory_object_store.hpp"

#include <gtest/gtest.h>

#include <chrono>

using directup::ErrorKind;
using directup::storage::MemoryObjectStore;

TEST(MemoryObjectStoreTest, IssuedUrlCarriesKeyExpiryAndToken) {
    MemoryObjectStore store("http://127.0.0.1:9000/");
    auto grant = store.issue_write_url("collections/a/other/1-x.bin", "application/octet-stream",
                                       std::chrono::seconds(60));

    ASSERT_TRUE(grant.is_ok());
    const auto& url = grant.value().url;
    EXPECT_EQ(url.rfind("http://127.0.0.1:9000/objects/collections/a/other/1-x.bin?expires=", 0), 0u) << url;
    EXPECT_NE(url.find("&token="), std::string::npos);
    EXPECT_GT(grant.value().expires_at, std::chrono::system_clock::now());
}

TEST(MemoryObjectStoreTest, WriteThroughIssuedUrlStoresObject) {
    MemoryObjectStore store("http://storage.test");
    auto grant = store.issue_write_url("k/1", "image/png", std::chrono::seconds(60));
    ASSERT_TRUE(grant.is_ok());

    auto stored = store.put_url(grant.value().url, "pixels");
    ASSERT_TRUE(stored.is_ok());
    EXPECT_EQ(stored.value().size, 6u);
    EXPECT_EQ(stored.value().content_type, "image/png");

    auto head = store.head("k/1");
    ASSERT_TRUE(head.is_ok());
    EXPECT_EQ(head.value().size, 6u);
    EXPECT_EQ(store.read("k/1").value(), "pixels");
}

TEST(MemoryObjectStoreTest, RejectsForgedToken) {
    MemoryObjectStore store("http://storage.test");
    auto grant = store.issue_write_url("k/1", "", std::chrono::seconds(60));
    ASSERT_TRUE(grant.is_ok());
    const auto expires = std::chrono::duration_cast<std::chrono::seconds>(
                             grant.value().expires_at.time_since_epoch()).count();

    auto forged = store.put("k/1", "deadbeef", expires, "evil");
    ASSERT_TRUE(forged.is_error());
    EXPECT_EQ(forged.error().kind, ErrorKind::Credential);
    EXPECT_FALSE(store.contains("k/1"));
}

TEST(MemoryObjectStoreTest, RejectsExpiredGrant) {
    MemoryObjectStore store("http://storage.test");
    auto grant = store.issue_write_url("k/1", "", std::chrono::seconds(0));
    ASSERT_TRUE(grant.is_ok());

    auto stored = store.put_url(grant.value().url, "late");
    ASSERT_TRUE(stored.is_error());
    EXPECT_EQ(stored.error().kind, ErrorKind::Credential);
}

TEST(MemoryObjectStoreTest, ReissueInvalidatesPreviousUrl) {
    MemoryObjectStore store("http://storage.test");
    auto first = store.issue_write_url("k/1", "", std::chrono::seconds(60));
    auto second = store.issue_write_url("k/1", "", std::chrono::seconds(60));
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    EXPECT_TRUE(store.put_url(first.value().url, "old").is_error());
    EXPECT_TRUE(store.put_url(second.value().url, "new").is_ok());
}

TEST(MemoryObjectStoreTest, HeadOfMissingObjectIsNotFound) {
    MemoryObjectStore store("http://storage.test");
    auto head = store.head("nope");
    ASSERT_TRUE(head.is_error());
    EXPECT_EQ(head.error().kind, ErrorKind::NotFound);
}

TEST(MemoryObjectStoreTest, RemoveDropsObjectAndGrant) {
    MemoryObjectStore store("http://storage.test");
    auto grant = store.issue_write_url("k/1", "", std::chrono::seconds(60));
    ASSERT_TRUE(grant.is_ok());
    ASSERT_TRUE(store.put_url(grant.value().url, "bytes").is_ok());

    EXPECT_TRUE(store.remove("k/1").is_ok());
    EXPECT_FALSE(store.contains("k/1"));
    EXPECT_EQ(store.object_count(), 0u);
    EXPECT_TRUE(store.put_url(grant.value().url, "again").is_error());
}

TEST(MemoryObjectStoreTest, WriteUrlIsSingleUse) {
    MemoryObjectStore store("http://storage.test");
    auto grant = store.issue_write_url("k/1", "", std::chrono::seconds(60));
    ASSERT_TRUE(grant.is_ok());
    ASSERT_TRUE(store.put_url(grant.value().url, "pixels").is_ok());
    EXPECT_FALSE(store.has_write_grant("k/1"));

    auto replay = store.put_url(grant.value().url, std::string(1000000, 'x'));
    ASSERT_TRUE(replay.is_error());
    EXPECT_EQ(replay.error().kind, ErrorKind::Credential);
    EXPECT_EQ(store.head("k/1").value().size, 6u);
    EXPECT_EQ(store.read("k/1").value(), "pixels");
}

TEST(MemoryObjectStoreTest, RevokeWriteBlocksUnusedUrl) {
    MemoryObjectStore store("http://storage.test");
    auto grant = store.issue_write_url("k/1", "", std::chrono::seconds(60));
    ASSERT_TRUE(grant.is_ok());
    EXPECT_TRUE(store.has_write_grant("k/1"));

    EXPECT_TRUE(store.revoke_write("k/1").is_ok());
    EXPECT_FALSE(store.has_write_grant("k/1"));
    EXPECT_TRUE(store.put_url(grant.value().url, "late").is_error());
    EXPECT_FALSE(store.contains("k/1"));

    // Nothing outstanding is not an error.
    EXPECT_TRUE(store.revoke_write("k/2").is_ok());
}
