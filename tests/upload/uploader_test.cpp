#include "directup/upload/uploader.hpp"
#include "directup/authority/local_broker.hpp"
#include "directup/authority/upload_authority.hpp"
#include "directup/events/components.hpp"
#include "directup/storage/memory_object_store.hpp"

#include "support/fake_transport.hpp"
#include "support/scripted_broker.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using directup::CancellationSource;
using directup::authority::LocalCredentialBroker;
using directup::authority::UploadAuthority;
using directup::events::EventBus;
using directup::events::EventDispatcher;
using directup::events::ObserverBridge;
using directup::storage::MemoryObjectStore;
using directup::testing::FakeTransport;
using directup::testing::ScriptedBroker;
using directup::upload::BatchResult;
using directup::upload::DirectUploader;
using directup::upload::FailureKind;
using directup::upload::UploadFile;
using directup::upload::UploadObserver;

namespace {

std::vector<UploadFile> gallery(int count) {
    std::vector<UploadFile> files;
    for (int i = 0; i < count; ++i) {
        files.push_back(UploadFile::from_memory("photo-" + std::to_string(i) + ".jpg",
                                                std::string(100 + i, static_cast<char>('a' + i))));
    }
    return files;
}

const directup::upload::FailedUpload* find_failed(const BatchResult& result, const std::string& filename) {
    for (const auto& failed : result.failed) {
        if (failed.filename == filename) {
            return &failed;
        }
    }
    return nullptr;
}

/// Uploader wired to a real authority and in-memory bucket.
class PipelineHarness {
public:
    explicit PipelineHarness(directup::config::AuthorityConfig authority_config = {},
                             directup::config::UploaderConfig uploader_config = {})
        : store(std::make_shared<MemoryObjectStore>("http://storage.test")),
          authority(authority_config, store, bus),
          broker(authority),
          transport(store),
          dispatcher(bus),
          uploader(uploader_config, broker, transport, dispatcher) {}

    BatchResult upload(const std::vector<UploadFile>& files, const std::string& collection_id = "wedding-2024",
                       const directup::CancellationToken& cancel = {}) {
        auto result = uploader.upload_files(files, collection_id, cancel);
        dispatcher.flush();
        return result;
    }

    EventBus bus;
    std::shared_ptr<MemoryObjectStore> store;
    UploadAuthority authority;
    LocalCredentialBroker broker;
    FakeTransport transport;
    EventDispatcher dispatcher;
    DirectUploader uploader;
};

/// Records what an UploadObserver is told.
struct ObserverLog {
    UploadObserver observer() {
        UploadObserver o;
        o.on_file_complete = [this](const std::string& filename, const std::optional<std::string>& key,
                                    bool success, const std::string&) {
            std::lock_guard lock(mutex);
            completions.push_back(filename + (success && key ? ":ok" : ":failed"));
        };
        o.on_all_complete = [this](const BatchResult&) { all_complete++; };
        o.on_error = [this](const std::string& source, const std::string& message) {
            std::lock_guard lock(mutex);
            errors.push_back(source + "|" + message);
        };
        o.on_progress = [this](const std::string&, double, std::uint64_t, std::uint64_t) { progress++; };
        return o;
    }

    std::mutex mutex;
    std::vector<std::string> completions;
    std::vector<std::string> errors;
    std::atomic<int> all_complete{0};
    std::atomic<int> progress{0};
};

} // namespace

TEST(DirectUploaderTest, UploadsAndConfirmsWholeBatch) {
    directup::config::UploaderConfig config;
    config.max_concurrent = 4;
    PipelineHarness harness({}, config);
    ObserverLog log;
    ObserverBridge bridge(harness.bus, log.observer(), "wedding-2024");

    const auto files = gallery(5);
    auto result = harness.upload(files);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.total, 5u);
    EXPECT_EQ(result.completed.size(), 5u);
    EXPECT_TRUE(result.failed.empty());
    EXPECT_TRUE(result.error.empty());
    ASSERT_TRUE(result.confirmation.has_value());
    EXPECT_EQ(result.confirmation->confirmed_count, 5u);
    EXPECT_LE(harness.transport.peak_concurrency(), 4);

    for (const auto& done : result.completed) {
        EXPECT_EQ(done.key.rfind("collections/wedding-2024/gallery/", 0), 0u) << done.key;
        ASSERT_TRUE(harness.store->contains(done.key));
    }
    EXPECT_EQ(harness.authority.manifest("wedding-2024").size(), 5u);

    EXPECT_EQ(log.completions.size(), 5u);
    EXPECT_EQ(log.all_complete.load(), 1);
    EXPECT_GE(log.progress.load(), 5);
    EXPECT_TRUE(log.errors.empty());
}

TEST(DirectUploaderTest, StoredBytesMatchSource) {
    PipelineHarness harness;
    std::vector<UploadFile> files{UploadFile::from_memory("notes.txt", "hello storage")};

    auto result = harness.upload(files, "notes");

    ASSERT_EQ(result.completed.size(), 1u);
    auto stored = harness.store->read(result.completed[0].key);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, "hello storage");
    EXPECT_EQ(result.completed[0].size, 13u);
}

TEST(DirectUploaderTest, ServerDeletesTamperedObject) {
    PipelineHarness harness;
    ObserverLog log;
    ObserverBridge bridge(harness.bus, log.observer());

    auto files = gallery(3);
    harness.transport.write_instead("photo-1.jpg", "short");
    auto result = harness.upload(files);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.security_violation);
    EXPECT_EQ(result.completed.size(), 2u);
    const auto* rejected = find_failed(result, "photo-1.jpg");
    ASSERT_NE(rejected, nullptr);
    EXPECT_EQ(rejected->kind, FailureKind::Security);
    EXPECT_EQ(rejected->error, "Size mismatch: declared 101 bytes, stored 5 bytes");
    EXPECT_FALSE(harness.store->contains(rejected->key));
    EXPECT_EQ(harness.authority.manifest("wedding-2024").size(), 2u);

    ASSERT_TRUE(result.confirmation.has_value());
    EXPECT_TRUE(result.confirmation->size_mismatch);
    EXPECT_EQ(result.confirmation->deleted_count, 1u);

    std::lock_guard lock(log.mutex);
    ASSERT_EQ(log.errors.size(), 1u);
    EXPECT_EQ(log.errors[0], "SECURITY|photo-1.jpg: Size mismatch: declared 101 bytes, stored 5 bytes");
}

TEST(DirectUploaderTest, OversizedFileIsRejectedWithoutBlockingOthers) {
    directup::config::UploaderConfig config;
    config.limits.audio = 10;
    PipelineHarness harness({}, config);
    ObserverLog log;
    ObserverBridge bridge(harness.bus, log.observer());

    std::vector<UploadFile> files{
        UploadFile::from_memory("song.mp3", std::string(11, 's')),
        UploadFile::from_memory("cover.png", "png-bytes"),
        UploadFile::from_memory("liner.pdf", "pdf-bytes"),
    };
    auto result = harness.upload(files);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.completed.size(), 2u);
    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0].filename, "song.mp3");
    EXPECT_EQ(result.failed[0].kind, FailureKind::Validation);
    EXPECT_TRUE(result.failed[0].key.empty());
    EXPECT_EQ(harness.transport.attempts("song.mp3"), 0);
    EXPECT_TRUE(result.error.empty());

    std::lock_guard lock(log.mutex);
    ASSERT_EQ(log.errors.size(), 1u);
    EXPECT_EQ(log.errors[0], "song.mp3|" + result.failed[0].error);
}

TEST(DirectUploaderTest, AuthorityRefusalFailsWholeBatch) {
    directup::config::AuthorityConfig authority_config;
    authority_config.max_files_per_request = 2;
    PipelineHarness harness(authority_config);

    auto result = harness.upload(gallery(3));

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.completed.empty());
    ASSERT_EQ(result.failed.size(), 3u);
    for (const auto& failed : result.failed) {
        EXPECT_EQ(failed.kind, FailureKind::Credential);
    }
    EXPECT_EQ(result.error, "Failed to get upload URLs: Too many files: 3 (max 2)");
    EXPECT_EQ(harness.transport.attempts("photo-0.jpg"), 0);
    EXPECT_FALSE(result.confirmation.has_value());
}

TEST(DirectUploaderTest, ShortCredentialResponseIsBatchFatal) {
    EventBus bus;
    EventDispatcher dispatcher(bus);
    ScriptedBroker broker;
    FakeTransport transport;
    broker.credentials.push_back({"k/only", "http://storage.test/objects/k/only",
                                  std::chrono::system_clock::now() + std::chrono::hours(1)});
    DirectUploader uploader({}, broker, transport, dispatcher);

    auto result = uploader.upload_files(gallery(2), "c");
    dispatcher.flush();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failed.size(), 2u);
    EXPECT_EQ(result.error, "Credential response has 1 entries for 2 files");
    EXPECT_EQ(broker.confirm_calls, 0);
}

TEST(DirectUploaderTest, ConfirmationFailureLeavesNothingCompleted) {
    EventBus bus;
    EventDispatcher dispatcher(bus);
    ScriptedBroker broker;
    FakeTransport transport;
    broker.confirm_error = directup::Error{directup::ErrorKind::Transfer, "timed out"};
    DirectUploader uploader({}, broker, transport, dispatcher);

    auto result = uploader.upload_files(gallery(3), "c");
    dispatcher.flush();

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.completed.empty());
    ASSERT_EQ(result.failed.size(), 3u);
    EXPECT_EQ(result.failed[0].kind, FailureKind::Confirmation);
    EXPECT_EQ(result.error, "Upload confirmation failed: timed out");
    EXPECT_EQ(result.completed.size() + result.failed.size(), result.total);
}

TEST(DirectUploaderTest, RepeatedConfirmationDoesNotDuplicateManifest) {
    PipelineHarness harness;
    auto result = harness.upload(gallery(2));
    ASSERT_TRUE(result.success);

    std::vector<directup::upload::ConfirmationItem> again;
    for (const auto& done : result.completed) {
        again.push_back({done.filename, done.key, done.size});
    }
    auto second = harness.authority.confirm_uploads("wedding-2024", again);

    ASSERT_TRUE(second.is_ok());
    EXPECT_TRUE(second.value().success);
    EXPECT_EQ(second.value().confirmed_count, 2u);
    EXPECT_EQ(harness.authority.manifest("wedding-2024").size(), 2u);
}

TEST(DirectUploaderTest, ShortLivedCredentialsAreRefreshedBeforeTransfer) {
    directup::config::AuthorityConfig authority_config;
    authority_config.credential_ttl = std::chrono::seconds(10);
    directup::config::UploaderConfig config;
    config.credential_expiry_skew = std::chrono::seconds(30);
    PipelineHarness harness(authority_config, config);

    std::atomic<int> issued{0};
    harness.bus.subscribe<directup::events::CredentialsIssuedEvent>(
        [&](const directup::events::CredentialsIssuedEvent&) { issued++; });

    auto result = harness.upload(gallery(2));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(issued.load(), 1);
    for (const auto& done : result.completed) {
        EXPECT_EQ(done.attempts, 1u);
    }
}

TEST(DirectUploaderTest, ExpiredCredentialsFailWhenRefreshDisabled) {
    directup::config::AuthorityConfig authority_config;
    authority_config.credential_ttl = std::chrono::seconds(0);
    directup::config::UploaderConfig config;
    config.refresh_expired_credentials = false;
    config.max_retries = 1;
    PipelineHarness harness(authority_config, config);

    auto result = harness.upload(gallery(1));

    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0].kind, FailureKind::Transfer);
    EXPECT_EQ(result.failed[0].attempts, 2u);
    EXPECT_EQ(harness.store->object_count(), 0u);
    EXPECT_FALSE(result.confirmation.has_value());
}

TEST(DirectUploaderTest, CancelledBeforeStartTransfersNothing) {
    PipelineHarness harness;
    CancellationSource source;
    source.cancel();

    auto result = harness.upload(gallery(3), "wedding-2024", source.token());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Upload cancelled");
    ASSERT_EQ(result.failed.size(), 3u);
    for (const auto& failed : result.failed) {
        EXPECT_EQ(failed.kind, FailureKind::Cancelled);
    }
    EXPECT_EQ(harness.store->object_count(), 0u);
}

TEST(DirectUploaderTest, CancellationStillConfirmsFinishedFiles) {
    directup::config::UploaderConfig config;
    config.max_concurrent = 2;
    PipelineHarness harness({}, config);
    harness.transport.block_until_cancelled("photo-0.jpg");

    CancellationSource source;
    auto token = source.token();
    auto pending = std::async(std::launch::async, [&] { return harness.upload(gallery(3), "wedding-2024", token); });

    harness.transport.wait_until_started("photo-0.jpg");
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (harness.store->object_count() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    source.cancel();
    auto result = pending.get();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Upload cancelled");
    EXPECT_EQ(result.completed.size(), 2u);
    const auto* cancelled = find_failed(result, "photo-0.jpg");
    ASSERT_NE(cancelled, nullptr);
    EXPECT_EQ(cancelled->kind, FailureKind::Cancelled);
    EXPECT_EQ(harness.authority.manifest("wedding-2024").size(), 2u);
}

TEST(DirectUploaderTest, DuplicateFilenamesGetDistinctKeys) {
    PipelineHarness harness;
    std::vector<UploadFile> files{
        UploadFile::from_memory("IMG 1.jpg", "first"),
        UploadFile::from_memory("IMG 1.jpg", "second!"),
    };

    auto result = harness.upload(files);

    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.completed.size(), 2u);
    EXPECT_NE(result.completed[0].key, result.completed[1].key);
    for (const auto& done : result.completed) {
        EXPECT_NE(done.key.find("-IMG_1.jpg"), std::string::npos) << done.key;
    }
}

TEST(DirectUploaderTest, EmptyCollectionIdFailsEveryFile) {
    PipelineHarness harness;
    auto result = harness.upload(gallery(2), "");

    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.failed.size(), 2u);
    EXPECT_EQ(result.failed[0].kind, FailureKind::Validation);
    EXPECT_EQ(result.failed[0].error, "Collection id is required");
}

TEST(DirectUploaderTest, EmptyBatchSucceedsTrivially) {
    PipelineHarness harness;
    auto result = harness.upload({});

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.total, 0u);
    EXPECT_FALSE(result.confirmation.has_value());
}

TEST(DirectUploaderTest, AbandonedTransfersAreDiscardedFromStorage) {
    directup::config::UploaderConfig config;
    config.max_retries = 0;
    PipelineHarness harness({}, config);
    std::atomic<int> discarded{0};
    harness.bus.subscribe<directup::events::ObjectDiscardedEvent>(
        [&](const directup::events::ObjectDiscardedEvent& e) {
            if (e.deleted) {
                discarded++;
            }
        });
    harness.transport.write_then_fail("photo-1.jpg", directup::upload::TransferStatus::Aborted);
    harness.transport.write_then_fail("photo-2.jpg", directup::upload::TransferStatus::Transient);

    auto result = harness.upload(gallery(3));

    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.completed.size(), 1u);
    const auto* aborted = find_failed(result, "photo-1.jpg");
    const auto* broken = find_failed(result, "photo-2.jpg");
    ASSERT_NE(aborted, nullptr);
    ASSERT_NE(broken, nullptr);
    EXPECT_EQ(aborted->kind, FailureKind::Cancelled);
    EXPECT_EQ(broken->kind, FailureKind::Transfer);
    EXPECT_FALSE(harness.store->contains(aborted->key));
    EXPECT_FALSE(harness.store->contains(broken->key));
    EXPECT_EQ(harness.store->object_count(), 1u);
    EXPECT_EQ(harness.authority.manifest("wedding-2024").size(), 1u);
    EXPECT_EQ(discarded.load(), 2);
}

TEST(DirectUploaderTest, OnlyKeyedFailuresAreDiscarded) {
    EventBus bus;
    EventDispatcher dispatcher(bus);
    ScriptedBroker broker;
    FakeTransport transport;
    transport.fail_times("photo-0.jpg", 5);
    directup::config::UploaderConfig config;
    config.max_retries = 1;
    config.limits.gallery_image = 100;
    DirectUploader uploader(config, broker, transport, dispatcher);

    auto result = uploader.upload_files(gallery(2), "c");
    dispatcher.flush();

    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.failed.size(), 2u);
    EXPECT_EQ(broker.discard_calls, 1);
    EXPECT_EQ(broker.discarded, (std::vector<std::string>{"k/0-photo-0.jpg"}));
}

TEST(DirectUploaderTest, CleanBatchDiscardsNothing) {
    EventBus bus;
    EventDispatcher dispatcher(bus);
    ScriptedBroker broker;
    FakeTransport transport;
    DirectUploader uploader({}, broker, transport, dispatcher);

    auto result = uploader.upload_files(gallery(2), "c");
    dispatcher.flush();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(broker.discard_calls, 0);
}
