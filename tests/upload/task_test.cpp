#include "directup/upload/batch.hpp"
#include "directup/upload/task.hpp"

#include <gtest/gtest.h>

#include <chrono>

using directup::upload::BatchState;
using directup::upload::Classification;
using directup::upload::FileCategory;
using directup::upload::TaskState;
using directup::upload::UploadBatch;
using directup::upload::UploadFile;
using directup::upload::UploadTask;
using directup::upload::WriteCredential;

namespace {

UploadTask make_task(const std::string& key = "k/1-photo.jpg") {
    return UploadTask(UploadFile::from_memory("photo.jpg", std::string(100, 'x')),
                      Classification{FileCategory::GalleryImage, 1000},
                      WriteCredential{key, "http://s/" + key, std::chrono::system_clock::now() + std::chrono::hours(1)});
}

} // namespace

TEST(UploadTaskTest, StartsQueuedWithCredentialKey) {
    auto task = make_task();
    EXPECT_EQ(task.state(), TaskState::Queued);
    EXPECT_EQ(task.key(), "k/1-photo.jpg");
    EXPECT_EQ(task.filename(), "photo.jpg");
    EXPECT_EQ(task.total_bytes(), 100u);
    EXPECT_EQ(task.attempt(), 0u);
}

TEST(UploadTaskTest, RetryCycleBumpsAttemptAndResetsProgress) {
    auto task = make_task();
    ASSERT_TRUE(task.begin_transfer().is_ok());
    task.record_progress(60);
    EXPECT_EQ(task.progress_bytes(), 60u);

    ASSERT_TRUE(task.requeue_for_retry("Upload failed with status 500").is_ok());
    EXPECT_EQ(task.state(), TaskState::Queued);
    EXPECT_EQ(task.attempt(), 1u);
    EXPECT_EQ(task.progress_bytes(), 0u);
    EXPECT_EQ(task.last_error(), "Upload failed with status 500");

    ASSERT_TRUE(task.begin_transfer().is_ok());
    EXPECT_EQ(task.transfers_started(), 2u);
    ASSERT_TRUE(task.transition_to(TaskState::Succeeded).is_ok());
    EXPECT_TRUE(task.is_terminal());
}

TEST(UploadTaskTest, ProgressIsMonotonicAndCapped) {
    auto task = make_task();
    ASSERT_TRUE(task.begin_transfer().is_ok());
    task.record_progress(70);
    task.record_progress(30);
    EXPECT_EQ(task.progress_bytes(), 70u);
    task.record_progress(5000);
    EXPECT_EQ(task.progress_bytes(), 100u);
}

TEST(UploadTaskTest, RejectsIllegalTransitions) {
    auto task = make_task();
    EXPECT_TRUE(task.transition_to(TaskState::Succeeded).is_error());
    EXPECT_TRUE(task.requeue_for_retry("nope").is_error());

    ASSERT_TRUE(task.begin_transfer().is_ok());
    ASSERT_TRUE(task.transition_to(TaskState::Succeeded).is_ok());
    EXPECT_TRUE(task.transition_to(TaskState::Queued).is_error());
    EXPECT_TRUE(task.abandon("late").is_error());
}

TEST(UploadTaskTest, AbandonFromTransferringPassesThroughFailed) {
    auto task = make_task();
    ASSERT_TRUE(task.begin_transfer().is_ok());
    ASSERT_TRUE(task.abandon("gave up").is_ok());
    EXPECT_EQ(task.state(), TaskState::Abandoned);
    EXPECT_EQ(task.last_error(), "gave up");
}

TEST(UploadTaskTest, CredentialReplacementKeepsKey) {
    auto task = make_task();
    WriteCredential fresh{"k/1-photo.jpg", "http://s/new", std::chrono::system_clock::now()};
    ASSERT_TRUE(task.replace_credential(fresh).is_ok());
    EXPECT_EQ(task.credential().url, "http://s/new");

    WriteCredential other{"k/2-other.jpg", "http://s/other", std::chrono::system_clock::now()};
    auto mismatch = task.replace_credential(other);
    ASSERT_TRUE(mismatch.is_error());
    EXPECT_EQ(mismatch.error().kind, directup::ErrorKind::Credential);
    EXPECT_EQ(task.key(), "k/1-photo.jpg");
}

TEST(UploadBatchTest, FollowsPipelineOrder) {
    UploadBatch batch("session-1");
    EXPECT_TRUE(batch.transition_to(BatchState::Validating).is_ok());
    EXPECT_TRUE(batch.transition_to(BatchState::AwaitingCredentials).is_ok());
    EXPECT_TRUE(batch.transition_to(BatchState::Transferring).is_ok());
    EXPECT_FALSE(batch.is_terminal());
    EXPECT_TRUE(batch.transition_to(BatchState::Confirming).is_ok());
    EXPECT_TRUE(batch.transition_to(BatchState::Complete).is_ok());
    EXPECT_TRUE(batch.is_terminal());
}

TEST(UploadBatchTest, CannotSkipConfirmationWhileAwaitingCredentials) {
    UploadBatch batch("session-1");
    ASSERT_TRUE(batch.transition_to(BatchState::Validating).is_ok());
    ASSERT_TRUE(batch.transition_to(BatchState::AwaitingCredentials).is_ok());
    EXPECT_TRUE(batch.transition_to(BatchState::Complete).is_error());
    EXPECT_TRUE(batch.transition_to(BatchState::Confirming).is_error());
}

TEST(UploadBatchTest, FailIsTerminalAndSticky) {
    UploadBatch batch("session-1");
    ASSERT_TRUE(batch.transition_to(BatchState::Validating).is_ok());
    batch.fail("credential service down");
    EXPECT_EQ(batch.state(), BatchState::Failed);
    EXPECT_EQ(batch.failure_reason(), "credential service down");
    EXPECT_TRUE(batch.transition_to(BatchState::AwaitingCredentials).is_error());
    batch.fail("again");
    EXPECT_EQ(batch.failure_reason(), "credential service down");
}
