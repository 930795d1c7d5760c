#pragma once

#include "directup/core/result.hpp"
#include "directup/upload/classifier.hpp"
#include "directup/upload/types.hpp"

#include <chrono>
#include <string>

namespace directup::upload {

enum class TaskState {
    Queued,
    Transferring,
    Succeeded,
    Failed,
    Abandoned
};

const char* to_string(TaskState state);

/**
 * @brief One file's journey through the pipeline
 *
 * `key` is the only identity used for tracking; two tasks may share a
 * filename but never a key.
 */
class UploadTask {
public:
    UploadTask(UploadFile file, Classification classification, WriteCredential credential);

    [[nodiscard]] const UploadFile& file() const noexcept { return file_; }
    [[nodiscard]] const std::string& filename() const noexcept { return file_.name; }
    [[nodiscard]] FileCategory category() const noexcept { return category_; }
    [[nodiscard]] const std::string& key() const noexcept { return credential_.key; }
    [[nodiscard]] const WriteCredential& credential() const noexcept { return credential_; }
    [[nodiscard]] TaskState state() const noexcept { return state_; }
    [[nodiscard]] std::uint32_t attempt() const noexcept { return attempt_; }
    [[nodiscard]] std::uint32_t transfers_started() const noexcept { return transfers_started_; }
    [[nodiscard]] std::uint64_t progress_bytes() const noexcept { return progress_bytes_; }
    [[nodiscard]] std::uint64_t total_bytes() const noexcept { return file_.size; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }

    directup::Result<void> transition_to(TaskState next_state);

    /// Marks the start of a transfer attempt and resets progress.
    directup::Result<void> begin_transfer();

    /// Progress never moves backwards within one attempt.
    void record_progress(std::uint64_t loaded);

    /// Transferring -> Queued with the attempt counter bumped.
    directup::Result<void> requeue_for_retry(std::string error);

    directup::Result<void> mark_failed(std::string error);

    directup::Result<void> abandon(std::string error);

    /// Replaces an expired credential; the key must not change.
    directup::Result<void> replace_credential(WriteCredential credential);

    [[nodiscard]] bool is_terminal() const noexcept {
        return state_ == TaskState::Succeeded || state_ == TaskState::Abandoned;
    }

private:
    [[nodiscard]] bool can_transition(TaskState target) const noexcept;

    UploadFile file_;
    FileCategory category_;
    WriteCredential credential_;
    TaskState state_ = TaskState::Queued;
    std::uint32_t attempt_ = 0;
    std::uint32_t transfers_started_ = 0;
    std::uint64_t progress_bytes_ = 0;
    std::string last_error_;
    std::chrono::steady_clock::time_point last_transition_{};
};

} // namespace directup::upload
