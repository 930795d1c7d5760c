#pragma once

#include "directup/core/result.hpp"

#include <chrono>
#include <string>

namespace directup::upload {

enum class BatchState {
    Created,
    Validating,
    AwaitingCredentials,
    Transferring,
    Confirming,
    Complete,
    Failed
};

const char* to_string(BatchState state);

/**
 * @brief Lifecycle of one upload_files() call
 *
 * A batch is terminal only in Complete or Failed, and Complete is only
 * reachable through Confirming (or directly from Transferring when nothing
 * was uploaded and there is nothing to confirm).
 */
class UploadBatch {
public:
    explicit UploadBatch(std::string collection_id)
        : collection_id_(std::move(collection_id)),
          started_at_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] const std::string& collection_id() const noexcept { return collection_id_; }
    [[nodiscard]] BatchState state() const noexcept { return state_; }
    [[nodiscard]] bool is_terminal() const noexcept {
        return state_ == BatchState::Complete || state_ == BatchState::Failed;
    }

    directup::Result<void> transition_to(BatchState next_state);

    /// Moves to Failed from any non-terminal state.
    void fail(std::string reason);

    [[nodiscard]] const std::string& failure_reason() const noexcept { return failure_reason_; }

    [[nodiscard]] std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                     started_at_);
    }

private:
    std::string collection_id_;
    BatchState state_ = BatchState::Created;
    std::string failure_reason_;
    std::chrono::steady_clock::time_point started_at_;
};

} // namespace directup::upload
