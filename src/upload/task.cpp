#include "directup/upload/task.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace directup::upload {
namespace {

bool is_allowed(TaskState current, TaskState target) {
    static const std::unordered_map<TaskState, std::vector<TaskState>> transitions {
        {TaskState::Queued, {TaskState::Transferring, TaskState::Failed, TaskState::Abandoned}},
        {TaskState::Transferring, {TaskState::Succeeded, TaskState::Failed, TaskState::Queued}},
        {TaskState::Failed, {TaskState::Queued, TaskState::Abandoned}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

const char* to_string(TaskState state) {
    switch (state) {
        case TaskState::Queued: return "queued";
        case TaskState::Transferring: return "transferring";
        case TaskState::Succeeded: return "succeeded";
        case TaskState::Failed: return "failed";
        case TaskState::Abandoned: return "abandoned";
    }
    return "unknown";
}

UploadTask::UploadTask(UploadFile file, Classification classification, WriteCredential credential)
    : file_(std::move(file)),
      category_(classification.category),
      credential_(std::move(credential)),
      last_transition_(std::chrono::steady_clock::now()) {}

directup::Result<void> UploadTask::transition_to(TaskState next_state) {
    if (!can_transition(next_state)) {
        return directup::Err<void>(Error{ErrorKind::Internal,
                                    std::string("Illegal task transition ") + to_string(state_) + " -> " +
                                        to_string(next_state) + " for " + credential_.key});
    }
    state_ = next_state;
    last_transition_ = std::chrono::steady_clock::now();
    return directup::Ok();
}

directup::Result<void> UploadTask::begin_transfer() {
    auto result = transition_to(TaskState::Transferring);
    if (result.is_error()) {
        return result;
    }
    progress_bytes_ = 0;
    ++transfers_started_;
    return directup::Ok();
}

void UploadTask::record_progress(std::uint64_t loaded) {
    progress_bytes_ = std::max(progress_bytes_, std::min(loaded, file_.size));
}

directup::Result<void> UploadTask::requeue_for_retry(std::string error) {
    auto result = transition_to(TaskState::Queued);
    if (result.is_error()) {
        return result;
    }
    ++attempt_;
    progress_bytes_ = 0;
    last_error_ = std::move(error);
    return directup::Ok();
}

directup::Result<void> UploadTask::mark_failed(std::string error) {
    last_error_ = std::move(error);
    return transition_to(TaskState::Failed);
}

directup::Result<void> UploadTask::abandon(std::string error) {
    if (state_ == TaskState::Transferring) {
        auto failed = mark_failed(error);
        if (failed.is_error()) {
            return failed;
        }
    }
    last_error_ = std::move(error);
    return transition_to(TaskState::Abandoned);
}

directup::Result<void> UploadTask::replace_credential(WriteCredential credential) {
    if (credential.key != credential_.key) {
        return directup::Err<void>(Error{ErrorKind::Credential,
                                    "Refreshed credential key " + credential.key + " does not match " +
                                        credential_.key});
    }
    credential_ = std::move(credential);
    return directup::Ok();
}

bool UploadTask::can_transition(TaskState target) const noexcept {
    if (state_ == TaskState::Succeeded || state_ == TaskState::Abandoned) {
        return false;
    }
    return is_allowed(state_, target);
}

} // namespace directup::upload
