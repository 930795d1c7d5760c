#pragma once

#include "directup/upload/task.hpp"
#include "directup/upload/transport.hpp"

#include <cstdint>
#include <string>

namespace directup::upload {

struct RetryPolicy {
    std::uint32_t max_retries = 3;
    bool refresh_expired_credentials = true;
};

enum class RetryAction {
    Requeue,                  ///< Put back at the front of the queue
    RefreshCredentialAndRequeue,
    Abandon,                  ///< Retry ceiling reached or failure not retryable
};

struct RetryDecision {
    RetryAction action = RetryAction::Abandon;
    FailureKind failure_kind = FailureKind::Transfer;
    std::string reason;
};

/**
 * @brief Decides what happens to a task after a failed transfer attempt
 *
 * A task makes at most max_retries + 1 transfer attempts. Cancellation is
 * never retried.
 */
class RetryController {
public:
    RetryController() = default;
    explicit RetryController(RetryPolicy policy) : policy_(policy) {}

    /**
     * Applies the decision to the task: on a retry the attempt counter is
     * bumped and progress reset (Transferring -> Queued); otherwise the task
     * is abandoned. The caller owns queue placement and credential refresh.
     */
    RetryDecision on_failure(UploadTask& task, const TransferOutcome& outcome) const;

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

private:
    RetryPolicy policy_;
};

} // namespace directup::upload
