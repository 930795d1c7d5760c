#include "directup/upload/retry.hpp"

#include <spdlog/spdlog.h>

namespace directup::upload {
namespace {

void abandon_logged(UploadTask& task, const std::string& reason) {
    auto result = task.abandon(reason);
    if (result.is_error()) {
        spdlog::error("[Retry] Failed to abandon {}: {}", task.key(), result.error().message);
    }
}

} // namespace

RetryDecision RetryController::on_failure(UploadTask& task, const TransferOutcome& outcome) const {
    RetryDecision decision;
    decision.reason = outcome.message.empty() ? to_string(outcome.status) : outcome.message;

    if (outcome.status == TransferStatus::Aborted) {
        decision.action = RetryAction::Abandon;
        decision.failure_kind = FailureKind::Cancelled;
        abandon_logged(task, decision.reason);
        return decision;
    }

    if (task.attempt() >= policy_.max_retries) {
        spdlog::warn("[Retry] Giving up on {} ({}) after {} attempts: {}",
                     task.filename(), task.key(), task.attempt() + 1, decision.reason);
        decision.action = RetryAction::Abandon;
        decision.failure_kind = FailureKind::Transfer;
        abandon_logged(task, decision.reason);
        return decision;
    }

    auto requeued = task.requeue_for_retry(decision.reason);
    if (requeued.is_error()) {
        decision.action = RetryAction::Abandon;
        decision.failure_kind = FailureKind::Transfer;
        decision.reason = requeued.error().message;
        abandon_logged(task, decision.reason);
        return decision;
    }

    const bool expired = outcome.status == TransferStatus::CredentialExpired;
    decision.action = expired && policy_.refresh_expired_credentials ? RetryAction::RefreshCredentialAndRequeue
                                                                     : RetryAction::Requeue;
    spdlog::info("[Retry] Retrying upload for {} (attempt {}/{})", task.filename(), task.attempt(), policy_.max_retries);
    return decision;
}

} // namespace directup::upload
