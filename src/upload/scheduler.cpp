#include "directup/upload/scheduler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <thread>

namespace directup::upload {

UploadScheduler::UploadScheduler(SchedulerOptions options,
                                 ObjectTransport& transport,
                                 CredentialBroker& broker,
                                 RetryController retry,
                                 ProgressReporter& reporter)
    : options_(options),
      transport_(transport),
      broker_(broker),
      retry_(std::move(retry)),
      reporter_(reporter),
      wake_(std::make_shared<WakeSignal>()),
      mutex_(wake_->mutex),
      cv_(wake_->cv) {
    if (options_.max_concurrent == 0) {
        options_.max_concurrent = 1;
    }
}

DrainResult UploadScheduler::run(std::vector<UploadTask> tasks, const CancellationToken& cancel) {
    {
        std::lock_guard lock(mutex_);
        if (started_) {
            throw std::logic_error("UploadScheduler::run called twice");
        }
        started_ = true;
        cancel_ = cancel;
        for (auto& task : tasks) {
            std::string key = task.key();
            queue_.push_back(key);
            tasks_.emplace(std::move(key), std::move(task));
        }
    }

    if (queue_.empty()) {
        return {};
    }

    // Wake idle workers so they can fail whatever is still queued.
    const auto callback_id = cancel_.on_cancel([wake = wake_] {
        std::lock_guard lock(wake->mutex);
        wake->cv.notify_all();
    });

    const std::size_t worker_count = std::min(options_.max_concurrent, queue_.size());
    spdlog::debug("[Scheduler] collection={} tasks={} workers={}",
                  reporter_.collection_id(), queue_.size(), worker_count);

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back([this] { worker_loop(); });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    cancel_.remove_callback(callback_id);

    std::lock_guard lock(mutex_);
    result_.cancelled = cancel_.is_cancelled();
    return std::move(result_);
}

void UploadScheduler::worker_loop() {
    std::unique_lock lock(mutex_);
    for (;;) {
        cv_.wait(lock, [this] {
            return !queue_.empty() || active_.empty() || cancel_.is_cancelled();
        });

        if (cancel_.is_cancelled()) {
            cancel_queued_locked();
            return;
        }
        if (queue_.empty()) {
            // Nothing queued and nothing in flight: the batch is drained.
            cv_.notify_all();
            return;
        }

        const std::string key = queue_.front();
        queue_.pop_front();
        active_.insert(key);
        result_.peak_concurrency = std::max(result_.peak_concurrency, active_.size());
        UploadTask& task = tasks_.at(key);

        lock.unlock();
        const AttemptResult outcome = attempt(task);
        lock.lock();

        settle(task, outcome);
        active_.erase(key);
        cv_.notify_all();
    }
}

UploadScheduler::AttemptResult UploadScheduler::attempt(UploadTask& task) {
    if (options_.refresh_expired_credentials &&
        task.credential().expires_within(options_.credential_expiry_skew)) {
        spdlog::info("[Scheduler] Credential for {} expires soon, refreshing before transfer", task.key());
        auto refreshed = refresh_credential(task);
        if (refreshed.settlement == Settlement::Failed) {
            return refreshed;
        }
    }

    auto started = task.begin_transfer();
    if (started.is_error()) {
        return {Settlement::Failed, FailureKind::Transfer, started.error().message};
    }
    reporter_.transfer_started(task.filename(), task.key(), task.attempt(), task.total_bytes());

    const auto on_progress = [this, &task](std::uint64_t loaded, std::uint64_t total) {
        task.record_progress(loaded);
        reporter_.progress(task.filename(), task.key(), task.progress_bytes(), total);
    };

    TransferOutcome outcome;
    try {
        outcome = transport_.put(task.credential(), task.file(), on_progress, cancel_, options_.attempt_timeout);
    } catch (const std::exception& e) {
        outcome = TransferOutcome::failure(TransferStatus::Transient, e.what());
    }

    if (outcome.ok()) {
        auto done = task.transition_to(TaskState::Succeeded);
        if (done.is_error()) {
            return {Settlement::Failed, FailureKind::Transfer, done.error().message};
        }
        return {Settlement::Completed, FailureKind::Transfer, {}};
    }

    if (cancel_.is_cancelled() && outcome.status != TransferStatus::Aborted) {
        outcome = TransferOutcome::failure(TransferStatus::Aborted, "Upload cancelled", outcome.http_status);
    }

    const RetryDecision decision = retry_.on_failure(task, outcome);
    switch (decision.action) {
        case RetryAction::Abandon:
            return {Settlement::Failed, decision.failure_kind, decision.reason};
        case RetryAction::RefreshCredentialAndRequeue: {
            auto refreshed = refresh_credential(task);
            if (refreshed.settlement == Settlement::Failed) {
                return refreshed;
            }
            reporter_.retry_scheduled(task.filename(), task.key(), task.attempt(),
                                      retry_.policy().max_retries, decision.reason, true);
            return {Settlement::Requeued, FailureKind::Transfer, decision.reason};
        }
        case RetryAction::Requeue:
            reporter_.retry_scheduled(task.filename(), task.key(), task.attempt(),
                                      retry_.policy().max_retries, decision.reason, false);
            return {Settlement::Requeued, FailureKind::Transfer, decision.reason};
    }
    return {Settlement::Failed, FailureKind::Transfer, decision.reason};
}

UploadScheduler::AttemptResult UploadScheduler::refresh_credential(UploadTask& task) {
    auto refreshed = broker_.refresh_credential(reporter_.collection_id(), task.key());
    std::string error;
    if (refreshed.is_error()) {
        error = "Credential refresh failed: " + refreshed.error().message;
    } else {
        auto replaced = task.replace_credential(std::move(refreshed.value()));
        if (replaced.is_error()) {
            error = replaced.error().message;
        }
    }

    if (error.empty()) {
        return {Settlement::Requeued, FailureKind::Credential, {}};
    }

    spdlog::error("[Scheduler] key={} {}", task.key(), error);
    auto abandoned = task.abandon(error);
    if (abandoned.is_error()) {
        spdlog::error("[Scheduler] key={} {}", task.key(), abandoned.error().message);
    }
    return {Settlement::Failed, FailureKind::Credential, error};
}

void UploadScheduler::settle(UploadTask& task, const AttemptResult& result) {
    switch (result.settlement) {
        case Settlement::Completed:
            result_.completed.push_back(
                CompletedUpload{task.filename(), task.key(), task.total_bytes(), task.transfers_started()});
            reporter_.file_completed(task.filename(), task.key(), true, {},
                                     task.transfers_started(), task.total_bytes());
            break;
        case Settlement::Requeued:
            // Retries jump the queue so a flaky file finishes before fresh work.
            queue_.push_front(task.key());
            break;
        case Settlement::Failed:
            record_failure(task, result.failure_kind, result.error);
            break;
    }
}

void UploadScheduler::record_failure(UploadTask& task, FailureKind kind, const std::string& error) {
    result_.failed.push_back(FailedUpload{task.filename(), task.key(), error, kind, task.transfers_started()});
    reporter_.file_completed(task.filename(), task.key(), false, error,
                             task.transfers_started(), task.total_bytes());
    reporter_.error(task.filename(), error);
}

void UploadScheduler::cancel_queued_locked() {
    while (!queue_.empty()) {
        UploadTask& task = tasks_.at(queue_.front());
        queue_.pop_front();
        auto abandoned = task.abandon("Upload cancelled");
        if (abandoned.is_error()) {
            spdlog::error("[Scheduler] key={} {}", task.key(), abandoned.error().message);
        }
        record_failure(task, FailureKind::Cancelled, "Upload cancelled");
    }
    cv_.notify_all();
}

} // namespace directup::upload
