#pragma once

#include "directup/core/cancellation.hpp"
#include "directup/upload/broker.hpp"
#include "directup/upload/reporter.hpp"
#include "directup/upload/retry.hpp"
#include "directup/upload/task.hpp"
#include "directup/upload/transport.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace directup::upload {

struct SchedulerOptions {
    std::size_t max_concurrent = 4;
    std::chrono::milliseconds attempt_timeout{std::chrono::minutes(10)};
    std::chrono::seconds credential_expiry_skew{30};
    bool refresh_expired_credentials = true;
};

struct DrainResult {
    std::vector<CompletedUpload> completed;
    std::vector<FailedUpload> failed;
    std::size_t peak_concurrency = 0;
    bool cancelled = false;
};

/**
 * @brief Bounded worker pool draining one batch's upload queue
 *
 * One scheduler per batch: the queue, the active set and the result lists
 * are members, never shared across batches. Tasks are tracked by storage
 * key only. run() returns once the queue is empty and no transfer is in
 * flight, including work re-added by retries.
 *
 * The transport and broker are called from worker threads and must be
 * safe for concurrent use.
 */
class UploadScheduler {
public:
    UploadScheduler(SchedulerOptions options,
                    ObjectTransport& transport,
                    CredentialBroker& broker,
                    RetryController retry,
                    ProgressReporter& reporter);

    UploadScheduler(const UploadScheduler&) = delete;
    UploadScheduler& operator=(const UploadScheduler&) = delete;

    /// May be called once per scheduler.
    DrainResult run(std::vector<UploadTask> tasks, const CancellationToken& cancel = {});

private:
    enum class Settlement { Completed, Requeued, Failed };

    struct AttemptResult {
        Settlement settlement = Settlement::Failed;
        FailureKind failure_kind = FailureKind::Transfer;
        std::string error;
    };

    void worker_loop();
    AttemptResult attempt(UploadTask& task);
    AttemptResult refresh_credential(UploadTask& task);
    void settle(UploadTask& task, const AttemptResult& result);
    void record_failure(UploadTask& task, FailureKind kind, const std::string& error);
    void cancel_queued_locked();

    SchedulerOptions options_;
    ObjectTransport& transport_;
    CredentialBroker& broker_;
    RetryController retry_;
    ProgressReporter& reporter_;
    CancellationToken cancel_;

    // Shared with the cancellation callback, which may outlive run().
    struct WakeSignal {
        std::mutex mutex;
        std::condition_variable cv;
    };
    std::shared_ptr<WakeSignal> wake_;
    std::mutex& mutex_;
    std::condition_variable& cv_;
    std::unordered_map<std::string, UploadTask> tasks_;
    std::deque<std::string> queue_;
    std::unordered_set<std::string> active_;
    DrainResult result_;
    bool started_ = false;
};

} // namespace directup::upload
