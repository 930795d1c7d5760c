#include "directup/upload/uploader.hpp"

#include "directup/upload/batch.hpp"
#include "directup/upload/reconciler.hpp"
#include "directup/upload/reporter.hpp"
#include "directup/upload/retry.hpp"
#include "directup/upload/scheduler.hpp"
#include "directup/upload/task.hpp"

#include <spdlog/spdlog.h>

#include <unordered_set>

namespace directup::upload {
namespace {

struct ValidatedFile {
    const UploadFile* file;
    Classification classification;
};

void advance(UploadBatch& batch, BatchState next) {
    auto moved = batch.transition_to(next);
    if (moved.is_error()) {
        spdlog::error("[Uploader] {}", moved.error().message);
    }
}

/// Every valid file fails with the same credential error.
void fail_all(const std::vector<ValidatedFile>& files, const std::string& error,
              BatchResult& result, ProgressReporter& reporter) {
    for (const auto& entry : files) {
        result.failed.push_back(FailedUpload{entry.file->name, {}, error, FailureKind::Credential, 0});
        reporter.file_completed(entry.file->name, {}, false, error, 0, entry.file->size);
    }
    reporter.error("credentials", error);
}

std::string check_credentials(const std::vector<WriteCredential>& credentials, std::size_t expected) {
    if (credentials.size() != expected) {
        return "Credential response has " + std::to_string(credentials.size()) + " entries for " +
               std::to_string(expected) + " files";
    }
    std::unordered_set<std::string> keys;
    for (const auto& credential : credentials) {
        if (credential.key.empty() || credential.url.empty()) {
            return "Credential response contains an empty key or url";
        }
        if (!keys.insert(credential.key).second) {
            return "Credential response contains duplicate key " + credential.key;
        }
    }
    return {};
}

/**
 * Failed transfers may still have left bytes behind their key. Best effort:
 * the authority sweeps anything this misses once the credential expires.
 */
void discard_abandoned(CredentialBroker& broker, const std::string& collection_id,
                       const std::vector<FailedUpload>& failed) {
    std::vector<std::string> keys;
    for (const auto& upload : failed) {
        if (!upload.key.empty()) {
            keys.push_back(upload.key);
        }
    }
    if (keys.empty()) {
        return;
    }
    auto discarded = broker.discard_uploads(collection_id, keys);
    if (discarded.is_error()) {
        spdlog::warn("[Uploader] collection={} could not discard {} abandoned keys: {}", collection_id,
                     keys.size(), discarded.error().message);
        return;
    }
    spdlog::info("[Uploader] collection={} discarded {} of {} abandoned keys", collection_id,
                 discarded.value(), keys.size());
}

} // namespace

DirectUploader::DirectUploader(config::UploaderConfig config,
                               CredentialBroker& broker,
                               ObjectTransport& transport,
                               events::EventDispatcher& dispatcher)
    : config_(std::move(config)),
      classifier_(config_.limits),
      broker_(broker),
      transport_(transport),
      dispatcher_(dispatcher) {}

BatchResult DirectUploader::upload_files(const std::vector<UploadFile>& files,
                                         const std::string& collection_id,
                                         const CancellationToken& cancel) {
    UploadBatch batch(collection_id);
    ProgressReporter reporter(dispatcher_, collection_id);

    BatchResult result;
    result.collection_id = collection_id;
    result.total = files.size();

    std::uint64_t total_bytes = 0;
    for (const auto& file : files) {
        total_bytes += file.size;
    }
    spdlog::info("[Uploader] collection={} starting batch of {} files ({} bytes)",
                 collection_id, files.size(), total_bytes);
    reporter.batch_started(files.size(), total_bytes);

    const auto finish = [&]() -> BatchResult {
        result.success = result.failed.empty() && result.error.empty() &&
                         (!result.confirmation || result.confirmation->success);
        if (!batch.is_terminal()) {
            if (result.error.empty()) {
                advance(batch, BatchState::Complete);
            } else {
                batch.fail(result.error);
            }
        }
        spdlog::info("[Uploader] collection={} finished: completed={} failed={} success={} state={}",
                     collection_id, result.completed.size(), result.failed.size(), result.success,
                     to_string(batch.state()));
        reporter.batch_completed(result, batch.elapsed());
        return result;
    };

    // Validation
    advance(batch, BatchState::Validating);
    std::vector<ValidatedFile> valid;
    valid.reserve(files.size());
    for (const auto& file : files) {
        std::string error;
        if (collection_id.empty()) {
            error = "Collection id is required";
        } else if (!file.data) {
            error = "No data source for " + file.name;
        } else {
            auto classified = classifier_.validate(file.name, file.size);
            if (classified.is_ok()) {
                valid.push_back(ValidatedFile{&file, classified.value()});
                continue;
            }
            error = classified.error().message;
        }
        spdlog::warn("[Uploader] collection={} rejected {}: {}", collection_id, file.name, error);
        result.failed.push_back(FailedUpload{file.name, {}, error, FailureKind::Validation, 0});
        reporter.file_rejected(file.name, error);
        reporter.file_completed(file.name, {}, false, error, 0, file.size);
        reporter.error(file.name, error);
    }

    if (valid.empty()) {
        return finish();
    }

    // Credentials: a single request so the authority can refuse the batch atomically.
    advance(batch, BatchState::AwaitingCredentials);
    if (cancel.is_cancelled()) {
        for (const auto& entry : valid) {
            result.failed.push_back(
                FailedUpload{entry.file->name, {}, "Upload cancelled", FailureKind::Cancelled, 0});
            reporter.file_completed(entry.file->name, {}, false, "Upload cancelled", 0, entry.file->size);
        }
        result.error = "Upload cancelled";
        return finish();
    }

    std::vector<CredentialRequestItem> request;
    request.reserve(valid.size());
    for (const auto& entry : valid) {
        request.push_back(CredentialRequestItem{entry.file->name, entry.file->content_type, entry.file->size});
    }

    auto issued = broker_.request_credentials(collection_id, request);
    std::string credential_error;
    if (issued.is_error()) {
        credential_error = "Failed to get upload URLs: " + issued.error().message;
    } else {
        credential_error = check_credentials(issued.value(), valid.size());
    }
    if (!credential_error.empty()) {
        spdlog::error("[Uploader] collection={} {}", collection_id, credential_error);
        fail_all(valid, credential_error, result, reporter);
        result.error = credential_error;
        return finish();
    }

    std::vector<UploadTask> tasks;
    tasks.reserve(valid.size());
    for (std::size_t i = 0; i < valid.size(); ++i) {
        tasks.emplace_back(*valid[i].file, valid[i].classification, std::move(issued.value()[i]));
    }

    // Transfers
    advance(batch, BatchState::Transferring);
    SchedulerOptions options;
    options.max_concurrent = config_.max_concurrent;
    options.attempt_timeout = config_.attempt_timeout;
    options.credential_expiry_skew = config_.credential_expiry_skew;
    options.refresh_expired_credentials = config_.refresh_expired_credentials;

    UploadScheduler scheduler(options, transport_, broker_,
                              RetryController(RetryPolicy{config_.max_retries, config_.refresh_expired_credentials}),
                              reporter);
    DrainResult drained = scheduler.run(std::move(tasks), cancel);
    result.failed.insert(result.failed.end(), drained.failed.begin(), drained.failed.end());
    if (drained.cancelled) {
        result.error = "Upload cancelled";
    }
    spdlog::info("[Uploader] collection={} transfers drained: succeeded={} failed={} peak_concurrency={}",
                 collection_id, drained.completed.size(), drained.failed.size(), drained.peak_concurrency);
    discard_abandoned(broker_, collection_id, drained.failed);

    if (drained.completed.empty()) {
        return finish();
    }

    // Confirmation is mandatory: nothing counts as stored until the server says so.
    advance(batch, BatchState::Confirming);
    ConfirmationReconciler reconciler(broker_, reporter, config_.confirmation_timeout);
    Reconciliation verdict = reconciler.reconcile(collection_id, std::move(drained.completed));

    result.completed = std::move(verdict.confirmed);
    result.failed.insert(result.failed.end(), verdict.demoted.begin(), verdict.demoted.end());
    result.confirmation = std::move(verdict.confirmation);
    result.security_violation = verdict.security_violation;
    if (!verdict.error.empty()) {
        result.error = verdict.error;
    }
    return finish();
}

} // namespace directup::upload
