#include "directup/upload/reporter.hpp"

namespace directup::upload {

void ProgressReporter::batch_started(std::size_t file_count, std::uint64_t total_bytes) {
    dispatcher_.post(events::BatchStartedEvent{collection_id_, file_count, total_bytes});
}

void ProgressReporter::file_rejected(const std::string& filename, const std::string& error) {
    dispatcher_.post(events::FileRejectedEvent{collection_id_, filename, error});
}

void ProgressReporter::transfer_started(const std::string& filename, const std::string& key,
                                        std::uint32_t attempt, std::uint64_t total_bytes) {
    dispatcher_.post(events::TransferStartedEvent{collection_id_, filename, key, attempt, total_bytes});
}

void ProgressReporter::progress(const std::string& filename, const std::string& key,
                                std::uint64_t loaded, std::uint64_t total) {
    const double percent = total == 0 ? 100.0
                                      : static_cast<double>(loaded) * 100.0 / static_cast<double>(total);
    dispatcher_.post(events::UploadProgressEvent{collection_id_, filename, key, percent, loaded, total});
}

void ProgressReporter::retry_scheduled(const std::string& filename, const std::string& key,
                                       std::uint32_t attempt, std::uint32_t max_retries,
                                       const std::string& error, bool credential_refreshed) {
    dispatcher_.post(events::TransferRetryEvent{collection_id_, filename, key, attempt, max_retries,
                                                error, credential_refreshed});
}

void ProgressReporter::file_completed(const std::string& filename, const std::string& key, bool success,
                                      const std::string& error, std::uint32_t attempts, std::uint64_t bytes) {
    dispatcher_.post(events::FileCompletedEvent{collection_id_, filename, key, success, error, attempts, bytes});
}

void ProgressReporter::error(const std::string& source, const std::string& message) {
    dispatcher_.post(events::UploadErrorEvent{collection_id_, source, message});
}

void ProgressReporter::confirmation_completed(std::size_t submitted,
                                              const std::optional<ConfirmationResult>& result,
                                              const std::string& error) {
    dispatcher_.post(events::ConfirmationCompletedEvent{collection_id_, submitted, result, error});
}

void ProgressReporter::security_violation(const std::string& filename, const std::string& key,
                                          const std::string& reason) {
    dispatcher_.post(events::SecurityViolationEvent{collection_id_, filename, key, reason});
}

void ProgressReporter::batch_completed(const BatchResult& summary, std::chrono::milliseconds duration) {
    dispatcher_.post(events::BatchCompletedEvent{summary, duration});
}

} // namespace directup::upload
