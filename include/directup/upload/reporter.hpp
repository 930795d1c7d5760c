#pragma once

#include "directup/events/dispatcher.hpp"
#include "directup/events/events.hpp"
#include "directup/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace directup::upload {

/**
 * @brief Caller-supplied callbacks; any member may be left empty
 *
 * Callbacks run on the dispatcher thread, never on a transfer worker.
 */
struct UploadObserver {
    std::function<void(const std::string& filename, double percent,
                       std::uint64_t loaded, std::uint64_t total)> on_progress;
    std::function<void(const std::string& filename, const std::optional<std::string>& key,
                       bool success, const std::string& error)> on_file_complete;
    std::function<void(const BatchResult& summary)> on_all_complete;
    std::function<void(const std::string& source, const std::string& message)> on_error;
};

/// Source name used by on_error for confirmation rejections.
inline constexpr const char* kSecuritySource = "SECURITY";

/**
 * @brief Relays pipeline state transitions as events for one batch
 *
 * Holds no pipeline state. Every method posts to the dispatcher and returns
 * immediately.
 */
class ProgressReporter {
public:
    ProgressReporter(events::EventDispatcher& dispatcher, std::string collection_id)
        : dispatcher_(dispatcher), collection_id_(std::move(collection_id)) {}

    void batch_started(std::size_t file_count, std::uint64_t total_bytes);
    void file_rejected(const std::string& filename, const std::string& error);
    void transfer_started(const std::string& filename, const std::string& key,
                          std::uint32_t attempt, std::uint64_t total_bytes);
    void progress(const std::string& filename, const std::string& key,
                  std::uint64_t loaded, std::uint64_t total);
    void retry_scheduled(const std::string& filename, const std::string& key, std::uint32_t attempt,
                         std::uint32_t max_retries, const std::string& error, bool credential_refreshed);
    void file_completed(const std::string& filename, const std::string& key, bool success,
                        const std::string& error, std::uint32_t attempts, std::uint64_t bytes);
    void error(const std::string& source, const std::string& message);
    void confirmation_completed(std::size_t submitted, const std::optional<ConfirmationResult>& result,
                                const std::string& error);
    void security_violation(const std::string& filename, const std::string& key, const std::string& reason);
    void batch_completed(const BatchResult& summary, std::chrono::milliseconds duration);

    [[nodiscard]] const std::string& collection_id() const noexcept { return collection_id_; }

private:
    events::EventDispatcher& dispatcher_;
    std::string collection_id_;
};

} // namespace directup::upload
