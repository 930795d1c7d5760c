/**
 * @file components.hpp
 * @brief Subscribers that react to upload events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * ObserverBridge bridge(bus, observer, "session-42");
 */

#pragma once

#include "directup/events/event_bus.hpp"
#include "directup/events/events.hpp"
#include "directup/upload/reporter.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace directup::events {

/**
 * @brief Logs every pipeline and authority event with spdlog
 *
 * Progress goes to debug; retries and rejections to warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<BatchStartedEvent>([](const BatchStartedEvent& e) {
            spdlog::info("[BatchStarted] collection={} files={} bytes={}",
                         e.collection_id, e.file_count, e.total_bytes);
        });

        bus_.subscribe<FileRejectedEvent>([](const FileRejectedEvent& e) {
            spdlog::warn("[FileRejected] collection={} file={} error={}", e.collection_id, e.filename, e.error);
        });

        bus_.subscribe<TransferStartedEvent>([](const TransferStartedEvent& e) {
            spdlog::info("[TransferStarted] collection={} file={} key={} attempt={} bytes={}",
                         e.collection_id, e.filename, e.key, e.attempt + 1, e.total_bytes);
        });

        bus_.subscribe<UploadProgressEvent>([](const UploadProgressEvent& e) {
            spdlog::debug("[Progress] file={} {:.1f}% ({}/{})",
                          e.filename, e.percent, e.bytes_loaded, e.bytes_total);
        });

        bus_.subscribe<TransferRetryEvent>([](const TransferRetryEvent& e) {
            spdlog::warn("[Retry] collection={} file={} key={} retry={}/{} refreshed={} error={}",
                         e.collection_id, e.filename, e.key, e.attempt, e.max_retries,
                         e.credential_refreshed, e.error);
        });

        bus_.subscribe<FileCompletedEvent>([](const FileCompletedEvent& e) {
            if (e.success) {
                spdlog::info("[FileCompleted] collection={} file={} key={} bytes={} attempts={}",
                             e.collection_id, e.filename, e.key, e.bytes, e.attempts);
            } else {
                spdlog::error("[FileFailed] collection={} file={} key={} attempts={} error={}",
                              e.collection_id, e.filename, e.key, e.attempts, e.error);
            }
        });

        bus_.subscribe<ConfirmationCompletedEvent>([](const ConfirmationCompletedEvent& e) {
            if (!e.result) {
                spdlog::error("[Confirmation] collection={} submitted={} call failed: {}",
                              e.collection_id, e.submitted, e.error);
                return;
            }
            spdlog::info("[Confirmation] collection={} submitted={} confirmed={} deleted={} size_mismatch={}",
                         e.collection_id, e.submitted, e.result->confirmed_count,
                         e.result->deleted_count, e.result->size_mismatch);
        });

        bus_.subscribe<SecurityViolationEvent>([](const SecurityViolationEvent& e) {
            spdlog::error("[SecurityViolation] collection={} file={} key={} reason={}",
                          e.collection_id, e.filename, e.key, e.reason);
        });

        bus_.subscribe<BatchCompletedEvent>([](const BatchCompletedEvent& e) {
            spdlog::info("[BatchCompleted] collection={} success={} completed={} failed={} total={} duration={}ms",
                         e.summary.collection_id, e.summary.success, e.summary.completed.size(),
                         e.summary.failed.size(), e.summary.total, e.duration.count());
        });

        bus_.subscribe<CredentialsIssuedEvent>([](const CredentialsIssuedEvent& e) {
            spdlog::info("[CredentialsIssued] collection={} count={} declared_bytes={}",
                         e.collection_id, e.count, e.declared_bytes);
        });

        bus_.subscribe<ObjectConfirmedEvent>([](const ObjectConfirmedEvent& e) {
            spdlog::debug("[ObjectConfirmed] collection={} key={} size={} new={}",
                          e.collection_id, e.key, e.size, e.newly_recorded);
        });

        bus_.subscribe<ObjectRejectedEvent>([](const ObjectRejectedEvent& e) {
            spdlog::warn("[ObjectRejected] collection={} key={} deleted={} reason={}",
                         e.collection_id, e.key, e.deleted, e.reason);
        });

        bus_.subscribe<ObjectDiscardedEvent>([](const ObjectDiscardedEvent& e) {
            spdlog::info("[ObjectDiscarded] collection={} key={} deleted={} reason={}",
                         e.collection_id, e.key, e.deleted, e.reason);
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Counters for uploads, retries and server-side verdicts
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> batches_completed{0};
        std::atomic<uint64_t> batches_succeeded{0};
        std::atomic<uint64_t> files_uploaded{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> files_failed{0};
        std::atomic<uint64_t> files_rejected{0};
        std::atomic<uint64_t> transfer_retries{0};
        std::atomic<uint64_t> credential_refreshes{0};
        std::atomic<uint64_t> security_violations{0};
        std::atomic<uint64_t> objects_confirmed{0};
        std::atomic<uint64_t> objects_deleted{0};
        std::atomic<uint64_t> objects_discarded{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<FileCompletedEvent>([this](const FileCompletedEvent& e) {
            if (e.success) {
                stats_.files_uploaded++;
                stats_.bytes_uploaded += e.bytes;
            } else {
                stats_.files_failed++;
            }
        });

        bus_.subscribe<FileRejectedEvent>([this](const FileRejectedEvent&) {
            stats_.files_rejected++;
        });

        bus_.subscribe<TransferRetryEvent>([this](const TransferRetryEvent& e) {
            stats_.transfer_retries++;
            if (e.credential_refreshed) {
                stats_.credential_refreshes++;
            }
        });

        bus_.subscribe<SecurityViolationEvent>([this](const SecurityViolationEvent&) {
            stats_.security_violations++;
        });

        bus_.subscribe<BatchCompletedEvent>([this](const BatchCompletedEvent& e) {
            stats_.batches_completed++;
            if (e.summary.success) {
                stats_.batches_succeeded++;
            }
        });

        bus_.subscribe<ObjectConfirmedEvent>([this](const ObjectConfirmedEvent&) {
            stats_.objects_confirmed++;
        });

        bus_.subscribe<ObjectRejectedEvent>([this](const ObjectRejectedEvent& e) {
            if (e.deleted) {
                stats_.objects_deleted++;
            }
        });

        bus_.subscribe<ObjectDiscardedEvent>([this](const ObjectDiscardedEvent&) {
            stats_.objects_discarded++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Batches:         {} ({} succeeded)", stats_.batches_completed.load(),
                     stats_.batches_succeeded.load());
        spdlog::info("  Files uploaded:  {}", stats_.files_uploaded.load());
        spdlog::info("  Bytes uploaded:  {}", stats_.bytes_uploaded.load());
        spdlog::info("  Files failed:    {}", stats_.files_failed.load());
        spdlog::info("  Files rejected:  {}", stats_.files_rejected.load());
        spdlog::info("  Retries:         {}", stats_.transfer_retries.load());
        spdlog::info("  Cred. refreshes: {}", stats_.credential_refreshes.load());
        spdlog::info("  Security viol.:  {}", stats_.security_violations.load());
        spdlog::info("  Obj. confirmed:  {}", stats_.objects_confirmed.load());
        spdlog::info("  Obj. deleted:    {}", stats_.objects_deleted.load());
        spdlog::info("  Obj. discarded:  {}", stats_.objects_discarded.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

/**
 * @brief Forwards events of one collection to an UploadObserver
 *
 * An empty collection id forwards every batch. Subscriptions are dropped in
 * the destructor, so the bridge may be shorter-lived than the bus.
 */
class ObserverBridge {
public:
    ObserverBridge(EventBus& bus, upload::UploadObserver observer, std::string collection_id = {})
        : bus_(bus), observer_(std::move(observer)), collection_id_(std::move(collection_id)) {
        progress_id_ = bus_.subscribe<UploadProgressEvent>([this](const UploadProgressEvent& e) {
            if (matches(e.collection_id) && observer_.on_progress) {
                observer_.on_progress(e.filename, e.percent, e.bytes_loaded, e.bytes_total);
            }
        });

        complete_id_ = bus_.subscribe<FileCompletedEvent>([this](const FileCompletedEvent& e) {
            if (matches(e.collection_id) && observer_.on_file_complete) {
                std::optional<std::string> key;
                if (e.success) {
                    key = e.key;
                }
                observer_.on_file_complete(e.filename, key, e.success, e.error);
            }
        });

        all_complete_id_ = bus_.subscribe<BatchCompletedEvent>([this](const BatchCompletedEvent& e) {
            if (matches(e.summary.collection_id) && observer_.on_all_complete) {
                observer_.on_all_complete(e.summary);
            }
        });

        error_id_ = bus_.subscribe<UploadErrorEvent>([this](const UploadErrorEvent& e) {
            if (matches(e.collection_id) && observer_.on_error) {
                observer_.on_error(e.source, e.message);
            }
        });
    }

    ~ObserverBridge() {
        bus_.unsubscribe<UploadProgressEvent>(progress_id_);
        bus_.unsubscribe<FileCompletedEvent>(complete_id_);
        bus_.unsubscribe<BatchCompletedEvent>(all_complete_id_);
        bus_.unsubscribe<UploadErrorEvent>(error_id_);
    }

    ObserverBridge(const ObserverBridge&) = delete;
    ObserverBridge& operator=(const ObserverBridge&) = delete;

private:
    bool matches(const std::string& collection_id) const {
        return collection_id_.empty() || collection_id_ == collection_id;
    }

    EventBus& bus_;
    upload::UploadObserver observer_;
    std::string collection_id_;
    size_t progress_id_ = 0;
    size_t complete_id_ = 0;
    size_t all_complete_id_ = 0;
    size_t error_id_ = 0;
};

} // namespace directup::events
