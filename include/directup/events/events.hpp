/**
 * @file events.hpp
 * @brief Event types emitted by the upload pipeline and the upload authority
 *
 * NAMING CONVENTION:
 * - Events are past-tense: FileCompletedEvent, ObjectRejectedEvent
 * - Every event carries the collection it belongs to so independent
 *   batches can share one bus
 */

#pragma once

#include "directup/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace directup::events {

// ════════════════════════════════════════════════════════
// Batch Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once the validated files of a batch hold credentials
 *
 * WHO EMITS: DirectUploader
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct BatchStartedEvent {
    std::string collection_id;
    std::size_t file_count = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted after the reconciler verdict, carrying the final summary
 *
 * WHO EMITS: DirectUploader
 * WHO SUBSCRIBES: ObserverBridge (onAllComplete), Logger, Metrics
 */
struct BatchCompletedEvent {
    upload::BatchResult summary;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Per-file Transfer Events
// ════════════════════════════════════════════════════════

/**
 * @brief A file failed validation and was never queued
 */
struct FileRejectedEvent {
    std::string collection_id;
    std::string filename;
    std::string error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferStartedEvent {
    std::string collection_id;
    std::string filename;
    std::string key;
    std::uint32_t attempt = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadProgressEvent {
    std::string collection_id;
    std::string filename;
    std::string key;
    double percent = 0.0;
    std::uint64_t bytes_loaded = 0;
    std::uint64_t bytes_total = 0;
};

struct TransferRetryEvent {
    std::string collection_id;
    std::string filename;
    std::string key;
    std::uint32_t attempt = 0;      ///< Retry number about to run, 1-based
    std::uint32_t max_retries = 0;
    std::string error;
    bool credential_refreshed = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A task reached a local terminal state
 *
 * `key` is empty when the file failed without a usable key.
 */
struct FileCompletedEvent {
    std::string collection_id;
    std::string filename;
    std::string key;
    bool success = false;
    std::string error;
    std::uint32_t attempts = 0;
    std::uint64_t bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Error surfaced to the caller
 *
 * `source` is a filename, or "SECURITY" for confirmation rejections.
 */
struct UploadErrorEvent {
    std::string collection_id;
    std::string source;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Confirmation Events
// ════════════════════════════════════════════════════════

struct ConfirmationCompletedEvent {
    std::string collection_id;
    std::size_t submitted = 0;
    std::optional<upload::ConfirmationResult> result;  ///< Empty when the call itself failed
    std::string error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SecurityViolationEvent {
    std::string collection_id;
    std::string filename;
    std::string key;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Authority Events
// ════════════════════════════════════════════════════════

struct CredentialsIssuedEvent {
    std::string collection_id;
    std::size_t count = 0;
    std::uint64_t declared_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ObjectConfirmedEvent {
    std::string collection_id;
    std::string key;
    std::uint64_t size = 0;
    bool newly_recorded = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ObjectRejectedEvent {
    std::string collection_id;
    std::string key;
    std::string filename;
    std::string reason;
    bool deleted = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief An issued key was dropped without being confirmed
 *
 * Either the uploader gave up on it or it expired unconfirmed. Whatever
 * reached storage under the key is deleted.
 */
struct ObjectDiscardedEvent {
    std::string collection_id;
    std::string key;
    std::string reason;
    bool deleted = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace directup::events
