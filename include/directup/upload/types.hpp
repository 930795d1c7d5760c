#pragma once

#include "directup/upload/byte_source.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace directup::upload {

enum class FileCategory {
    RawImage,
    GalleryImage,
    Video,
    Audio,
    Document,
    DesignFile,
    Other
};

const char* to_string(FileCategory category);

/**
 * @brief Per-category maximum object size in bytes
 */
struct CategoryLimits {
    static constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;
    static constexpr std::uint64_t kGiB = 1024ULL * kMiB;

    std::uint64_t raw_image = 5 * kGiB;
    std::uint64_t video = 5 * kGiB;
    std::uint64_t gallery_image = 500 * kMiB;
    std::uint64_t design_file = 500 * kMiB;
    std::uint64_t audio = 100 * kMiB;
    std::uint64_t document = 100 * kMiB;
    std::uint64_t other = 100 * kMiB;

    [[nodiscard]] std::uint64_t limit_for(FileCategory category) const noexcept;
};

/**
 * @brief Caller-owned file handed to the pipeline
 *
 * The pipeline only reads through `data`; it never mutates the handle.
 */
struct UploadFile {
    std::string name;
    std::string content_type = "application/octet-stream";
    std::uint64_t size = 0;
    std::shared_ptr<const ByteSource> data;

    static UploadFile from_path(const std::string& path, std::string content_type = {});
    static UploadFile from_memory(std::string name, std::string bytes, std::string content_type = {});
};

/**
 * @brief Time-limited authorization to write one object
 */
struct WriteCredential {
    std::string key;
    std::string url;
    std::chrono::system_clock::time_point expires_at{};

    [[nodiscard]] bool expires_within(std::chrono::seconds skew) const {
        return std::chrono::system_clock::now() + skew >= expires_at;
    }
};

struct CompletedUpload {
    std::string filename;
    std::string key;
    std::uint64_t size = 0;
    std::uint32_t attempts = 0;
};

enum class FailureKind {
    Validation,
    Credential,
    Transfer,
    Cancelled,
    Confirmation,
    Security
};

const char* to_string(FailureKind kind);

struct FailedUpload {
    std::string filename;
    std::string key;    ///< Empty when the file never received a credential
    std::string error;
    FailureKind kind = FailureKind::Transfer;
    std::uint32_t attempts = 0;
};

/**
 * @brief Locally-successful upload submitted for server verification
 */
struct ConfirmationItem {
    std::string filename;
    std::string key;
    std::uint64_t size = 0;
};

struct DeletedFile {
    std::string key;
    std::string filename;
    std::string reason;
};

/**
 * @brief Authoritative server verdict for a confirmation request
 */
struct ConfirmationResult {
    bool success = false;
    std::size_t confirmed_count = 0;
    std::size_t deleted_count = 0;
    std::vector<DeletedFile> deleted_files;
    bool size_mismatch = false;
    std::uint64_t total_declared_size = 0;
    std::uint64_t total_actual_size = 0;
    std::string error;
};

/**
 * @brief Final summary returned by DirectUploader::upload_files
 *
 * completed.size() + failed.size() == total always holds.
 */
struct BatchResult {
    bool success = false;
    std::string collection_id;
    std::vector<CompletedUpload> completed;
    std::vector<FailedUpload> failed;
    std::size_t total = 0;
    std::optional<ConfirmationResult> confirmation;
    bool security_violation = false;
    std::string error;  ///< Batch-level error, empty when the batch ran to completion
};

} // namespace directup::upload
