#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace directup::upload {

/**
 * ByteSource models an immutable, random-access byte range.
 *
 * Reads are positional so a retry can restart from offset 0 without the
 * source keeping a cursor.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    [[nodiscard]] virtual std::uint64_t size() const = 0;

    /**
     * Copies up to max_len bytes starting at offset into buffer.
     * Returns 0 at end of data. Throws std::runtime_error on I/O failure.
     */
    virtual std::size_t read(std::uint64_t offset, std::uint8_t* buffer, std::size_t max_len) const = 0;
};

/// Opens the file once; reads from concurrent attempts are serialized.
class FileByteSource : public ByteSource {
public:
    explicit FileByteSource(std::filesystem::path path);

    [[nodiscard]] std::uint64_t size() const override { return size_; }
    std::size_t read(std::uint64_t offset, std::uint8_t* buffer, std::size_t max_len) const override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::uint64_t size_ = 0;
    mutable std::mutex mutex_;
    mutable std::ifstream input_;
};

class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::string bytes) : bytes_(std::move(bytes)) {}

    [[nodiscard]] std::uint64_t size() const override { return bytes_.size(); }
    std::size_t read(std::uint64_t offset, std::uint8_t* buffer, std::size_t max_len) const override;

private:
    std::string bytes_;
};

} // namespace directup::upload
