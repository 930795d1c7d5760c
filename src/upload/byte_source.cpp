#include "directup/upload/byte_source.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace directup::upload {
namespace fs = std::filesystem;

FileByteSource::FileByteSource(fs::path path) : path_(std::move(path)) {
    std::error_code ec;
    size_ = fs::file_size(path_, ec);
    if (ec) {
        throw std::runtime_error("Failed to stat source file: " + path_.string() + " (" + ec.message() + ")");
    }
    input_.open(path_, std::ios::binary);
    if (!input_) {
        throw std::runtime_error("Failed to open source file: " + path_.string());
    }
}

std::size_t FileByteSource::read(std::uint64_t offset, std::uint8_t* buffer, std::size_t max_len) const {
    if (offset >= size_ || max_len == 0) {
        return 0;
    }

    std::lock_guard lock(mutex_);
    // A short read at the end leaves eof set; the next seek needs it cleared.
    input_.clear();
    input_.seekg(static_cast<std::streamoff>(offset));
    const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(max_len, size_ - offset));
    input_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(wanted));
    if (input_.bad()) {
        throw std::runtime_error("Failed to read source file: " + path_.string());
    }
    return static_cast<std::size_t>(input_.gcount());
}

std::size_t MemoryByteSource::read(std::uint64_t offset, std::uint8_t* buffer, std::size_t max_len) const {
    if (offset >= bytes_.size()) {
        return 0;
    }
    const auto count = std::min<std::size_t>(max_len, bytes_.size() - static_cast<std::size_t>(offset));
    std::memcpy(buffer, bytes_.data() + offset, count);
    return count;
}

} // namespace directup::upload
