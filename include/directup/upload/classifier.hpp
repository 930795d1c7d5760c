#pragma once

#include "directup/core/result.hpp"
#include "directup/upload/types.hpp"

#include <string>

namespace directup::upload {

struct Classification {
    FileCategory category = FileCategory::Other;
    std::uint64_t max_bytes = 0;
};

/**
 * @brief Maps filenames to a category and its size ceiling
 *
 * Pure: the only state is the configured limit table.
 */
class FileClassifier {
public:
    FileClassifier() = default;
    explicit FileClassifier(CategoryLimits limits) : limits_(limits) {}

    [[nodiscard]] Classification classify(const std::string& filename) const;

    /// A file exactly at the ceiling passes; one byte over is a Validation error.
    [[nodiscard]] directup::Result<Classification> validate(const std::string& filename, std::uint64_t size) const;

    [[nodiscard]] const CategoryLimits& limits() const noexcept { return limits_; }

    /// Lowercase extension including the dot, empty when there is none.
    static std::string extension_of(const std::string& filename);

    static std::string guess_content_type(const std::string& filename);

private:
    CategoryLimits limits_;
};

std::string format_megabytes(std::uint64_t bytes, int precision);

} // namespace directup::upload
