#include "directup/upload/classifier.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace directup::upload {
namespace {

const std::unordered_map<std::string, FileCategory>& extension_table() {
    static const std::unordered_map<std::string, FileCategory> table = [] {
        std::unordered_map<std::string, FileCategory> t;
        for (const char* ext : {".nef", ".cr2", ".cr3", ".arw", ".dng", ".raf", ".orf", ".rw2", ".3fr", ".crw",
                                ".dcr", ".erf", ".k25", ".kdc", ".mrw", ".pef", ".sr2", ".srf", ".x3f"}) {
            t.emplace(ext, FileCategory::RawImage);
        }
        for (const char* ext : {".jpg", ".jpeg", ".png", ".gif", ".bmp", ".webp", ".svg", ".tiff", ".tif", ".heic"}) {
            t.emplace(ext, FileCategory::GalleryImage);
        }
        for (const char* ext : {".mp4", ".mov", ".avi", ".mkv", ".wmv", ".flv", ".webm", ".m4v"}) {
            t.emplace(ext, FileCategory::Video);
        }
        for (const char* ext : {".mp3", ".wav", ".flac", ".aac", ".ogg", ".wma", ".m4a"}) {
            t.emplace(ext, FileCategory::Audio);
        }
        for (const char* ext : {".pdf", ".doc", ".docx", ".txt", ".rtf", ".odt"}) {
            t.emplace(ext, FileCategory::Document);
        }
        for (const char* ext : {".psd", ".ai", ".indd", ".eps", ".xd"}) {
            t.emplace(ext, FileCategory::DesignFile);
        }
        return t;
    }();
    return table;
}

const std::unordered_map<std::string, std::string>& content_type_table() {
    static const std::unordered_map<std::string, std::string> table {
        {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".png", "image/png"},
        {".gif", "image/gif"}, {".bmp", "image/bmp"}, {".webp", "image/webp"},
        {".svg", "image/svg+xml"}, {".tif", "image/tiff"}, {".tiff", "image/tiff"},
        {".heic", "image/heic"}, {".mp4", "video/mp4"}, {".mov", "video/quicktime"},
        {".webm", "video/webm"}, {".mkv", "video/x-matroska"}, {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"}, {".flac", "audio/flac"}, {".m4a", "audio/mp4"},
        {".pdf", "application/pdf"}, {".txt", "text/plain"}, {".rtf", "application/rtf"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".psd", "image/vnd.adobe.photoshop"},
    };
    return table;
}

} // namespace

const char* to_string(FileCategory category) {
    switch (category) {
        case FileCategory::RawImage: return "raw";
        case FileCategory::GalleryImage: return "gallery";
        case FileCategory::Video: return "video";
        case FileCategory::Audio: return "audio";
        case FileCategory::Document: return "document";
        case FileCategory::DesignFile: return "design";
        case FileCategory::Other: return "other";
    }
    return "other";
}

std::uint64_t CategoryLimits::limit_for(FileCategory category) const noexcept {
    switch (category) {
        case FileCategory::RawImage: return raw_image;
        case FileCategory::GalleryImage: return gallery_image;
        case FileCategory::Video: return video;
        case FileCategory::Audio: return audio;
        case FileCategory::Document: return document;
        case FileCategory::DesignFile: return design_file;
        case FileCategory::Other: return other;
    }
    return other;
}

std::string FileClassifier::extension_of(const std::string& filename) {
    const auto dot = filename.find_last_of('.');
    if (dot == std::string::npos) {
        return {};
    }
    std::string ext = filename.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string FileClassifier::guess_content_type(const std::string& filename) {
    const auto& table = content_type_table();
    const auto it = table.find(extension_of(filename));
    return it != table.end() ? it->second : "application/octet-stream";
}

Classification FileClassifier::classify(const std::string& filename) const {
    const auto& table = extension_table();
    const auto it = table.find(extension_of(filename));
    const FileCategory category = it != table.end() ? it->second : FileCategory::Other;
    return Classification{category, limits_.limit_for(category)};
}

directup::Result<Classification> FileClassifier::validate(const std::string& filename, std::uint64_t size) const {
    if (filename.empty()) {
        return directup::Fail<Classification>(ErrorKind::Validation, "File name must not be empty");
    }

    const auto classification = classify(filename);
    if (size > classification.max_bytes) {
        return directup::Fail<Classification>(
            ErrorKind::Validation,
            "File too large: " + filename + " (" + format_megabytes(size, 2) + "MB exceeds " +
                format_megabytes(classification.max_bytes, 0) + "MB limit)");
    }
    return directup::Ok(classification);
}

std::string format_megabytes(std::uint64_t bytes, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision)
        << static_cast<double>(bytes) / static_cast<double>(CategoryLimits::kMiB);
    return oss.str();
}

} // namespace directup::upload
