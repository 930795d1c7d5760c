#include "directup/upload/types.hpp"
#include "directup/upload/classifier.hpp"

#include <filesystem>

namespace directup::upload {

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::Validation: return "validation";
        case FailureKind::Credential: return "credential";
        case FailureKind::Transfer: return "transfer";
        case FailureKind::Cancelled: return "cancelled";
        case FailureKind::Confirmation: return "confirmation";
        case FailureKind::Security: return "security";
    }
    return "unknown";
}

UploadFile UploadFile::from_path(const std::string& path, std::string content_type) {
    auto source = std::make_shared<FileByteSource>(path);
    UploadFile file;
    file.name = std::filesystem::path(path).filename().string();
    file.content_type = content_type.empty() ? FileClassifier::guess_content_type(file.name)
                                             : std::move(content_type);
    file.size = source->size();
    file.data = std::move(source);
    return file;
}

UploadFile UploadFile::from_memory(std::string name, std::string bytes, std::string content_type) {
    UploadFile file;
    file.content_type = content_type.empty() ? FileClassifier::guess_content_type(name)
                                             : std::move(content_type);
    file.name = std::move(name);
    file.size = bytes.size();
    file.data = std::make_shared<MemoryByteSource>(std::move(bytes));
    return file;
}

} // namespace directup::upload
