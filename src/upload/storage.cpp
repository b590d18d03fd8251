#include "rus/upload/storage.hpp"

#include "rus/upload/file_storage.hpp"
#include "rus/upload/memory_storage.hpp"

#include <spdlog/spdlog.h>

namespace rus::upload {

Result<StorageBackendPtr> make_storage_backend(const std::string& kind,
                                               const std::filesystem::path& root) {
    if (kind == "memory") {
        spdlog::warn("Using in-memory storage, uploads are lost on restart");
        return Ok<StorageBackendPtr>(std::make_shared<MemoryStorage>());
    }

    if (kind == "file") {
        try {
            auto storage = std::make_shared<FileStorage>(root);
            spdlog::info("Storing upload data under {}", root.string());
            return Ok<StorageBackendPtr>(std::move(storage));
        } catch (const std::filesystem::filesystem_error& e) {
            return fail<StorageBackendPtr>(ErrorKind::StorageUnavailable,
                std::string("Cannot prepare data directory: ") + e.what());
        }
    }

    return fail<StorageBackendPtr>(ErrorKind::Malformed, "Unknown storage backend: " + kind);
}

} // namespace rus::upload
