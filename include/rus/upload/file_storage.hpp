#pragma once

#include "rus/upload/storage.hpp"

#include <filesystem>

namespace rus::upload {

/*
  Filesystem storage tier.

  One data file per upload, named after the id, directly under the root.
  Writes go through pwrite + ftruncate + fsync so a successful write() is on
  disk before the registry offset moves.

  errno mapping:
    ENOSPC, EDQUOT                  -> StorageFull
    EAGAIN, EINTR, EBUSY, ETXTBSY   -> StorageUnavailable (retryable)
    ENOENT                          -> NotFound
    anything else                   -> Internal
*/
class FileStorage final : public StorageBackend {
public:
    /**
     * @throws std::filesystem::filesystem_error if the root cannot be created
     */
    explicit FileStorage(std::filesystem::path root);
    ~FileStorage() override = default;

    using StorageBackend::write;

    Result<void> create(const std::string& id) override;

    Result<std::size_t> write(const std::string& id,
                              std::uint64_t offset,
                              const std::uint8_t* data,
                              std::size_t len) override;

    Result<std::uint64_t> read_length(const std::string& id) override;

    Result<std::vector<std::uint8_t>> read(const std::string& id,
                                           std::uint64_t offset,
                                           std::uint64_t length) override;

    Result<std::uint64_t> concatenate(const std::string& target,
                                      const std::vector<std::string>& parents) override;

    Result<void> remove(const std::string& id) override;

    std::string name() const override { return "file"; }

    const std::filesystem::path& root() const { return root_; }

private:
    Result<std::filesystem::path> data_path(const std::string& id) const;

    std::filesystem::path root_;
};

} // namespace rus::upload
