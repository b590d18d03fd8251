#pragma once

#include "rus/upload/storage.hpp"

#include <shared_mutex>
#include <unordered_map>

namespace rus::upload {

/*
  RAM storage tier.

  Bytes live in process memory and vanish on restart.

  Thread safety:
    - shared reads
    - exclusive writes
*/
class MemoryStorage final : public StorageBackend {
public:
    MemoryStorage() = default;
    ~MemoryStorage() override = default;

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

    std::string name() const override { return "memory"; }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::vector<std::uint8_t>> buffers_;
};

} // namespace rus::upload
