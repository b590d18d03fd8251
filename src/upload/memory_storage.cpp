#include "rus/upload/memory_storage.hpp"

#include <mutex>

namespace rus::upload {

Result<void> MemoryStorage::create(const std::string& id) {
    std::unique_lock lock(mutex_);
    buffers_[id].clear();
    return Ok();
}

Result<std::size_t> MemoryStorage::write(const std::string& id,
                                         std::uint64_t offset,
                                         const std::uint8_t* data,
                                         std::size_t len) {
    std::unique_lock lock(mutex_);

    auto it = buffers_.find(id);
    if (it == buffers_.end()) {
        return fail<std::size_t>(ErrorKind::NotFound, "No storage for " + id);
    }

    auto& buffer = it->second;
    if (offset > buffer.size()) {
        return fail<std::size_t>(ErrorKind::InvalidOffset,
            "Write at " + std::to_string(offset) + " past end of data (" +
            std::to_string(buffer.size()) + ") for " + id);
    }

    buffer.resize(static_cast<std::size_t>(offset));
    buffer.insert(buffer.end(), data, data + len);
    return Ok<std::size_t>(len);
}

Result<std::uint64_t> MemoryStorage::read_length(const std::string& id) {
    std::shared_lock lock(mutex_);

    auto it = buffers_.find(id);
    if (it == buffers_.end()) {
        return fail<std::uint64_t>(ErrorKind::NotFound, "No storage for " + id);
    }
    return Ok<std::uint64_t>(it->second.size());
}

Result<std::vector<std::uint8_t>> MemoryStorage::read(const std::string& id,
                                                      std::uint64_t offset,
                                                      std::uint64_t length) {
    using Bytes = std::vector<std::uint8_t>;
    std::shared_lock lock(mutex_);

    auto it = buffers_.find(id);
    if (it == buffers_.end()) {
        return fail<Bytes>(ErrorKind::NotFound, "No storage for " + id);
    }

    const auto& buffer = it->second;
    if (offset > buffer.size() || length > buffer.size() - offset) {
        return fail<Bytes>(ErrorKind::InvalidOffset, "Range outside stored data for " + id);
    }

    const auto begin = buffer.begin() + static_cast<std::ptrdiff_t>(offset);
    return Ok(Bytes(begin, begin + static_cast<std::ptrdiff_t>(length)));
}

Result<std::uint64_t> MemoryStorage::concatenate(const std::string& target,
                                                 const std::vector<std::string>& parents) {
    std::unique_lock lock(mutex_);

    std::vector<std::uint8_t> joined;
    for (const auto& parent : parents) {
        auto it = buffers_.find(parent);
        if (it == buffers_.end()) {
            return fail<std::uint64_t>(ErrorKind::NotFound, "No storage for " + parent);
        }
        joined.insert(joined.end(), it->second.begin(), it->second.end());
    }

    const auto total = static_cast<std::uint64_t>(joined.size());
    buffers_[target] = std::move(joined);
    return Ok<std::uint64_t>(total);
}

Result<void> MemoryStorage::remove(const std::string& id) {
    std::unique_lock lock(mutex_);
    buffers_.erase(id);
    return Ok();
}

} // namespace rus::upload
