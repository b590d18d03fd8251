#pragma once

#include "rus/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace rus::upload {

/*
  Durable byte storage keyed by upload id.

  The registry owns offsets; a backend only stores bytes. The service calls
  write() first and advances the registry offset only after write() returned
  success, so a backend must not report success before the bytes survive a
  crash.

  Implementations:
    file    -> one data file per upload under a root directory
    memory  -> process-local buffers (tests, ephemeral deployments)
*/
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    /*
      Allocate empty storage for a new upload.
    */
    virtual Result<void> create(const std::string& id) = 0;

    /*
      Write `data` at `offset` and make it durable.

      Afterwards the stored length is exactly offset + data.size(): a stale
      tail from an earlier attempt that was never committed is cut off, so
      retrying a chunk is safe. `offset` past the current end of data is
      InvalidOffset.
    */
    virtual Result<std::size_t> write(const std::string& id,
                                      std::uint64_t offset,
                                      const std::uint8_t* data,
                                      std::size_t len) = 0;

    Result<std::size_t> write(const std::string& id,
                              std::uint64_t offset,
                              const std::vector<std::uint8_t>& data) {
        return write(id, offset, data.data(), data.size());
    }

    /*
      Bytes currently stored for `id`.
    */
    virtual Result<std::uint64_t> read_length(const std::string& id) = 0;

    virtual Result<std::vector<std::uint8_t>> read(const std::string& id,
                                                   std::uint64_t offset,
                                                   std::uint64_t length) = 0;

    /*
      Append every parent's bytes, in order, to the (empty) target.
      Returns the resulting length of the target.
    */
    virtual Result<std::uint64_t> concatenate(const std::string& target,
                                              const std::vector<std::string>& parents) = 0;

    /*
      Remove stored bytes. Removing an id with no bytes succeeds.
    */
    virtual Result<void> remove(const std::string& id) = 0;

    virtual std::string name() const = 0;
};

using StorageBackendPtr = std::shared_ptr<StorageBackend>;

/**
 * @brief Build the backend named in the configuration ("file" or "memory")
 *
 * `root` is only used by the file backend.
 */
Result<StorageBackendPtr> make_storage_backend(const std::string& kind,
                                               const std::filesystem::path& root);

} // namespace rus::upload
