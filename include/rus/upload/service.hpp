#pragma once

#include "rus/core/result.hpp"
#include "rus/events/event_bus.hpp"
#include "rus/upload/lock_table.hpp"
#include "rus/upload/registry.hpp"
#include "rus/upload/storage.hpp"
#include "rus/upload/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace rus::upload {

struct ServiceOptions {
    std::uint64_t max_size = 0;                         ///< 0 means unlimited
    int storage_retry_attempts = 3;                     ///< Total tries for a transient failure
    std::chrono::milliseconds storage_retry_backoff{50};
};

/**
 * @brief Result of a create call
 *
 * With creation-with-upload, `upload` reflects the initial bytes when they
 * were accepted. When they were refused the upload still exists at offset 0
 * and `initial_append_error` says why.
 */
struct CreateOutcome {
    Upload upload;
    std::optional<Error> initial_append_error;
};

/**
 * @brief Protocol state machine for resumable uploads
 *
 * Validates every operation against the upload's registry state and applies
 * it. Appends follow write-then-commit: bytes are stored durably first, the
 * registry offset moves only afterwards, all under the per-id lock.
 *
 * Thread-safe. Appends to different uploads run in parallel.
 */
class UploadService {
public:
    UploadService(UploadRegistry& registry,
                  StorageBackendPtr storage,
                  events::EventBus& bus,
                  ServiceOptions options = {});

    Result<CreateOutcome> create(CreateRequest request);

    /**
     * @brief Apply one chunk
     *
     * Rejections leave registry and storage untouched. Errors concerning an
     * existing upload carry its committed offset and length.
     */
    Result<Upload> append(const AppendRequest& request);

    Result<UploadStatus> status(const std::string& id) const;

    /**
     * @brief Build a final upload from complete, non-final parents
     *
     * The parents' bytes are copied in order, so the result stays readable
     * after the parents are terminated.
     */
    Result<Upload> concatenate(const std::vector<std::string>& parent_ids, Metadata metadata);

    /**
     * @brief Delete an upload and its bytes; unknown ids succeed
     */
    Result<void> terminate(const std::string& id);

    /**
     * @brief Bytes of a complete upload
     */
    Result<std::vector<std::uint8_t>> read(const std::string& id) const;

    const ServiceOptions& options() const { return options_; }
    UploadRegistry& registry() { return registry_; }
    StorageBackend& storage() { return *storage_; }

private:
    Result<Upload> append_locked(const AppendRequest& request);
    Result<std::size_t> write_with_retry(const std::string& id,
                                         std::uint64_t offset,
                                         const std::vector<std::uint8_t>& bytes);
    void discard(const std::string& id);

    UploadRegistry& registry_;
    StorageBackendPtr storage_;
    events::EventBus& bus_;
    ServiceOptions options_;
    UploadLockTable locks_;
};

} // namespace rus::upload
