#pragma once

#include "rus/core/result.hpp"
#include "rus/upload/types.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace rus::upload {

/**
 * @brief Source of truth for upload state (length, offset, roles, expiry)
 *
 * All members are internally synchronized with a reader/writer lock, and each
 * call is atomic on its own. Serializing a whole append (validate, write,
 * advance) is the job of UploadLockTable, not of the registry.
 *
 * PERSISTENCE:
 * With a `persist_dir`, every mutation first writes `<dir>/<id>.info` (JSON,
 * temp file + rename) and only then updates memory, so a failed write leaves
 * both views unchanged. Existing `.info` files are loaded on construction;
 * records that do not parse are reported as Corrupted and never touched.
 */
class UploadRegistry {
public:
    struct Options {
        std::chrono::seconds expiry{86400};               ///< 0 disables expiry
        std::optional<std::filesystem::path> persist_dir;
        std::function<Clock::time_point()> now;           ///< Defaults to Clock::now
    };

    UploadRegistry();
    explicit UploadRegistry(Options options);

    UploadRegistry(const UploadRegistry&) = delete;
    UploadRegistry& operator=(const UploadRegistry&) = delete;

    Result<Upload> create(Metadata metadata, std::optional<std::uint64_t> total_length, bool is_partial);

    /**
     * @brief Create a final (concatenated) upload in one step
     *
     * The new upload starts at offset 0 with its length fixed to
     * `total_length`; the caller advances the offset once the joined bytes
     * are stored.
     */
    Result<Upload> create_final(const std::vector<std::string>& parent_ids,
                                Metadata metadata,
                                std::uint64_t total_length);

    /**
     * NotFound if absent, removed or expired; Corrupted if the persisted
     * record could not be loaded.
     */
    Result<Upload> get(const std::string& id) const;

    /**
     * @brief Move the committed offset forward
     *
     * InvalidOffset if `new_offset` is below the current offset or beyond the
     * declared length. Refreshes `expires_at` (sliding expiry).
     */
    Result<Upload> advance_offset(const std::string& id, std::uint64_t new_offset);

    /**
     * @brief Fix the length of a deferred-length upload
     *
     * Declaring the same length again is accepted. A different value is
     * LengthImmutable, a value below the current offset is InvalidLength.
     */
    Result<Upload> declare_length(const std::string& id, std::uint64_t length);

    Result<void> mark_final(const std::string& id, const std::vector<std::string>& parent_ids);

    /**
     * @brief Delete the entry (expired or not) and tombstone the id
     *
     * @return true if an entry was removed
     */
    bool remove(const std::string& id);

    /**
     * @brief Remove every entry whose expiry is at or before `now`
     *
     * @return ids that were removed
     */
    std::vector<std::string> sweep_expired(Clock::time_point now);

    bool is_tombstoned(const std::string& id) const;
    bool is_corrupted(const std::string& id) const;
    std::size_t size() const;

    Clock::time_point now() const { return options_.now(); }

private:
    using UploadMap = std::unordered_map<std::string, Upload>;

    // Callers hold mutex_ (shared or exclusive)
    Result<UploadMap::iterator> find_live(const std::string& id);
    Result<void> check_known(const std::string& id) const;

    Result<Upload> insert(Upload upload);
    Result<void> persist(const Upload& upload) const;
    void forget(const std::string& id);

    std::filesystem::path info_path(const std::string& id) const;
    std::optional<Clock::time_point> expiry_from(Clock::time_point now) const;
    std::string generate_id();
    void load_existing();

    Options options_;
    mutable std::shared_mutex mutex_;
    UploadMap uploads_;
    std::unordered_set<std::string> tombstones_;
    std::unordered_set<std::string> corrupted_;
    std::mt19937_64 rng_;
};

} // namespace rus::upload
