#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rus::upload {

class UploadLockTable;

/**
 * @brief Exclusive hold on one upload id, released on destruction
 */
class UploadLock {
public:
    UploadLock(UploadLock&& other) noexcept;
    UploadLock& operator=(UploadLock&&) = delete;
    UploadLock(const UploadLock&) = delete;
    UploadLock& operator=(const UploadLock&) = delete;
    ~UploadLock();

    const std::string& id() const { return id_; }

private:
    friend class UploadLockTable;

    struct Slot {
        std::mutex mutex;
        std::size_t holders = 0;   // Guarded by the table mutex
    };

    UploadLock(UploadLockTable* table, std::string id, std::shared_ptr<Slot> slot);

    UploadLockTable* table_;
    std::string id_;
    std::shared_ptr<Slot> slot_;
};

/**
 * @brief Per-upload mutual exclusion
 *
 * Maps id -> reference counted mutex slot. A slot exists only while at least
 * one thread holds or waits for it, so the table stays as small as the set
 * of uploads currently being touched. Different ids never share a mutex.
 *
 * USAGE:
 * auto lock = locks.acquire(id);
 * // validate, write, advance
 */
class UploadLockTable {
public:
    UploadLockTable() = default;
    UploadLockTable(const UploadLockTable&) = delete;
    UploadLockTable& operator=(const UploadLockTable&) = delete;

    UploadLock acquire(const std::string& id);

    /**
     * @brief Number of ids with a live slot
     */
    std::size_t active() const;

private:
    friend class UploadLock;

    void release(const std::string& id);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<UploadLock::Slot>> slots_;
};

} // namespace rus::upload
