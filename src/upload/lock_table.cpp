#include "rus/upload/lock_table.hpp"

namespace rus::upload {

UploadLock::UploadLock(UploadLockTable* table, std::string id, std::shared_ptr<Slot> slot)
    : table_(table)
    , id_(std::move(id))
    , slot_(std::move(slot)) {
}

UploadLock::UploadLock(UploadLock&& other) noexcept
    : table_(other.table_)
    , id_(std::move(other.id_))
    , slot_(std::move(other.slot_)) {
    other.table_ = nullptr;
}

UploadLock::~UploadLock() {
    if (!slot_) {
        return;
    }
    slot_->mutex.unlock();
    table_->release(id_);
}

UploadLock UploadLockTable::acquire(const std::string& id) {
    std::shared_ptr<UploadLock::Slot> slot;
    {
        std::lock_guard lock(mutex_);
        auto& entry = slots_[id];
        if (!entry) {
            entry = std::make_shared<UploadLock::Slot>();
        }
        entry->holders++;
        slot = entry;
    }

    // Block outside the table mutex so other ids stay unaffected
    slot->mutex.lock();
    return UploadLock(this, id, std::move(slot));
}

std::size_t UploadLockTable::active() const {
    std::lock_guard lock(mutex_);
    return slots_.size();
}

void UploadLockTable::release(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto it = slots_.find(id);
    if (it == slots_.end()) {
        return;
    }
    if (--it->second->holders == 0) {
        slots_.erase(it);
    }
}

} // namespace rus::upload
