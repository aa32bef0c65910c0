// ============================================================
// path_lock.cpp -- PathLockTable implementation
// ============================================================

#include "path_lock.hpp"

PathLockTable::Guard PathLockTable::lock(const std::string& path) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto& slot = entries_[path];
        if (!slot) slot = std::make_shared<Entry>();
        slot->users += 1;
        entry = slot;
    }
    // Wait outside the table lock so other paths stay available
    entry->mutex.lock();
    return Guard(this, path, std::move(entry));
}

size_t PathLockTable::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return entries_.size();
}

void PathLockTable::release(const std::string& key, const std::shared_ptr<Entry>& entry) {
    entry->mutex.unlock();
    std::lock_guard<std::mutex> lk(mutex_);
    if (--entry->users == 0) {
        entries_.erase(key);
    }
}

void PathLockTable::Guard::release() {
    if (table_) {
        table_->release(key_, entry_);
        table_ = nullptr;
        entry_.reset();
    }
}
