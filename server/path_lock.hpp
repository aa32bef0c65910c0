#pragma once

// ============================================================
// path_lock.hpp -- Per-target-path write serialisation
//
// Two connections that send files resolving to the same output path
// take turns; writers to different paths never block each other.
// Entries exist only while some writer holds or waits for them.
// ============================================================

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

class PathLockTable {
    struct Entry {
        std::mutex mutex;
        size_t     users{0};
    };

public:
    // Holds the lock for one path until destroyed
    class Guard {
    public:
        Guard() = default;
        Guard(PathLockTable* table, std::string key, std::shared_ptr<Entry> entry)
            : table_(table), key_(std::move(key)), entry_(std::move(entry)) {}
        ~Guard() { release(); }

        Guard(Guard&& o) noexcept
            : table_(o.table_), key_(std::move(o.key_)), entry_(std::move(o.entry_)) {
            o.table_ = nullptr;
        }
        Guard& operator=(Guard&& o) noexcept {
            if (this != &o) {
                release();
                table_ = o.table_;
                key_   = std::move(o.key_);
                entry_ = std::move(o.entry_);
                o.table_ = nullptr;
            }
            return *this;
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        bool owns_lock() const { return table_ != nullptr; }

    private:
        PathLockTable*         table_{nullptr};
        std::string            key_;
        std::shared_ptr<Entry> entry_;

        void release();
    };

    PathLockTable() = default;
    PathLockTable(const PathLockTable&) = delete;
    PathLockTable& operator=(const PathLockTable&) = delete;

    // Blocks until no other Guard holds 'path'
    Guard lock(const std::string& path);

    // Number of paths currently held or awaited
    size_t size() const;

private:
    mutable std::mutex                                      mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;

    void release(const std::string& key, const std::shared_ptr<Entry>& entry);
};
