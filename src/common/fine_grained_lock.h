#pragma once

#include <cstddef>
#include <memory>
#include <mutex>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

namespace Leasehold {

// One lock per key, created on first use and dropped once no thread holds or
// waits for it. Distinct keys never contend. Locks are re-entrant so a
// callback running under a key's lock may call back into code that locks the
// same key on the same thread.
template<typename Key>
class KeyedLock {
private:
    struct Entry {
        std::recursive_mutex mutex;
        size_t refs = 0;  // holders plus waiters, guarded by KeyedLock::mutex_
    };

public:
    KeyedLock() = default;

    KeyedLock(const KeyedLock&) = delete;
    KeyedLock& operator=(const KeyedLock&) = delete;

    // RAII guard holding one key's lock
    class Guard {
    public:
        Guard(KeyedLock& locks, const Key& key)
            : locks_(locks), key_(key), entry_(locks_.Pin(key_)) {
            entry_->mutex.lock();
        }

        ~Guard() {
            entry_->mutex.unlock();
            locks_.Unpin(key_);
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        KeyedLock& locks_;
        Key key_;
        Entry* entry_;
    };

    // Number of keys currently locked or waited for
    size_t size() const {
        absl::MutexLock lock(&mutex_);
        return entries_.size();
    }

private:
    Entry* Pin(const Key& key) {
        absl::MutexLock lock(&mutex_);
        std::unique_ptr<Entry>& entry = entries_[key];
        if (!entry) {
            entry = std::make_unique<Entry>();
        }
        ++entry->refs;
        return entry.get();
    }

    void Unpin(const Key& key) {
        absl::MutexLock lock(&mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end() && --it->second->refs == 0) {
            entries_.erase(it);
        }
    }

    mutable absl::Mutex mutex_;
    absl::flat_hash_map<Key, std::unique_ptr<Entry>> entries_ ABSL_GUARDED_BY(mutex_);
};

} // namespace Leasehold
