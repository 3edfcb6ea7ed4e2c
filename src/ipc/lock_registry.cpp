#include "lock_registry.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

LockRegistry::~LockRegistry() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : entries_) {
        platform::unlock_file(kv.second->fd, kv.second->path, true);
        kv.second->fd = -1;
        kv.second->holders = 0;
    }
    entries_.clear();
}

fs::path LockRegistry::key_for(const fs::path& path) {
    return fs::absolute(path).lexically_normal();
}

std::shared_ptr<LockRegistry::Entry> LockRegistry::acquire(const fs::path& path,
                                                           platform::LockWait wait) {
    const fs::path key = key_for(path);

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            ++it->second->holders;
            return it->second;
        }
        if (pending_.count(key) == 0) break;

        // A local caller is already blocked on the OS lock for this path,
        // which means another process holds it.
        if (wait == platform::LockWait::NonBlocking) {
            return nullptr;
        }
        changed_.wait(lock);
    }

    if (wait == platform::LockWait::NonBlocking) {
        int fd = platform::lock_file(key, wait);
        if (fd < 0) {
            return nullptr;
        }
        solo_log(fmt::format("LockRegistry: locked {}", key.string()));
        return publish(key, fd);
    }

    // Only this caller asks the OS; later local callers wait on changed_
    // and share the entry once it is published. Other paths stay usable.
    pending_.insert(key);
    lock.unlock();

    int fd;
    try {
        fd = platform::lock_file(key, wait);
    } catch (...) {
        lock.lock();
        pending_.erase(key);
        changed_.notify_all();
        throw;
    }

    lock.lock();
    pending_.erase(key);
    auto entry = publish(key, fd);
    changed_.notify_all();
    solo_log(fmt::format("LockRegistry: locked {} (blocking)", key.string()));
    return entry;
}

std::shared_ptr<LockRegistry::Entry> LockRegistry::publish(const fs::path& key, int fd) {
    auto entry = std::make_shared<Entry>();
    entry->path = key;
    entry->fd = fd;
    entry->holders = 1;
    entries_[key] = entry;
    return entry;
}

bool LockRegistry::release(const std::shared_ptr<Entry>& entry) noexcept {
    if (!entry) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    if (entry->holders <= 0) return false;
    if (--entry->holders > 0) return false;

    platform::unlock_file(entry->fd, entry->path, true);
    entry->fd = -1;

    auto it = entries_.find(entry->path);
    if (it != entries_.end() && it->second == entry) {
        entries_.erase(it);
    }
    return true;
}

int LockRegistry::holders(const fs::path& path) const {
    const fs::path key = key_for(path);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it == entries_.end() ? 0 : it->second->holders;
}

std::size_t LockRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}
