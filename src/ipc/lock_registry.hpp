#pragma once

#include <filesystem>
#include <condition_variable>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <platform/file_lock.hpp>

namespace fs = std::filesystem;

// Process-local table of held lock files. Every LockFile built over the same
// registry shares one OS lock per path: the first acquisition takes the
// flock(), later ones only bump the holder count, and the last release drops
// the lock and deletes the file.
//
// The registry must outlive the LockFiles that use it. Two registries in one
// process behave like two processes: they contend for the same path.
class LockRegistry {
public:
    struct Entry {
        fs::path path;
        int fd = -1;
        int holders = 0;
    };

    LockRegistry() = default;
    ~LockRegistry();

    LockRegistry(const LockRegistry&) = delete;
    LockRegistry& operator=(const LockRegistry&) = delete;

    // Share or take the lock on `path`. Returns nullptr only for a
    // NonBlocking attempt on a lock held elsewhere. A Blocking attempt while
    // another local caller is already waiting on the same path joins that
    // wait instead of requesting the OS lock a second time. Throws IoError.
    std::shared_ptr<Entry> acquire(const fs::path& path, platform::LockWait wait);

    // Drop one holder. Returns true when it was the last one, in which case
    // the OS lock is released and the file deleted.
    bool release(const std::shared_ptr<Entry>& entry) noexcept;

    // Number of local holders of `path` (0 if not held).
    int holders(const fs::path& path) const;

    // Number of paths currently locked through this registry.
    std::size_t size() const;

    // Registry key for a path: absolute and lexically normalized.
    static fs::path key_for(const fs::path& path);

private:
    // Register a freshly locked fd. Caller holds mutex_.
    std::shared_ptr<Entry> publish(const fs::path& key, int fd);

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::map<fs::path, std::shared_ptr<Entry>> entries_;
    std::set<fs::path> pending_;    // paths a local caller is blocked on
};
