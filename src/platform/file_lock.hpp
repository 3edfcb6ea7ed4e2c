#pragma once

#include <filesystem>

namespace platform {

enum class LockWait {
    NonBlocking,   // fail immediately if another open file holds the lock
    Blocking,      // wait until the lock is granted
};

// Open (creating if absent) the file at `path` read-write and take an
// exclusive flock() on it. Returns the locked descriptor, or -1 when
// `wait` is NonBlocking and the lock is held elsewhere.
//
// flock() locks belong to the open file description: a second open() of the
// same path in this process conflicts with the first, exactly as another
// process would.
//
// If the file is unlinked and recreated while we wait (a releasing holder
// deletes it), the stale descriptor is dropped and the new file is locked.
// Throws IoError if the file cannot be opened or locked.
int lock_file(const std::filesystem::path& path, LockWait wait);

// Delete `path` (if `remove` is set) and close the locked descriptor, which
// releases the lock. The file is unlinked first so a waiter that is granted
// the old inode notices and reopens. Never throws.
void unlock_file(int fd, const std::filesystem::path& path, bool remove) noexcept;

} // namespace platform
