#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <utility>
#include "lock_registry.hpp"
#include "state_stream.hpp"

namespace fs = std::filesystem;

// Exclusive lock over one file, doubling as the storage for a tiny record
// (see InstanceState). Holders in one process share the OS lock through a
// LockRegistry; other processes see it as taken.
//
// A LockFile is a scoped resource: the destructor releases it. One LockFile
// object is not meant to be shared between threads; give each thread its own
// over the same registry instead.
class LockFile {
public:
    using Writer = std::function<void(StateWriter&)>;

    LockFile(LockRegistry& registry, const fs::path& path);
    ~LockFile();

    LockFile(const LockFile&) = delete;
    LockFile& operator=(const LockFile&) = delete;

    // Try to take the lock without blocking. Returns false if another
    // process holds it. Calling again while held is a no-op returning true.
    // Throws IoError if the file cannot be created or opened.
    bool acquire();

    // Take the lock, waiting as long as needed.
    void lock();

    // Give up this holder's share. The last holder in the process releases
    // the OS lock and deletes the file. Idempotent, never throws.
    void release() noexcept;

    bool held() const { return entry_ != nullptr; }
    const fs::path& path() const { return path_; }

    // Truncate the file and hand `writer` a stream positioned at offset 0.
    // Takes the lock if needed; throws IllegalStateError if it is held
    // by another process.
    void write(const Writer& writer);

    // Hand `reader` a stream positioned at offset 0 and return its result.
    // Works without holding the lock. Throws IoError if the file is missing.
    template <typename Fn>
    auto read(Fn&& reader) -> decltype(reader(std::declval<StateReader&>())) {
        StateReader in = open_reader();
        return reader(in);
    }

private:
    StateReader open_reader() const;

    LockRegistry& registry_;
    fs::path path_;
    std::shared_ptr<LockRegistry::Entry> entry_;
};
