#include "lock_file.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <fcntl.h>
#include <unistd.h>

LockFile::LockFile(LockRegistry& registry, const fs::path& path)
    : registry_(registry), path_(LockRegistry::key_for(path)) {}

LockFile::~LockFile() {
    release();
}

bool LockFile::acquire() {
    if (!entry_) {
        entry_ = registry_.acquire(path_, platform::LockWait::NonBlocking);
    }
    return entry_ != nullptr;
}

void LockFile::lock() {
    if (!entry_) {
        entry_ = registry_.acquire(path_, platform::LockWait::Blocking);
    }
}

void LockFile::release() noexcept {
    if (!entry_) return;
    registry_.release(entry_);
    entry_.reset();
}

void LockFile::write(const Writer& writer) {
    if (!acquire()) {
        throw IllegalStateError(fmt::format("Cannot acquire write access to lock file {}", path_.string()));
    }

    if (ftruncate(entry_->fd, 0) != 0) {
        throw io_error_from_errno(fmt::format("Cannot truncate lock file {}", path_.string()));
    }

    StateWriter out(entry_->fd);
    writer(out);
}

StateReader LockFile::open_reader() const {
    if (entry_) {
        return StateReader(entry_->fd, false);
    }

    int fd = open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw io_error_from_errno(fmt::format("Cannot open lock file {}", path_.string()));
    }
    return StateReader(fd, true);
}
