#include "file_lock.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <fmt/format.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>

namespace fs = std::filesystem;

namespace platform {

// True when `fd` still refers to the file currently linked at `path`.
static bool same_file(int fd, const fs::path& path) {
    struct stat by_fd{};
    struct stat by_path{};
    if (fstat(fd, &by_fd) != 0) return false;
    if (stat(path.c_str(), &by_path) != 0) return false;
    return by_fd.st_dev == by_path.st_dev && by_fd.st_ino == by_path.st_ino;
}

int lock_file(const fs::path& path, LockWait wait) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
    }

    const int op = LOCK_EX | (wait == LockWait::NonBlocking ? LOCK_NB : 0);

    for (int attempt = 0; attempt < LOCK_REOPEN_MAX_ATTEMPTS; ++attempt) {
        int fd = open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw io_error_from_errno(fmt::format("Cannot open lock file {}", path.string()));
        }

        int rc;
        do {
            rc = flock(fd, op);
        } while (rc != 0 && errno == EINTR);

        if (rc != 0) {
            if (errno == EWOULDBLOCK) {
                close(fd);
                return -1;
            }
            IoError err = io_error_from_errno(fmt::format("flock() failed on {}", path.string()));
            close(fd);
            throw err;
        }

        if (same_file(fd, path)) {
            return fd;
        }

        // Previous holder deleted the file between our open() and flock()
        close(fd);
    }

    throw IoError(fmt::format("Lock file {} keeps being replaced", path.string()));
}

void unlock_file(int fd, const fs::path& path, bool remove) noexcept {
    if (fd < 0) return;
    if (remove) {
        unlink(path.c_str());
    }
    close(fd);
}

} // namespace platform
