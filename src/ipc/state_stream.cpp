#include "state_stream.hpp"
#include <core/errors.hpp>
#include <unistd.h>
#include <cerrno>

void StateWriter::write_int32(int32_t value) {
    uint32_t v = static_cast<uint32_t>(value);
    uint8_t buf[4] = {
        static_cast<uint8_t>(v >> 24),
        static_cast<uint8_t>(v >> 16),
        static_cast<uint8_t>(v >> 8),
        static_cast<uint8_t>(v),
    };
    write_bytes(buf, sizeof(buf));
}

void StateWriter::write_bytes(const uint8_t* data, std::size_t size) {
    std::size_t done = 0;
    while (done < size) {
        ssize_t w = pwrite(fd_, data + done, size - done,
                           static_cast<off_t>(offset_ + done));
        if (w < 0) {
            if (errno == EINTR) continue;
            throw io_error_from_errno("Cannot write lock file");
        }
        done += static_cast<std::size_t>(w);
    }
    offset_ += size;
}

StateReader::~StateReader() {
    if (owns_fd_ && fd_ >= 0) {
        close(fd_);
    }
}

std::optional<int32_t> StateReader::read_int32() {
    uint8_t buf[4];
    if (read_bytes(buf, sizeof(buf)) != sizeof(buf)) {
        return std::nullopt;
    }
    uint32_t v = (static_cast<uint32_t>(buf[0]) << 24) |
                 (static_cast<uint32_t>(buf[1]) << 16) |
                 (static_cast<uint32_t>(buf[2]) << 8) |
                 static_cast<uint32_t>(buf[3]);
    return static_cast<int32_t>(v);
}

std::size_t StateReader::read_bytes(uint8_t* out, std::size_t size) {
    std::size_t done = 0;
    while (done < size) {
        ssize_t r = pread(fd_, out + done, size - done,
                          static_cast<off_t>(offset_ + done));
        if (r < 0) {
            if (errno == EINTR) continue;
            throw io_error_from_errno("Cannot read lock file");
        }
        if (r == 0) break;  // EOF
        done += static_cast<std::size_t>(r);
    }
    offset_ += done;
    return done;
}
