#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

// Positioned big-endian writer over a lock file descriptor, starting at
// offset 0. Uses pwrite() so the descriptor's own offset is untouched.
class StateWriter {
public:
    explicit StateWriter(int fd) : fd_(fd) {}

    void write_int32(int32_t value);
    void write_bytes(const uint8_t* data, std::size_t size);

    std::size_t offset() const { return offset_; }

private:
    int fd_;
    std::size_t offset_ = 0;
};

// Positioned big-endian reader starting at offset 0. A short file is not an
// error: reads past the end report "nothing there" instead.
class StateReader {
public:
    // When `owns_fd` is set the descriptor is closed with the reader.
    StateReader(int fd, bool owns_fd) : fd_(fd), owns_fd_(owns_fd) {}
    ~StateReader();

    StateReader(const StateReader&) = delete;
    StateReader& operator=(const StateReader&) = delete;

    // Next 4 bytes as a big-endian int32, or nullopt if fewer remain.
    std::optional<int32_t> read_int32();

    // Read up to `size` bytes. Returns how many were available.
    std::size_t read_bytes(uint8_t* out, std::size_t size);

    std::size_t offset() const { return offset_; }

private:
    int fd_;
    bool owns_fd_;
    std::size_t offset_ = 0;
};
