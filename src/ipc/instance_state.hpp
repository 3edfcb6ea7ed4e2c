#pragma once

#include <cstdint>
#include <optional>
#include <string>

class LockFile;

// Record the first instance keeps in its lock file:
//   [0:4) pid   int32 big-endian
//   [4:8) port  int32 big-endian, only once the server is open
struct InstanceState {
    int32_t pid = 0;
    std::optional<int32_t> port;

    bool has_port() const { return port.has_value(); }
    std::string to_string() const;
};

// Overwrite the record. Requires (and takes if needed) the lock.
void write_instance_state(LockFile& lock, const InstanceState& state);

// Read the record. A 4-byte file yields a state without a port. Throws
// IllegalStateError if not even the pid has been written yet, IoError if the
// file cannot be read.
InstanceState read_instance_state(LockFile& lock);
