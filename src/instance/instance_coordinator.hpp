#pragma once

#include <memory>
#include <optional>
#include <core/types.hpp>
#include <ipc/local_server.hpp>
#include "distant_instance.hpp"

class LockFile;

// Decides whether this process is the first instance, and wires the lock
// file, the state record and the server together:
//
//   first:    acquire() -> pid written -> open_server() -> pid+port written
//   follower: find_distant() -> DistantInstance reading pid/port
class InstanceCoordinator {
public:
    explicit InstanceCoordinator(LockFile& lock_file, ServerConfig server_config = {});

    // Take the lock without blocking and record our pid. Returns false, with
    // no side effect, when another process is first.
    bool acquire();

    // nullopt when this process is first; otherwise a handle on the first one.
    std::optional<DistantInstance> find_distant();

    // nullptr when another process is first; otherwise an open server whose
    // port has been recorded next to our pid.
    std::unique_ptr<LocalServer> open_server();

    // Give up the lock (see LockFile::release).
    void release() noexcept;

    LockFile& lock_file() { return lock_file_; }

private:
    LockFile& lock_file_;
    ServerConfig server_config_;
};
