#include "instance_state.hpp"
#include "lock_file.hpp"
#include <core/errors.hpp>
#include <fmt/format.h>

std::string InstanceState::to_string() const {
    if (port) {
        return fmt::format("pid={} port={}", pid, *port);
    }
    return fmt::format("pid={} port=?", pid);
}

void write_instance_state(LockFile& lock, const InstanceState& state) {
    lock.write([&state](StateWriter& out) {
        out.write_int32(state.pid);
        if (state.port) {
            out.write_int32(*state.port);
        }
    });
}

InstanceState read_instance_state(LockFile& lock) {
    return lock.read([&lock](StateReader& in) {
        auto pid = in.read_int32();
        if (!pid) {
            throw IllegalStateError(fmt::format(
                "Lock file {} does not contain a process id yet", lock.path().string()));
        }

        InstanceState state;
        state.pid = *pid;
        state.port = in.read_int32();
        return state;
    });
}
