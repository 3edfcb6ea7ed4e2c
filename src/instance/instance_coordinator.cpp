#include "instance_coordinator.hpp"
#include <ipc/lock_file.hpp>
#include <ipc/instance_state.hpp>
#include <platform/platform.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

InstanceCoordinator::InstanceCoordinator(LockFile& lock_file, ServerConfig server_config)
    : lock_file_(lock_file), server_config_(std::move(server_config)) {}

bool InstanceCoordinator::acquire() {
    // Already ours: keep the record, it may carry the server port by now
    if (lock_file_.held()) {
        return true;
    }
    if (!lock_file_.acquire()) {
        return false;
    }

    InstanceState state;
    state.pid = platform::current_pid();
    write_instance_state(lock_file_, state);
    return true;
}

std::optional<DistantInstance> InstanceCoordinator::find_distant() {
    if (acquire()) {
        return std::nullopt;
    }
    return std::optional<DistantInstance>(std::in_place, lock_file_);
}

std::unique_ptr<LocalServer> InstanceCoordinator::open_server() {
    if (!acquire()) {
        return nullptr;
    }

    auto server = std::make_unique<LocalServer>(server_config_);
    server->open();

    InstanceState state;
    state.pid = platform::current_pid();
    state.port = server->port();
    write_instance_state(lock_file_, state);

    solo_log(fmt::format("InstanceCoordinator: first instance {} on {}",
                         state.to_string(), lock_file_.path().string()));
    return server;
}

void InstanceCoordinator::release() noexcept {
    lock_file_.release();
}
