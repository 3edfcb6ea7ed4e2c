#include "distant_instance.hpp"
#include <ipc/lock_file.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

DistantInstance::DistantInstance(LockFile& lock_file)
    : lock_file_(lock_file) {
    reload();
}

void DistantInstance::reload() {
    state_ = read_instance_state(lock_file_);
    solo_log(fmt::format("DistantInstance: {} from {}", state_.to_string(), lock_file_.path().string()));
}

int DistantInstance::port() {
    if (!state_.has_port()) {
        try {
            reload();
        } catch (const IoError& e) {
            solo_log(fmt::format("DistantInstance: reload failed: {}", e.what()));
        }

        if (!state_.has_port()) {
            throw IllegalStateError("The distant server is not started or its port cannot be read");
        }
    }
    return *state_.port;
}

LocalClient& DistantInstance::client() {
    if (!client_) {
        client_ = std::make_unique<LocalClient>(port());
    }
    return *client_;
}

void DistantInstance::send(const Message& message) {
    client().send(message);
}
