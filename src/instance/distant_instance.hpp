#pragma once

#include <memory>
#include <ipc/instance_state.hpp>
#include <ipc/local_client.hpp>
#include <ipc/message.hpp>

class LockFile;

// The first instance, seen from a follower. Reads pid/port from the lock
// file and talks to the first instance's server through a LocalClient.
class DistantInstance : public MessageSender {
public:
    // Loads the state immediately. Throws IllegalStateError if the first
    // instance has not written its pid yet, IoError if the file is unreadable.
    explicit DistantInstance(LockFile& lock_file);

    int32_t pid() const { return state_.pid; }

    // Server port. Re-reads the lock file when it was not known yet and
    // throws IllegalStateError if the first instance still is not serving.
    int port();

    // Re-read the lock file.
    void reload();

    const InstanceState& state() const { return state_; }

    // Client bound to port(), created on first use.
    LocalClient& client();

    using MessageSender::send;
    void send(const Message& message) override;

private:
    LockFile& lock_file_;
    InstanceState state_;
    std::unique_ptr<LocalClient> client_;
};
