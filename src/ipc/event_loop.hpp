#pragma once

#include <memory>
#include <vector>
#include <platform/socket_util.hpp>

struct ReadyEvent {
    socket_t fd = SOLO_INVALID_SOCKET;
    bool acceptable = false;    // listener has a pending connection
    bool readable = false;      // data (or EOF/error) waiting on a connection
};

// Readiness notification for the server loop. watch/unwatch/wait are called
// from the loop thread only; interrupt() may be called from any thread and
// makes the current or next wait() return false.
class EventLoop {
public:
    virtual ~EventLoop() = default;

    virtual void watch_accept(socket_t fd) = 0;
    virtual void watch_read(socket_t fd) = 0;
    virtual void unwatch(socket_t fd) = 0;

    // Block until something is ready and fill `events`. Returns false once
    // interrupted. Throws IoError if the underlying wait fails.
    virtual bool wait(std::vector<ReadyEvent>& events) = 0;

    virtual void interrupt() = 0;
    virtual bool interrupted() const = 0;
};

// poll()-based loop with a self-pipe for interruption.
std::unique_ptr<EventLoop> make_event_loop();
