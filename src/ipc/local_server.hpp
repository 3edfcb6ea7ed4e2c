#pragma once

#include <string>
#include <mutex>
#include <condition_variable>
#include <memory>
#include <thread>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "event_loop.hpp"
#include "message.hpp"

enum class ServerState {
    Closed,     // no listener
    Open,       // listening, consume() not running
    Running,    // consume() is dispatching messages
};

// Loopback TCP server receiving framed messages from follower instances.
//
// consume() runs a single-threaded readiness loop: accept new connections,
// read whatever is available on ready ones, feed each connection's decoder
// and hand complete messages to the handler in arrival order.
// close() may be called from any thread and makes consume() return.
class LocalServer {
public:
    LocalServer() = default;
    explicit LocalServer(const ServerConfig& config) : config_(config) {}
    ~LocalServer();

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

    // Bind the configured address (loopback, ephemeral port by default).
    // Throws IllegalStateError if already open, IoError if binding fails.
    void open();
    void open(const std::string& host, int port);

    // Port the listener is bound to. Throws IllegalStateError if not open.
    int port() const;

    // Blocking dispatch loop. Returns once close() is called. Throws
    // IllegalStateError if the server is not open (or already consuming).
    // A failing connection is dropped and logged; the loop keeps going.
    // Exceptions thrown by `handler` are logged and do not stop the loop.
    void consume(const MessageHandler& handler);

    // True while Open or Running.
    bool running() const;
    ServerState state() const;

    // Release the listener and stop consume(). When called from another
    // thread, waits until the loop has closed its connections. Idempotent.
    void close();

private:
    // Close the listener and drop the event loop. Caller holds mutex_.
    void release_locked();

    ServerConfig config_;
    mutable std::mutex mutex_;
    std::condition_variable loop_done_;
    ServerState state_ = ServerState::Closed;
    socket_t listen_fd_ = SOLO_INVALID_SOCKET;
    int port_ = 0;
    std::unique_ptr<EventLoop> loop_;
    std::thread::id loop_thread_;
};
