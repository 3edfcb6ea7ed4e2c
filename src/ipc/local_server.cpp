#include "local_server.hpp"
#include "protocol.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <unordered_map>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace {

// One decoder per accepted connection, keyed by its socket.
using ConnectionMap = std::unordered_map<socket_t, FrameDecoder>;

void drop_connection(socket_t fd, EventLoop& loop, ConnectionMap& conns) {
    loop.unwatch(fd);
    conns.erase(fd);
    platform::close_socket(fd);
}

void accept_pending(socket_t listen_fd, EventLoop& loop, ConnectionMap& conns) {
    while (true) {
        socket_t client = accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0) {
            if (errno == EINTR || errno == ECONNABORTED) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            solo_log(fmt::format("LocalServer: accept() failed: {}", std::strerror(errno)));
            return;
        }

        try {
            platform::set_nonblocking(client);
        } catch (const IoError& e) {
            solo_log(fmt::format("LocalServer: dropping fd={}: {}", client, e.what()));
            platform::close_socket(client);
            continue;
        }

        loop.watch_read(client);
        conns.emplace(client, FrameDecoder{});
        solo_log(fmt::format("LocalServer: accepted connection fd={}", client));
    }
}

void dispatch(const MessageHandler& handler, const Message& message) {
    try {
        handler(message);
    } catch (const std::exception& e) {
        solo_log(fmt::format("LocalServer: handler failed on {}: {}", message.name, e.what()));
    }
}

void read_connection(socket_t fd, std::vector<uint8_t>& buffer, EventLoop& loop,
                     ConnectionMap& conns, const MessageHandler& handler) {
    auto it = conns.find(fd);
    if (it == conns.end()) return;

    ssize_t n = recv(fd, buffer.data(), buffer.size(), 0);
    if (n > 0) {
        FrameDecoder& decoder = it->second;
        decoder.feed(buffer.data(), static_cast<std::size_t>(n));
        for (const auto& message : decoder.take()) {
            dispatch(handler, message);
        }
        return;
    }

    if (n == 0) {
        if (it->second.in_frame()) {
            solo_log(fmt::format("LocalServer: fd={} closed mid-frame", fd));
        }
        solo_log(fmt::format("LocalServer: connection fd={} closed", fd));
        drop_connection(fd, loop, conns);
        return;
    }

    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return;

    solo_log(fmt::format("LocalServer: read failed on fd={}: {}", fd, std::strerror(errno)));
    drop_connection(fd, loop, conns);
}

} // namespace

LocalServer::~LocalServer() {
    try {
        close();
    } catch (const std::exception& e) {
        solo_log(fmt::format("LocalServer: error while closing: {}", e.what()));
    }
}

void LocalServer::open() {
    open(config_.host, config_.port);
}

void LocalServer::open(const std::string& host, int port) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ServerState::Closed) {
        throw IllegalStateError("Server is already open");
    }

    auto loop = make_event_loop();
    socket_t fd = platform::listen_tcp(host, port, config_.backlog);
    try {
        platform::set_nonblocking(fd);
        port_ = platform::local_port(fd);
    } catch (const IoError&) {
        platform::close_socket(fd);
        throw;
    }

    listen_fd_ = fd;
    loop_ = std::move(loop);
    state_ = ServerState::Open;
    solo_log(fmt::format("LocalServer: listening on {}:{}", host, port_));
}

int LocalServer::port() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ServerState::Closed) {
        throw IllegalStateError("Server must be opened");
    }
    return port_;
}

bool LocalServer::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ServerState::Open) return true;
    return state_ == ServerState::Running && !loop_->interrupted();
}

ServerState LocalServer::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void LocalServer::consume(const MessageHandler& handler) {
    EventLoop* loop = nullptr;
    socket_t listen_fd = SOLO_INVALID_SOCKET;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ServerState::Closed) {
            throw IllegalStateError("Server must be opened");
        }
        if (state_ == ServerState::Running) {
            throw IllegalStateError("Server is already consuming");
        }
        state_ = ServerState::Running;
        loop_thread_ = std::this_thread::get_id();
        loop = loop_.get();
        listen_fd = listen_fd_;
    }

    ConnectionMap conns;

    // Whatever ends the loop (close(), a failing wait), tear everything down
    // and wake a close() waiting on another thread.
    struct LoopExit {
        LocalServer& server;
        ConnectionMap& conns;
        ~LoopExit() {
            for (auto& kv : conns) {
                platform::close_socket(kv.first);
            }
            conns.clear();
            std::lock_guard<std::mutex> lock(server.mutex_);
            server.release_locked();
            server.loop_done_.notify_all();
        }
    } loop_exit{*this, conns};

    loop->watch_accept(listen_fd);

    std::vector<uint8_t> buffer(static_cast<std::size_t>(config_.read_buffer));
    std::vector<ReadyEvent> events;

    while (loop->wait(events)) {
        for (const auto& ev : events) {
            if (loop->interrupted()) break;
            if (ev.acceptable) {
                accept_pending(listen_fd, *loop, conns);
            } else if (ev.readable) {
                read_connection(ev.fd, buffer, *loop, conns, handler);
            }
        }
    }

    solo_log(fmt::format("LocalServer: loop stopped, {} connection(s) dropped", conns.size()));
}

void LocalServer::close() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ == ServerState::Closed) return;

    if (state_ == ServerState::Running) {
        loop_->interrupt();
        // Called from a handler: the loop releases everything as it unwinds
        if (std::this_thread::get_id() == loop_thread_) return;
        loop_done_.wait(lock, [this] { return state_ != ServerState::Running; });
        return;
    }

    release_locked();
}

void LocalServer::release_locked() {
    if (listen_fd_ != SOLO_INVALID_SOCKET) {
        platform::close_socket(listen_fd_);
        listen_fd_ = SOLO_INVALID_SOCKET;
        solo_log(fmt::format("LocalServer: closed listener on port {}", port_));
    }
    loop_.reset();
    port_ = 0;
    loop_thread_ = std::thread::id();
    state_ = ServerState::Closed;
}
