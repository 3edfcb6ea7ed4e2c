#pragma once

#include <string>
#include <core/constants.hpp>
#include <platform/socket_util.hpp>
#include "message.hpp"

// Sends framed messages to a LocalServer on a known port. The connection is
// opened on first send, and again on the next send after close().
class LocalClient : public MessageSender {
public:
    explicit LocalClient(int port, std::string host = LOOPBACK_HOST)
        : port_(port), host_(std::move(host)) {}
    ~LocalClient() override;

    LocalClient(const LocalClient&) = delete;
    LocalClient& operator=(const LocalClient&) = delete;

    // Connect now. Throws IoError if nothing accepts on the port.
    void open();

    // Encode and write one frame, connecting first if needed. A connection
    // dropped by the server is not retried: the write fails with IoError.
    using MessageSender::send;
    void send(const Message& message) override;

    // Drop the connection. Idempotent.
    void close() noexcept;

    bool connected() const { return sock_ != SOLO_INVALID_SOCKET; }
    int port() const { return port_; }

private:
    int port_;
    std::string host_;
    socket_t sock_ = SOLO_INVALID_SOCKET;
};
