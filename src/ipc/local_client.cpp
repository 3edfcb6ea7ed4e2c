#include "local_client.hpp"
#include "protocol.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

LocalClient::~LocalClient() {
    close();
}

void LocalClient::open() {
    close();
    sock_ = platform::connect_tcp(host_, port_);
    solo_log(fmt::format("LocalClient: connected to {}:{}", host_, port_));
}

void LocalClient::send(const Message& message) {
    std::vector<uint8_t> frame = encode_frame(message);

    if (!connected()) {
        open();
    }

    platform::send_all(sock_, frame.data(), frame.size());
}

void LocalClient::close() noexcept {
    if (sock_ == SOLO_INVALID_SOCKET) return;
    platform::close_socket(sock_);
    sock_ = SOLO_INVALID_SOCKET;
}
