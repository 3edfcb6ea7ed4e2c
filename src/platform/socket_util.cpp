#include "socket_util.hpp"
#include <core/errors.hpp>
#include <fmt/format.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace platform {

// Resolve host (numeric or name) to an IPv4 address.
static sockaddr_in make_address(const std::string& host, int port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) {
        return addr;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || !res) {
        throw IoError(fmt::format("cannot resolve {}: {}", host, gai_strerror(rc)));
    }
    addr.sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return addr;
}

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0 || fcntl(sock, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw io_error_from_errno("fcntl(O_NONBLOCK)");
    }
}

socket_t listen_tcp(const std::string& host, int port, int backlog) {
    sockaddr_in addr = make_address(host, port);

    socket_t sock = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sock < 0) {
        throw io_error_from_errno("socket()");
    }

    int reuse = 1;
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    if (bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        IoError err = io_error_from_errno(fmt::format("bind() failed for {}:{}", host, port));
        close(sock);
        throw err;
    }

    if (listen(sock, backlog) < 0) {
        IoError err = io_error_from_errno(fmt::format("listen() failed for {}:{}", host, port));
        close(sock);
        throw err;
    }

    return sock;
}

socket_t connect_tcp(const std::string& host, int port) {
    sockaddr_in addr = make_address(host, port);

    socket_t sock = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sock < 0) {
        throw io_error_from_errno("socket()");
    }

    int rc;
    do {
        rc = connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        IoError err = io_error_from_errno(fmt::format("connect() to {}:{} failed", host, port));
        close(sock);
        throw err;
    }

    return sock;
}

int local_port(socket_t sock) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        throw io_error_from_errno("getsockname()");
    }
    return ntohs(addr.sin_port);
}

void send_all(socket_t sock, const uint8_t* data, std::size_t size) {
    std::size_t sent = 0;
    while (sent < size) {
        ssize_t w = ::send(sock, data + sent, size - sent, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) continue;
            throw io_error_from_errno("send()");
        }
        sent += static_cast<std::size_t>(w);
    }
}

void close_socket(socket_t sock) {
    if (sock == SOLO_INVALID_SOCKET) return;
    close(sock);
}

} // namespace platform
