#pragma once

// POSIX socket helpers shared by the IPC server and client.
// All failures are reported as IoError.

#include <string>
#include <cstddef>
#include <cstdint>

using socket_t = int;
#define SOLO_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Create a TCP listener bound to host:port (port 0 = ephemeral).
socket_t listen_tcp(const std::string& host, int port, int backlog);

// Blocking connect to host:port.
socket_t connect_tcp(const std::string& host, int port);

// Port a bound socket is listening on.
int local_port(socket_t sock);

// Write the whole buffer (blocking socket). SIGPIPE is suppressed;
// a peer reset surfaces as IoError.
void send_all(socket_t sock, const uint8_t* data, std::size_t size);

// Close a socket. Ignores invalid handles.
void close_socket(socket_t sock);

} // namespace platform
