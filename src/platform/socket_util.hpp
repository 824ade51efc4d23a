#pragma once

#include <string>
#include <poll.h>
#include <core/types.hpp>

using socket_t = int;
#define REXEC_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Resolve host and open a non-blocking TCP connection. Tries every resolved
// address (IPv4 and IPv6) in order; timeout_ms bounds all attempts together.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Enable TCP keepalive probes on a connected socket.
void enable_keepalive(socket_t sock);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
