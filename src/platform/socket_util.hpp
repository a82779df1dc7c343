#pragma once

// POSIX socket helpers used by the libssh2 transport.

#include <poll.h>
#include <string>
#include <core/types.hpp>

using socket_t = int;
#define SSHBRIDGE_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Enable TCP keepalive probes (idle 60s, interval 15s, 4 probes).
void set_tcp_keepalive(socket_t sock);

// Resolve host and open a non-blocking TCP connection, trying each
// address in turn until one connects within timeout_ms overall.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
