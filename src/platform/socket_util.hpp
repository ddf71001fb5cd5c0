#pragma once

// POSIX socket helpers shared by the SSH session and the forward binder.

#include <atomic>
#include <string>
#include <poll.h>
#include <core/types.hpp>

using socket_t = int;
#define TUNNELD_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Enable TCP keepalive (idle/interval/count in seconds).
void enable_tcp_keepalive(socket_t sock, int idle, int interval, int count);

// Resolve `host` and open a TCP connection, trying each address in turn.
// The connect wait is sliced so a set `cancelled` flag aborts within ~100ms.
// Errors: NetworkUnreachable (resolve/refused/unreachable), Timeout.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms,
                             const std::atomic<bool>& cancelled);

} // namespace platform
