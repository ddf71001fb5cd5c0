#include "socket_util.hpp"
#include <chrono>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>
#include <fmt/format.h>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    if (sock >= 0) close(sock);
}

void enable_tcp_keepalive(socket_t sock, int idle, int interval, int count) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, &count, sizeof(count));
#endif
}

static ErrorType classify_errno(int err) {
    return err == ETIMEDOUT ? ErrorType::Timeout : ErrorType::NetworkUnreachable;
}

// Wait for a non-blocking connect in 100ms slices. Returns 0 when connected,
// the socket error otherwise, ETIMEDOUT past the deadline, ECANCELED if cancelled.
static int wait_connected(socket_t sock,
                          std::chrono::steady_clock::time_point deadline,
                          const std::atomic<bool>& cancelled) {
    while (true) {
        if (cancelled.load()) return ECANCELED;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return ETIMEDOUT;

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int slice = static_cast<int>(left < 100 ? left : 100);
        int revents = poll_socket(sock, POLLOUT, slice);
        if (revents == 0) continue;

        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        return sock_err;
    }
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms,
                             const std::atomic<bool>& cancelled) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        return Result<socket_t>::Err(
            fmt::format("Failed to resolve host {}: {}", host, gai_strerror(gai)),
            ErrorType::NetworkUnreachable);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    int last_err = 0;

    for (auto* ai = res; ai != nullptr; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            last_err = errno;
            continue;
        }
        set_nonblocking(sock);

        int ret = ::connect(sock, ai->ai_addr, ai->ai_addrlen);
        int err = 0;
        if (ret < 0) {
            err = (errno == EINPROGRESS) ? wait_connected(sock, deadline, cancelled) : errno;
        }

        if (err == 0) {
            freeaddrinfo(res);
            return Result<socket_t>::Ok(sock);
        }

        close_socket(sock);
        last_err = err;
        if (err == ECANCELED || err == ETIMEDOUT) break;
    }
    freeaddrinfo(res);

    if (last_err == ECANCELED) {
        return Result<socket_t>::Err("Connection attempt cancelled", ErrorType::Unknown);
    }
    if (last_err == ETIMEDOUT) {
        return Result<socket_t>::Err(
            fmt::format("Connection to {}:{} timed out", host, port), ErrorType::Timeout);
    }
    return Result<socket_t>::Err(
        fmt::format("Failed to connect to {}:{}: {}", host, port, std::strerror(last_err)),
        classify_errno(last_err));
}

} // namespace platform
