#include "socket_util.hpp"
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <chrono>
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

void set_tcp_keepalive(socket_t sock) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, &keepcnt, sizeof(keepcnt));
#endif
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        return Result<socket_t>::Err(ErrorKind::Connection,
            fmt::format("Failed to resolve host {}: {}", host, gai_strerror(gai)));
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string last_error = "no usable address";
    bool timed_out = false;

    for (auto* ai = res; ai; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        set_nonblocking(sock);

        int ret = ::connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            last_error = std::strerror(errno);
            close_socket(sock);
            continue;
        }

        // Wait for non-blocking connect to complete
        if (ret < 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            int revents = remaining > 0 ? poll_socket(sock, POLLOUT, static_cast<int>(remaining)) : 0;
            if (revents == 0) {
                close_socket(sock);
                timed_out = true;
                break;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
            if (sock_err != 0) {
                last_error = std::strerror(sock_err);
                close_socket(sock);
                continue;
            }
        }

        freeaddrinfo(res);
        return Result<socket_t>::Ok(sock);
    }

    freeaddrinfo(res);
    if (timed_out) {
        return Result<socket_t>::Err(ErrorKind::Connection,
            fmt::format("Connection timeout after {}s", timeout_ms / 1000));
    }
    return Result<socket_t>::Err(ErrorKind::Connection,
        fmt::format("Failed to connect to {}:{}: {}", host, port, last_error));
}

void close_socket(socket_t sock) {
    if (sock != SSHBRIDGE_INVALID_SOCKET) close(sock);
}

} // namespace platform
