#include "socket_util.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <memory>

namespace platform {

namespace {

constexpr int KEEPALIVE_IDLE_SECS = 60;

void set_nonblocking(int sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

void enable_keepalive(int sock) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
#ifdef TCP_KEEPIDLE
    int idle = KEEPALIVE_IDLE_SECS;
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
#endif
}

// Non-blocking connect bounded by timeout_ms. Returns "" on success.
std::string connect_one(int sock, const struct addrinfo* ai, int timeout_ms) {
    int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret == 0) return "";
    if (errno != EINPROGRESS) return strerror(errno);

    if (poll_socket(sock, POLLOUT, timeout_ms) == 0) return "timed out";

    int sock_err = 0;
    socklen_t len = sizeof(sock_err);
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &len) != 0) return strerror(errno);
    return sock_err == 0 ? "" : strerror(sock_err);
}

} // namespace

Result<int> connect_tcp(const std::string& host, int port, int timeout_secs) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* raw = nullptr;
    int gai = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &raw);
    if (gai != 0 || !raw) {
        return Result<int>::Err(fmt::format("Failed to resolve host {}: {}", host, gai_strerror(gai)));
    }
    std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> res(raw, freeaddrinfo);

    std::string last_error = "no usable address";
    for (const struct addrinfo* ai = res.get(); ai; ai = ai->ai_next) {
        int sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            last_error = strerror(errno);
            continue;
        }
        set_nonblocking(sock);
        std::string err = connect_one(sock, ai, timeout_secs * 1000);
        if (err.empty()) {
            enable_keepalive(sock);
            return Result<int>::Ok(sock);
        }
        close(sock);
        last_error = err;
    }
    return Result<int>::Err(fmt::format("Failed to connect to {}:{}: {}", host, port, last_error));
}

int poll_socket(int sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(int sock) {
    close(sock);
}

} // namespace platform
