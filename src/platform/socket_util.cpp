#include "socket_util.hpp"
#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

namespace platform {

namespace {

struct AddrList {
    addrinfo* head = nullptr;
    ~AddrList() { if (head) freeaddrinfo(head); }
};

ConnectStatus status_for(int err) {
    return err == ECONNREFUSED ? ConnectStatus::Refused : ConnectStatus::Failed;
}

// One attempt against a single resolved address.
Dialed dial(const addrinfo* ai, const std::string& host, int timeout_ms) {
    Dialed d;
    socket_t fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
        d.error = fmt::format("socket: {}", std::strerror(errno));
        return d;
    }
    set_nonblocking(fd);

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
        int err = errno;
        if (err != EINPROGRESS) {
            close_socket(fd);
            d.status = status_for(err);
            d.error = fmt::format("connect to {}: {}", host, std::strerror(err));
            return d;
        }
        if (poll_socket(fd, POLLOUT, timeout_ms) == 0) {
            close_socket(fd);
            d.status = ConnectStatus::TimedOut;
            d.error = fmt::format("connect to {} timed out", host);
            return d;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        if (so_error != 0) {
            close_socket(fd);
            d.status = status_for(so_error);
            d.error = fmt::format("connect to {}: {}", host, std::strerror(so_error));
            return d;
        }
    }

    d.fd = fd;
    d.status = ConnectStatus::Connected;
    return d;
}

} // namespace

Dialed connect_socket(const std::string& host, int port, SocketKind kind, int timeout_ms) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = kind == SocketKind::Datagram ? SOCK_DGRAM : SOCK_STREAM;

    AddrList addrs;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &addrs.head);
    if (rc != 0 || !addrs.head) {
        Dialed d;
        d.status = ConnectStatus::ResolveFailed;
        d.error = rc != 0 ? gai_strerror(rc) : "no addresses";
        return d;
    }

    Dialed last;
    last.error = "no usable address for " + host;
    for (const addrinfo* ai = addrs.head; ai; ai = ai->ai_next) {
        last = dial(ai, host, timeout_ms);
        if (last.connected()) break;
    }
    return last;
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    pollfd pfd{sock, events, 0};
    return poll(&pfd, 1, timeout_ms) > 0 ? pfd.revents : 0;
}

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags >= 0) fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

void close_socket(socket_t sock) {
    if (sock >= 0) ::close(sock);
}

void enable_tcp_keepalive(socket_t sock) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
#ifdef TCP_KEEPIDLE
    int idle = 60, interval = 15, count = 4;
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval));
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, &count, sizeof(count));
#endif
}

} // namespace platform
