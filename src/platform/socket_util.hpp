#pragma once

#include <string>
#include <poll.h>

using socket_t = int;
constexpr socket_t INVALID_SOCKET_FD = -1;

namespace platform {

enum class ConnectStatus { Connected, Refused, TimedOut, ResolveFailed, Failed };

struct Dialed {
    socket_t fd = INVALID_SOCKET_FD;
    ConnectStatus status = ConnectStatus::Failed;
    std::string error;

    bool connected() const { return status == ConnectStatus::Connected; }
};

enum class SocketKind { Stream, Datagram };

// Tries each resolved address in turn with a non-blocking connect bounded by
// timeout_ms. A datagram socket is connected so send/recv need no address.
// Only a Connected result carries an open descriptor.
Dialed connect_socket(const std::string& host, int port, SocketKind kind, int timeout_ms);

// revents for sock, 0 on timeout or poll error.
int poll_socket(socket_t sock, short events, int timeout_ms);

void set_nonblocking(socket_t sock);
void close_socket(socket_t sock);

// Idle 60s, then a probe every 15s; dropped after 4 misses.
void enable_tcp_keepalive(socket_t sock);

} // namespace platform
