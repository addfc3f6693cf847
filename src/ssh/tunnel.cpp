#include "tunnel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/socket_util.hpp>
#include <sys/socket.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

TunnelPump::TunnelPump(std::unique_ptr<ChannelStream> forward)
    : forward_(std::move(forward)) {}

TunnelPump::~TunnelPump() {
    stop();
}

bool TunnelPump::start(std::string& error) {
    if (socketpair(AF_UNIX, SOCK_STREAM, 0, sv_) < 0) {
        error = "socketpair failed: " + std::string(strerror(errno));
        sv_[0] = sv_[1] = -1;
        return false;
    }
    running_ = true;
    thread_ = std::thread(&TunnelPump::pump, this);
    return true;
}

void TunnelPump::pump() {
    char buf[TUNNEL_BUF_SIZE];

    while (!stop_.load()) {
        // forward -> local
        std::string chunk;
        int n = forward_->read(chunk, 20);
        if (n < 0) break;
        if (n > 0) {
            size_t sent = 0;
            while (sent < chunk.size()) {
                ssize_t w = ::write(sv_[0], chunk.data() + sent, chunk.size() - sent);
                if (w <= 0) goto done;
                sent += static_cast<size_t>(w);
            }
        }

        // local -> forward
        struct pollfd pfd = {sv_[0], POLLIN, 0};
        if (poll(&pfd, 1, 0) > 0) {
            if (pfd.revents & (POLLHUP | POLLERR)) break;
            ssize_t r = ::read(sv_[0], buf, sizeof(buf));
            if (r <= 0) break;
            if (!forward_->write(std::string(buf, static_cast<size_t>(r)))) break;
        }
    }

done:
    // Inner session sees EOF instead of hanging
    if (sv_[0] >= 0) shutdown(sv_[0], SHUT_RDWR);
    running_ = false;
}

void TunnelPump::stop() {
    stop_ = true;
    if (thread_.joinable()) thread_.join();
    for (int& fd : sv_) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
    if (forward_) {
        forward_->close();
        forward_.reset();
        fleetrun_log("Tunnel pump stopped");
    }
}
