#include "libssh2_channel.hpp"
#include <core/constants.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <algorithm>

Libssh2Channel::Libssh2Channel(LIBSSH2_CHANNEL* ch, std::shared_ptr<std::mutex> io_mutex, int sock)
    : ch_(ch), io_mutex_(std::move(io_mutex)), sock_(sock) {}

Libssh2Channel::~Libssh2Channel() {
    close();
}

void Libssh2Channel::close() {
    if (!ch_) return;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    libssh2_channel_close(ch_);
    libssh2_channel_free(ch_);
    ch_ = nullptr;
}

void Libssh2Channel::wait_socket(short events, Clock::time_point deadline) const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    if (left <= 0) return;
    platform::poll_socket(sock_, events, static_cast<int>(std::min<long long>(left, 10)));
}

bool Libssh2Channel::write(const std::string& data) {
    std::lock_guard<std::mutex> serial(write_mutex_);
    auto deadline = Clock::now() + std::chrono::seconds(SSH_OPEN_TIMEOUT_SECS);

    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        if (!ch_) return false;
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_write(ch_, p, left);
        }
        if (n == LIBSSH2_ERROR_EAGAIN) {
            if (Clock::now() >= deadline) return false;
            wait_socket(POLLOUT, deadline);
            continue;
        }
        if (n < 0) return false;
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

int Libssh2Channel::read(std::string& out, int wait_ms) {
    auto deadline = Clock::now() + std::chrono::milliseconds(wait_ms);
    char buf[SSH_READ_BUF_SIZE];

    for (;;) {
        if (!ch_ || eof_) return -1;

        ssize_t n;
        bool at_eof = false;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read(ch_, buf, sizeof(buf));
            if (n <= 0) at_eof = libssh2_channel_eof(ch_) != 0;
        }

        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            return static_cast<int>(n);
        }
        if ((n < 0 && n != LIBSSH2_ERROR_EAGAIN) || at_eof) {
            eof_ = true;
            return -1;
        }
        if (Clock::now() >= deadline) return 0;
        wait_socket(POLLIN, deadline);
    }
}
