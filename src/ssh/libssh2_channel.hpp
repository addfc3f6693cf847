#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include "transport.hpp"

typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// A PTY shell or direct-tcpip forward on a shared libssh2 session.
// Every libssh2 call takes the session-wide io mutex; socket waits do not.
class Libssh2Channel : public ChannelStream {
public:
    Libssh2Channel(LIBSSH2_CHANNEL* ch, std::shared_ptr<std::mutex> io_mutex, int sock);
    ~Libssh2Channel() override;

    Libssh2Channel(const Libssh2Channel&) = delete;
    Libssh2Channel& operator=(const Libssh2Channel&) = delete;

    bool write(const std::string& data) override;
    int read(std::string& out, int wait_ms) override;
    bool is_open() const override { return ch_ != nullptr && !eof_; }
    void close() override;

private:
    using Clock = std::chrono::steady_clock;

    // Sleeps on the session socket for at most 10ms, never past deadline.
    void wait_socket(short events, Clock::time_point deadline) const;

    LIBSSH2_CHANNEL* ch_;
    std::shared_ptr<std::mutex> io_mutex_;
    int sock_;
    bool eof_ = false;
    std::mutex write_mutex_;
};
