#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include "transport.hpp"

// Carries an inner SSH session over a direct-tcpip stream on the jump
// session. A socketpair gives libssh2 a real fd: the pump thread copies
// bytes between the forward stream and one end, the inner session
// handshakes on the other.
class TunnelPump {
public:
    explicit TunnelPump(std::unique_ptr<ChannelStream> forward);
    ~TunnelPump();

    TunnelPump(const TunnelPump&) = delete;
    TunnelPump& operator=(const TunnelPump&) = delete;

    // Create the socketpair and start pumping. False if the socketpair fails.
    bool start(std::string& error);

    // Socket the inner session should use.
    int inner_socket() const { return sv_[1]; }

    bool running() const { return running_.load(); }

    // Stop the thread and close both ends and the forward stream. Idempotent.
    void stop();

private:
    std::unique_ptr<ChannelStream> forward_;
    int sv_[2] = {-1, -1};
    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> running_{false};

    void pump();
};
