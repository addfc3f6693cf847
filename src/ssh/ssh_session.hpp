#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "transport.hpp"
#include "tunnel.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Session-level knobs that come from the connection and security config.
struct SessionOptions {
    int banner_timeout = DEFAULT_BANNER_TIMEOUT_SECS;
    int keep_alive = DEFAULT_KEEP_ALIVE_SECS;
    bool compression = false;
    bool host_key_verification = true;
    bool strict_host_key_checking = true;
    std::string known_hosts_file = "~/.ssh/known_hosts";
    std::vector<std::string> key_types;
    std::vector<std::string> cipher_preferences;
};

// libssh2-backed RemoteSession. Non-blocking throughout; each libssh2 call
// takes io_mutex_ briefly so a tunnel pump can share the session.
class Libssh2Session : public RemoteSession {
public:
    Libssh2Session(const HostAddress& address, const SessionOptions& options);
    ~Libssh2Session() override;

    Libssh2Session(const Libssh2Session&) = delete;
    Libssh2Session& operator=(const Libssh2Session&) = delete;

    // Connect (directly, or through via), handshake, verify host key, authenticate.
    Result<void> establish(RemoteSession* via);

    const HostAddress& address() const override { return address_; }
    SSHResult exec(const std::string& command, int timeout_secs = SSH_CMD_TIMEOUT_SECS) override;
    Result<std::unique_ptr<ChannelStream>> open_shell() override;
    Result<std::unique_ptr<ChannelStream>> open_forward(const std::string& host, int port) override;
    Result<uint64_t> upload(const std::filesystem::path& local, const std::string& remote,
                            const TransferOptions& opts) override;
    Result<uint64_t> download(const std::string& remote, const std::filesystem::path& local,
                              const TransferOptions& opts) override;
    bool ping() override;
    bool is_active() const override;
    void close() override;

private:
    using Clock = std::chrono::steady_clock;

    HostAddress address_;
    SessionOptions options_;
    LIBSSH2_SESSION* session_ = nullptr;
    int sock_ = -1;
    bool owns_socket_ = true;
    std::atomic<bool> active_{false};
    std::shared_ptr<std::mutex> io_mutex_;
    std::unique_ptr<TunnelPump> pump_;

    Result<void> open_socket(RemoteSession* via);
    Result<void> handshake();
    Result<void> verify_host_key();
    Result<void> authenticate();
    std::string last_error();
    void wait_socket(int timeout_ms);

    // Run fn under io_mutex_ until it stops returning EAGAIN or deadline passes.
    template <typename Fn>
    int call_rc(Fn fn, Clock::time_point deadline);

    // Same for calls that return a handle (nullptr + EAGAIN means retry).
    template <typename Fn>
    auto call_ptr(Fn fn, Clock::time_point deadline) -> decltype(fn());
};
