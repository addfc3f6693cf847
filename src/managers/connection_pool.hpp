#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <core/types.hpp>
#include <core/config.hpp>
#include <ssh/transport.hpp>

enum class ConnectionState { Idle, InUse, Unhealthy, Closed };

const char* to_string(ConnectionState state);

class Connection;
class ConnectionPool;
class ConnectionLease;

// A jump-host connection shared by every target connection layered on it.
struct TunnelRef {
    std::string identity;
    std::shared_ptr<Connection> connection;
    std::atomic<int> refs{0};
};

// One authenticated session, owned by the pool and leased to one caller
// at a time.
class Connection {
public:
    using Clock = std::chrono::steady_clock;

    RemoteSession& session() { return *session_; }
    const std::string& identity() const { return identity_; }
    ConnectionState state() const { return state_.load(); }
    uint64_t id() const { return id_; }
    bool tunneled() const { return tunnel_ != nullptr; }

    void mark_unhealthy() { state_ = ConnectionState::Unhealthy; }

private:
    friend class ConnectionPool;

    std::unique_ptr<RemoteSession> session_;
    std::string identity_;
    uint64_t id_ = 0;
    std::atomic<ConnectionState> state_{ConnectionState::InUse};
    std::atomic<bool> leased_{false};
    Clock::time_point last_acquired_;
    Clock::time_point last_released_;
    std::shared_ptr<TunnelRef> tunnel_;
};

// RAII lease: returns the connection to the pool on destruction.
// Must not outlive the pool that issued it.
class ConnectionLease {
public:
    ConnectionLease() = default;
    ConnectionLease(ConnectionPool* pool, std::shared_ptr<Connection> conn);
    ~ConnectionLease();

    ConnectionLease(ConnectionLease&& other) noexcept;
    ConnectionLease& operator=(ConnectionLease&& other) noexcept;
    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;

    explicit operator bool() const { return conn_ != nullptr; }
    Connection* operator->() const { return conn_.get(); }
    Connection& operator*() const { return *conn_; }
    RemoteSession& session() const { return conn_->session(); }
    const std::shared_ptr<Connection>& connection() const { return conn_; }

    // The connection is closed instead of returned to Idle on release.
    void mark_unhealthy() { healthy_ = false; }

    // Give the connection back now. Idempotent.
    void release();

private:
    ConnectionPool* pool_ = nullptr;
    std::shared_ptr<Connection> conn_;
    bool healthy_ = true;
};

struct PoolOptions {
    int max_size = DEFAULT_POOL_SIZE;                       // per identity
    std::chrono::milliseconds idle_timeout{DEFAULT_IDLE_TIMEOUT_SECS * 1000};
    std::chrono::milliseconds reaper_interval{0};           // 0: min(idle_timeout/2, 30s)

    static PoolOptions from_config(const Config& config);
};

struct PoolStats {
    int idle = 0;
    int in_use = 0;
    int opening = 0;
    uint64_t opened = 0;
    uint64_t reused = 0;
    uint64_t evicted = 0;   // failed the reuse ping
    uint64_t reaped = 0;    // idle too long
    uint64_t closed = 0;
};

class ConnectionPool {
public:
    ConnectionPool(Transport& transport, const PoolOptions& options);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Lease a connection for address, opening one if needed. Waits up to
    // timeout for capacity; fails with PoolExhausted if none frees up.
    Result<ConnectionLease> acquire(const HostAddress& address,
                                    std::chrono::milliseconds timeout);

    // Return a leased connection. A second release is a no-op.
    void release(const std::shared_ptr<Connection>& conn, bool healthy);

    PoolStats stats(const std::string& identity) const;

    // Dependents of the live tunnel through the given jump identity.
    int tunnel_refs(const std::string& jump_identity) const;

    // One reaper pass. The background reaper calls this on its interval.
    void reap_idle();

    // Stop the reaper and close idle connections. Leased connections are
    // closed as they come back.
    void shutdown();

private:
    using Clock = std::chrono::steady_clock;

    struct HostSlot {
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::shared_ptr<Connection>> idle;   // back = most recently used
        int leased = 0;
        int opening = 0;
        PoolStats counters;
    };

    Transport& transport_;
    PoolOptions options_;
    std::atomic<bool> shutdown_{false};
    std::atomic<uint64_t> next_id_{1};

    mutable std::mutex slots_mutex_;
    std::map<std::string, std::unique_ptr<HostSlot>> slots_;

    mutable std::mutex tunnels_mutex_;
    std::map<std::string, std::shared_ptr<TunnelRef>> tunnels_;

    std::mutex reaper_mutex_;
    std::condition_variable reaper_cv_;
    std::thread reaper_;

    HostSlot& slot_for(const std::string& identity);
    HostSlot* find_slot(const std::string& identity) const;

    Result<std::shared_ptr<Connection>> lease_internal(const HostAddress& address,
                                                       Clock::time_point deadline);
    Result<std::shared_ptr<Connection>> open_connection(const HostAddress& address,
                                                        Clock::time_point deadline);
    Result<std::shared_ptr<TunnelRef>> acquire_tunnel(const HostAddress& jump,
                                                      Clock::time_point deadline);
    void release_tunnel(const std::shared_ptr<TunnelRef>& ref);
    void close_connection(const std::shared_ptr<Connection>& conn);
    void reaper_loop();
};
