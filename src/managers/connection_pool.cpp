#include "connection_pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <vector>

const char* to_string(ConnectionState state) {
    switch (state) {
    case ConnectionState::Idle:      return "idle";
    case ConnectionState::InUse:     return "in_use";
    case ConnectionState::Unhealthy: return "unhealthy";
    case ConnectionState::Closed:    return "closed";
    }
    return "unknown";
}

PoolOptions PoolOptions::from_config(const Config& config) {
    PoolOptions o;
    o.max_size = config.connection().connection_pool_size;
    o.idle_timeout = std::chrono::seconds(config.connection().connection_idle_timeout);
    return o;
}

// ── ConnectionLease ─────────────────────────────────────────

ConnectionLease::ConnectionLease(ConnectionPool* pool, std::shared_ptr<Connection> conn)
    : pool_(pool), conn_(std::move(conn)) {}

ConnectionLease::~ConnectionLease() {
    release();
}

ConnectionLease::ConnectionLease(ConnectionLease&& other) noexcept
    : pool_(other.pool_), conn_(std::move(other.conn_)), healthy_(other.healthy_) {
    other.pool_ = nullptr;
}

ConnectionLease& ConnectionLease::operator=(ConnectionLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        conn_ = std::move(other.conn_);
        healthy_ = other.healthy_;
        other.pool_ = nullptr;
    }
    return *this;
}

void ConnectionLease::release() {
    if (pool_ && conn_) {
        pool_->release(conn_, healthy_ && conn_->state() != ConnectionState::Unhealthy);
    }
    conn_.reset();
    pool_ = nullptr;
}

// ── Construction / Destruction ──────────────────────────────

ConnectionPool::ConnectionPool(Transport& transport, const PoolOptions& options)
    : transport_(transport), options_(options) {
    reaper_ = std::thread(&ConnectionPool::reaper_loop, this);
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

ConnectionPool::HostSlot& ConnectionPool::slot_for(const std::string& identity) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto& slot = slots_[identity];
    if (!slot) slot = std::make_unique<HostSlot>();
    return *slot;
}

ConnectionPool::HostSlot* ConnectionPool::find_slot(const std::string& identity) const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(identity);
    return it == slots_.end() ? nullptr : it->second.get();
}

// ── Acquire ─────────────────────────────────────────────────

Result<ConnectionLease> ConnectionPool::acquire(const HostAddress& address,
                                                std::chrono::milliseconds timeout) {
    auto leased = lease_internal(address, Clock::now() + timeout);
    if (leased.is_err()) {
        return Result<ConnectionLease>::Err(leased.error, leased.kind);
    }
    return Result<ConnectionLease>::Ok(ConnectionLease(this, std::move(leased.value)));
}

Result<std::shared_ptr<Connection>> ConnectionPool::lease_internal(const HostAddress& address,
                                                                   Clock::time_point deadline) {
    using R = Result<std::shared_ptr<Connection>>;
    const std::string id = address.identity();
    HostSlot& slot = slot_for(id);

    // Called with slot.opening already incremented and the lock released.
    auto open_fresh = [&]() -> R {
        auto opened = open_connection(address, deadline);
        {
            std::lock_guard<std::mutex> lock(slot.mutex);
            slot.opening--;
            if (opened.is_ok()) {
                slot.leased++;
                slot.counters.opened++;
            }
        }
        if (opened.is_err()) slot.cv.notify_one();
        return opened;
    };

    std::unique_lock<std::mutex> lk(slot.mutex);
    while (true) {
        if (shutdown_) return R::Err("Connection pool is shut down", ErrorKind::ConnectFailed);

        if (!slot.idle.empty()) {
            auto conn = slot.idle.back();
            slot.idle.pop_back();
            slot.leased++;
            conn->state_ = ConnectionState::InUse;
            conn->leased_ = true;
            lk.unlock();

            if (conn->session_->ping()) {
                conn->last_acquired_ = Clock::now();
                std::lock_guard<std::mutex> lock(slot.mutex);
                slot.counters.reused++;
                return R::Ok(conn);
            }

            fleetrun_log(fmt::format("Pool {}: connection #{} failed ping, evicting", id, conn->id_));
            conn->leased_ = false;
            close_connection(conn);
            {
                std::lock_guard<std::mutex> lock(slot.mutex);
                slot.leased--;
                slot.counters.evicted++;
                slot.opening++;
            }
            return open_fresh();
        }

        int total = static_cast<int>(slot.idle.size()) + slot.leased + slot.opening;
        if (total < options_.max_size) {
            slot.opening++;
            lk.unlock();
            return open_fresh();
        }

        if (slot.cv.wait_until(lk, deadline) == std::cv_status::timeout) {
            total = static_cast<int>(slot.idle.size()) + slot.leased + slot.opening;
            if (slot.idle.empty() && total >= options_.max_size) {
                fleetrun_log(fmt::format("Pool {}: exhausted ({} connections)", id, total));
                return R::Err(fmt::format("Connection pool exhausted for {}", id),
                              ErrorKind::PoolExhausted);
            }
        }
    }
}

Result<std::shared_ptr<Connection>> ConnectionPool::open_connection(const HostAddress& address,
                                                                    Clock::time_point deadline) {
    using R = Result<std::shared_ptr<Connection>>;

    std::shared_ptr<TunnelRef> tunnel;
    RemoteSession* via = nullptr;
    if (address.jumphost) {
        auto t = acquire_tunnel(*address.jumphost, deadline);
        if (t.is_err()) {
            return R::Err(fmt::format("Jump host {}: {}", address.jumphost->identity(), t.error), t.kind);
        }
        tunnel = t.value;
        via = &tunnel->connection->session();
    }

    auto opened = transport_.open(address, via);
    if (opened.is_err()) {
        if (tunnel) release_tunnel(tunnel);
        return R::Err(opened.error, opened.kind);
    }

    auto conn = std::make_shared<Connection>();
    conn->session_ = std::move(opened.value);
    conn->identity_ = address.identity();
    conn->id_ = next_id_++;
    conn->tunnel_ = tunnel;
    conn->leased_ = true;
    conn->state_ = ConnectionState::InUse;
    conn->last_acquired_ = Clock::now();
    fleetrun_log(fmt::format("Pool {}: opened connection #{}{}", conn->identity_, conn->id_,
                             tunnel ? " via " + tunnel->identity : ""));
    return R::Ok(conn);
}

// ── Release ─────────────────────────────────────────────────

void ConnectionPool::release(const std::shared_ptr<Connection>& conn, bool healthy) {
    if (!conn) return;
    bool expected = true;
    if (!conn->leased_.compare_exchange_strong(expected, false)) return;

    HostSlot* slot = find_slot(conn->identity_);
    if (!slot) return;

    auto now = Clock::now();
    ConnectionState state = conn->state_.load();
    bool already_closed = state == ConnectionState::Closed;
    bool young = (now - conn->last_acquired_) < options_.idle_timeout;
    bool keep = healthy && !already_closed && state != ConnectionState::Unhealthy &&
                !shutdown_ && young && conn->session_->is_active();

    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->leased--;
        if (keep) {
            conn->state_ = ConnectionState::Idle;
            conn->last_released_ = now;
            slot->idle.push_back(conn);
        }
    }
    slot->cv.notify_one();

    if (!keep && !already_closed) {
        fleetrun_log(fmt::format("Pool {}: closing connection #{} on release ({})", conn->identity_,
                                 conn->id_, !healthy ? "unhealthy" : (!young ? "aged out" : "inactive")));
        close_connection(conn);
    }
}

void ConnectionPool::close_connection(const std::shared_ptr<Connection>& conn) {
    bool was_closed = conn->state_.exchange(ConnectionState::Closed) == ConnectionState::Closed;
    if (!was_closed) {
        if (conn->session_) conn->session_->close();
        if (HostSlot* slot = find_slot(conn->identity_)) {
            std::lock_guard<std::mutex> lock(slot->mutex);
            slot->counters.closed++;
        }
    }

    std::shared_ptr<TunnelRef> tunnel;
    tunnel.swap(conn->tunnel_);
    if (tunnel) release_tunnel(tunnel);
}

// ── Tunnels ─────────────────────────────────────────────────

Result<std::shared_ptr<TunnelRef>> ConnectionPool::acquire_tunnel(const HostAddress& jump,
                                                                  Clock::time_point deadline) {
    using R = Result<std::shared_ptr<TunnelRef>>;
    const std::string id = jump.identity();

    {
        std::lock_guard<std::mutex> lock(tunnels_mutex_);
        auto it = tunnels_.find(id);
        if (it != tunnels_.end()) {
            if (it->second->connection->session().is_active()) {
                it->second->refs++;
                return R::Ok(it->second);
            }
            fleetrun_log(fmt::format("Tunnel {}: jump session dead, replacing", id));
            tunnels_.erase(it);
        }
    }

    auto leased = lease_internal(jump, deadline);
    if (leased.is_err()) return R::Err(leased.error, leased.kind);

    auto ref = std::make_shared<TunnelRef>();
    ref->identity = id;
    ref->connection = leased.value;

    std::shared_ptr<TunnelRef> existing;
    {
        std::lock_guard<std::mutex> lock(tunnels_mutex_);
        auto it = tunnels_.find(id);
        if (it != tunnels_.end() && it->second->connection->session().is_active()) {
            it->second->refs++;
            existing = it->second;
        } else {
            ref->refs = 1;
            tunnels_[id] = ref;
        }
    }

    if (existing) {
        // Lost the race to another opener
        release(ref->connection, true);
        return R::Ok(existing);
    }
    fleetrun_log(fmt::format("Tunnel {}: created on connection #{}", id, ref->connection->id_));
    return R::Ok(ref);
}

void ConnectionPool::release_tunnel(const std::shared_ptr<TunnelRef>& ref) {
    bool last = false;
    {
        std::lock_guard<std::mutex> lock(tunnels_mutex_);
        if (ref->refs.fetch_sub(1) == 1) {
            last = true;
            auto it = tunnels_.find(ref->identity);
            if (it != tunnels_.end() && it->second == ref) tunnels_.erase(it);
        }
    }
    if (last) {
        fleetrun_log(fmt::format("Tunnel {}: last dependent gone, closing", ref->identity));
        release(ref->connection, false);
    }
}

int ConnectionPool::tunnel_refs(const std::string& jump_identity) const {
    std::lock_guard<std::mutex> lock(tunnels_mutex_);
    auto it = tunnels_.find(jump_identity);
    return it == tunnels_.end() ? 0 : it->second->refs.load();
}

// ── Stats ───────────────────────────────────────────────────

PoolStats ConnectionPool::stats(const std::string& identity) const {
    PoolStats s;
    HostSlot* slot = find_slot(identity);
    if (!slot) return s;
    std::lock_guard<std::mutex> lock(slot->mutex);
    s = slot->counters;
    s.idle = static_cast<int>(slot->idle.size());
    s.in_use = slot->leased;
    s.opening = slot->opening;
    return s;
}

// ── Reaper ──────────────────────────────────────────────────

void ConnectionPool::reap_idle() {
    std::vector<std::shared_ptr<Connection>> stale;
    std::vector<HostSlot*> touched;
    auto now = Clock::now();

    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (auto& [id, slot] : slots_) {
            std::lock_guard<std::mutex> slot_lock(slot->mutex);
            auto before = stale.size();
            auto keep_end = std::stable_partition(slot->idle.begin(), slot->idle.end(),
                [&](const std::shared_ptr<Connection>& c) {
                    return now - c->last_released_ < options_.idle_timeout;
                });
            stale.insert(stale.end(), keep_end, slot->idle.end());
            slot->idle.erase(keep_end, slot->idle.end());
            slot->counters.reaped += stale.size() - before;
            if (stale.size() != before) touched.push_back(slot.get());
        }
    }

    for (auto* slot : touched) slot->cv.notify_all();
    for (auto& conn : stale) {
        fleetrun_log(fmt::format("Pool {}: reaping idle connection #{}", conn->identity_, conn->id_));
        close_connection(conn);
    }
}

void ConnectionPool::reaper_loop() {
    auto interval = options_.reaper_interval;
    if (interval.count() <= 0) {
        interval = std::min<std::chrono::milliseconds>(
            options_.idle_timeout / 2, std::chrono::seconds(REAPER_MAX_INTERVAL_SECS));
    }
    if (interval < std::chrono::milliseconds(10)) interval = std::chrono::milliseconds(10);

    std::unique_lock<std::mutex> lk(reaper_mutex_);
    while (!shutdown_) {
        reaper_cv_.wait_for(lk, interval, [&] { return shutdown_.load(); });
        if (shutdown_) break;
        lk.unlock();
        reap_idle();
        lk.lock();
    }
}

void ConnectionPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(reaper_mutex_);
        if (shutdown_.exchange(true)) return;
    }
    reaper_cv_.notify_all();
    if (reaper_.joinable()) reaper_.join();

    std::vector<std::shared_ptr<Connection>> idle;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (auto& [id, slot] : slots_) {
            std::lock_guard<std::mutex> slot_lock(slot->mutex);
            idle.insert(idle.end(), slot->idle.begin(), slot->idle.end());
            slot->idle.clear();
            slot->cv.notify_all();
        }
    }
    for (auto& conn : idle) close_connection(conn);
    fleetrun_log(fmt::format("Pool: shut down, closed {} idle connections", idle.size()));
}
