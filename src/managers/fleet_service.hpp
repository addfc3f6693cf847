#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <ssh/transport.hpp>
#include <traffic/iperf.hpp>
#include <traffic/traffic_engine.hpp>
#include "channel_manager.hpp"
#include "connection_pool.hpp"
#include "log_streamer.hpp"
#include "metrics_export.hpp"
#include "metrics_store.hpp"
#include "parallel_executor.hpp"

using ResultMap = std::map<std::string, OperationResult>;

// Called with each captured line. Calls are serialized.
using LineCallback = std::function<void(const std::string& host, const std::string& line)>;

struct TailOptions {
    bool follow = true;
    int timeout_secs = 0;                   // 0: until stop_tails() (or EOF without follow)
    std::vector<std::string> filter_patterns;
    std::vector<std::string> exclude_patterns;
    fs::path output_dir;                    // local capture copy, empty = none
};

// Headless service facade: owns the pool and the managers, and runs every
// fleet-wide operation through the parallel executor.
class FleetService {
public:
    // config must already be validated. A null transport means libssh2; a
    // null metrics store disables recording.
    explicit FleetService(Config config,
                          std::unique_ptr<Transport> transport = nullptr,
                          std::unique_ptr<MetricsStore> metrics = nullptr);
    ~FleetService();

    FleetService(const FleetService&) = delete;
    FleetService& operator=(const FleetService&) = delete;

    const Config& config() const { return config_; }

    // Empty host list means the configured hosts.
    std::vector<HostAddress> addresses(const std::vector<std::string>& hosts) const;

    void set_progress(ProgressCallback cb) { progress_ = std::move(cb); }

    // ── Operations ────────────────────────────────────────────
    // parallel <= 0 uses max_parallel from the config.

    ResultMap execute(const std::vector<std::string>& hosts, const std::string& command,
                      int timeout_secs = SSH_CMD_TIMEOUT_SECS, int parallel = 0);

    ResultMap chain(const std::vector<std::string>& hosts, const std::vector<std::string>& commands,
                    bool new_channel = false, int timeout_secs = SSH_CMD_TIMEOUT_SECS,
                    int parallel = 0);

    ResultMap interactive(const std::vector<std::string>& hosts,
                          const std::vector<InteractiveStep>& steps,
                          int timeout_secs = DEFAULT_INTERACTIVE_TIMEOUT_SECS, int parallel = 0);

    ResultMap upload(const std::vector<std::string>& hosts, const fs::path& local_path,
                     const std::string& remote_path, int parallel = 0);

    // Each host's copy lands in local_dir/{key}_{basename}, where key is the
    // host's result key (user@host:port when a host repeats in the set).
    ResultMap download(const std::vector<std::string>& hosts, const std::string& remote_path,
                       const fs::path& local_dir, int parallel = 0);

    ResultMap tail(const std::vector<std::string>& hosts, const std::string& path,
                   const TailOptions& options, LineCallback on_line, int parallel = 0);

    // Ask running tails to stop. Safe from any thread.
    void stop_tails();

    Result<std::vector<TrafficResult>> traffic(const TrafficRequest& request,
                                               SampleCallback on_sample = nullptr);
    void cancel_traffic();

    // iperf3 between every client and every server. Each pair is recorded
    // as an "iperf" operation of its client.
    std::vector<IperfResult> iperf(const std::vector<std::string>& clients,
                                   const std::vector<std::string>& servers,
                                   const IperfOptions& options);

    Result<void> export_metrics(ExportFormat format, const fs::path& path);

    // ── State ─────────────────────────────────────────────────

    LogStatistics log_statistics() const { return logs_.statistics(); }
    const LogStreamer& logs() const { return logs_; }
    PoolStats pool_stats(const std::string& host) const;
    MetricsStore* metrics() { return metrics_.get(); }

    void shutdown();

private:
    Config config_;
    std::unique_ptr<Transport> transport_;
    std::unique_ptr<ConnectionPool> pool_;
    std::unique_ptr<MetricsStore> metrics_;
    ChannelManager channels_;
    ParallelExecutor executor_;
    LogStreamer logs_;
    TrafficEngine traffic_;
    IperfRunner iperf_;
    ProgressCallback progress_;
    std::atomic<bool> stop_tails_{false};
    std::mutex line_mutex_;

    Result<ConnectionLease> lease(const HostAddress& address);
    ResultMap dispatch(const std::string& operation, const std::vector<std::string>& hosts,
                       const HostOperation& op, int parallel);
    void record(const ResultMap& results);
};

// 0 when every host succeeded, 1 otherwise.
int exit_status(const ResultMap& results);
