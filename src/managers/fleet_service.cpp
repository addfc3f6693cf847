#include "fleet_service.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/ssh_transport.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>

FleetService::FleetService(Config config, std::unique_ptr<Transport> transport,
                           std::unique_ptr<MetricsStore> metrics)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      metrics_(std::move(metrics)),
      traffic_([this](const std::string& source) { return lease(config_.address_for(source)); }),
      iperf_([this](const std::string& host) { return lease(config_.address_for(host)); }) {
    if (!transport_) {
        transport_ = std::make_unique<Libssh2Transport>(Libssh2Transport::options_from(config_));
    }
    pool_ = std::make_unique<ConnectionPool>(*transport_, PoolOptions::from_config(config_));
}

FleetService::~FleetService() {
    shutdown();
}

void FleetService::shutdown() {
    stop_tails();
    traffic_.cancel();
    logs_.stop_all();
    if (pool_) pool_->shutdown();
}

std::vector<HostAddress> FleetService::addresses(const std::vector<std::string>& hosts) const {
    return config_.addresses(hosts.empty() ? config_.hosts() : hosts);
}

PoolStats FleetService::pool_stats(const std::string& host) const {
    return pool_->stats(config_.address_for(host).identity());
}

Result<ConnectionLease> FleetService::lease(const HostAddress& address) {
    return pool_->acquire(address, std::chrono::seconds(config_.connection().timeout));
}

ResultMap FleetService::dispatch(const std::string& operation,
                                 const std::vector<std::string>& hosts,
                                 const HostOperation& op, int parallel) {
    DispatchOptions options;
    options.operation = operation;
    options.max_parallel = parallel > 0 ? parallel : config_.connection().max_parallel;
    options.retry = RetryPolicy::from_config(config_);
    options.progress = progress_;

    ResultMap results = executor_.dispatch(addresses(hosts), op, options);
    record(results);
    return results;
}

void FleetService::record(const ResultMap& results) {
    if (!metrics_) return;
    try {
        metrics_->record(results);
    } catch (const std::exception& e) {
        fleetrun_log(std::string("FleetService: metrics not recorded: ") + e.what());
    }
}

namespace {

// Lease failures and lost sessions end the attempt the same way everywhere.
OperationResult lease_failure(const Result<ConnectionLease>& lease) {
    OperationResult r;
    r.error = lease.error;
    r.error_kind = lease.kind;
    return r;
}

void apply_sequence(OperationResult& r, const SequenceResult& seq) {
    r.commands = seq.commands;
    r.success = seq.success();
    r.error_kind = seq.error_kind;
    r.error = seq.error;
    r.exit_code = seq.exit_code;

    std::vector<std::string> outputs;
    for (const auto& c : seq.commands) outputs.push_back(c.output);
    r.output = fmt::format("{}", fmt::join(outputs, "\n"));
}

bool session_lost(ErrorKind kind) {
    return kind == ErrorKind::ChannelClosed || kind == ErrorKind::TimeoutExceeded;
}

} // namespace

// ── Execute / chain / interactive ─────────────────────────────

ResultMap FleetService::execute(const std::vector<std::string>& hosts, const std::string& command,
                                int timeout_secs, int parallel) {
    return dispatch("execute", hosts, [&](const HostAddress& host, int) {
        auto acquired = lease(host);
        if (acquired.is_err()) return lease_failure(acquired);
        auto& conn = acquired.value;

        SSHResult res = conn.session().exec(command, timeout_secs);
        fleetrun_log_ssh(host.name(), command, res);

        OperationResult r;
        r.output = res.stdout_data;
        r.error = res.stderr_data;
        if (res.kind != ErrorKind::None) {
            r.error_kind = res.kind;
            if (r.error.empty()) r.error = to_string(res.kind);
            if (session_lost(res.kind)) conn.mark_unhealthy();
            return r;
        }
        r.exit_code = res.exit_code;
        r.success = res.exit_code == 0;
        if (!r.success) r.error_kind = ErrorKind::CommandFailed;
        r.commands.push_back(CommandResult{command, res.stdout_data, res.stderr_data,
                                           res.exit_code, 0.0, r.success});
        return r;
    }, parallel);
}

ResultMap FleetService::chain(const std::vector<std::string>& hosts,
                              const std::vector<std::string>& commands,
                              bool new_channel, int timeout_secs, int parallel) {
    ChainOptions options;
    options.new_channel = new_channel;
    options.timeout_secs = timeout_secs;

    return dispatch("chain", hosts, [&](const HostAddress& host, int) {
        auto acquired = lease(host);
        if (acquired.is_err()) return lease_failure(acquired);
        auto& conn = acquired.value;

        SequenceResult seq = channels_.chain(conn.session(), commands, options);
        if (session_lost(seq.error_kind)) conn.mark_unhealthy();

        OperationResult r;
        apply_sequence(r, seq);
        return r;
    }, parallel);
}

ResultMap FleetService::interactive(const std::vector<std::string>& hosts,
                                    const std::vector<InteractiveStep>& steps,
                                    int timeout_secs, int parallel) {
    return dispatch("interactive", hosts, [&](const HostAddress& host, int) {
        auto acquired = lease(host);
        if (acquired.is_err()) return lease_failure(acquired);
        auto& conn = acquired.value;

        SequenceResult seq = channels_.run_interactive(conn.session(), steps, timeout_secs);
        if (session_lost(seq.error_kind)) conn.mark_unhealthy();

        OperationResult r;
        apply_sequence(r, seq);
        return r;
    }, parallel);
}

// ── Transfers ─────────────────────────────────────────────────

namespace {

// Compare the remote md5sum of path with local_md5. Empty on match.
std::string verify_checksum(RemoteSession& session, const std::string& remote_path,
                            const std::string& local_md5, ErrorKind& kind) {
    SSHResult res = session.exec("md5sum " + shell_quote(remote_path), SSH_OPEN_TIMEOUT_SECS);
    if (res.kind != ErrorKind::None) {
        kind = res.kind;
        return "Checksum command failed: " + std::string(to_string(res.kind));
    }
    std::string remote_md5 = parse_md5sum_output(res.stdout_data);
    if (res.exit_code != 0 || remote_md5.empty()) {
        kind = ErrorKind::CommandFailed;
        return "md5sum failed: " + res.get_output();
    }
    if (remote_md5 != local_md5) {
        kind = ErrorKind::TransferChecksumMismatch;
        return fmt::format("Checksum mismatch: local {} remote {}", local_md5, remote_md5);
    }
    return "";
}

} // namespace

ResultMap FleetService::upload(const std::vector<std::string>& hosts, const fs::path& local_path,
                               const std::string& remote_path, int parallel) {
    const auto& ft = config_.file_transfer();
    TransferOptions opts{ft.chunk_size, ft.preserve_permissions};

    return dispatch("upload", hosts, [&](const HostAddress& host, int) {
        OperationResult r;
        if (!fs::is_regular_file(local_path)) {
            r.error = "Local file not found: " + local_path.string();
            r.error_kind = ErrorKind::CommandFailed;
            return r;
        }

        auto acquired = lease(host);
        if (acquired.is_err()) return lease_failure(acquired);
        auto& conn = acquired.value;

        auto sent = conn.session().upload(local_path, remote_path, opts);
        if (sent.is_err()) {
            r.error = sent.error;
            r.error_kind = sent.kind;
            if (session_lost(sent.kind)) conn.mark_unhealthy();
            return r;
        }

        TransferRecord t{"upload", local_path.string(), remote_path, sent.value, ""};
        if (ft.verify_checksum) {
            t.checksum = compute_file_md5(local_path);
            ErrorKind kind = ErrorKind::None;
            std::string err = verify_checksum(conn.session(), remote_path, t.checksum, kind);
            if (!err.empty()) {
                r.error = err;
                r.error_kind = kind;
                r.transfer = t;
                return r;
            }
        }

        r.success = true;
        r.output = fmt::format("Uploaded {} bytes to {}", t.size, remote_path);
        r.transfer = t;
        return r;
    }, parallel);
}

ResultMap FleetService::download(const std::vector<std::string>& hosts,
                                 const std::string& remote_path, const fs::path& local_dir,
                                 int parallel) {
    const auto& ft = config_.file_transfer();
    TransferOptions opts{ft.chunk_size, ft.preserve_permissions};
    std::string basename = fs::path(remote_path).filename().string();

    return dispatch("download", hosts, [&](const HostAddress& host, int) {
        OperationResult r;
        std::error_code ec;
        fs::create_directories(local_dir, ec);
        if (ec) {
            r.error = "Cannot create " + local_dir.string() + ": " + ec.message();
            r.error_kind = ErrorKind::CommandFailed;
            return r;
        }
        fs::path local = local_dir / (host.name() + "_" + basename);

        auto acquired = lease(host);
        if (acquired.is_err()) return lease_failure(acquired);
        auto& conn = acquired.value;

        auto got = conn.session().download(remote_path, local, opts);
        if (got.is_err()) {
            r.error = got.error;
            r.error_kind = got.kind;
            if (session_lost(got.kind)) conn.mark_unhealthy();
            return r;
        }

        TransferRecord t{"download", local.string(), remote_path, got.value, ""};
        if (ft.verify_checksum) {
            t.checksum = compute_file_md5(local);
            ErrorKind kind = ErrorKind::None;
            std::string err = verify_checksum(conn.session(), remote_path, t.checksum, kind);
            if (!err.empty()) {
                r.error = err;
                r.error_kind = kind;
                r.transfer = t;
                return r;
            }
        }

        r.success = true;
        r.output = fmt::format("Downloaded {} bytes to {}", t.size, local.string());
        r.transfer = t;
        return r;
    }, parallel);
}

// ── Tail ──────────────────────────────────────────────────────

void FleetService::stop_tails() {
    stop_tails_ = true;
}

ResultMap FleetService::tail(const std::vector<std::string>& hosts, const std::string& path,
                             const TailOptions& options, LineCallback on_line, int parallel) {
    stop_tails_ = false;

    CaptureOptions capture = CaptureOptions::from_config(config_);
    capture.follow = options.follow;
    capture.filter_patterns = options.filter_patterns;
    capture.exclude_patterns = options.exclude_patterns;
    capture.output_dir = options.output_dir;

    auto hosts_n = hosts.empty() ? config_.hosts().size() : hosts.size();
    // Every capture runs for the whole tail, so all hosts need a worker.
    int workers = std::max(parallel, static_cast<int>(hosts_n));

    return dispatch("tail", hosts, [&](const HostAddress& host, int) {
        auto acquired = lease(host);
        if (acquired.is_err()) return lease_failure(acquired);

        std::shared_ptr<CaptureSession> session;
        try {
            session = logs_.start_capture(host.name(), std::move(acquired.value), path, capture);
        } catch (const std::exception& e) {
            OperationResult r;
            r.error = std::string("Cannot start capture: ") + e.what();
            r.error_kind = ErrorKind::CommandFailed;
            return r;
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(options.timeout_secs);
        auto queue = session->queue();
        LineBatch batch;
        while (true) {
            if (queue->pop(batch, std::chrono::milliseconds(200))) {
                if (on_line) {
                    std::lock_guard<std::mutex> lock(line_mutex_);
                    for (const auto& line : batch.lines) on_line(batch.host, line);
                }
                continue;
            }
            if (queue->closed()) break;
            if (stop_tails_) break;
            if (options.timeout_secs > 0 && std::chrono::steady_clock::now() >= deadline) break;
        }

        logs_.stop_capture(*session);
        // Lines flushed by the stop itself.
        while (queue->pop(batch, std::chrono::milliseconds(0))) {
            if (on_line) {
                std::lock_guard<std::mutex> lock(line_mutex_);
                for (const auto& line : batch.lines) on_line(batch.host, line);
            }
        }

        CaptureStats stats = session->stats();
        OperationResult r;
        r.output = fmt::format("{} lines ({} filtered, {} rotations)", stats.lines_emitted,
                               stats.lines_filtered, stats.rotations);
        r.error = session->error();
        r.error_kind = session->error_kind();
        // Lines already delivered would be repeated by another attempt.
        if (stats.lines_emitted > 0 && is_retryable(r.error_kind)) {
            r.error = "Capture interrupted: " + r.error;
            r.error_kind = ErrorKind::CommandFailed;
        }
        r.success = r.error_kind == ErrorKind::None;
        return r;
    }, workers);
}

// ── Traffic / metrics ─────────────────────────────────────────

Result<std::vector<TrafficResult>> FleetService::traffic(const TrafficRequest& request,
                                                         SampleCallback on_sample) {
    auto results = traffic_.run(request, std::move(on_sample));
    if (results.is_ok() && metrics_) {
        std::vector<ProbeSummary> summaries;
        for (const auto& r : results.value) summaries.push_back(r.summary);
        try {
            metrics_->record(summaries);
        } catch (const std::exception& e) {
            fleetrun_log(std::string("FleetService: traffic not recorded: ") + e.what());
        }
    }
    return results;
}

void FleetService::cancel_traffic() {
    traffic_.cancel();
}

std::vector<IperfResult> FleetService::iperf(const std::vector<std::string>& clients,
                                             const std::vector<std::string>& servers,
                                             const IperfOptions& options) {
    auto pairs = iperf_pairs(clients, servers);
    for (auto& p : pairs) p.server_address = config_.address_for(p.server).host;

    auto results = iperf_.run(pairs, options);

    ResultMap records;
    for (const auto& r : results) {
        OperationResult op;
        op.host = r.client;
        op.operation = "iperf";
        op.success = r.success;
        op.error = r.error;
        op.error_kind = r.error_kind;
        op.output = fmt::format("{} -> {}:{} {:.3f} Gbit/s", r.client, r.server, r.port,
                                r.report.average_gbps.value_or(0.0));
        op.duration = r.duration;
        op.timestamp = r.finished;
        records[r.client + "->" + r.server] = op;
    }
    record(records);
    return results;
}

Result<void> FleetService::export_metrics(ExportFormat format, const fs::path& path) {
    MetricsSnapshot snapshot;
    if (metrics_) snapshot = metrics_->load();
    try {
        return write_export(metrics_document(snapshot), format, path);
    } catch (const std::exception& e) {
        return Result<void>::Err(std::string("Export failed: ") + e.what(), ErrorKind::CommandFailed);
    }
}

int exit_status(const ResultMap& results) {
    for (const auto& [host, r] : results) {
        if (!r.success) return 1;
    }
    return 0;
}
