#include "iperf.hpp"
#include "probe_stats.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <managers/parallel_executor.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <numeric>
#include <regex>
#include <thread>

using nlohmann::json;

std::vector<IperfPair> iperf_pairs(const std::vector<std::string>& clients,
                                   const std::vector<std::string>& servers) {
    std::vector<IperfPair> pairs;
    for (const auto& c : clients) {
        for (const auto& s : servers) {
            if (c == s) continue;
            pairs.push_back(IperfPair{c, s, s});
        }
    }
    return pairs;
}

static std::string pid_file(int port) {
    return fmt::format("/tmp/fleetrun_iperf_{}.pid", port);
}

std::string iperf_server_command(int port) {
    return fmt::format("iperf3 -s -1 -D -p {} --pidfile {}", port, pid_file(port));
}

std::string iperf_client_command(const std::string& server_address, const IperfOptions& o) {
    return fmt::format("iperf3 -c {} -p {} -O 1 -P {} -M {} -t {} -i {} -J",
                       shell_quote(server_address), o.port, o.parallel_streams, o.mss,
                       o.duration_secs, o.interval_secs);
}

std::string iperf_stop_command(int port) {
    return fmt::format("f={}; if [ -f $f ]; then kill $(cat $f) 2>/dev/null; rm -f $f; fi; true",
                       pid_file(port));
}

// ── Parsing ────────────────────────────────────────────────

Result<IperfReport> parse_iperf_json(const std::string& text) {
    using R = Result<IperfReport>;
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return R::Err("not iperf3 JSON", ErrorKind::CommandFailed);

    IperfReport rep;
    try {
        if (doc.contains("error") && doc["error"].is_string()) rep.error = doc["error"].get<std::string>();

        const json end = doc.value("end", json::object());
        const json sent = end.value("sum_sent", json::object());
        const json received = end.value("sum_received", json::object());
        rep.sent_bps = sent.value("bits_per_second", 0.0);
        rep.bytes_sent = sent.value("bytes", uint64_t{0});
        rep.retransmits = sent.value("retransmits", 0);
        rep.received_bps = received.value("bits_per_second", 0.0);
        rep.bytes_received = received.value("bytes", uint64_t{0});

        const json cpu = end.value("cpu_utilization_percent", json::object());
        if (cpu.contains("host_total")) rep.cpu_host_percent = cpu["host_total"].get<double>();
        if (cpu.contains("remote_total")) rep.cpu_remote_percent = cpu["remote_total"].get<double>();

        for (const auto& interval : doc.value("intervals", json::array())) {
            const json sum = interval.value("sum", json::object());
            if (sum.contains("bits_per_second")) {
                rep.interval_gbps.push_back(sum["bits_per_second"].get<double>() / 1e9);
            }
        }
        rep.parsed = !sent.empty() || !received.empty() || !rep.interval_gbps.empty();
    } catch (const json::exception& e) {
        return R::Err(std::string("malformed iperf3 JSON: ") + e.what(), ErrorKind::CommandFailed);
    }

    if (!rep.interval_gbps.empty()) {
        rep.average_gbps = std::accumulate(rep.interval_gbps.begin(), rep.interval_gbps.end(), 0.0) /
                           static_cast<double>(rep.interval_gbps.size());
        for (int p : {10, 25, 50, 75, 90, 99}) rep.percentiles_gbps[p] = percentile(rep.interval_gbps, p);
    } else if (rep.received_bps > 0.0) {
        rep.average_gbps = rep.received_bps / 1e9;
    }
    return R::Ok(std::move(rep));
}

std::optional<double> parse_iperf_text_mbps(const std::string& text) {
    static const std::regex rate(R"((\d+(?:\.\d+)?)\s+([KMG]?)bits/sec)");
    std::optional<double> mbps;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), rate); it != std::sregex_iterator(); ++it) {
        double value = safe_stod((*it)[1].str());
        std::string unit = (*it)[2].str();
        if (unit == "G") mbps = value * 1000.0;
        else if (unit == "K") mbps = value / 1000.0;
        else if (unit == "M") mbps = value;
        else mbps = value / 1e6;
    }
    return mbps;
}

IperfReport parse_iperf_output(const std::string& output) {
    auto from_json = parse_iperf_json(output);
    if (from_json.is_ok() && (from_json.value.parsed || !from_json.value.error.empty())) {
        return from_json.value;
    }

    IperfReport rep;
    if (auto mbps = parse_iperf_text_mbps(output)) {
        rep.parsed = true;
        rep.from_text = true;
        rep.received_bps = *mbps * 1e6;
        rep.average_gbps = *mbps / 1000.0;
    }
    return rep;
}

bool throughput_within_tolerance(double average_gbps, double expected_gbps, double tolerance_pct) {
    return average_gbps >= expected_gbps * (1.0 - tolerance_pct / 100.0);
}

json to_json(const IperfResult& r) {
    json j = {
        {"client", r.client},
        {"server", r.server},
        {"port", r.port},
        {"success", r.success},
        {"error", r.error},
        {"error_kind", to_string(r.error_kind)},
        {"started", r.started},
        {"finished", r.finished},
        {"sent_bps", r.report.sent_bps},
        {"received_bps", r.report.received_bps},
        {"bytes_sent", r.report.bytes_sent},
        {"bytes_received", r.report.bytes_received},
        {"retransmits", r.report.retransmits},
        {"interval_gbps", r.report.interval_gbps},
        {"tolerance_pct", r.tolerance_pct},
        {"duration", r.duration},
    };
    j["average_gbps"] = r.report.average_gbps ? json(*r.report.average_gbps) : json(nullptr);
    j["cpu_host_percent"] = r.report.cpu_host_percent ? json(*r.report.cpu_host_percent) : json(nullptr);
    j["cpu_remote_percent"] = r.report.cpu_remote_percent ? json(*r.report.cpu_remote_percent) : json(nullptr);
    j["expected_gbps"] = r.expected_gbps ? json(*r.expected_gbps) : json(nullptr);
    j["passed"] = r.passed ? json(*r.passed) : json(nullptr);

    json pct = json::object();
    for (const auto& [p, v] : r.report.percentiles_gbps) pct["p" + std::to_string(p)] = v;
    j["percentiles_gbps"] = pct;
    return j;
}

// ── Runner ─────────────────────────────────────────────────

namespace {

void fail_with(IperfResult& r, const std::string& error, ErrorKind kind) {
    r.success = false;
    r.error = error;
    r.error_kind = kind == ErrorKind::None ? ErrorKind::CommandFailed : kind;
}

bool session_lost(ErrorKind kind) {
    return kind == ErrorKind::ChannelClosed || kind == ErrorKind::TimeoutExceeded;
}

std::string exec_failure(const SSHResult& res) {
    std::string out = res.get_output();
    trim(out);
    if (res.kind != ErrorKind::None) return out.empty() ? to_string(res.kind) : out;
    return out.empty() ? fmt::format("exit {}", res.exit_code) : out;
}

} // namespace

IperfRunner::IperfRunner(SourceResolver resolver) : resolver_(std::move(resolver)) {}

IperfResult IperfRunner::run_pair(const IperfPair& pair, const IperfOptions& options) {
    IperfResult r;
    r.client = pair.client;
    r.server = pair.server;
    r.port = options.port;
    r.expected_gbps = options.expected_gbps;
    r.tolerance_pct = options.tolerance_pct;
    r.started = now_iso();
    auto t0 = std::chrono::steady_clock::now();

    auto finish = [&]() -> IperfResult {
        r.finished = now_iso();
        r.duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        fleetrun_log(fmt::format("iperf {} -> {}:{}: {}", r.client, r.server, r.port,
                                 r.success ? fmt::format("{:.3f} Gbit/s", r.report.average_gbps.value_or(0.0))
                                           : r.error));
        return r;
    };

    if (!resolver_) {
        fail_with(r, "No session resolver", ErrorKind::ConnectFailed);
        return finish();
    }

    auto server = resolver_(pair.server);
    if (server.is_err()) {
        fail_with(r, "server unavailable: " + server.error, server.kind);
        return finish();
    }
    SSHResult started = server.value.session().exec(iperf_server_command(options.port), 30);
    if (!started.success()) {
        if (session_lost(started.kind)) server.value.mark_unhealthy();
        fail_with(r, "iperf3 server did not start: " + exec_failure(started), started.kind);
        return finish();
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(std::max(0, options.settle_ms)));

    auto stop_server = [&]() {
        SSHResult stopped = server.value.session().exec(iperf_stop_command(options.port), 15);
        if (!stopped.success()) {
            if (session_lost(stopped.kind)) server.value.mark_unhealthy();
            fleetrun_log(fmt::format("iperf {}: server stop failed: {}", pair.server, exec_failure(stopped)));
        }
    };

    auto client = resolver_(pair.client);
    if (client.is_err()) {
        stop_server();
        fail_with(r, "client unavailable: " + client.error, client.kind);
        return finish();
    }

    SSHResult ran = client.value.session().exec(iperf_client_command(pair.server_address, options),
                                                options.duration_secs + 30);
    stop_server();
    if (session_lost(ran.kind)) client.value.mark_unhealthy();

    r.report = parse_iperf_output(ran.stdout_data);
    if (ran.kind != ErrorKind::None) {
        fail_with(r, exec_failure(ran), ran.kind);
    } else if (!r.report.error.empty()) {
        fail_with(r, "iperf3: " + r.report.error, ErrorKind::CommandFailed);
    } else if (ran.exit_code != 0) {
        fail_with(r, "iperf3 client failed: " + exec_failure(ran), ErrorKind::CommandFailed);
    } else if (!r.report.parsed) {
        fail_with(r, "unreadable iperf3 output", ErrorKind::CommandFailed);
    } else {
        r.success = true;
        if (options.expected_gbps && r.report.average_gbps) {
            r.passed = throughput_within_tolerance(*r.report.average_gbps, *options.expected_gbps,
                                                   options.tolerance_pct);
            if (!*r.passed) {
                fail_with(r, fmt::format("throughput {:.3f} Gbit/s below expected {:.3f} Gbit/s "
                                         "(tolerance {}%)",
                                         *r.report.average_gbps, *options.expected_gbps,
                                         options.tolerance_pct),
                          ErrorKind::CommandFailed);
            }
        }
    }
    return finish();
}

std::vector<IperfResult> IperfRunner::run(const std::vector<IperfPair>& pairs, const IperfOptions& options) {
    std::vector<IperfResult> results(pairs.size());

    // Pair indices per server, in request order.
    std::vector<std::string> servers;
    std::map<std::string, std::vector<size_t>> by_server;
    for (size_t i = 0; i < pairs.size(); ++i) {
        auto& slot = by_server[pairs[i].server];
        if (slot.empty()) servers.push_back(pairs[i].server);
        slot.push_back(i);
    }

    fleetrun_log(fmt::format("iperf: {} pairs across {} servers, {}s each", pairs.size(), servers.size(),
                             options.duration_secs));

    std::vector<std::function<void()>> tasks;
    for (const auto& s : servers) {
        const std::vector<size_t>* indices = &by_server[s];
        tasks.push_back([this, &pairs, &options, &results, indices] {
            for (size_t i : *indices) results[i] = run_pair(pairs[i], options);
        });
    }
    ParallelExecutor::run_bounded(std::move(tasks), options.max_parallel);
    return results;
}
