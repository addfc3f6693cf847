#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <core/constants.hpp>
#include <core/types.hpp>
#include "traffic_engine.hpp"

struct IperfOptions {
    int port = DEFAULT_IPERF_PORT;
    int duration_secs = DEFAULT_IPERF_DURATION_SECS;
    int parallel_streams = DEFAULT_IPERF_STREAMS;
    int mss = DEFAULT_IPERF_MSS;
    int interval_secs = DEFAULT_IPERF_INTERVAL_SECS;
    std::optional<double> expected_gbps;        // pass/fail threshold, average over intervals
    double tolerance_pct = DEFAULT_IPERF_TOLERANCE_PCT;
    int max_parallel = DEFAULT_MAX_PARALLEL;
    int settle_ms = IPERF_SERVER_SETTLE_MS;
};

// The client connects to server_address; client and server name the hosts
// whose sessions run each side.
struct IperfPair {
    std::string client;
    std::string server;
    std::string server_address;
};

// What could be read out of the client's output.
struct IperfReport {
    bool parsed = false;
    bool from_text = false;                     // fell back to the human-readable summary
    double sent_bps = 0.0;
    double received_bps = 0.0;
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
    int retransmits = 0;
    std::optional<double> cpu_host_percent;
    std::optional<double> cpu_remote_percent;
    std::vector<double> interval_gbps;
    std::optional<double> average_gbps;
    std::map<int, double> percentiles_gbps;     // 10, 25, 50, 75, 90, 99
    std::string error;                          // iperf3's own "error" field
};

struct IperfResult {
    std::string client;
    std::string server;
    int port = DEFAULT_IPERF_PORT;
    bool success = false;
    std::string error;
    ErrorKind error_kind = ErrorKind::None;
    IperfReport report;
    std::optional<double> expected_gbps;
    double tolerance_pct = DEFAULT_IPERF_TOLERANCE_PCT;
    std::optional<bool> passed;                 // set when an expectation was given and met or missed
    std::string started;
    std::string finished;
    double duration = 0.0;                      // seconds, server start to server stop
};

// Every client against every server, skipping a host paired with itself.
std::vector<IperfPair> iperf_pairs(const std::vector<std::string>& clients,
                                   const std::vector<std::string>& servers);

std::string iperf_server_command(int port);
std::string iperf_client_command(const std::string& server_address, const IperfOptions& options);
std::string iperf_stop_command(int port);

// iperf3 -J output. Err when the text is not a JSON object.
Result<IperfReport> parse_iperf_json(const std::string& text);

// Last "<n> [KMG]bits/sec" figure of the text output, in Mbit/s.
std::optional<double> parse_iperf_text_mbps(const std::string& text);

// JSON first, then the text summary.
IperfReport parse_iperf_output(const std::string& output);

// Fails only when average is below expected * (1 - tolerance/100).
bool throughput_within_tolerance(double average_gbps, double expected_gbps, double tolerance_pct);

nlohmann::json to_json(const IperfResult& r);

// Runs iperf3 server/client pairs over leased sessions. iperf3 serves one
// test at a time, so pairs sharing a server run one after another while
// different servers run in parallel.
class IperfRunner {
public:
    explicit IperfRunner(SourceResolver resolver);

    std::vector<IperfResult> run(const std::vector<IperfPair>& pairs, const IperfOptions& options);

    IperfResult run_pair(const IperfPair& pair, const IperfOptions& options);

private:
    SourceResolver resolver_;
};
