#include "command_helpers.hpp"
#include "../result_view.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <managers/metrics_export.hpp>
#include <iostream>
#include <fmt/format.h>

static std::vector<int> parse_ports(const std::string& list, bool& ok) {
    std::vector<int> ports;
    ok = true;
    for (const auto& p : split_list(list)) {
        int port = safe_stoi(p, -1);
        if (port < 0 || port > 65535) {
            ok = false;
            return {};
        }
        ports.push_back(port);
    }
    return ports;
}

static void do_traffic(BaseCLI& cli, const std::vector<std::string>& args) {
    const std::string usage =
        "traffic -p <tcp|udp|http|https|dns|icmp|scp|ftp> [-d east_west|north_south] "
        "[--sources a,b] [--targets x,y] [--ports 80,443] [--duration s] [--interval s]";
    auto parsed = parse_command(cli, args,
                                {"-p", "--protocol", "-d", "--direction", "--sources", "--targets",
                                 "--ports", "--duration", "--interval", "--probe-timeout",
                                 "--packet-size", "--dns-server", "--header", "--transfer-user",
                                 "--transfer-password"},
                                {"--insecure", "-v", "--verbose"}, usage);
    if (!parsed) return;
    if (!parsed->positional.empty() || parsed->get("-p").empty()) {
        std::cout << theme::step("Usage: " + usage);
        cli.set_status(1);
        return;
    }

    TrafficRequest request;
    auto protocol = protocol_from_string(parsed->get("-p"));
    if (!protocol) {
        std::cout << theme::fail("Unknown protocol: " + parsed->get("-p"));
        cli.set_status(1);
        return;
    }
    request.protocol = *protocol;

    auto direction = direction_from_string(parsed->get("-d", "east_west"));
    if (!direction) {
        std::cout << theme::fail("Unknown direction: " + parsed->get("-d"));
        cli.set_status(1);
        return;
    }
    request.direction = *direction;

    bool ports_ok = true;
    request.ports = parse_ports(parsed->get("--ports"), ports_ok);
    if (!ports_ok) {
        std::cout << theme::fail("Invalid port list: " + parsed->get("--ports"));
        cli.set_status(1);
        return;
    }

    auto duration = double_option(*parsed, "--duration", DEFAULT_PROBE_DURATION_SECS);
    auto interval = double_option(*parsed, "--interval", DEFAULT_PROBE_INTERVAL_SECS);
    auto probe_timeout = int_option(*parsed, "--probe-timeout", DEFAULT_PROBE_TIMEOUT_SECS);
    auto packet_size = int_option(*parsed, "--packet-size", DEFAULT_PACKET_SIZE);
    auto parallel = int_option(*parsed, "-P", 0);
    if (!duration || !interval || !probe_timeout || !packet_size || !parallel) return cli.set_status(1);

    request.duration = *duration;
    request.interval = *interval;
    request.params.timeout_secs = *probe_timeout;
    request.params.packet_size = *packet_size;
    request.params.verify_tls = !parsed->has("--insecure");
    request.params.dns_server = parsed->get("--dns-server");
    request.params.transfer_user = parsed->get("--transfer-user");
    request.params.transfer_password = parsed->get("--transfer-password");
    for (const auto& h : parsed->all("--header")) {
        auto colon = h.find(':');
        if (colon == std::string::npos) {
            std::cout << theme::fail("Header must be 'Name: value': " + h);
            cli.set_status(1);
            return;
        }
        std::string name = h.substr(0, colon);
        std::string value = h.substr(colon + 1);
        trim(name);
        trim(value);
        request.params.headers[name] = value;
    }

    if (!cli.require_service()) return;

    // Sources default to the selected (or configured) hosts.
    request.sources = split_list(parsed->get("--sources"));
    if (request.sources.empty()) {
        for (const auto& a : cli.service->addresses(selected_hosts(*parsed))) request.sources.push_back(a.host);
    }
    request.targets = split_list(parsed->get("--targets"));
    request.max_parallel = *parallel > 0 ? *parallel : cli.config->connection().max_parallel;

    auto plan = TrafficEngine::plan(request);
    if (plan.is_err()) {
        std::cout << theme::fail(plan.error);
        cli.set_status(2);
        return;
    }
    std::cout << theme::step(fmt::format("Probing {} pairings over {} for {}s every {}s",
                                         plan.value.size(), to_string(request.protocol),
                                         request.duration, request.interval));
    std::cout << theme::dim("    Press Ctrl+C to stop early") << "\n";

    SampleCallback on_sample;
    if (parsed->has("-v") || parsed->has("--verbose")) {
        on_sample = [](const ProbeSpec& spec, const ProbeSample& s) {
            std::string what = s.success
                ? fmt::format("{:.1f} ms", s.latency_ms.value_or(0.0))
                : s.reason;
            std::cout << theme::log(fmt::format("{} -> {}:{} #{} {}", spec.source, spec.target, spec.port,
                                                s.sequence, what))
                      << std::flush;
        };
    }

    FleetService* service = cli.service.get();
    Result<std::vector<TrafficResult>> results;
    {
        InterruptWatch watch([service]() { service->cancel_traffic(); });
        results = service->traffic(request, on_sample);
    }
    if (results.is_err()) {
        std::cout << theme::fail(results.error);
        cli.set_status(results.kind == ErrorKind::ConfigInvalid ? 2 : 1);
        return;
    }

    print_traffic(results.value);

    std::string out = parsed->get("-o");
    if (!out.empty()) {
        MetricsSnapshot snapshot;
        for (const auto& r : results.value) snapshot.traffic.push_back(r.summary);
        auto format = export_format_from_string(parsed->get("--format", "json")).value_or(ExportFormat::Json);
        auto written = write_export(metrics_document(snapshot), format, expand_home(out));
        std::cout << (written.is_ok() ? theme::ok("Summaries exported to " + out) : theme::fail(written.error));
    }

    bool all_ok = true;
    for (const auto& r : results.value) {
        if (r.summary.success_count < r.summary.count) all_ok = false;
    }
    cli.set_status(all_ok ? 0 : 1);
}

static void do_iperf(BaseCLI& cli, const std::vector<std::string>& args) {
    const std::string usage =
        "iperf --clients a,b --servers x,y [--port n] [--duration s] [--streams n] [--mss n] "
        "[--interval s] [--expect gbps] [--tolerance pct] [-o file]";
    auto parsed = parse_command(cli, args,
                                {"--clients", "--servers", "--port", "--duration", "--streams", "--mss",
                                 "--interval", "--expect", "--tolerance"},
                                {}, usage);
    if (!parsed) return;
    auto clients = split_list(parsed->get("--clients"));
    auto servers = split_list(parsed->get("--servers"));
    if (!parsed->positional.empty() || clients.empty() || servers.empty()) {
        std::cout << theme::step("Usage: " + usage);
        cli.set_status(1);
        return;
    }

    IperfOptions options;
    auto port = int_option(*parsed, "--port", DEFAULT_IPERF_PORT);
    auto duration = int_option(*parsed, "--duration", DEFAULT_IPERF_DURATION_SECS);
    auto streams = int_option(*parsed, "--streams", DEFAULT_IPERF_STREAMS);
    auto mss = int_option(*parsed, "--mss", DEFAULT_IPERF_MSS);
    auto interval = int_option(*parsed, "--interval", DEFAULT_IPERF_INTERVAL_SECS);
    auto tolerance = double_option(*parsed, "--tolerance", DEFAULT_IPERF_TOLERANCE_PCT);
    auto parallel = int_option(*parsed, "-P", 0);
    if (!port || !duration || !streams || !mss || !interval || !tolerance || !parallel) {
        return cli.set_status(1);
    }
    if (*port <= 0 || *port > 65535 || *duration <= 0 || *streams <= 0 || *interval <= 0) {
        std::cout << theme::fail("Port, duration, streams and interval must be positive");
        cli.set_status(2);
        return;
    }
    options.port = *port;
    options.duration_secs = *duration;
    options.parallel_streams = *streams;
    options.mss = *mss;
    options.interval_secs = *interval;
    options.tolerance_pct = *tolerance;
    if (!parsed->get("--expect").empty()) {
        auto expect = double_option(*parsed, "--expect", 0.0);
        if (!expect) return cli.set_status(1);
        options.expected_gbps = *expect;
    }

    if (!cli.require_service()) return;
    options.max_parallel = *parallel > 0 ? *parallel : cli.config->connection().max_parallel;

    auto pairs = iperf_pairs(clients, servers);
    if (pairs.empty()) {
        std::cout << theme::fail("No client/server pairs (a host cannot test against itself)");
        cli.set_status(2);
        return;
    }
    std::cout << theme::step(fmt::format("Running iperf3 on {} pairs for {}s", pairs.size(),
                                         options.duration_secs));

    auto results = cli.service->iperf(clients, servers, options);

    std::cout << theme::section("iperf3 results");
    bool all_ok = true;
    for (const auto& r : results) {
        std::string pair = fmt::format("{} -> {}", r.client, r.server);
        if (!r.success) {
            all_ok = false;
            std::cout << theme::fail(fmt::format("{}  {}", pair, r.error));
            continue;
        }
        std::string line = fmt::format("{}  {:.3f} Gbit/s", pair, r.report.average_gbps.value_or(0.0));
        if (r.report.retransmits > 0) line += fmt::format("  {} retransmits", r.report.retransmits);
        if (r.passed) line += theme::dim(fmt::format("  (expected {:.3f})", *r.expected_gbps));
        std::cout << theme::ok(line);
    }

    std::string out = parsed->get("-o");
    if (!out.empty()) {
        nlohmann::json doc = nlohmann::json::array();
        for (const auto& r : results) doc.push_back(to_json(r));
        auto written = write_export(doc, ExportFormat::Json, expand_home(out));
        std::cout << (written.is_ok() ? theme::ok("Results written to " + out) : theme::fail(written.error));
    }
    cli.set_status(all_ok ? 0 : 1);
}

void register_traffic_commands(BaseCLI& cli) {
    cli.add_command("traffic", do_traffic, "Probe connectivity and latency between hosts");
    cli.add_command("iperf", do_iperf, "Measure throughput with iperf3 between host pairs");
}
