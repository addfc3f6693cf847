#include "probe.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <sys/socket.h>

// ── Names ──────────────────────────────────────────────────

namespace {

struct ProtocolName {
    Protocol protocol;
    const char* name;
    int port;
};

const ProtocolName PROTOCOL_NAMES[] = {
    {Protocol::TCP,   "tcp",   80},
    {Protocol::UDP,   "udp",   53},
    {Protocol::HTTP,  "http",  80},
    {Protocol::HTTPS, "https", 443},
    {Protocol::DNS,   "dns",   53},
    {Protocol::ICMP,  "icmp",  0},
    {Protocol::SCP,   "scp",   22},
    {Protocol::FTP,   "ftp",   21},
};

} // namespace

std::string to_string(Protocol p) {
    for (const auto& n : PROTOCOL_NAMES) {
        if (n.protocol == p) return n.name;
    }
    return "unknown";
}

std::string to_string(Direction d) {
    return d == Direction::EastWest ? "east_west" : "north_south";
}

std::optional<Protocol> protocol_from_string(const std::string& s) {
    std::string lower = to_lower(s);
    for (const auto& n : PROTOCOL_NAMES) {
        if (lower == n.name) return n.protocol;
    }
    return std::nullopt;
}

std::optional<Direction> direction_from_string(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "east_west" || lower == "east-west") return Direction::EastWest;
    if (lower == "north_south" || lower == "north-south") return Direction::NorthSouth;
    return std::nullopt;
}

int default_port(Protocol p) {
    for (const auto& n : PROTOCOL_NAMES) {
        if (n.protocol == p) return n.port;
    }
    return 0;
}

int ProbeSpec::sample_count() const {
    if (interval <= 0.0 || duration <= 0.0) return 0;
    return static_cast<int>(std::floor(duration / interval + 1e-9));
}

bool is_local_source(const std::string& source) {
    return source.empty() || source == "local" || source == "localhost";
}

// ── Source command execution ──────────────────────────────

SSHResult run_on_source(const ProbeContext& ctx, const std::string& command, int timeout_secs) {
    if (ctx.source) {
        return ctx.source->exec(command, timeout_secs);
    }

    auto out = platform::run_captured("/bin/sh", {"-c", command}, timeout_secs * 1000);
    SSHResult r{out.exit_code, out.stdout_data, out.stderr_data, ErrorKind::None};
    if (!out.spawned) {
        r.exit_code = -1;
        r.kind = ErrorKind::CommandFailed;
        r.stderr_data = "failed to spawn /bin/sh";
    } else if (out.timed_out) {
        r.exit_code = -1;
        r.kind = ErrorKind::TimeoutExceeded;
    }
    return r;
}

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* ELAPSED_TAG = "__fleetrun_elapsed_us=";

double elapsed_ms(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

// Wrap body so the source reports its own wall time, excluding the cost of
// reaching the source.
std::string timed(const std::string& body) {
    return fmt::format("s=$(date +%s%N); {}; rc=$?; e=$(date +%s%N); "
                       "echo \"{}$(( (e - s) / 1000 ))\"; exit $rc",
                       body, ELAPSED_TAG);
}

std::optional<double> parse_elapsed(const std::string& output) {
    auto pos = output.rfind(ELAPSED_TAG);
    if (pos == std::string::npos) return std::nullopt;
    std::string digits = output.substr(pos + std::char_traits<char>::length(ELAPSED_TAG));
    trim(digits);
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    return safe_stod(digits) / 1000.0;
}

std::string exit_reason(const SSHResult& r) {
    if (r.kind == ErrorKind::TimeoutExceeded || r.exit_code == 124) return "timeout";
    if (r.kind != ErrorKind::None) return std::string("source unavailable: ") + to_string(r.kind);
    return fmt::format("exit {}", r.exit_code);
}

// Run a timed command and fill success/latency/reason.
ProbeSample timed_sample(const ProbeContext& ctx, const std::string& body) {
    ProbeSample s;
    auto start = Clock::now();
    SSHResult r = run_on_source(ctx, timed(body), ctx.spec.params.timeout_secs + 5);
    double wall = elapsed_ms(start);

    s.success = r.success();
    if (s.success) {
        s.latency_ms = parse_elapsed(r.stdout_data).value_or(wall);
    } else {
        s.reason = exit_reason(r);
    }
    return s;
}

std::string connect_reason(platform::ConnectStatus status, const std::string& error) {
    switch (status) {
        case platform::ConnectStatus::Refused:       return "connection refused";
        case platform::ConnectStatus::TimedOut:      return "timeout";
        case platform::ConnectStatus::ResolveFailed: return "resolve failed: " + error;
        default:                                     return error.empty() ? "connect failed" : error;
    }
}

// ── TCP ────────────────────────────────────────────────────

class TcpProbe : public Probe {
public:
    ProbeSample sample(const ProbeContext& ctx) const override {
        const auto& spec = ctx.spec;
        if (ctx.source) {
            std::string target = fmt::format("</dev/tcp/{}/{}", spec.target, spec.port);
            return timed_sample(ctx, fmt::format("timeout {} bash -c {}",
                                                 spec.params.timeout_secs, shell_quote(target)));
        }

        ProbeSample s;
        auto start = Clock::now();
        auto dialed = platform::connect_socket(spec.target, spec.port, platform::SocketKind::Stream,
                                               spec.params.timeout_secs * 1000);
        double latency = elapsed_ms(start);
        if (dialed.connected()) {
            platform::close_socket(dialed.fd);
            s.success = true;
            s.latency_ms = latency;
        } else {
            s.reason = connect_reason(dialed.status, dialed.error);
        }
        return s;
    }

    std::vector<std::string> summary_fields() const override { return {}; }
};

// ── UDP ────────────────────────────────────────────────────

class UdpProbe : public Probe {
public:
    ProbeSample sample(const ProbeContext& ctx) const override {
        const auto& spec = ctx.spec;
        if (ctx.source) {
            return timed_sample(ctx, fmt::format("nc -u -z -w {} {} {}", spec.params.timeout_secs,
                                                 shell_quote(spec.target), spec.port));
        }

        ProbeSample s;
        auto start = Clock::now();
        auto dialed = platform::connect_socket(spec.target, spec.port, platform::SocketKind::Datagram,
                                               spec.params.timeout_secs * 1000);
        if (!dialed.connected()) {
            s.reason = connect_reason(dialed.status, dialed.error);
            return s;
        }
        socket_t sock = dialed.fd;

        std::string payload(static_cast<size_t>(std::max(1, spec.params.packet_size)), 'X');
        auto sent = ::send(sock, payload.data(), payload.size(), 0);
        if (sent < 0) {
            platform::close_socket(sock);
            s.reason = "send failed";
            return s;
        }

        int revents = platform::poll_socket(sock, POLLIN, spec.params.timeout_secs * 1000);
        if (revents & (POLLIN | POLLERR)) {
            std::string buf(payload.size(), '\0');
            auto got = ::recv(sock, &buf[0], buf.size(), 0);
            if (got > 0) {
                s.success = true;
                s.latency_ms = elapsed_ms(start);
                s.bytes = static_cast<uint64_t>(sent) + static_cast<uint64_t>(got);
            } else {
                s.reason = "connection refused";
            }
        } else {
            s.reason = "no response";
        }
        platform::close_socket(sock);
        return s;
    }

    std::vector<std::string> summary_fields() const override {
        return {"jitter_ms", "packet_loss_percent"};
    }
};

// ── HTTP / HTTPS ───────────────────────────────────────────

class HttpProbe : public Probe {
public:
    explicit HttpProbe(bool tls) : tls_(tls) {}

    ProbeSample sample(const ProbeContext& ctx) const override {
        const auto& spec = ctx.spec;
        std::string url = fmt::format("{}://{}:{}/", tls_ ? "https" : "http", spec.target, spec.port);

        std::string cmd = fmt::format("curl -s -o /dev/null -m {}", spec.params.timeout_secs);
        if (tls_ && !spec.params.verify_tls) cmd += " -k";
        for (const auto& [k, v] : spec.params.headers) {
            cmd += " -H " + shell_quote(k + ": " + v);
        }
        cmd += " -w " + shell_quote("%{http_code},%{time_total},%{size_download},"
                                    "%{speed_download},%{time_appconnect}");
        cmd += " " + shell_quote(url);

        ProbeSample s;
        SSHResult r = run_on_source(ctx, cmd, spec.params.timeout_secs + 5);
        if (r.kind != ErrorKind::None) {
            s.reason = exit_reason(r);
            return s;
        }

        std::string out = r.stdout_data;
        trim(out);
        auto parts = split_list(out, ',');
        if (parts.size() < 5) {
            s.reason = r.exit_code == 28 ? "timeout" : fmt::format("curl exit {}", r.exit_code);
            return s;
        }

        int code = safe_stoi(parts[0]);
        s.status_code = code;
        s.latency_ms = safe_stod(parts[1]) * 1000.0;
        s.bytes = static_cast<uint64_t>(safe_stod(parts[2]));
        s.throughput_bps = safe_stod(parts[3]);
        if (tls_) s.tls_handshake_ms = safe_stod(parts[4]) * 1000.0;

        if (r.exit_code != 0 || code == 0) {
            s.reason = r.exit_code == 28 ? "timeout" : fmt::format("curl exit {}", r.exit_code);
            s.latency_ms.reset();
        } else if (code < 200 || code >= 400) {
            s.reason = fmt::format("HTTP {}", code);
        } else {
            s.success = true;
        }
        return s;
    }

    std::vector<std::string> summary_fields() const override {
        if (tls_) return {"status_codes", "avg_throughput_bps", "avg_tls_handshake_ms"};
        return {"status_codes", "avg_throughput_bps"};
    }

private:
    bool tls_;
};

// ── DNS ────────────────────────────────────────────────────

// nslookup prints the server's own address before "Name:"; only addresses
// after it are answers.
bool has_dns_answer(const std::string& output) {
    auto name = output.find("Name:");
    if (name == std::string::npos) return false;
    return output.find("Address", name) != std::string::npos;
}

class DnsProbe : public Probe {
public:
    ProbeSample sample(const ProbeContext& ctx) const override {
        const auto& spec = ctx.spec;
        std::string cmd = fmt::format("nslookup -timeout={} {}", spec.params.timeout_secs,
                                      shell_quote(spec.target));
        if (!spec.params.dns_server.empty()) cmd += " " + shell_quote(spec.params.dns_server);

        ProbeSample s;
        auto start = Clock::now();
        SSHResult r = run_on_source(ctx, timed(cmd), spec.params.timeout_secs + 5);
        if (r.success() && has_dns_answer(r.stdout_data)) {
            s.success = true;
            s.latency_ms = parse_elapsed(r.stdout_data).value_or(elapsed_ms(start));
        } else if (r.success()) {
            s.reason = "no address returned";
        } else {
            s.reason = exit_reason(r);
        }
        return s;
    }

    std::vector<std::string> summary_fields() const override { return {}; }
};

// ── ICMP ───────────────────────────────────────────────────

std::optional<double> parse_ping_time(const std::string& output) {
    auto pos = output.find("time=");
    if (pos == std::string::npos) return std::nullopt;
    std::istringstream iss(output.substr(pos + 5));
    double ms;
    if (!(iss >> ms)) return std::nullopt;
    return ms;
}

class IcmpProbe : public Probe {
public:
    ProbeSample sample(const ProbeContext& ctx) const override {
        const auto& spec = ctx.spec;
        ProbeSample s;
        SSHResult r = run_on_source(ctx, fmt::format("ping -c 1 -W {} {}", spec.params.timeout_secs,
                                                     shell_quote(spec.target)),
                                    spec.params.timeout_secs + 5);
        auto latency = parse_ping_time(r.stdout_data);
        if (r.success() && latency) {
            s.success = true;
            s.latency_ms = latency;
        } else if (r.kind == ErrorKind::None && r.exit_code == 1) {
            s.reason = "no reply";
        } else {
            s.reason = exit_reason(r);
        }
        return s;
    }

    std::vector<std::string> summary_fields() const override {
        return {"packet_loss_percent"};
    }
};

// ── SCP / FTP ──────────────────────────────────────────────

class TransferProbe : public Probe {
public:
    explicit TransferProbe(bool ftp) : ftp_(ftp) {}

    ProbeSample sample(const ProbeContext& ctx) const override {
        const auto& spec = ctx.spec;
        const auto& p = spec.params;
        uint64_t size = static_cast<uint64_t>(std::max(1, p.packet_size));

        std::string send;
        if (ftp_) {
            std::string url = fmt::format("ftp://{}:{}/fleetrun_probe_{}", spec.target, spec.port,
                                          ctx.sequence);
            send = fmt::format("curl -s -m {} -T \"$f\"", p.timeout_secs);
            if (!p.transfer_user.empty()) {
                send += " -u " + shell_quote(p.transfer_user + ":" + p.transfer_password);
            }
            send += " " + shell_quote(url);
        } else {
            std::string dest = (p.transfer_user.empty() ? "" : p.transfer_user + "@") +
                               spec.target + ":/tmp/";
            send = fmt::format("scp -B -q -o StrictHostKeyChecking=no -o ConnectTimeout={} -P {} "
                               "\"$f\" {}", p.timeout_secs, spec.port, shell_quote(dest));
        }

        // The test file is written before the clock starts.
        std::string cmd = fmt::format("f=$(mktemp) && head -c {} /dev/zero > \"$f\" && {{ {}; }}; "
                                      "rc=$?; rm -f \"$f\"; exit $rc",
                                      size, timed(send));

        ProbeSample s;
        auto start = Clock::now();
        SSHResult r = run_on_source(ctx, cmd, p.timeout_secs + 5);
        if (r.success()) {
            double ms = parse_elapsed(r.stdout_data).value_or(elapsed_ms(start));
            s.success = true;
            s.latency_ms = ms;
            s.bytes = size;
            if (ms > 0.0) s.throughput_bps = static_cast<double>(size) / (ms / 1000.0);
        } else {
            s.reason = exit_reason(r);
        }
        return s;
    }

    std::vector<std::string> summary_fields() const override {
        return {"avg_throughput_bps"};
    }

private:
    bool ftp_;
};

// ── Registry ───────────────────────────────────────────────

struct ProbeEntry {
    Protocol protocol;
    const Probe* probe;
};

const TcpProbe TCP_PROBE{};
const UdpProbe UDP_PROBE{};
const HttpProbe HTTP_PROBE(false);
const HttpProbe HTTPS_PROBE(true);
const DnsProbe DNS_PROBE{};
const IcmpProbe ICMP_PROBE{};
const TransferProbe SCP_PROBE(false);
const TransferProbe FTP_PROBE(true);

const ProbeEntry PROBES[] = {
    {Protocol::TCP,   &TCP_PROBE},
    {Protocol::UDP,   &UDP_PROBE},
    {Protocol::HTTP,  &HTTP_PROBE},
    {Protocol::HTTPS, &HTTPS_PROBE},
    {Protocol::DNS,   &DNS_PROBE},
    {Protocol::ICMP,  &ICMP_PROBE},
    {Protocol::SCP,   &SCP_PROBE},
    {Protocol::FTP,   &FTP_PROBE},
};

} // namespace

const Probe& probe_for(Protocol p) {
    for (const auto& e : PROBES) {
        if (e.protocol == p) return *e.probe;
    }
    return TCP_PROBE;
}
