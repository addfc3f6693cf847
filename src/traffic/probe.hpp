#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <ssh/transport.hpp>

enum class Protocol { TCP, UDP, HTTP, HTTPS, DNS, ICMP, SCP, FTP };
enum class Direction { EastWest, NorthSouth };

std::string to_string(Protocol p);
std::string to_string(Direction d);
std::optional<Protocol> protocol_from_string(const std::string& s);
std::optional<Direction> direction_from_string(const std::string& s);

// Port probed when the caller gives none.
int default_port(Protocol p);

struct ProbeParams {
    int timeout_secs = DEFAULT_PROBE_TIMEOUT_SECS;
    int packet_size = DEFAULT_PACKET_SIZE;
    bool verify_tls = true;
    std::string dns_server;                         // nslookup server, empty = resolver default
    std::string transfer_user;                      // scp/ftp login on the target
    std::string transfer_password;                  // ftp only
    std::map<std::string, std::string> headers;     // http/https
};

// One source -> target:port pairing.
struct ProbeSpec {
    Protocol protocol = Protocol::TCP;
    Direction direction = Direction::EastWest;
    std::string source;
    std::string target;
    int port = 0;
    double duration = DEFAULT_PROBE_DURATION_SECS;
    double interval = DEFAULT_PROBE_INTERVAL_SECS;
    ProbeParams params;

    // floor(duration / interval)
    int sample_count() const;
};

struct ProbeSample {
    std::string timestamp;
    int sequence = 0;
    bool success = false;
    std::optional<double> latency_ms;
    std::string reason;                             // why a failed sample failed

    std::optional<int> status_code;
    std::optional<double> tls_handshake_ms;
    std::optional<double> throughput_bps;
    std::optional<uint64_t> bytes;
};

struct ProbeSummary {
    Protocol protocol = Protocol::TCP;
    Direction direction = Direction::EastWest;
    std::string source;
    std::string target;
    int port = 0;

    int count = 0;
    int success_count = 0;
    int failure_count = 0;
    double success_rate = 0.0;                      // 0..1

    // Unset when no sample succeeded.
    std::optional<double> min_ms;
    std::optional<double> max_ms;
    std::optional<double> avg_ms;
    std::optional<double> median_ms;
    std::optional<double> p95_ms;
    std::optional<double> p99_ms;
    std::optional<double> stddev_ms;

    std::optional<double> jitter_ms;
    std::optional<double> avg_throughput_bps;
    std::optional<double> avg_tls_handshake_ms;
    double packet_loss_percent = 0.0;
    std::map<int, int> status_codes;
    std::map<std::string, int> failure_reasons;
    bool cancelled = false;

    // Protocol-specific fields that carry meaning for this protocol.
    std::vector<std::string> fields;

    std::string started;
    std::string finished;
};

// Where one sample is taken from. A null source means this machine.
struct ProbeContext {
    const ProbeSpec& spec;
    RemoteSession* source = nullptr;
    int sequence = 0;
};

class Probe {
public:
    virtual ~Probe() = default;

    // Take one sample. Failures are reported in the sample, never thrown.
    virtual ProbeSample sample(const ProbeContext& ctx) const = 0;

    // Names of the protocol-specific summary fields this probe fills.
    virtual std::vector<std::string> summary_fields() const = 0;
};

// Registered implementation for a protocol; never null.
const Probe& probe_for(Protocol p);

// Run a shell command on the probe source (remote exec or local sh -c).
SSHResult run_on_source(const ProbeContext& ctx, const std::string& command, int timeout_secs);

// Treat "local" and "localhost" sources as this machine.
bool is_local_source(const std::string& source);
