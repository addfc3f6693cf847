#include "metrics_store.hpp"
#include <core/log.hpp>
#include <core/config.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>

OperationRecord OperationRecord::from_result(const OperationResult& r) {
    OperationRecord rec;
    rec.host = r.host;
    rec.operation = r.operation;
    rec.success = r.success;
    rec.error_kind = r.error_kind;
    rec.error = r.error;
    rec.exit_code = r.exit_code;
    rec.duration = r.duration;
    rec.retry_count = r.retry_count;
    if (r.transfer) rec.bytes_transferred = r.transfer->size;
    rec.timestamp = r.timestamp;
    return rec;
}

MetricsStore::MetricsStore(fs::path path) : path_(std::move(path)) {}

fs::path MetricsStore::default_path() {
    return get_global_config_dir() / "metrics.yaml";
}

namespace {

template <typename T>
void emit_optional(YAML::Emitter& out, const char* key, const std::optional<T>& v) {
    if (v) out << YAML::Key << key << YAML::Value << *v;
}

template <typename T>
std::optional<T> read_optional(const YAML::Node& n, const char* key) {
    if (!n[key]) return std::nullopt;
    return n[key].as<T>();
}

ProbeSummary read_summary(const YAML::Node& n) {
    ProbeSummary s;
    s.protocol = protocol_from_string(n["protocol"].as<std::string>("tcp")).value_or(Protocol::TCP);
    s.direction = direction_from_string(n["direction"].as<std::string>("east_west"))
                      .value_or(Direction::EastWest);
    s.source = n["source"].as<std::string>("");
    s.target = n["target"].as<std::string>("");
    s.port = n["port"].as<int>(0);
    s.count = n["count"].as<int>(0);
    s.success_count = n["success_count"].as<int>(0);
    s.failure_count = n["failure_count"].as<int>(0);
    s.success_rate = n["success_rate"].as<double>(0.0);
    s.min_ms = read_optional<double>(n, "min_ms");
    s.max_ms = read_optional<double>(n, "max_ms");
    s.avg_ms = read_optional<double>(n, "avg_ms");
    s.median_ms = read_optional<double>(n, "median_ms");
    s.p95_ms = read_optional<double>(n, "p95_ms");
    s.p99_ms = read_optional<double>(n, "p99_ms");
    s.stddev_ms = read_optional<double>(n, "stddev_ms");
    s.jitter_ms = read_optional<double>(n, "jitter_ms");
    s.avg_throughput_bps = read_optional<double>(n, "avg_throughput_bps");
    s.avg_tls_handshake_ms = read_optional<double>(n, "avg_tls_handshake_ms");
    s.packet_loss_percent = n["packet_loss_percent"].as<double>(0.0);
    if (n["status_codes"] && n["status_codes"].IsMap()) {
        for (const auto& kv : n["status_codes"]) {
            s.status_codes[kv.first.as<int>()] = kv.second.as<int>(0);
        }
    }
    if (n["failure_reasons"] && n["failure_reasons"].IsMap()) {
        for (const auto& kv : n["failure_reasons"]) {
            s.failure_reasons[kv.first.as<std::string>()] = kv.second.as<int>(0);
        }
    }
    if (n["fields"] && n["fields"].IsSequence()) {
        for (const auto& f : n["fields"]) s.fields.push_back(f.as<std::string>());
    }
    s.cancelled = n["cancelled"].as<bool>(false);
    s.started = n["started"].as<std::string>("");
    s.finished = n["finished"].as<std::string>("");
    return s;
}

void emit_summary(YAML::Emitter& out, const ProbeSummary& s) {
    out << YAML::BeginMap;
    out << YAML::Key << "protocol" << YAML::Value << to_string(s.protocol);
    out << YAML::Key << "direction" << YAML::Value << to_string(s.direction);
    out << YAML::Key << "source" << YAML::Value << s.source;
    out << YAML::Key << "target" << YAML::Value << s.target;
    out << YAML::Key << "port" << YAML::Value << s.port;
    out << YAML::Key << "count" << YAML::Value << s.count;
    out << YAML::Key << "success_count" << YAML::Value << s.success_count;
    out << YAML::Key << "failure_count" << YAML::Value << s.failure_count;
    out << YAML::Key << "success_rate" << YAML::Value << s.success_rate;
    emit_optional(out, "min_ms", s.min_ms);
    emit_optional(out, "max_ms", s.max_ms);
    emit_optional(out, "avg_ms", s.avg_ms);
    emit_optional(out, "median_ms", s.median_ms);
    emit_optional(out, "p95_ms", s.p95_ms);
    emit_optional(out, "p99_ms", s.p99_ms);
    emit_optional(out, "stddev_ms", s.stddev_ms);
    emit_optional(out, "jitter_ms", s.jitter_ms);
    emit_optional(out, "avg_throughput_bps", s.avg_throughput_bps);
    emit_optional(out, "avg_tls_handshake_ms", s.avg_tls_handshake_ms);
    out << YAML::Key << "packet_loss_percent" << YAML::Value << s.packet_loss_percent;
    out << YAML::Key << "status_codes" << YAML::Value << YAML::BeginMap;
    for (const auto& [code, n] : s.status_codes) out << YAML::Key << code << YAML::Value << n;
    out << YAML::EndMap;
    out << YAML::Key << "failure_reasons" << YAML::Value << YAML::BeginMap;
    for (const auto& [reason, n] : s.failure_reasons) out << YAML::Key << reason << YAML::Value << n;
    out << YAML::EndMap;
    out << YAML::Key << "fields" << YAML::Value << YAML::Flow << s.fields;
    out << YAML::Key << "cancelled" << YAML::Value << s.cancelled;
    out << YAML::Key << "started" << YAML::Value << s.started;
    out << YAML::Key << "finished" << YAML::Value << s.finished;
    out << YAML::EndMap;
}

template <typename T>
void keep_newest(std::vector<T>& v, size_t max) {
    if (v.size() > max) v.erase(v.begin(), v.begin() + static_cast<long>(v.size() - max));
}

} // namespace

MetricsSnapshot MetricsStore::load() const {
    MetricsSnapshot snapshot;

    if (!fs::exists(path_)) {
        return snapshot;
    }

    try {
        YAML::Node root = YAML::LoadFile(path_.string());

        if (root["operations"] && root["operations"].IsSequence()) {
            for (const auto& n : root["operations"]) {
                OperationRecord r;
                r.host = n["host"].as<std::string>("");
                r.operation = n["operation"].as<std::string>("");
                r.success = n["success"].as<bool>(false);
                r.error_kind = error_kind_from_string(n["error_kind"].as<std::string>("none"));
                r.error = n["error"].as<std::string>("");
                r.exit_code = read_optional<int>(n, "exit_code");
                r.duration = n["duration"].as<double>(0.0);
                r.retry_count = n["retry_count"].as<int>(0);
                r.bytes_transferred = n["bytes_transferred"].as<uint64_t>(0);
                r.timestamp = n["timestamp"].as<std::string>("");
                snapshot.operations.push_back(r);
            }
        }

        if (root["traffic"] && root["traffic"].IsSequence()) {
            for (const auto& n : root["traffic"]) {
                snapshot.traffic.push_back(read_summary(n));
            }
        }

    } catch (const std::exception& e) {
        // Corrupted metrics file: start fresh
        fleetrun_log(std::string("MetricsStore: ignoring unreadable ") + path_.string() + ": " + e.what());
        return MetricsSnapshot{};
    }

    return snapshot;
}

void MetricsStore::save(const MetricsSnapshot& snapshot) const {
    fs::create_directories(path_.parent_path());

    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "operations" << YAML::Value << YAML::BeginSeq;
    for (const auto& r : snapshot.operations) {
        out << YAML::BeginMap;
        out << YAML::Key << "host" << YAML::Value << r.host;
        out << YAML::Key << "operation" << YAML::Value << r.operation;
        out << YAML::Key << "success" << YAML::Value << r.success;
        out << YAML::Key << "error_kind" << YAML::Value << to_string(r.error_kind);
        out << YAML::Key << "error" << YAML::Value << r.error;
        emit_optional(out, "exit_code", r.exit_code);
        out << YAML::Key << "duration" << YAML::Value << r.duration;
        out << YAML::Key << "retry_count" << YAML::Value << r.retry_count;
        out << YAML::Key << "bytes_transferred" << YAML::Value << r.bytes_transferred;
        out << YAML::Key << "timestamp" << YAML::Value << r.timestamp;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "traffic" << YAML::Value << YAML::BeginSeq;
    for (const auto& s : snapshot.traffic) emit_summary(out, s);
    out << YAML::EndSeq;

    out << YAML::EndMap;

    std::ofstream fout(path_.string());
    if (!fout) {
        fleetrun_log("MetricsStore: cannot write " + path_.string());
        return;
    }
    fout << out.c_str();
}

void MetricsStore::record(const std::map<std::string, OperationResult>& results) {
    if (results.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    MetricsSnapshot snapshot = load();
    for (const auto& [host, r] : results) {
        snapshot.operations.push_back(OperationRecord::from_result(r));
    }
    keep_newest(snapshot.operations, MAX_HISTORY);
    save(snapshot);
}

void MetricsStore::record(const std::vector<ProbeSummary>& summaries) {
    if (summaries.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    MetricsSnapshot snapshot = load();
    snapshot.traffic.insert(snapshot.traffic.end(), summaries.begin(), summaries.end());
    keep_newest(snapshot.traffic, MAX_HISTORY);
    save(snapshot);
}

void MetricsStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    save(MetricsSnapshot{});
}

std::map<std::string, HostMetrics> MetricsStore::aggregate(const std::vector<OperationRecord>& ops) {
    std::map<std::string, HostMetrics> hosts;
    for (const auto& op : ops) {
        auto& m = hosts[op.host];
        if (m.total_operations == 0) {
            m.host = op.host;
            m.min_duration = op.duration;
            m.max_duration = op.duration;
        }
        m.total_operations++;
        if (op.success) m.successful_operations++;
        else m.failed_operations++;
        m.total_duration += op.duration;
        m.min_duration = std::min(m.min_duration, op.duration);
        m.max_duration = std::max(m.max_duration, op.duration);
        m.bytes_transferred += op.bytes_transferred;
        m.total_retries += op.retry_count;
        if (op.timestamp > m.last_operation) m.last_operation = op.timestamp;
    }
    return hosts;
}
