#include "metrics_export.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

using nlohmann::json;

std::optional<ExportFormat> export_format_from_string(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "json") return ExportFormat::Json;
    if (lower == "csv") return ExportFormat::Csv;
    if (lower == "prometheus" || lower == "prom") return ExportFormat::Prometheus;
    return std::nullopt;
}

namespace {

template <typename T>
json optional_json(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

json summary_json(const std::vector<OperationRecord>& ops, size_t unique_hosts) {
    int ok = 0;
    double total_duration = 0.0;
    uint64_t bytes = 0;
    for (const auto& op : ops) {
        if (op.success) ok++;
        total_duration += op.duration;
        bytes += op.bytes_transferred;
    }
    json j;
    j["total_operations"] = ops.size();
    j["successful_operations"] = ok;
    j["failed_operations"] = static_cast<int>(ops.size()) - ok;
    j["success_rate"] = ops.empty() ? 0.0 : static_cast<double>(ok) / ops.size();
    j["total_duration"] = total_duration;
    j["avg_duration"] = ops.empty() ? 0.0 : total_duration / ops.size();
    j["total_bytes_transferred"] = bytes;
    j["unique_hosts"] = unique_hosts;
    return j;
}

json hosts_json(const std::vector<OperationRecord>& ops) {
    json hosts = json::object();
    for (const auto& [host, m] : MetricsStore::aggregate(ops)) hosts[host] = to_json(m);
    return hosts;
}

} // namespace

json to_json(const CommandResult& c) {
    json j;
    j["command"] = c.command;
    j["output"] = c.output;
    j["error"] = c.error;
    j["exit_code"] = optional_json(c.exit_code);
    j["duration"] = c.duration;
    j["success"] = c.success;
    return j;
}

json to_json(const OperationResult& r) {
    json j;
    j["host"] = r.host;
    j["operation"] = r.operation;
    j["success"] = r.success;
    j["output"] = r.output;
    j["error"] = r.error;
    j["error_kind"] = to_string(r.error_kind);
    j["exit_code"] = optional_json(r.exit_code);
    j["duration"] = r.duration;
    j["retry_count"] = r.retry_count;
    j["timestamp"] = r.timestamp;
    j["bytes_transferred"] = r.transfer ? r.transfer->size : 0;

    j["commands"] = json::array();
    for (const auto& c : r.commands) j["commands"].push_back(to_json(c));

    if (r.transfer) {
        const auto& t = *r.transfer;
        j["transfer"] = {
            {"operation", t.operation},
            {"local_path", t.local_path},
            {"remote_path", t.remote_path},
            {"size", t.size},
            {"checksum", t.checksum},
        };
    } else {
        j["transfer"] = nullptr;
    }
    return j;
}

json to_json(const OperationRecord& r) {
    json j;
    j["host"] = r.host;
    j["operation"] = r.operation;
    j["success"] = r.success;
    j["error"] = r.error;
    j["error_kind"] = to_string(r.error_kind);
    j["exit_code"] = optional_json(r.exit_code);
    j["duration"] = r.duration;
    j["retry_count"] = r.retry_count;
    j["bytes_transferred"] = r.bytes_transferred;
    j["timestamp"] = r.timestamp;
    return j;
}

json to_json(const HostMetrics& m) {
    json j;
    j["total_operations"] = m.total_operations;
    j["successful_operations"] = m.successful_operations;
    j["failed_operations"] = m.failed_operations;
    j["total_duration"] = m.total_duration;
    j["avg_duration"] = m.avg_duration();
    j["min_duration"] = m.min_duration;
    j["max_duration"] = m.max_duration;
    j["bytes_transferred"] = m.bytes_transferred;
    j["total_retries"] = m.total_retries;
    j["last_operation"] = m.last_operation;
    return j;
}

json to_json(const ProbeSample& s) {
    json j;
    j["timestamp"] = s.timestamp;
    j["sequence"] = s.sequence;
    j["success"] = s.success;
    j["latency_ms"] = optional_json(s.latency_ms);
    j["reason"] = s.reason;
    j["status_code"] = optional_json(s.status_code);
    j["tls_handshake_ms"] = optional_json(s.tls_handshake_ms);
    j["throughput_bps"] = optional_json(s.throughput_bps);
    j["bytes"] = optional_json(s.bytes);
    return j;
}

json to_json(const ProbeSummary& s) {
    json j;
    j["protocol"] = to_string(s.protocol);
    j["direction"] = to_string(s.direction);
    j["source"] = s.source;
    j["target"] = s.target;
    j["port"] = s.port;
    j["count"] = s.count;
    j["success_count"] = s.success_count;
    j["failure_count"] = s.failure_count;
    j["success_rate"] = s.success_rate;

    // Latency statistics are left out entirely when nothing succeeded.
    if (s.min_ms) {
        j["latency_ms"] = {
            {"min", *s.min_ms},
            {"max", s.max_ms.value_or(0.0)},
            {"avg", s.avg_ms.value_or(0.0)},
            {"median", s.median_ms.value_or(0.0)},
            {"p95", s.p95_ms.value_or(0.0)},
            {"p99", s.p99_ms.value_or(0.0)},
            {"stddev", s.stddev_ms.value_or(0.0)},
        };
    }
    j["jitter_ms"] = optional_json(s.jitter_ms);
    j["avg_throughput_bps"] = optional_json(s.avg_throughput_bps);
    j["avg_tls_handshake_ms"] = optional_json(s.avg_tls_handshake_ms);
    j["packet_loss_percent"] = s.packet_loss_percent;

    j["status_codes"] = json::object();
    for (const auto& [code, n] : s.status_codes) j["status_codes"][std::to_string(code)] = n;
    j["failure_reasons"] = s.failure_reasons;
    j["fields"] = s.fields;
    j["cancelled"] = s.cancelled;
    j["started"] = s.started;
    j["finished"] = s.finished;
    return j;
}

json metrics_document(const MetricsSnapshot& snapshot) {
    json doc;
    doc["operations"] = json::array();
    for (const auto& op : snapshot.operations) doc["operations"].push_back(to_json(op));
    doc["hosts"] = hosts_json(snapshot.operations);
    doc["summary"] = summary_json(snapshot.operations, doc["hosts"].size());
    doc["traffic"] = json::array();
    for (const auto& s : snapshot.traffic) doc["traffic"].push_back(to_json(s));
    doc["export_time"] = now_iso();
    return doc;
}

json results_document(const std::map<std::string, OperationResult>& results) {
    std::vector<OperationRecord> records;
    json doc;
    doc["operations"] = json::array();
    for (const auto& [host, r] : results) {
        doc["operations"].push_back(to_json(r));
        records.push_back(OperationRecord::from_result(r));
    }
    doc["hosts"] = hosts_json(records);
    doc["summary"] = summary_json(records, doc["hosts"].size());
    doc["traffic"] = json::array();
    doc["export_time"] = now_iso();
    return doc;
}

// ── CSV ────────────────────────────────────────────────────

std::string csv_escape(const std::string& s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

namespace {

const char* const OPERATION_COLUMNS[] = {
    "host", "operation", "success", "error_kind", "error", "exit_code",
    "duration", "retry_count", "bytes_transferred", "timestamp",
};

const char* const TRAFFIC_COLUMNS[] = {
    "protocol", "direction", "source", "target", "port", "count", "success_count",
    "failure_count", "success_rate", "min_ms", "avg_ms", "max_ms", "median_ms", "p95_ms",
    "p99_ms", "stddev_ms", "jitter_ms", "packet_loss_percent", "avg_throughput_bps",
    "avg_tls_handshake_ms", "cancelled",
};

std::string cell(const json& v) {
    if (v.is_null()) return "";
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    return v.dump();
}

// Traffic rows flatten latency_ms.{min,...} into <stat>_ms columns.
json traffic_field(const json& row, const std::string& column) {
    static const std::string suffix = "_ms";
    if (column.size() > suffix.size() && column.compare(column.size() - 3, 3, suffix) == 0 &&
        column != "jitter_ms" && column != "avg_tls_handshake_ms") {
        std::string stat = column.substr(0, column.size() - 3);
        if (row.contains("latency_ms") && row["latency_ms"].contains(stat)) {
            return row["latency_ms"][stat];
        }
        return nullptr;
    }
    return row.value(column, json(nullptr));
}

template <size_t N, typename Get>
void write_table(std::ostringstream& out, const char* const (&columns)[N], const json& rows, Get get) {
    for (size_t i = 0; i < N; ++i) out << (i ? "," : "") << columns[i];
    out << "\n";
    for (const auto& row : rows) {
        for (size_t i = 0; i < N; ++i) {
            out << (i ? "," : "") << csv_escape(cell(get(row, columns[i])));
        }
        out << "\n";
    }
}

} // namespace

std::string render_csv(const json& doc) {
    std::ostringstream out;
    json ops = doc.value("operations", json::array());
    json traffic = doc.value("traffic", json::array());

    if (!ops.empty() || traffic.empty()) {
        write_table(out, OPERATION_COLUMNS, ops, [](const json& row, const std::string& col) {
            return row.value(col, json(nullptr));
        });
    }
    if (!traffic.empty()) {
        if (!ops.empty()) out << "\n";
        write_table(out, TRAFFIC_COLUMNS, traffic, traffic_field);
    }
    return out.str();
}

// ── Prometheus text exposition ─────────────────────────────

namespace {

struct Family {
    std::string name;
    std::string help;
    std::string type;
    std::vector<std::string> samples;
};

std::string label_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '\\') out += "\\\\";
        else if (c == '"') out += "\\\"";
        else if (c == '\n') out += "\\n";
        else out += c;
    }
    return out;
}

std::string labels(const std::vector<std::pair<std::string, std::string>>& kv) {
    std::string out = "{";
    for (size_t i = 0; i < kv.size(); ++i) {
        if (i) out += ",";
        out += kv[i].first + "=\"" + label_escape(kv[i].second) + "\"";
    }
    return out + "}";
}

class Exposition {
public:
    void add(const std::string& name, const std::string& help, const std::string& type,
             const std::string& label_set, const json& value) {
        if (!value.is_number() && !value.is_boolean()) return;
        double v = value.is_boolean() ? (value.get<bool>() ? 1.0 : 0.0) : value.get<double>();
        family(name, help, type).samples.push_back(fmt::format("{}{} {}", name, label_set, v));
    }

    std::string str() const {
        std::ostringstream out;
        for (const auto& f : families_) {
            out << "# HELP " << f.name << " " << f.help << "\n";
            out << "# TYPE " << f.name << " " << f.type << "\n";
            for (const auto& s : f.samples) out << s << "\n";
        }
        return out.str();
    }

private:
    std::vector<Family> families_;

    Family& family(const std::string& name, const std::string& help, const std::string& type) {
        for (auto& f : families_) {
            if (f.name == name) return f;
        }
        families_.push_back(Family{name, help, type, {}});
        return families_.back();
    }
};

} // namespace

std::string render_prometheus(const json& doc) {
    Exposition ex;

    json summary = doc.value("summary", json::object());
    ex.add("fleetrun_operations", "Recorded operations.", "gauge", "",
           summary.value("total_operations", json(0)));
    ex.add("fleetrun_operations_failed", "Recorded operations that failed.", "gauge", "",
           summary.value("failed_operations", json(0)));
    ex.add("fleetrun_operation_success_ratio", "Share of recorded operations that succeeded.",
           "gauge", "", summary.value("success_rate", json(0.0)));

    for (const auto& [host, m] : doc.value("hosts", json::object()).items()) {
        std::string l = labels({{"host", host}});
        ex.add("fleetrun_host_operations_total", "Operations per host.", "counter", l,
               m.value("total_operations", json(0)));
        ex.add("fleetrun_host_operations_failed_total", "Failed operations per host.", "counter", l,
               m.value("failed_operations", json(0)));
        ex.add("fleetrun_host_retries_total", "Retries performed per host.", "counter", l,
               m.value("total_retries", json(0)));
        ex.add("fleetrun_host_bytes_transferred_total", "Bytes moved by transfers per host.",
               "counter", l, m.value("bytes_transferred", json(0)));
        for (const char* stat : {"avg", "min", "max"}) {
            ex.add("fleetrun_host_operation_duration_seconds", "Operation duration per host.",
                   "gauge", labels({{"host", host}, {"stat", stat}}),
                   m.value(std::string(stat) + "_duration", json(nullptr)));
        }
    }

    for (const auto& t : doc.value("traffic", json::array())) {
        std::vector<std::pair<std::string, std::string>> base = {
            {"protocol", t.value("protocol", "")},
            {"direction", t.value("direction", "")},
            {"source", t.value("source", "")},
            {"target", t.value("target", "")},
            {"port", std::to_string(t.value("port", 0))},
        };
        std::string l = labels(base);
        ex.add("fleetrun_probe_samples", "Samples taken per pairing.", "gauge", l,
               t.value("count", json(0)));
        ex.add("fleetrun_probe_success_ratio", "Share of successful samples per pairing.", "gauge",
               l, t.value("success_rate", json(0.0)));
        ex.add("fleetrun_probe_packet_loss_percent", "Failed samples as a percentage.", "gauge", l,
               t.value("packet_loss_percent", json(0.0)));
        ex.add("fleetrun_probe_jitter_ms", "Mean change between consecutive latencies.", "gauge",
               l, t.value("jitter_ms", json(nullptr)));
        ex.add("fleetrun_probe_throughput_bps", "Average throughput in bytes per second.", "gauge",
               l, t.value("avg_throughput_bps", json(nullptr)));
        ex.add("fleetrun_probe_tls_handshake_ms", "Average TLS handshake time.", "gauge", l,
               t.value("avg_tls_handshake_ms", json(nullptr)));
        if (t.contains("latency_ms")) {
            for (const auto& [stat, v] : t["latency_ms"].items()) {
                auto with_stat = base;
                with_stat.emplace_back("stat", stat);
                ex.add("fleetrun_probe_latency_ms", "Sample latency statistics.", "gauge",
                       labels(with_stat), v);
            }
        }
        for (const auto& [code, n] : t.value("status_codes", json::object()).items()) {
            auto with_code = base;
            with_code.emplace_back("code", code);
            ex.add("fleetrun_probe_status_codes", "HTTP status codes seen per pairing.", "gauge",
                   labels(with_code), n);
        }
    }

    return ex.str();
}

std::string render(const json& doc, ExportFormat format) {
    switch (format) {
        case ExportFormat::Csv:        return render_csv(doc);
        case ExportFormat::Prometheus: return render_prometheus(doc);
        case ExportFormat::Json:       break;
    }
    return doc.dump(2);
}

Result<void> write_export(const json& doc, ExportFormat format, const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);

    std::ofstream out(path);
    if (!out) {
        return Result<void>::Err("Cannot write " + path.string(), ErrorKind::CommandFailed);
    }
    out << render(doc, format);
    if (format == ExportFormat::Json) out << "\n";
    if (!out) {
        return Result<void>::Err("Write failed for " + path.string(), ErrorKind::CommandFailed);
    }
    fleetrun_log("Exported metrics to " + path.string());
    return Result<void>::Ok();
}
