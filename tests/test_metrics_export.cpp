#include <gtest/gtest.h>
#include <managers/metrics_export.hpp>
#include <managers/metrics_store.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

using nlohmann::json;

namespace {

OperationResult result(const std::string& host, bool ok, double duration, int retries = 0) {
    OperationResult r;
    r.host = host;
    r.operation = "execute";
    r.success = ok;
    r.exit_code = ok ? 0 : 2;
    r.error_kind = ok ? ErrorKind::None : ErrorKind::CommandFailed;
    r.error = ok ? "" : "bad, \"quoted\" error";
    r.duration = duration;
    r.retry_count = retries;
    r.timestamp = "2026-01-01T00:00:0" + std::to_string(static_cast<int>(duration)) + "Z";
    return r;
}

ProbeSummary summary(bool with_latency) {
    ProbeSummary s;
    s.protocol = Protocol::HTTP;
    s.source = "web1";
    s.target = "db1";
    s.port = 80;
    s.count = 4;
    s.success_count = with_latency ? 3 : 0;
    s.failure_count = 4 - s.success_count;
    s.success_rate = s.success_count / 4.0;
    s.packet_loss_percent = 100.0 * s.failure_count / 4.0;
    if (with_latency) {
        s.min_ms = 1.0;
        s.max_ms = 3.0;
        s.avg_ms = 2.0;
        s.median_ms = 2.0;
        s.p95_ms = 3.0;
        s.p99_ms = 3.0;
        s.stddev_ms = 0.8;
        s.jitter_ms = 1.0;
        s.status_codes[200] = 3;
    }
    s.failure_reasons["timeout"] = s.failure_count;
    return s;
}

fs::path temp_path(const std::string& name) {
    auto p = fs::temp_directory_path() / "fleetrun_metrics_test" / name;
    fs::remove(p);
    return p;
}

std::string slurp(const fs::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

// ── Format names ────────────────────────────────────────────

TEST(ExportFormat, ParsesNames) {
    EXPECT_EQ(export_format_from_string("JSON"), ExportFormat::Json);
    EXPECT_EQ(export_format_from_string("csv"), ExportFormat::Csv);
    EXPECT_EQ(export_format_from_string("prom"), ExportFormat::Prometheus);
    EXPECT_FALSE(export_format_from_string("xml").has_value());
}

// ── Aggregation ─────────────────────────────────────────────

TEST(MetricsStore, AggregatePerHost) {
    std::vector<OperationRecord> ops = {
        OperationRecord::from_result(result("a", true, 1.0)),
        OperationRecord::from_result(result("a", false, 3.0, 2)),
        OperationRecord::from_result(result("b", true, 2.0)),
    };
    auto hosts = MetricsStore::aggregate(ops);
    ASSERT_EQ(hosts.size(), 2u);
    const auto& a = hosts.at("a");
    EXPECT_EQ(a.total_operations, 2);
    EXPECT_EQ(a.failed_operations, 1);
    EXPECT_DOUBLE_EQ(a.min_duration, 1.0);
    EXPECT_DOUBLE_EQ(a.max_duration, 3.0);
    EXPECT_DOUBLE_EQ(a.avg_duration(), 2.0);
    EXPECT_EQ(a.total_retries, 2);
    EXPECT_EQ(a.last_operation, "2026-01-01T00:00:03Z");
}

TEST(MetricsStore, PersistsAcrossInstances) {
    auto path = temp_path("store.yaml");
    {
        MetricsStore store(path);
        store.record(std::map<std::string, OperationResult>{{"a", result("a", true, 1.0)}, {"b", result("b", false, 2.0, 1)}});
        store.record(std::vector<ProbeSummary>{summary(true), summary(false)});
    }
    MetricsStore reopened(path);
    auto snap = reopened.load();
    ASSERT_EQ(snap.operations.size(), 2u);
    EXPECT_EQ(snap.operations[1].error_kind, ErrorKind::CommandFailed);
    EXPECT_EQ(snap.operations[1].exit_code, 2);
    ASSERT_EQ(snap.traffic.size(), 2u);
    EXPECT_EQ(snap.traffic[0].protocol, Protocol::HTTP);
    EXPECT_EQ(snap.traffic[0].status_codes.at(200), 3);
    ASSERT_TRUE(snap.traffic[0].p95_ms.has_value());
    EXPECT_FALSE(snap.traffic[1].avg_ms.has_value());

    reopened.clear();
    EXPECT_TRUE(reopened.load().operations.empty());
    fs::remove(path);
}

TEST(MetricsStore, HistoryIsCapped) {
    auto path = temp_path("capped.yaml");
    MetricsStore store(path);
    MetricsSnapshot big;
    for (size_t i = 0; i < MetricsStore::MAX_HISTORY; i++) {
        big.operations.push_back(OperationRecord::from_result(result("old", true, 1.0)));
    }
    store.save(big);
    store.record(std::map<std::string, OperationResult>{{"new", result("new", true, 1.0)}});

    auto snap = store.load();
    EXPECT_EQ(snap.operations.size(), MetricsStore::MAX_HISTORY);
    EXPECT_EQ(snap.operations.front().host, "old");
    EXPECT_EQ(snap.operations.back().host, "new");
    fs::remove(path);
}

TEST(MetricsStore, UnreadableFileStartsFresh) {
    auto path = temp_path("corrupt.yaml");
    fs::create_directories(path.parent_path());
    std::ofstream(path) << "operations: [ {host: a\n";
    MetricsStore store(path);
    EXPECT_TRUE(store.load().operations.empty());
    fs::remove(path);
}

// ── Documents ───────────────────────────────────────────────

TEST(MetricsExport, DocumentShape) {
    MetricsSnapshot snap;
    snap.operations.push_back(OperationRecord::from_result(result("a", true, 1.0)));
    snap.operations.push_back(OperationRecord::from_result(result("b", false, 3.0)));
    snap.traffic.push_back(summary(true));

    json doc = metrics_document(snap);
    EXPECT_EQ(doc["operations"].size(), 2u);
    EXPECT_EQ(doc["hosts"].size(), 2u);
    EXPECT_EQ(doc["summary"]["total_operations"], 2);
    EXPECT_EQ(doc["summary"]["failed_operations"], 1);
    EXPECT_DOUBLE_EQ(doc["summary"]["success_rate"].get<double>(), 0.5);
    EXPECT_EQ(doc["operations"][1]["error_kind"], "command_failed");
    EXPECT_EQ(doc["traffic"][0]["latency_ms"]["p95"], 3.0);
    EXPECT_EQ(doc["traffic"][0]["status_codes"]["200"], 3);
    EXPECT_TRUE(doc.contains("export_time"));
}

TEST(MetricsExport, NoLatencyWhenNothingSucceeded) {
    json j = to_json(summary(false));
    EXPECT_FALSE(j.contains("latency_ms"));
    EXPECT_TRUE(j["jitter_ms"].is_null());
    EXPECT_EQ(j["failure_reasons"]["timeout"], 4);
}

TEST(MetricsExport, ResultsDocumentIncludesCommandsAndTransfer) {
    OperationResult r = result("a", true, 1.0);
    r.operation = "upload";
    r.transfer = TransferRecord{"upload", "/tmp/x", "/srv/x", 42, "abc"};
    CommandResult c;
    c.command = "pwd";
    c.output = "/tmp";
    c.exit_code = 0;
    c.success = true;
    r.commands.push_back(c);

    json doc = results_document({{"a", r}});
    const auto& op = doc["operations"][0];
    EXPECT_EQ(op["bytes_transferred"], 42);
    EXPECT_EQ(op["transfer"]["checksum"], "abc");
    EXPECT_EQ(op["commands"][0]["output"], "/tmp");
    EXPECT_EQ(doc["summary"]["total_bytes_transferred"], 42);
}

// ── Renderers ───────────────────────────────────────────────

TEST(MetricsExport, CsvEscapesAndFlattensLatency) {
    MetricsSnapshot snap;
    snap.operations.push_back(OperationRecord::from_result(result("b", false, 3.0)));
    snap.traffic.push_back(summary(true));
    std::string csv = render_csv(metrics_document(snap));

    std::istringstream in(csv);
    std::string header, row, blank, traffic_header, traffic_row;
    std::getline(in, header);
    std::getline(in, row);
    std::getline(in, blank);
    std::getline(in, traffic_header);
    std::getline(in, traffic_row);

    EXPECT_EQ(header.rfind("host,operation,success,error_kind", 0), 0u);
    EXPECT_NE(row.find("\"bad, \"\"quoted\"\" error\""), std::string::npos);
    EXPECT_TRUE(blank.empty());
    EXPECT_EQ(traffic_header.rfind("protocol,direction,source,target,port", 0), 0u);
    EXPECT_EQ(traffic_row.rfind("http,east_west,web1,db1,80,4,3,1,0.75,1.0,2.0,3.0", 0), 0u)
        << traffic_row;
}

TEST(MetricsExport, CsvEmptyDocumentHasHeaderOnly) {
    std::string csv = render_csv(metrics_document(MetricsSnapshot{}));
    EXPECT_EQ(std::count(csv.begin(), csv.end(), '\n'), 1);
}

TEST(MetricsExport, PrometheusExposition) {
    MetricsSnapshot snap;
    snap.operations.push_back(OperationRecord::from_result(result("a", true, 1.0)));
    snap.operations.push_back(OperationRecord::from_result(result("a", false, 3.0, 2)));
    snap.traffic.push_back(summary(true));
    std::string text = render_prometheus(metrics_document(snap));

    EXPECT_NE(text.find("# TYPE fleetrun_operations gauge\nfleetrun_operations 2\n"), std::string::npos);
    EXPECT_NE(text.find("fleetrun_host_retries_total{host=\"a\"} 2\n"), std::string::npos);
    EXPECT_NE(text.find("fleetrun_probe_success_ratio{protocol=\"http\",direction=\"east_west\","
                        "source=\"web1\",target=\"db1\",port=\"80\"} 0.75"),
              std::string::npos);
    EXPECT_NE(text.find("stat=\"p95\"} 3"), std::string::npos);
    EXPECT_NE(text.find("code=\"200\"} 3"), std::string::npos);

    // One HELP line per family even with several samples.
    size_t first = text.find("# HELP fleetrun_host_operation_duration_seconds");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(text.find("# HELP fleetrun_host_operation_duration_seconds", first + 1), std::string::npos);
}

TEST(MetricsExport, WriteCreatesParentDirectories) {
    auto dir = fs::temp_directory_path() / "fleetrun_metrics_test" / "nested";
    fs::remove_all(dir);
    auto path = dir / "out.json";

    MetricsSnapshot snap;
    snap.operations.push_back(OperationRecord::from_result(result("a", true, 1.0)));
    auto r = write_export(metrics_document(snap), ExportFormat::Json, path);
    ASSERT_TRUE(r.is_ok()) << r.error;

    json back = json::parse(slurp(path));
    EXPECT_EQ(back["summary"]["total_operations"], 1);
    fs::remove_all(dir);
}

TEST(MetricsExport, WriteToUnwritablePathFails) {
    auto r = write_export(json::object(), ExportFormat::Json, "/proc/fleetrun/out.json");
    EXPECT_TRUE(r.is_err());
}
