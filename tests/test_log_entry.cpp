#include <gtest/gtest.h>
#include <managers/log_entry.hpp>
#include <fstream>
#include <sstream>

// ── Level / timestamp ───────────────────────────────────────

TEST(LogEntry, LevelFromKeywords) {
    EXPECT_EQ(detect_log_level("2025 ERROR disk full"), "ERROR");
    EXPECT_EQ(detect_log_level("connect err=5"), "ERROR");
    EXPECT_EQ(detect_log_level("WARN low memory"), "WARNING");
    EXPECT_EQ(detect_log_level("debug: cache hit"), "DEBUG");
    EXPECT_EQ(detect_log_level("FATAL: cannot start"), "CRITICAL");
    EXPECT_EQ(detect_log_level("service started"), "INFO");
}

TEST(LogEntry, ErrorOutranksLaterLevels) {
    EXPECT_EQ(detect_log_level("WARNING: retry after error"), "ERROR");
}

TEST(LogEntry, BracketedTimestampFormats) {
    EXPECT_EQ(bracketed_timestamp("[2025-01-15 14:35:22] ready"), "2025-01-15T14:35:22");
    EXPECT_EQ(bracketed_timestamp("x [2025/01/15 14:35:22] y"), "2025-01-15T14:35:22");

    auto syslog = bracketed_timestamp("[Jan 15 14:35:22] kernel: up");
    ASSERT_TRUE(syslog.has_value());
    EXPECT_EQ(syslog->substr(4), "-01-15T14:35:22");
}

TEST(LogEntry, UnreadableTimestampFallsBackToCaptureTime) {
    EXPECT_FALSE(bracketed_timestamp("[worker-3] started").has_value());
    EXPECT_FALSE(bracketed_timestamp("no brackets").has_value());

    auto e = parse_log_entry("h1", "[worker-3] started", "/var/log/app.log");
    EXPECT_EQ(e.host, "h1");
    EXPECT_EQ(e.level, "INFO");
    EXPECT_EQ(e.message, "[worker-3] started");
    EXPECT_EQ(e.source_file, "/var/log/app.log");
    ASSERT_FALSE(e.timestamp.empty());
    EXPECT_EQ(e.timestamp.back(), 'Z');
}

// ── Rendering ───────────────────────────────────────────────

TEST(LogEntry, FormatNames) {
    EXPECT_EQ(log_export_format_from_string("JSON"), LogExportFormat::Json);
    EXPECT_EQ(log_export_format_from_string("csv"), LogExportFormat::Csv);
    EXPECT_EQ(log_export_format_from_string("text"), LogExportFormat::Text);
    EXPECT_FALSE(log_export_format_from_string("xml").has_value());
}

TEST(LogEntry, CsvQuotesMessages) {
    LogEntry e{"h1", "2025-01-15T14:35:22", "ERROR", "failed: a, b \"c\"", "/app.log"};
    std::string csv = render_log_entries({e}, LogExportFormat::Csv);
    EXPECT_EQ(csv,
              "timestamp,host,level,message,source_file\n"
              "2025-01-15T14:35:22,h1,ERROR,\"failed: a, b \"\"c\"\"\",/app.log\n");
}

TEST(LogEntry, JsonAndTextRendering) {
    LogEntry e{"h2", "2025-01-15T14:35:22", "WARNING", "slow", "/app.log"};

    auto doc = nlohmann::json::parse(render_log_entries({e}, LogExportFormat::Json));
    ASSERT_TRUE(doc.is_array());
    ASSERT_EQ(doc.size(), 1u);
    EXPECT_EQ(doc[0]["host"], "h2");
    EXPECT_EQ(doc[0]["level"], "WARNING");
    EXPECT_EQ(doc[0]["message"], "slow");

    EXPECT_EQ(render_log_entries({e}, LogExportFormat::Text),
              "2025-01-15T14:35:22 [WARNING] h2: slow\n");
}

TEST(LogEntry, WriteCreatesParentDirectory) {
    auto dir = std::filesystem::temp_directory_path() / "fleetrun_log_entry_test";
    std::filesystem::remove_all(dir);
    LogEntry e{"h1", "2025-01-15T14:35:22", "INFO", "ok", "/app.log"};

    auto r = write_log_entries({e}, LogExportFormat::Text, dir / "out" / "logs.txt");
    ASSERT_TRUE(r.is_ok()) << r.error;
    std::ifstream in(dir / "out" / "logs.txt");
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "2025-01-15T14:35:22 [INFO] h1: ok\n");
    std::filesystem::remove_all(dir);
}
