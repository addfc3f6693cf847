#include <gtest/gtest.h>
#include <managers/log_streamer.hpp>
#include "fake_transport.hpp"
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

namespace {

HostAddress addr(const std::string& host) {
    HostAddress a;
    a.host = host;
    a.user = "tester";
    return a;
}

PoolOptions pool_options() {
    PoolOptions o;
    o.max_size = 4;
    o.idle_timeout = 60s;
    o.reaper_interval = 10s;
    return o;
}

CaptureOptions fast_options(bool follow) {
    CaptureOptions o;
    o.follow = follow;
    o.poll_ms = 20;
    o.flush_interval = 0.01;
    return o;
}

// Pull batches until the queue closes or `want` lines have arrived.
std::vector<std::string> collect(LineBatchQueue& q, size_t want, std::chrono::milliseconds limit) {
    std::vector<std::string> lines;
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (lines.size() < want && std::chrono::steady_clock::now() < deadline) {
        LineBatch b;
        if (q.pop(b, 50ms)) {
            lines.insert(lines.end(), b.lines.begin(), b.lines.end());
        } else if (q.closed()) {
            break;
        }
    }
    return lines;
}

class LogStreamerTest : public ::testing::Test {
protected:
    FakeWorld world;
    FakeTransport transport{world};
    ConnectionPool pool{transport, pool_options()};
    LogStreamer streamer;

    ConnectionLease lease(const std::string& host) {
        auto r = pool.acquire(addr(host), 1s);
        EXPECT_TRUE(r.is_ok()) << r.error;
        return std::move(r.value);
    }
};

} // namespace

// ── Filter ──────────────────────────────────────────────────

TEST(LineFilter, NoPatternsAcceptsEverything) {
    LineFilter f({}, {});
    EXPECT_TRUE(f.accepts("anything"));
    EXPECT_TRUE(f.accepts(""));
}

TEST(LineFilter, FiltersAreAlternativesAndCaseInsensitive) {
    LineFilter f({"error", "warn"}, {});
    EXPECT_TRUE(f.accepts("ERROR: disk full"));
    EXPECT_TRUE(f.accepts("a warning"));
    EXPECT_FALSE(f.accepts("info: ok"));
}

TEST(LineFilter, ExcludeWinsOverFilter) {
    LineFilter f({"error"}, {"healthcheck"});
    EXPECT_TRUE(f.accepts("error in request"));
    EXPECT_FALSE(f.accepts("error in healthcheck"));
}

TEST(LineFilter, InvalidRegexMatchesLiterally) {
    LineFilter f({"(oops"}, {});
    EXPECT_TRUE(f.accepts("prefix (oops suffix"));
    EXPECT_FALSE(f.accepts("oops"));
}

// ── Queue ───────────────────────────────────────────────────

TEST(LineBatchQueue, DrainsAfterClose) {
    LineBatchQueue q;
    q.push(LineBatch{"h1", {"a"}});
    q.close();
    q.push(LineBatch{"h1", {"dropped"}});

    LineBatch b;
    ASSERT_TRUE(q.pop(b, 10ms));
    EXPECT_EQ(b.lines[0], "a");
    EXPECT_FALSE(q.pop(b, 10ms));
    EXPECT_TRUE(q.closed());
}

// ── Remote commands ─────────────────────────────────────────

TEST(CaptureCommands, QuotePathAndUseOneBasedOffset) {
    EXPECT_EQ(capture_stat_command("/var/log/app.log"),
              "stat -L -c '%i %s' '/var/log/app.log' 2>/dev/null");
    EXPECT_EQ(capture_read_command("/var/log/a b.log", 10, 5),
              "tail -c +11 '/var/log/a b.log' 2>/dev/null | head -c 5");
}

// ── Capture ─────────────────────────────────────────────────

TEST_F(LogStreamerTest, NonFollowReadsToEndAndStops) {
    world.set_file("/var/log/app.log", "first\r\nsecond\nthird");
    auto session = streamer.start_capture("h1", lease("h1"), "/var/log/app.log", fast_options(false));

    auto lines = collect(*session->queue(), 10, 2s);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "first");
    EXPECT_EQ(lines[1], "second");
    EXPECT_EQ(lines[2], "third");
    EXPECT_TRUE(session->queue()->closed());
    EXPECT_EQ(session->error_kind(), ErrorKind::None);

    streamer.stop_capture(*session);
    EXPECT_EQ(pool.stats(addr("h1").identity()).idle, 1);
}

TEST_F(LogStreamerTest, NonFollowMissingFileFails) {
    auto session = streamer.start_capture("h1", lease("h1"), "/nope.log", fast_options(false));
    auto lines = collect(*session->queue(), 1, 2s);
    EXPECT_TRUE(lines.empty());
    EXPECT_EQ(session->error_kind(), ErrorKind::CommandFailed);
    streamer.stop_capture(*session);
}

TEST_F(LogStreamerTest, FilterCountsDroppedLines) {
    world.set_file("/app.log", "ok 1\nERROR 2\nok 3\nerror 4\n");
    auto opts = fast_options(false);
    opts.filter_patterns = {"error"};
    auto session = streamer.start_capture("h1", lease("h1"), "/app.log", opts);

    auto lines = collect(*session->queue(), 10, 2s);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "ERROR 2");
    streamer.stop_capture(*session);

    auto st = session->stats();
    EXPECT_EQ(st.lines_read, 4u);
    EXPECT_EQ(st.lines_emitted, 2u);
    EXPECT_EQ(st.lines_filtered, 2u);
}

TEST_F(LogStreamerTest, FollowPicksUpAppendsWithoutDuplicates) {
    world.set_file("/app.log", "one\ntw");
    auto session = streamer.start_capture("h1", lease("h1"), "/app.log", fast_options(true));

    auto first = collect(*session->queue(), 1, 2s);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0], "one");

    world.append_file("/app.log", "o\nthree\n");
    auto more = collect(*session->queue(), 2, 2s);
    ASSERT_EQ(more.size(), 2u);
    EXPECT_EQ(more[0], "two");
    EXPECT_EQ(more[1], "three");

    streamer.stop_capture(*session);
    EXPECT_FALSE(session->running());
}

TEST_F(LogStreamerTest, TruncationRestartsFromTheBeginning) {
    world.set_file("/app.log", "alpha\nbeta\n", 7);
    auto session = streamer.start_capture("h1", lease("h1"), "/app.log", fast_options(true));
    ASSERT_EQ(collect(*session->queue(), 2, 2s).size(), 2u);

    world.set_file("/app.log", "gamma\n", 7);
    auto after = collect(*session->queue(), 1, 2s);
    ASSERT_EQ(after.size(), 1u);
    EXPECT_EQ(after[0], "gamma");

    // Nothing from before the truncation comes back.
    EXPECT_TRUE(collect(*session->queue(), 1, 200ms).empty());
    streamer.stop_capture(*session);
    EXPECT_EQ(session->stats().rotations, 1u);
}

TEST_F(LogStreamerTest, NewInodeIsTreatedAsRotation) {
    world.set_file("/app.log", "old line that is long\n", 1);
    auto session = streamer.start_capture("h1", lease("h1"), "/app.log", fast_options(true));
    ASSERT_EQ(collect(*session->queue(), 1, 2s).size(), 1u);

    // Same size as before but a different file.
    world.set_file("/app.log", "new line that is long\n", 2);
    auto after = collect(*session->queue(), 1, 2s);
    ASSERT_EQ(after.size(), 1u);
    EXPECT_EQ(after[0], "new line that is long");
    streamer.stop_capture(*session);
}

TEST_F(LogStreamerTest, StatisticsTrackLiveCaptures) {
    world.set_file("/app.log", "x\ny\n");
    auto a = streamer.start_capture("h1", lease("h1"), "/app.log", fast_options(true));
    auto b = streamer.start_capture("h2", lease("h2"), "/app.log", fast_options(true));
    collect(*a->queue(), 2, 2s);
    collect(*b->queue(), 2, 2s);

    auto stats = streamer.statistics();
    EXPECT_EQ(stats.active_captures, 2);
    EXPECT_EQ(stats.total_lines, 4u);

    streamer.stop_capture(*a);
    streamer.stop_capture(*a);
    stats = streamer.statistics();
    EXPECT_EQ(stats.active_captures, 1);
    EXPECT_EQ(stats.total_lines, 4u);

    streamer.stop_all();
    EXPECT_EQ(streamer.statistics().active_captures, 0);
}

TEST_F(LogStreamerTest, WritesLocalCopy) {
    auto dir = fs::temp_directory_path() / "fleetrun_capture_test";
    fs::remove_all(dir);

    world.set_file("/app.log", "one\ntwo\n");
    auto opts = fast_options(false);
    opts.output_dir = dir;
    auto session = streamer.start_capture("h1", lease("h1"), "/app.log", opts);
    collect(*session->queue(), 10, 2s);
    streamer.stop_capture(*session);

    std::ifstream in(dir / "h1.log");
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "one\ntwo\n");
    fs::remove_all(dir);
}

TEST_F(LogStreamerTest, CapturedLinesAreParsedIntoEntries) {
    world.set_file("/app.log", "[2025-01-15 14:35:22] ERROR disk full\nservice ok\n");
    auto session = streamer.start_capture("h1", lease("h1"), "/app.log", fast_options(false));
    collect(*session->queue(), 10, 2s);
    streamer.stop_capture(*session);

    auto entries = streamer.recent();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].host, "h1");
    EXPECT_EQ(entries[0].level, "ERROR");
    EXPECT_EQ(entries[0].timestamp, "2025-01-15T14:35:22");
    EXPECT_EQ(entries[0].source_file, "/app.log");
    EXPECT_EQ(entries[1].level, "INFO");

    auto stats = streamer.statistics();
    EXPECT_EQ(stats.entries_by_host.at("h1"), 2u);
    EXPECT_EQ(stats.entries_by_level.at("ERROR"), 1u);
    EXPECT_EQ(stats.buffered, 2u);
}

TEST(LogStreamer, RecentBufferIsBounded) {
    LogStreamer streamer(3);
    streamer.remember("h1", "/a.log", {"one", "two", "three", "four", "five"});

    auto entries = streamer.recent(10);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].message, "three");
    EXPECT_EQ(entries[2].message, "five");
    EXPECT_EQ(streamer.recent(2).front().message, "four");
    EXPECT_EQ(streamer.statistics().entries_by_host.at("h1"), 5u);

    streamer.clear_recent();
    EXPECT_TRUE(streamer.recent().empty());
}

TEST(LogStreamer, QueriesByHostAndLevel) {
    LogStreamer streamer;
    streamer.remember("h1", "/a.log", {"ERROR a", "ok b", "ERROR c"});
    streamer.remember("h2", "/a.log", {"WARN d", "ERROR e"});

    auto h1 = streamer.logs_by_host("h1");
    ASSERT_EQ(h1.size(), 3u);
    EXPECT_EQ(h1[1].message, "ok b");

    auto errors = streamer.logs_by_level("error");
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0].message, "ERROR a");
    EXPECT_EQ(errors[2].message, "ERROR e");

    auto last_error = streamer.logs_by_level("ERROR", 1);
    ASSERT_EQ(last_error.size(), 1u);
    EXPECT_EQ(last_error[0].host, "h2");
    EXPECT_TRUE(streamer.logs_by_host("h9").empty());
}

TEST(LogStreamer, ExportNarrowsByHostAndLevel) {
    auto dir = fs::temp_directory_path() / "fleetrun_log_export_test";
    fs::remove_all(dir);

    LogStreamer streamer;
    streamer.remember("h1", "/a.log", {"ERROR a", "ok b"});
    streamer.remember("h2", "/a.log", {"ERROR c"});

    auto r = streamer.export_logs(dir / "errors.json", LogExportFormat::Json, {"h1"}, {"error"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    std::ifstream in(dir / "errors.json");
    auto doc = nlohmann::json::parse(in);
    ASSERT_EQ(doc.size(), 1u);
    EXPECT_EQ(doc[0]["message"], "ERROR a");

    r = streamer.export_logs(dir / "all.csv", LogExportFormat::Csv);
    ASSERT_TRUE(r.is_ok());
    std::ifstream csv(dir / "all.csv");
    std::string line;
    int rows = 0;
    while (std::getline(csv, line)) rows++;
    EXPECT_EQ(rows, 4);
    fs::remove_all(dir);
}

// ── Capture file rotation ───────────────────────────────────

TEST(CaptureFile, RotatesAndKeepsNewestFiles) {
    auto dir = fs::temp_directory_path() / "fleetrun_rotation_test";
    fs::remove_all(dir);
    {
        CaptureFile file(dir, "web1", 10, 2, false);
        file.append({"aaaaaaaaa"});     // 10 bytes: rotate to .1
        file.append({"bbbbbbbbb"});     // .1 -> .2, new .1
        file.append({"ccccccccc"});     // oldest dropped
        file.append({"dd"});
    }
    EXPECT_TRUE(fs::exists(dir / "web1.log"));
    EXPECT_TRUE(fs::exists(dir / "web1.log.1"));
    EXPECT_TRUE(fs::exists(dir / "web1.log.2"));
    EXPECT_FALSE(fs::exists(dir / "web1.log.3"));

    std::ifstream in(dir / "web1.log.1");
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, "ccccccccc");
    fs::remove_all(dir);
}
