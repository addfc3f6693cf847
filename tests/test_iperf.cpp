#include <gtest/gtest.h>
#include <traffic/iperf.hpp>
#include "fake_transport.hpp"

using namespace std::chrono_literals;

namespace {

// Trimmed iperf3 -J client output: three 1-second intervals.
const char* IPERF_JSON = R"({
  "start": {"connected": [{"local_host": "10.0.0.1", "remote_host": "10.0.0.2"}]},
  "intervals": [
    {"sum": {"bits_per_second": 9.0e9}},
    {"sum": {"bits_per_second": 9.5e9}},
    {"sum": {"bits_per_second": 10.0e9}}
  ],
  "end": {
    "sum_sent": {"bytes": 3562500000, "bits_per_second": 9.5e9, "retransmits": 12},
    "sum_received": {"bytes": 3560000000, "bits_per_second": 9.49e9},
    "cpu_utilization_percent": {"host_total": 35.5, "remote_total": 20.25}
  }
})";

const char* IPERF_TEXT =
    "[ ID] Interval           Transfer     Bitrate         Retr\n"
    "[  5]   0.00-1.00   sec   112 MBytes   940 Mbits/sec    0\n"
    "[  5]   0.00-10.00  sec  1.09 GBytes   938 Mbits/sec    3             sender\n"
    "[  5]   0.00-10.00  sec  1.09 GBytes   936 Mbits/sec                  receiver\n";

} // namespace

// ── Parsing ─────────────────────────────────────────────────

TEST(IperfParse, JsonSummaryAndIntervals) {
    auto r = parse_iperf_json(IPERF_JSON);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& rep = r.value;
    EXPECT_TRUE(rep.parsed);
    EXPECT_DOUBLE_EQ(rep.sent_bps, 9.5e9);
    EXPECT_DOUBLE_EQ(rep.received_bps, 9.49e9);
    EXPECT_EQ(rep.bytes_sent, 3562500000u);
    EXPECT_EQ(rep.retransmits, 12);
    EXPECT_DOUBLE_EQ(rep.cpu_host_percent.value_or(0), 35.5);
    EXPECT_DOUBLE_EQ(rep.cpu_remote_percent.value_or(0), 20.25);

    ASSERT_EQ(rep.interval_gbps.size(), 3u);
    ASSERT_TRUE(rep.average_gbps.has_value());
    EXPECT_NEAR(*rep.average_gbps, 9.5, 1e-9);
    EXPECT_NEAR(rep.percentiles_gbps.at(50), 9.5, 1e-9);
    EXPECT_NEAR(rep.percentiles_gbps.at(10), 9.1, 1e-9);
    EXPECT_EQ(rep.percentiles_gbps.size(), 6u);
}

TEST(IperfParse, ErrorFieldIsKept) {
    auto r = parse_iperf_json(R"({"start": {}, "intervals": [], "end": {},
                                  "error": "unable to connect to server: Connection refused"})");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.parsed);
    EXPECT_EQ(r.value.error, "unable to connect to server: Connection refused");
}

TEST(IperfParse, TextFallbackTakesTheLastRate) {
    EXPECT_DOUBLE_EQ(parse_iperf_text_mbps(IPERF_TEXT).value_or(0), 936.0);
    EXPECT_DOUBLE_EQ(parse_iperf_text_mbps("9.41 Gbits/sec").value_or(0), 9410.0);
    EXPECT_DOUBLE_EQ(parse_iperf_text_mbps("512 Kbits/sec").value_or(0), 0.512);
    EXPECT_FALSE(parse_iperf_text_mbps("iperf3: error").has_value());

    auto rep = parse_iperf_output(IPERF_TEXT);
    EXPECT_TRUE(rep.parsed);
    EXPECT_TRUE(rep.from_text);
    EXPECT_NEAR(rep.average_gbps.value_or(0), 0.936, 1e-9);
}

TEST(IperfParse, GarbageIsNotParsed) {
    EXPECT_TRUE(parse_iperf_json("not json").is_err());
    EXPECT_FALSE(parse_iperf_output("bash: iperf3: command not found").parsed);
}

TEST(Iperf, ToleranceBoundary) {
    EXPECT_TRUE(throughput_within_tolerance(9.0, 10.0, 10.0));
    EXPECT_FALSE(throughput_within_tolerance(8.99, 10.0, 10.0));
    EXPECT_TRUE(throughput_within_tolerance(12.0, 10.0, 0.0));
    EXPECT_FALSE(throughput_within_tolerance(9.99, 10.0, 0.0));
}

TEST(Iperf, PairsSkipSelf) {
    auto pairs = iperf_pairs({"a", "b"}, {"b", "c"});
    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0].client, "a");
    EXPECT_EQ(pairs[0].server, "b");
    EXPECT_EQ(pairs[2].client, "b");
    EXPECT_EQ(pairs[2].server, "c");
}

TEST(Iperf, Commands) {
    IperfOptions o;
    o.port = 5300;
    o.parallel_streams = 4;
    o.duration_secs = 30;
    EXPECT_EQ(iperf_client_command("10.0.0.2", o),
              "iperf3 -c '10.0.0.2' -p 5300 -O 1 -P 4 -M 1460 -t 30 -i 2 -J");
    EXPECT_NE(iperf_server_command(5300).find("iperf3 -s -1 -D -p 5300"), std::string::npos);
    EXPECT_NE(iperf_stop_command(5300).find("/tmp/fleetrun_iperf_5300.pid"), std::string::npos);
}

// ── Runner over scripted sessions ───────────────────────────

class IperfRunnerTest : public ::testing::Test {
protected:
    FakeWorld world;
    FakeTransport transport{world};
    ConnectionPool pool{transport, PoolOptions{}};
    IperfRunner runner{[this](const std::string& host) {
        HostAddress a;
        a.host = host;
        a.user = "tester";
        return pool.acquire(a, 1s);
    }};

    IperfOptions options() {
        IperfOptions o;
        o.duration_secs = 1;
        o.settle_ms = 0;
        return o;
    }

    void serve(const std::string& host) {
        world.host(host).exec_containing["iperf3 -s"] = SSHResult{0, "", ""};
        world.host(host).exec_containing["fleetrun_iperf_"] = SSHResult{0, "", ""};
    }

    int count_commands(const std::string& needle) {
        std::lock_guard<std::mutex> lock(world.mutex);
        int n = 0;
        for (const auto& c : world.exec_commands) {
            if (c.find(needle) != std::string::npos) n++;
        }
        return n;
    }
};

TEST_F(IperfRunnerTest, MeasuresAndPassesExpectation) {
    serve("srv");
    world.host("cli").exec_containing["iperf3 -c"] = SSHResult{0, IPERF_JSON, ""};

    auto o = options();
    o.expected_gbps = 10.0;
    auto results = runner.run({IperfPair{"cli", "srv", "10.0.0.2"}}, o);
    ASSERT_EQ(results.size(), 1u);
    const auto& r = results[0];
    EXPECT_TRUE(r.success) << r.error;
    ASSERT_TRUE(r.passed.has_value());
    EXPECT_TRUE(*r.passed);
    EXPECT_NEAR(r.report.average_gbps.value_or(0), 9.5, 1e-9);
    EXPECT_FALSE(r.finished.empty());

    EXPECT_EQ(count_commands("iperf3 -s -1 -D"), 1);
    EXPECT_EQ(count_commands("iperf3 -c '10.0.0.2'"), 1);
    EXPECT_EQ(count_commands("kill $(cat"), 1);
}

TEST_F(IperfRunnerTest, BelowToleranceFails) {
    serve("srv");
    world.host("cli").exec_containing["iperf3 -c"] = SSHResult{0, IPERF_JSON, ""};

    auto o = options();
    o.expected_gbps = 12.0;
    o.tolerance_pct = 10.0;
    auto r = runner.run_pair(IperfPair{"cli", "srv", "srv"}, o);
    EXPECT_FALSE(r.success);
    ASSERT_TRUE(r.passed.has_value());
    EXPECT_FALSE(*r.passed);
    EXPECT_EQ(r.error_kind, ErrorKind::CommandFailed);
    EXPECT_NE(r.error.find("below expected"), std::string::npos);
}

TEST_F(IperfRunnerTest, ClientErrorIsReportedAndServerStopped) {
    serve("srv");
    world.host("cli").exec_containing["iperf3 -c"] =
        SSHResult{1, R"({"start": {}, "intervals": [], "end": {}, "error": "unable to connect to server"})", ""};

    auto r = runner.run_pair(IperfPair{"cli", "srv", "srv"}, options());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "iperf3: unable to connect to server");
    EXPECT_EQ(count_commands("kill $(cat"), 1);
}

TEST_F(IperfRunnerTest, ServerThatWillNotStart) {
    world.host("srv").exec_containing["iperf3 -s"] = SSHResult{127, "", "iperf3: command not found"};

    auto r = runner.run_pair(IperfPair{"cli", "srv", "srv"}, options());
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("server did not start"), std::string::npos);
    EXPECT_EQ(count_commands("iperf3 -c"), 0);
}

TEST_F(IperfRunnerTest, UnreachableClient) {
    serve("srv");
    world.host("cli").connect_failures = 100;

    auto r = runner.run_pair(IperfPair{"cli", "srv", "srv"}, options());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, ErrorKind::ConnectFailed);
    EXPECT_NE(r.error.find("client unavailable"), std::string::npos);
    EXPECT_EQ(count_commands("kill $(cat"), 1);
}

TEST_F(IperfRunnerTest, PairsSharingAServerRunInTurn) {
    serve("srv");
    for (const char* c : {"c1", "c2", "c3"}) {
        world.host(c).exec_containing["iperf3 -c"] = SSHResult{0, IPERF_JSON, ""};
        world.host(c).exec_delay_ms = 50;
    }
    auto o = options();
    o.max_parallel = 8;
    auto results = runner.run(iperf_pairs({"c1", "c2", "c3"}, {"srv"}), o);
    ASSERT_EQ(results.size(), 3u);
    for (const auto& r : results) EXPECT_TRUE(r.success) << r.error;
    EXPECT_EQ(results[1].client, "c2");
    // One server: exec calls never overlap.
    EXPECT_EQ(world.max_active_execs.load(), 1);
}
