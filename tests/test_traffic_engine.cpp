#include <gtest/gtest.h>
#include <traffic/traffic_engine.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <thread>

namespace {

// Listening socket on an ephemeral loopback port. Connections complete in
// the backlog without an accept().
class Listener {
public:
    Listener() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in sa{};
        sa.sin_family = AF_INET;
        sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        sa.sin_port = 0;
        ::bind(fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa));
        ::listen(fd_, 64);
        socklen_t len = sizeof(sa);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&sa), &len);
        port_ = ntohs(sa.sin_port);
    }
    ~Listener() { ::close(fd_); }

    int port() const { return port_; }

private:
    int fd_ = -1;
    int port_ = 0;
};

TrafficRequest request(Protocol p, std::vector<std::string> sources, std::vector<std::string> targets) {
    TrafficRequest r;
    r.protocol = p;
    r.sources = std::move(sources);
    r.targets = std::move(targets);
    r.duration = 0.5;
    r.interval = 0.1;
    r.params.timeout_secs = 1;
    return r;
}

} // namespace

// ── Names ───────────────────────────────────────────────────

TEST(Protocol, NamesAndDefaultPorts) {
    EXPECT_EQ(protocol_from_string("HTTPS"), Protocol::HTTPS);
    EXPECT_EQ(protocol_from_string("ftp"), Protocol::FTP);
    EXPECT_FALSE(protocol_from_string("gopher").has_value());
    EXPECT_EQ(to_string(Protocol::DNS), "dns");
    EXPECT_EQ(default_port(Protocol::HTTPS), 443);
    EXPECT_EQ(default_port(Protocol::SCP), 22);
    EXPECT_EQ(direction_from_string("north-south"), Direction::NorthSouth);
    EXPECT_FALSE(direction_from_string("up").has_value());
}

// ── Planning ────────────────────────────────────────────────

TEST(TrafficPlan, EastWestMeshSkipsSelfPairs) {
    auto r = TrafficEngine::plan(request(Protocol::TCP, {"a", "b", "c"}, {}));
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 6u);
    for (const auto& spec : r.value) {
        EXPECT_NE(spec.source, spec.target);
        EXPECT_EQ(spec.port, 80);
    }
}

TEST(TrafficPlan, ExplicitTargetsTimesPorts) {
    auto req = request(Protocol::TCP, {"a", "b"}, {"x"});
    req.ports = {22, 443};
    auto r = TrafficEngine::plan(req);
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 4u);
    EXPECT_EQ(r.value[0].source, "a");
    EXPECT_EQ(r.value[0].port, 22);
    EXPECT_EQ(r.value[1].port, 443);
    EXPECT_EQ(r.value[3].source, "b");
}

TEST(TrafficPlan, NorthSouthNeedsTargets) {
    auto req = request(Protocol::HTTP, {"a"}, {});
    req.direction = Direction::NorthSouth;
    auto r = TrafficEngine::plan(req);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConfigInvalid);
}

TEST(TrafficPlan, RejectsBadTiming) {
    auto req = request(Protocol::TCP, {"a"}, {"b"});
    req.interval = 0;
    EXPECT_TRUE(TrafficEngine::plan(req).is_err());

    req = request(Protocol::TCP, {"a"}, {"b"});
    req.duration = -1;
    EXPECT_TRUE(TrafficEngine::plan(req).is_err());

    req = request(Protocol::TCP, {}, {"b"});
    EXPECT_TRUE(TrafficEngine::plan(req).is_err());
}

TEST(TrafficPlan, CarriesParams) {
    auto req = request(Protocol::HTTP, {"a"}, {"b"});
    req.params.headers["X-Test"] = "1";
    req.params.verify_tls = false;
    auto r = TrafficEngine::plan(req);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value[0].params.headers.at("X-Test"), "1");
    EXPECT_FALSE(r.value[0].params.verify_tls);
    EXPECT_EQ(r.value[0].sample_count(), 5);
}

// ── Running ─────────────────────────────────────────────────

TEST(TrafficEngine, LocalTcpRefusedFailsEverySample) {
    TrafficEngine engine;
    auto req = request(Protocol::TCP, {"local"}, {"127.0.0.1"});
    req.ports = {1};

    std::atomic<int> seen{0};
    auto r = engine.run(req, [&](const ProbeSpec&, const ProbeSample&) { seen++; });
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 1u);

    const auto& summary = r.value[0].summary;
    EXPECT_EQ(summary.count, 5);
    EXPECT_EQ(summary.failure_count, 5);
    EXPECT_DOUBLE_EQ(summary.success_rate, 0.0);
    EXPECT_FALSE(summary.avg_ms.has_value());
    EXPECT_EQ(summary.failure_reasons.at("connection refused"), 5);
    EXPECT_EQ(seen.load(), 5);
}

TEST(TrafficEngine, LocalTcpToListenerSucceeds) {
    Listener listener;
    TrafficEngine engine;
    auto req = request(Protocol::TCP, {"localhost"}, {"127.0.0.1"});
    req.ports = {listener.port()};

    auto start = std::chrono::steady_clock::now();
    auto r = engine.run(req);
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(r.is_ok());

    const auto& summary = r.value[0].summary;
    EXPECT_EQ(summary.count, 5);
    EXPECT_EQ(summary.success_count, 5);
    EXPECT_DOUBLE_EQ(summary.success_rate, 1.0);
    ASSERT_TRUE(summary.avg_ms.has_value());
    EXPECT_GE(*summary.avg_ms, 0.0);
    // Samples are spread over the requested duration.
    EXPECT_GE(elapsed, std::chrono::milliseconds(350));

    for (size_t i = 0; i < r.value[0].samples.size(); ++i) {
        EXPECT_EQ(r.value[0].samples[i].sequence, static_cast<int>(i));
    }
}

TEST(TrafficEngine, UnavailableRemoteSourceFailsScheduledSamples) {
    TrafficEngine engine([](const std::string& source) {
        return Result<ConnectionLease>::Err("no route to " + source, ErrorKind::ConnectFailed);
    });
    auto req = request(Protocol::TCP, {"web1"}, {"db1"});
    auto r = engine.run(req);
    ASSERT_TRUE(r.is_ok());

    const auto& res = r.value[0];
    EXPECT_EQ(res.samples.size(), 5u);
    EXPECT_EQ(res.summary.failure_count, 5);
    for (const auto& s : res.samples) {
        EXPECT_FALSE(s.success);
        EXPECT_NE(s.reason.find("source unavailable"), std::string::npos);
    }
}

TEST(TrafficEngine, PlanErrorIsReturned) {
    TrafficEngine engine;
    auto r = engine.run(request(Protocol::TCP, {}, {}));
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConfigInvalid);
}

TEST(TrafficEngine, CancelEndsRunEarly) {
    Listener listener;
    TrafficEngine engine;
    auto req = request(Protocol::TCP, {"local"}, {"127.0.0.1"});
    req.ports = {listener.port()};
    req.duration = 30;
    req.interval = 1;

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        engine.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto r = engine.run(req);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_TRUE(r.is_ok());
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_TRUE(r.value[0].summary.cancelled);
    EXPECT_LT(r.value[0].summary.count, 30);
}

TEST(TrafficEngine, CancelBeforeRunIsHonored) {
    Listener listener;
    TrafficEngine engine;
    auto req = request(Protocol::TCP, {"local"}, {"127.0.0.1"});
    req.ports = {listener.port()};
    req.duration = 30;
    req.interval = 1;

    engine.cancel();
    auto start = std::chrono::steady_clock::now();
    auto r = engine.run(req);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(r.is_ok());
    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_TRUE(r.value[0].summary.cancelled);
    EXPECT_EQ(r.value[0].summary.count, 0);

    // The cancel is spent; the next run probes normally.
    req.duration = 0.3;
    req.interval = 0.1;
    auto again = engine.run(req);
    ASSERT_TRUE(again.is_ok());
    EXPECT_FALSE(again.value[0].summary.cancelled);
    EXPECT_EQ(again.value[0].summary.count, 3);
}
