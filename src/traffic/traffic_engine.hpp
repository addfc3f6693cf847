#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <managers/connection_pool.hpp>
#include "probe.hpp"
#include "probe_run.hpp"

struct TrafficRequest {
    Protocol protocol = Protocol::TCP;
    Direction direction = Direction::EastWest;
    std::vector<std::string> sources;
    std::vector<std::string> targets;
    std::vector<int> ports;                 // empty: the protocol's default port
    double duration = DEFAULT_PROBE_DURATION_SECS;
    double interval = DEFAULT_PROBE_INTERVAL_SECS;
    ProbeParams params;
    int max_parallel = DEFAULT_MAX_PARALLEL;
};

struct TrafficResult {
    ProbeSummary summary;
    std::vector<ProbeSample> samples;
};

// Lease a session on a remote probe source.
using SourceResolver = std::function<Result<ConnectionLease>(const std::string& source)>;

// Called for every sample as it is taken. Calls are serialized.
using SampleCallback = std::function<void(const ProbeSpec&, const ProbeSample&)>;

class TrafficEngine {
public:
    explicit TrafficEngine(SourceResolver resolver = nullptr);

    // Expand a request into independent pairings.
    static Result<std::vector<ProbeSpec>> plan(const TrafficRequest& request);

    // Probe every pairing, at most max_parallel at a time.
    Result<std::vector<TrafficResult>> run(const TrafficRequest& request,
                                           SampleCallback on_sample = nullptr);

    // End every run in progress; pairings not yet started are skipped. With
    // no run in progress the next run() starts cancelled.
    void cancel();

private:
    SourceResolver resolver_;
    std::mutex mutex_;
    std::vector<ProbeRun*> active_;
    bool cancelled_ = false;
    std::mutex callback_mutex_;

    TrafficResult run_pairing(const ProbeSpec& spec, const SampleCallback& on_sample);
};
