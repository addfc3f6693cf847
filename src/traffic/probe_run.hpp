#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <vector>
#include "probe.hpp"

// Lazily takes the samples of one pairing. Sample k is taken at
// start + k * interval, where start is the first next() call.
class ProbeRun {
public:
    ProbeRun(ProbeSpec spec, const Probe& probe, RemoteSession* source = nullptr);

    ProbeRun(const ProbeRun&) = delete;
    ProbeRun& operator=(const ProbeRun&) = delete;

    // The next sample, or nullopt once all were taken or the run was cancelled.
    std::optional<ProbeSample> next();

    // Wake a waiting next() and end the run. Safe from any thread.
    void cancel();
    bool cancelled() const;

    int total() const { return total_; }
    const ProbeSpec& spec() const { return spec_; }
    const std::vector<ProbeSample>& samples() const { return samples_; }

    ProbeSummary summarize() const;

private:
    using Clock = std::chrono::steady_clock;

    ProbeSpec spec_;
    const Probe& probe_;
    RemoteSession* source_;
    int total_;
    int taken_ = 0;
    bool started_ = false;
    Clock::time_point start_;
    std::vector<ProbeSample> samples_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};
