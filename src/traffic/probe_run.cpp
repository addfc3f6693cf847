#include "probe_run.hpp"
#include "probe_stats.hpp"
#include <core/utils.hpp>

ProbeRun::ProbeRun(ProbeSpec spec, const Probe& probe, RemoteSession* source)
    : spec_(std::move(spec)), probe_(probe), source_(source), total_(spec_.sample_count()) {}

std::optional<ProbeSample> ProbeRun::next() {
    if (taken_ >= total_) return std::nullopt;

    if (!started_) {
        started_ = true;
        start_ = Clock::now();
    }

    auto due = start_ + std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(spec_.interval * taken_));
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, due, [&] { return cancelled_; });
        if (cancelled_) return std::nullopt;
    }

    ProbeSample sample;
    try {
        sample = probe_.sample(ProbeContext{spec_, source_, taken_});
    } catch (const std::exception& e) {
        sample = ProbeSample{};
        sample.reason = e.what();
    }
    sample.sequence = taken_;
    sample.timestamp = now_iso();
    if (!sample.success) sample.latency_ms.reset();

    taken_++;
    samples_.push_back(sample);
    return sample;
}

void ProbeRun::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool ProbeRun::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

ProbeSummary ProbeRun::summarize() const {
    return ::summarize(spec_, samples_, cancelled() && taken_ < total_);
}
