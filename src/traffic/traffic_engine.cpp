#include "traffic_engine.hpp"
#include "probe_stats.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <managers/parallel_executor.hpp>
#include <fmt/format.h>
#include <algorithm>

TrafficEngine::TrafficEngine(SourceResolver resolver)
    : resolver_(std::move(resolver)) {}

Result<std::vector<ProbeSpec>> TrafficEngine::plan(const TrafficRequest& request) {
    using R = Result<std::vector<ProbeSpec>>;

    if (request.sources.empty()) return R::Err("No traffic sources given", ErrorKind::ConfigInvalid);
    if (request.interval <= 0.0) return R::Err("Interval must be positive", ErrorKind::ConfigInvalid);
    if (request.duration <= 0.0) return R::Err("Duration must be positive", ErrorKind::ConfigInvalid);
    if (request.direction == Direction::NorthSouth && request.targets.empty()) {
        return R::Err("north_south needs at least one external target", ErrorKind::ConfigInvalid);
    }

    std::vector<int> ports = request.ports;
    if (ports.empty()) ports.push_back(default_port(request.protocol));

    const auto& targets = (request.direction == Direction::EastWest && request.targets.empty())
        ? request.sources : request.targets;

    std::vector<ProbeSpec> specs;
    for (const auto& source : request.sources) {
        for (const auto& target : targets) {
            if (request.direction == Direction::EastWest && source == target) continue;
            for (int port : ports) {
                ProbeSpec spec;
                spec.protocol = request.protocol;
                spec.direction = request.direction;
                spec.source = source;
                spec.target = target;
                spec.port = port;
                spec.duration = request.duration;
                spec.interval = request.interval;
                spec.params = request.params;
                specs.push_back(std::move(spec));
            }
        }
    }
    return R::Ok(std::move(specs));
}

TrafficResult TrafficEngine::run_pairing(const ProbeSpec& spec, const SampleCallback& on_sample) {
    TrafficResult result;

    ConnectionLease lease;
    if (!is_local_source(spec.source)) {
        Result<ConnectionLease> acquired = resolver_
            ? resolver_(spec.source)
            : Result<ConnectionLease>::Err("No session resolver for remote source",
                                           ErrorKind::ConnectFailed);
        if (acquired.is_err()) {
            // Every scheduled sample fails with the same reason.
            fleetrun_log(fmt::format("Traffic {} -> {}:{} source unavailable: {}",
                                     spec.source, spec.target, spec.port, acquired.error));
            for (int k = 0; k < spec.sample_count(); ++k) {
                ProbeSample s;
                s.sequence = k;
                s.timestamp = now_iso();
                s.reason = "source unavailable: " + acquired.error;
                result.samples.push_back(s);
            }
            result.summary = summarize(spec, result.samples, false);
            return result;
        }
        lease = std::move(acquired.value);
    }

    ProbeRun run(spec, probe_for(spec.protocol), lease ? &lease.session() : nullptr);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) run.cancel();
        active_.push_back(&run);
    }

    while (auto sample = run.next()) {
        if (on_sample) {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            on_sample(spec, *sample);
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(std::remove(active_.begin(), active_.end(), &run), active_.end());
    }

    result.samples = run.samples();
    result.summary = run.summarize();
    fleetrun_log(fmt::format("Traffic {} {} -> {}:{}: {}/{} ok{}",
                             to_string(spec.protocol), spec.source, spec.target, spec.port,
                             result.summary.success_count, result.summary.count,
                             result.summary.cancelled ? " (cancelled)" : ""));
    return result;
}

Result<std::vector<TrafficResult>> TrafficEngine::run(const TrafficRequest& request,
                                                      SampleCallback on_sample) {
    auto planned = plan(request);
    if (planned.is_err()) {
        return Result<std::vector<TrafficResult>>::Err(planned.error, planned.kind);
    }
    const auto& specs = planned.value;

    fleetrun_log(fmt::format("Traffic {}: {} pairings, {} samples each, max_parallel={}",
                             to_string(request.protocol), specs.size(),
                             specs.empty() ? 0 : specs.front().sample_count(),
                             request.max_parallel));

    std::vector<TrafficResult> results(specs.size());
    std::vector<std::function<void()>> tasks;
    tasks.reserve(specs.size());
    for (size_t i = 0; i < specs.size(); ++i) {
        tasks.push_back([&, i] { results[i] = run_pairing(specs[i], on_sample); });
    }
    ParallelExecutor::run_bounded(std::move(tasks), request.max_parallel);

    {
        // A cancel covers one run, including one issued before it started.
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = false;
    }
    return Result<std::vector<TrafficResult>>::Ok(std::move(results));
}

void TrafficEngine::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    for (auto* run : active_) run->cancel();
}
