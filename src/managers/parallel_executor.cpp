#include "parallel_executor.hpp"
#include "worker_pool.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>

double RetryPolicy::backoff(int n) const {
    double delay = retry_delay * std::pow(2.0, n);
    return std::min(delay, max_retry_delay);
}

RetryPolicy RetryPolicy::from_config(const Config& config) {
    RetryPolicy p;
    p.max_retries = config.connection().max_retries;
    p.retry_delay = config.connection().retry_delay;
    return p;
}

std::vector<std::string> result_keys(const std::vector<HostAddress>& hosts) {
    std::map<std::string, int> per_host;
    for (const auto& h : hosts) per_host[h.host]++;

    std::vector<std::string> keys;
    keys.reserve(hosts.size());
    std::map<std::string, int> seen;
    for (const auto& h : hosts) {
        std::string key = per_host[h.host] > 1 ? h.identity() : h.host;
        int n = ++seen[key];
        if (n > 1) key += "#" + std::to_string(n);
        keys.push_back(std::move(key));
    }
    return keys;
}

void ParallelExecutor::emit(const DispatchOptions& options, const ProgressEvent& event) {
    if (!options.progress) return;
    std::lock_guard<std::mutex> lock(progress_mutex_);
    options.progress(event);
}

OperationResult ParallelExecutor::attempt_once(const HostAddress& host, int attempt,
                                               const HostOperation& op,
                                               const DispatchOptions& options) {
    emit(options, ProgressEvent{host.name(), attempt, ProgressPhase::AttemptStarted, false, ErrorKind::None});

    OperationResult result;
    try {
        result = op(host, attempt);
    } catch (const std::exception& e) {
        result = OperationResult{};
        result.success = false;
        result.error = e.what();
        result.error_kind = ErrorKind::CommandFailed;
    }
    if (!result.success && result.error_kind == ErrorKind::None) {
        result.error_kind = ErrorKind::CommandFailed;
    }

    emit(options, ProgressEvent{host.name(), attempt, ProgressPhase::AttemptFinished,
                                result.success, result.error_kind});
    return result;
}

// A retry waits in the delayed list, not on a worker, so a host in backoff
// never holds a slot another host could use. The dispatching thread moves
// due retries back onto the pool.
std::map<std::string, OperationResult> ParallelExecutor::dispatch(
    const std::vector<HostAddress>& hosts,
    const HostOperation& op,
    const DispatchOptions& options) {

    using Clock = std::chrono::steady_clock;

    struct HostRun {
        HostAddress host;
        int attempt = 0;
        Clock::time_point start;
    };

    std::map<std::string, OperationResult> results;
    if (hosts.empty()) return results;

    std::vector<std::string> keys = result_keys(hosts);
    std::vector<HostRun> runs(hosts.size());
    for (std::size_t i = 0; i < hosts.size(); i++) {
        runs[i].host = hosts[i];
        runs[i].host.label = keys[i];
    }

    std::mutex mutex;
    std::condition_variable cv;
    std::multimap<Clock::time_point, std::size_t> delayed;
    std::size_t remaining = hosts.size();

    auto run_attempt = [&](std::size_t i) {
        HostRun& run = runs[i];
        if (run.attempt == 0) run.start = Clock::now();
        OperationResult r = attempt_once(run.host, run.attempt, op, options);

        bool retry = !r.success && is_retryable(r.error_kind) &&
                     run.attempt < options.retry.max_retries;
        if (retry) {
            double delay = options.retry.backoff(run.attempt);
            fleetrun_log(fmt::format("Executor {}: {} attempt {} failed ({}), retrying in {:.1f}s",
                                     options.operation, run.host.name(), run.attempt + 1,
                                     to_string(r.error_kind), delay));
            run.attempt++;
            auto due = Clock::now() + std::chrono::duration_cast<Clock::duration>(
                                          std::chrono::duration<double>(delay));
            std::lock_guard<std::mutex> lock(mutex);
            delayed.emplace(due, i);
            cv.notify_all();
            return;
        }

        r.host = run.host.name();
        r.operation = options.operation;
        r.retry_count = run.attempt;
        r.duration = std::chrono::duration<double>(Clock::now() - run.start).count();
        r.timestamp = now_iso();

        std::lock_guard<std::mutex> lock(mutex);
        results[run.host.label] = std::move(r);
        remaining--;
        cv.notify_all();
    };

    std::size_t workers = static_cast<std::size_t>(std::max(1, options.max_parallel));
    workers = std::min(workers, hosts.size());

    fleetrun_log(fmt::format("Executor {}: dispatching to {} hosts, max_parallel={}",
                             options.operation, hosts.size(), options.max_parallel));

    WorkerPool pool(workers);
    for (std::size_t i = 0; i < runs.size(); i++) {
        pool.submit([&run_attempt, i] { run_attempt(i); });
    }

    {
        std::unique_lock<std::mutex> lock(mutex);
        while (remaining > 0) {
            auto now = Clock::now();
            while (!delayed.empty() && delayed.begin()->first <= now) {
                std::size_t i = delayed.begin()->second;
                delayed.erase(delayed.begin());
                pool.submit([&run_attempt, i] { run_attempt(i); });
            }
            if (delayed.empty()) {
                cv.wait(lock);
            } else {
                cv.wait_until(lock, delayed.begin()->first);
            }
        }
    }
    pool.shutdown();
    return results;
}

void ParallelExecutor::run_bounded(std::vector<std::function<void()>> tasks, int max_parallel) {
    if (tasks.empty()) return;
    std::size_t workers = static_cast<std::size_t>(std::max(1, max_parallel));
    workers = std::min(workers, tasks.size());

    WorkerPool pool(workers);
    for (auto& t : tasks) pool.submit(std::move(t));
    pool.wait_idle();
    pool.shutdown();
}
