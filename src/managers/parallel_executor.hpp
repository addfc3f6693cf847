#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/config.hpp>

enum class ProgressPhase { AttemptStarted, AttemptFinished };

struct ProgressEvent {
    std::string host;
    int attempt = 0;            // 0-based
    ProgressPhase phase = ProgressPhase::AttemptStarted;
    bool success = false;
    ErrorKind kind = ErrorKind::None;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

struct RetryPolicy {
    int max_retries = DEFAULT_MAX_RETRIES;
    double retry_delay = DEFAULT_RETRY_DELAY_SECS;
    double max_retry_delay = MAX_RETRY_DELAY_SECS;

    // Seconds to wait before retry n (0-based): retry_delay * 2^n, capped.
    double backoff(int n) const;

    static RetryPolicy from_config(const Config& config);
};

struct DispatchOptions {
    std::string operation;
    int max_parallel = DEFAULT_MAX_PARALLEL;
    RetryPolicy retry;
    ProgressCallback progress;
};

// One attempt against one host. host.label holds the result key. The
// executor fills in host, operation, retry_count, duration and timestamp.
using HostOperation = std::function<OperationResult(const HostAddress& host, int attempt)>;

// Name each host's result is filed under: the bare host name, or
// user@host:port when the set holds that host more than once. Exact
// duplicates get a #n suffix.
std::vector<std::string> result_keys(const std::vector<HostAddress>& hosts);

class ParallelExecutor {
public:
    // Run op on every host with bounded concurrency and per-host retry.
    // A failing or throwing host never affects the others. Results are keyed
    // by result_keys(hosts).
    std::map<std::string, OperationResult> dispatch(const std::vector<HostAddress>& hosts,
                                                    const HostOperation& op,
                                                    const DispatchOptions& options);

    // Run independent tasks at most max_parallel at a time and wait for all.
    static void run_bounded(std::vector<std::function<void()>> tasks, int max_parallel);

private:
    std::mutex progress_mutex_;

    void emit(const DispatchOptions& options, const ProgressEvent& event);
    OperationResult attempt_once(const HostAddress& host, int attempt, const HostOperation& op,
                                 const DispatchOptions& options);
};
