#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <traffic/probe.hpp>

namespace fs = std::filesystem;

// One recorded per-host operation.
struct OperationRecord {
    std::string host;
    std::string operation;
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::optional<int> exit_code;
    double duration = 0.0;
    int retry_count = 0;
    uint64_t bytes_transferred = 0;
    std::string timestamp;

    static OperationRecord from_result(const OperationResult& r);
};

struct HostMetrics {
    std::string host;
    int total_operations = 0;
    int successful_operations = 0;
    int failed_operations = 0;
    double total_duration = 0.0;
    double min_duration = 0.0;
    double max_duration = 0.0;
    uint64_t bytes_transferred = 0;
    int total_retries = 0;
    std::string last_operation;         // timestamp

    double avg_duration() const {
        return total_operations > 0 ? total_duration / total_operations : 0.0;
    }
};

struct MetricsSnapshot {
    std::vector<OperationRecord> operations;
    std::vector<ProbeSummary> traffic;
};

// Operation history and traffic summaries persisted across invocations.
class MetricsStore {
public:
    explicit MetricsStore(fs::path path = default_path());

    // ~/.fleetrun/metrics.yaml
    static fs::path default_path();

    MetricsSnapshot load() const;
    void save(const MetricsSnapshot& snapshot) const;

    // Append and persist, keeping the newest MAX_HISTORY entries of each kind.
    void record(const std::map<std::string, OperationResult>& results);
    void record(const std::vector<ProbeSummary>& summaries);

    void clear();

    const fs::path& path() const { return path_; }

    static std::map<std::string, HostMetrics> aggregate(const std::vector<OperationRecord>& ops);

    static constexpr size_t MAX_HISTORY = 5000;

private:
    fs::path path_;
    mutable std::mutex mutex_;
};
