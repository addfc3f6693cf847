#include "probe_stats.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

double percentile(std::vector<double> values, double p) {
    if (values.empty()) return std::numeric_limits<double>::quiet_NaN();
    std::sort(values.begin(), values.end());
    if (values.size() == 1) return values.front();

    double rank = std::clamp(p, 0.0, 100.0) / 100.0 * static_cast<double>(values.size() - 1);
    auto lo = static_cast<size_t>(std::floor(rank));
    auto hi = static_cast<size_t>(std::ceil(rank));
    double frac = rank - static_cast<double>(lo);
    return values[lo] + (values[hi] - values[lo]) * frac;
}

double stddev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double sq = 0.0;
    for (double v : values) sq += (v - mean) * (v - mean);
    return std::sqrt(sq / static_cast<double>(values.size() - 1));
}

std::optional<double> jitter(const std::vector<double>& values) {
    if (values.size() < 2) return std::nullopt;
    double total = 0.0;
    for (size_t i = 1; i < values.size(); ++i) total += std::fabs(values[i] - values[i - 1]);
    return total / static_cast<double>(values.size() - 1);
}

namespace {

std::optional<double> mean_of(const std::vector<double>& values) {
    if (values.empty()) return std::nullopt;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

} // namespace

ProbeSummary summarize(const ProbeSpec& spec, const std::vector<ProbeSample>& samples,
                       bool cancelled) {
    ProbeSummary s;
    s.protocol = spec.protocol;
    s.direction = spec.direction;
    s.source = spec.source;
    s.target = spec.target;
    s.port = spec.port;
    s.cancelled = cancelled;
    s.fields = probe_for(spec.protocol).summary_fields();
    s.count = static_cast<int>(samples.size());

    std::vector<double> latencies, throughputs, handshakes;
    for (const auto& sample : samples) {
        if (sample.status_code) s.status_codes[*sample.status_code]++;
        if (!sample.success) {
            s.failure_count++;
            s.failure_reasons[sample.reason.empty() ? "unknown" : sample.reason]++;
            continue;
        }
        s.success_count++;
        if (sample.latency_ms) latencies.push_back(*sample.latency_ms);
        if (sample.throughput_bps) throughputs.push_back(*sample.throughput_bps);
        if (sample.tls_handshake_ms) handshakes.push_back(*sample.tls_handshake_ms);
    }

    if (s.count > 0) {
        s.success_rate = static_cast<double>(s.success_count) / s.count;
        s.packet_loss_percent = 100.0 * s.failure_count / s.count;
    }

    if (!latencies.empty()) {
        s.min_ms = *std::min_element(latencies.begin(), latencies.end());
        s.max_ms = *std::max_element(latencies.begin(), latencies.end());
        s.avg_ms = mean_of(latencies);
        s.median_ms = percentile(latencies, 50);
        s.p95_ms = percentile(latencies, 95);
        s.p99_ms = percentile(latencies, 99);
        s.stddev_ms = stddev(latencies);
        s.jitter_ms = jitter(latencies);
    }
    s.avg_throughput_bps = mean_of(throughputs);
    s.avg_tls_handshake_ms = mean_of(handshakes);

    if (!samples.empty()) {
        s.started = samples.front().timestamp;
        s.finished = samples.back().timestamp;
    }
    return s;
}
