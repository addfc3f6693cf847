#include "result_view.hpp"
#include "theme.hpp"
#include <core/time_utils.hpp>
#include <iostream>
#include <algorithm>
#include <fmt/format.h>

std::string describe_outcome(const OperationResult& r) {
    if (r.success) {
        if (r.retry_count > 0) return fmt::format("ok after {} retries", r.retry_count);
        return "ok";
    }
    std::string text = fmt::format("failed after {} retries with {}", r.retry_count,
                                   to_string(r.error_kind));
    if (!r.error.empty()) text += ": " + r.error;
    return text;
}

namespace {

std::string exit_text(const OperationResult& r) {
    return r.exit_code ? std::to_string(*r.exit_code) : "-";
}

std::string ms_text(const std::optional<double>& ms) {
    return ms ? fmt::format("{:.1f}", *ms) : "-";
}

} // namespace

void print_results(const std::string& title, const ResultMap& results) {
    if (results.empty()) {
        std::cout << theme::dim("  No hosts.") << "\n";
        return;
    }

    std::cout << theme::section(title);

    // Compute column widths from headers and data
    size_t w0 = 4, w1 = 4;
    for (const auto& [host, r] : results) {
        w0 = std::max(w0, host.size());
        w1 = std::max(w1, exit_text(r).size());
    }

    std::string hfmt = fmt::format("  {{:<{}}} {{:<{}}} {{:<10}} {{}}\n", w0 + 2, w1 + 2);
    std::cout << theme::color::DIM
              << fmt::format(fmt::runtime(hfmt), "HOST", "EXIT", "TIME", "RESULT")
              << theme::color::RESET;

    std::string rfmt = fmt::format("  {{:<{}}} {{:<{}}} {{:<10}} ", w0 + 2, w1 + 2);
    for (const auto& [host, r] : results) {
        std::cout << fmt::format(fmt::runtime(rfmt), host, exit_text(r), format_elapsed(r.duration))
                  << (r.success ? theme::green(describe_outcome(r)) : theme::red(describe_outcome(r)))
                  << "\n";
    }
    print_summary(results);
}

void print_outputs(const ResultMap& results) {
    for (const auto& [host, r] : results) {
        std::cout << "\n" << theme::color::TEAL << theme::color::BOLD << "  " << host
                  << theme::color::RESET << "\n";

        if (!r.commands.empty()) {
            for (const auto& c : r.commands) {
                std::cout << theme::dim("  $ " + c.command)
                          << (c.exit_code ? theme::dim(fmt::format("  [{}]", *c.exit_code)) : "")
                          << "\n";
                if (!c.output.empty()) {
                    std::cout << c.output;
                    if (c.output.back() != '\n') std::cout << "\n";
                }
                if (!c.error.empty()) std::cout << theme::red(c.error) << "\n";
            }
            continue;
        }

        if (!r.output.empty()) {
            std::cout << r.output;
            if (r.output.back() != '\n') std::cout << "\n";
        }
        if (!r.success && !r.error.empty()) std::cout << theme::red(r.error) << "\n";
    }
}

void print_summary(const ResultMap& results) {
    size_t total = results.size();
    size_t ok = 0;
    double duration = 0.0;
    uint64_t bytes = 0;
    for (const auto& [host, r] : results) {
        if (r.success) ok++;
        duration += r.duration;
        if (r.transfer && r.success) bytes += r.transfer->size;
    }
    double rate = total > 0 ? 100.0 * static_cast<double>(ok) / static_cast<double>(total) : 0.0;
    double avg = total > 0 ? duration / static_cast<double>(total) : 0.0;

    std::string line = fmt::format("Total: {}  Succeeded: {}  Failed: {}  Success rate: {:.1f}%  Avg: {}",
                                   total, ok, total - ok, rate, format_elapsed(avg));
    if (bytes > 0) line += fmt::format("  Bytes: {}", bytes);
    std::cout << "\n" << (ok == total ? theme::ok(line) : theme::fail(line));
}

void print_traffic(const std::vector<TrafficResult>& results) {
    if (results.empty()) {
        std::cout << theme::dim("  No pairings.") << "\n";
        return;
    }

    std::cout << theme::section("Traffic");

    std::vector<std::string> pairs;
    size_t w0 = 4;
    for (const auto& r : results) {
        const auto& s = r.summary;
        pairs.push_back(fmt::format("{} -> {}:{}", s.source.empty() ? "local" : s.source, s.target, s.port));
        w0 = std::max(w0, pairs.back().size());
    }

    std::string fmt_row = fmt::format("  {{:<{}}} {{:<6}} {{:<7}} {{:<8}} {{:<8}} {{:<8}} {{:<8}} {{}}\n", w0 + 2);
    std::cout << theme::color::DIM
              << fmt::format(fmt::runtime(fmt_row), "PAIR", "PROTO", "COUNT", "OK %", "AVG ms", "P95 ms",
                             "JITTER", "LOSS %")
              << theme::color::RESET;

    for (size_t i = 0; i < results.size(); i++) {
        const auto& s = results[i].summary;
        std::string row = fmt::format(fmt::runtime(fmt_row), pairs[i], to_string(s.protocol), s.count,
                                      fmt::format("{:.1f}", s.success_rate * 100.0), ms_text(s.avg_ms),
                                      ms_text(s.p95_ms), ms_text(s.jitter_ms),
                                      fmt::format("{:.1f}", s.packet_loss_percent));
        std::cout << (s.success_count == s.count ? row : theme::yellow(row));
        for (const auto& [reason, n] : s.failure_reasons) {
            std::cout << theme::log(fmt::format("{} x{}", reason, n));
        }
        if (s.cancelled) std::cout << theme::log("cancelled");
    }
    std::cout << "\n";
}

void print_host_metrics(const std::map<std::string, HostMetrics>& hosts) {
    if (hosts.empty()) {
        std::cout << theme::dim("  No recorded operations.") << "\n";
        return;
    }

    size_t w0 = 4;
    for (const auto& [host, m] : hosts) w0 = std::max(w0, host.size());

    std::string fmt_row = fmt::format("  {{:<{}}} {{:<6}} {{:<6}} {{:<6}} {{:<9}} {{:<9}} {{:<8}} {{}}\n", w0 + 2);
    std::cout << "\n" << theme::color::DIM
              << fmt::format(fmt::runtime(fmt_row), "HOST", "OPS", "OK", "FAIL", "AVG", "MAX", "RETRIES",
                             "LAST")
              << theme::color::RESET;
    for (const auto& [host, m] : hosts) {
        std::cout << fmt::format(fmt::runtime(fmt_row), host, m.total_operations, m.successful_operations,
                                 m.failed_operations, format_elapsed(m.avg_duration()),
                                 format_elapsed(m.max_duration), m.total_retries,
                                 format_timestamp(m.last_operation));
    }
    std::cout << "\n";
}

ProgressCallback retry_reporter() {
    return [](const ProgressEvent& e) {
        if (e.phase == ProgressPhase::AttemptStarted && e.attempt > 0) {
            std::cout << theme::log(fmt::format("{}: retry {}", e.host, e.attempt)) << std::flush;
        } else if (e.phase == ProgressPhase::AttemptFinished && !e.success) {
            std::cout << theme::log(fmt::format("{}: attempt {} failed ({})", e.host, e.attempt + 1,
                                                to_string(e.kind)))
                      << std::flush;
        }
    };
}
