#include "command_helpers.hpp"
#include "../result_view.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <managers/metrics_export.hpp>
#include <managers/metrics_store.hpp>
#include <iostream>
#include <fmt/format.h>

static void do_metrics(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!args.empty() && args[0] == "clear") {
        MetricsStore store;
        store.clear();
        std::cout << theme::ok("Metrics history cleared.");
        return;
    }
    if (!args.empty()) {
        std::cout << theme::step("Usage: metrics [clear]");
        cli.set_status(1);
        return;
    }

    MetricsStore store;
    MetricsSnapshot snapshot = store.load();

    std::cout << theme::section("Host metrics");
    print_host_metrics(MetricsStore::aggregate(snapshot.operations));

    if (!snapshot.traffic.empty()) {
        std::vector<TrafficResult> recent;
        size_t first = snapshot.traffic.size() > 10 ? snapshot.traffic.size() - 10 : 0;
        for (size_t i = first; i < snapshot.traffic.size(); i++) {
            recent.push_back(TrafficResult{snapshot.traffic[i], {}});
        }
        print_traffic(recent);
    }
    std::cout << theme::kv("history", fmt::format("{} operations, {} probe summaries",
                                                  snapshot.operations.size(), snapshot.traffic.size()));
    std::cout << theme::kv("file", store.path().string()) << "\n";
}

static void do_export(BaseCLI& cli, const std::vector<std::string>& args) {
    const std::string usage = "export <json|csv|prometheus> <path>";
    if (args.size() != 2) {
        std::cout << theme::step("Usage: " + usage);
        cli.set_status(1);
        return;
    }
    auto format = export_format_from_string(args[0]);
    if (!format) {
        std::cout << theme::fail("Unknown export format: " + args[0]);
        cli.set_status(1);
        return;
    }

    // Exporting history needs no hosts, so the service is optional here.
    Result<void> written = Result<void>::Ok();
    if (cli.service) {
        written = cli.service->export_metrics(*format, expand_home(args[1]));
    } else {
        MetricsStore store;
        written = write_export(metrics_document(store.load()), *format, expand_home(args[1]));
    }

    if (written.is_err()) {
        std::cout << theme::fail(written.error);
        cli.set_status(1);
        return;
    }
    std::cout << theme::ok("Metrics exported to " + args[1]);
}

void register_metrics_commands(BaseCLI& cli) {
    cli.add_command("metrics", do_metrics, "Show recorded per-host metrics");
    cli.add_command("export", do_export, "Write metrics as JSON, CSV or Prometheus text");
}
