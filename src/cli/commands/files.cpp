#include "command_helpers.hpp"
#include "../result_view.hpp"
#include "../theme.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <iostream>
#include <limits>
#include <fmt/format.h>

static void do_upload(BaseCLI& cli, const std::vector<std::string>& args) {
    const std::string usage = "upload [-H hosts] [-P n] <local-file> <remote-path>";
    auto parsed = parse_command(cli, args, {}, {}, usage);
    if (!parsed) return;
    if (parsed->positional.size() != 2) {
        std::cout << theme::step("Usage: " + usage);
        cli.set_status(1);
        return;
    }
    auto parallel = int_option(*parsed, "-P", 0);
    if (!parallel) return cli.set_status(1);

    fs::path local = expand_home(parsed->positional[0]);
    if (!fs::is_regular_file(local)) {
        std::cout << theme::fail("Local file not found: " + local.string());
        cli.set_status(1);
        return;
    }
    if (!cli.require_service()) return;

    std::cout << theme::step(fmt::format("Uploading {} ({} bytes)", local.filename().string(),
                                         fs::file_size(local)));
    auto results = cli.service->upload(selected_hosts(*parsed), local, parsed->positional[1], *parallel);
    finish(cli, "Upload results", results, *parsed);
}

static void do_download(BaseCLI& cli, const std::vector<std::string>& args) {
    const std::string usage = "download [-H hosts] [-P n] <remote-path> [local-dir]";
    auto parsed = parse_command(cli, args, {}, {}, usage);
    if (!parsed) return;
    if (parsed->positional.empty() || parsed->positional.size() > 2) {
        std::cout << theme::step("Usage: " + usage);
        cli.set_status(1);
        return;
    }
    auto parallel = int_option(*parsed, "-P", 0);
    if (!parallel) return cli.set_status(1);
    if (!cli.require_service()) return;

    fs::path local_dir = parsed->positional.size() == 2 ? fs::path(expand_home(parsed->positional[1]))
                                                         : fs::current_path();
    auto results = cli.service->download(selected_hosts(*parsed), parsed->positional[0], local_dir,
                                         *parallel);
    finish(cli, "Download results", results, *parsed);
}

static void do_tail(BaseCLI& cli, const std::vector<std::string>& args) {
    const std::string usage =
        "tail [-H hosts] [--no-follow] [-t secs] [--filter re] [--exclude re] [--output-dir dir] <path>";
    auto parsed = parse_command(cli, args, {"-t", "--timeout", "--filter", "--exclude", "--output-dir"},
                                {"-f", "--follow", "--no-follow"}, usage);
    if (!parsed) return;
    if (parsed->positional.size() != 1) {
        std::cout << theme::step("Usage: " + usage);
        cli.set_status(1);
        return;
    }
    auto timeout = int_option(*parsed, "-t", 0);
    auto parallel = int_option(*parsed, "-P", 0);
    if (!timeout || !parallel) return cli.set_status(1);
    if (!cli.require_service()) return;

    TailOptions options;
    options.follow = !parsed->has("--no-follow");
    options.timeout_secs = *timeout;
    options.filter_patterns = parsed->all("--filter");
    options.exclude_patterns = parsed->all("--exclude");
    if (!parsed->get("--output-dir").empty()) options.output_dir = expand_home(parsed->get("--output-dir"));

    const std::string& path = parsed->positional[0];
    std::cout << theme::step(fmt::format("Tailing {} on {} hosts", path,
                                         cli.service->addresses(selected_hosts(*parsed)).size()));
    if (options.follow) std::cout << theme::dim("    Press Ctrl+C to stop") << "\n";

    FleetService* service = cli.service.get();
    ResultMap results;
    {
        InterruptWatch watch([service]() { service->stop_tails(); });
        results = service->tail(selected_hosts(*parsed), path, options,
                                [](const std::string& host, const std::string& line) {
                                    std::cout << theme::teal(host) << theme::dim(" | ") << line << "\n";
                                },
                                *parallel);
    }
    std::cout << "\n";

    auto stats = service->log_statistics();
    fleetrun_log(fmt::format("CLI: tail finished, {} lines", stats.total_lines));
    finish(cli, "Capture results", results, *parsed);
}

// Entries parsed from earlier tails in this session.
static void do_logs(BaseCLI& cli, const std::vector<std::string>& args) {
    const std::string usage =
        "logs [--host h] [--level L] [-n count] [--export path [--format json|csv|text]]";
    auto parsed = parse_command(cli, args, {"--host", "--level", "-n", "--export", "--format"}, {}, usage);
    if (!parsed) return;
    if (!parsed->positional.empty()) {
        std::cout << theme::step("Usage: " + usage);
        cli.set_status(1);
        return;
    }
    auto count = int_option(*parsed, "-n", 100);
    if (!count || *count <= 0) {
        if (count) std::cout << theme::fail("-n must be positive");
        return cli.set_status(1);
    }
    if (!cli.require_service()) return;
    const LogStreamer& logs = cli.service->logs();

    std::string host = parsed->get("--host");
    std::string level = parsed->get("--level");

    if (!parsed->get("--export").empty()) {
        auto format = log_export_format_from_string(parsed->get("--format", "json"));
        if (!format) {
            std::cout << theme::fail("Unknown log export format: " + parsed->get("--format"));
            return cli.set_status(1);
        }
        std::vector<std::string> hosts, levels;
        if (!host.empty()) hosts.push_back(host);
        if (!level.empty()) levels.push_back(level);
        auto written = logs.export_logs(expand_home(parsed->get("--export")), *format, hosts, levels);
        if (written.is_err()) {
            std::cout << theme::fail(written.error);
            return cli.set_status(1);
        }
        std::cout << theme::ok("Log entries exported to " + parsed->get("--export"));
        return;
    }

    auto n = static_cast<std::size_t>(*count);
    std::vector<LogEntry> entries;
    if (!host.empty()) {
        entries = logs.logs_by_host(host, std::numeric_limits<std::size_t>::max());
        if (!level.empty()) {
            std::string wanted = to_upper(level);
            entries.erase(std::remove_if(entries.begin(), entries.end(),
                                         [&](const LogEntry& e) { return e.level != wanted; }),
                          entries.end());
        }
        if (entries.size() > n) entries.erase(entries.begin(), entries.end() - static_cast<long>(n));
    } else if (!level.empty()) {
        entries = logs.logs_by_level(level, n);
    } else {
        entries = logs.recent(n);
    }

    if (entries.empty()) {
        std::cout << theme::dim("    No captured log entries") << "\n";
        return;
    }
    for (const auto& e : entries) {
        std::string lvl = e.level == "ERROR" || e.level == "CRITICAL" ? theme::red(e.level)
                        : e.level == "WARNING" ? theme::yellow(e.level)
                        : theme::dim(e.level);
        std::cout << "    " << theme::dim(e.timestamp) << " " << lvl << " "
                  << theme::teal(e.host) << theme::dim(" | ") << e.message << "\n";
    }

    auto stats = logs.statistics();
    std::cout << "\n" << theme::kv("buffered", std::to_string(stats.buffered));
}

void register_files_commands(BaseCLI& cli) {
    cli.add_command("upload", do_upload, "Copy a local file to every host");
    cli.add_command("download", do_download, "Fetch a remote file from every host");
    cli.add_command("tail", do_tail, "Stream a remote log from every host");
    cli.add_command("logs", do_logs, "Query or export lines captured by tail");
}
