#include "command_helpers.hpp"
#include "../result_view.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <managers/metrics_export.hpp>
#include <iostream>
#include <map>

const std::set<std::string> HOST_OPTIONS = {"-H", "--hosts", "-P", "--parallel", "-o", "--output",
                                            "--format"};

std::optional<ParsedArgs> parse_command(BaseCLI& cli, const std::vector<std::string>& args,
                                        std::set<std::string> valued,
                                        const std::set<std::string>& flags,
                                        const std::string& usage,
                                        bool stop_at_positional) {
    valued.insert(HOST_OPTIONS.begin(), HOST_OPTIONS.end());
    ParsedArgs parsed = parse_args(args, valued, flags, stop_at_positional);
    if (!parsed.error.empty()) {
        std::cout << theme::fail(parsed.error);
        std::cout << theme::step("Usage: " + usage);
        cli.set_status(1);
        return std::nullopt;
    }

    // Long spellings are stored under their short name.
    static const std::map<std::string, std::string> aliases = {
        {"--hosts", "-H"}, {"--parallel", "-P"}, {"--output", "-o"}, {"--timeout", "-t"},
        {"--follow", "-f"}, {"--protocol", "-p"}, {"--direction", "-d"},
    };
    for (const auto& [long_name, short_name] : aliases) {
        auto it = parsed.options.find(long_name);
        if (it != parsed.options.end()) {
            parsed.options[short_name] = it->second;
            parsed.options.erase(long_name);
        }
        if (parsed.flags.erase(long_name)) parsed.flags.insert(short_name);
    }
    return parsed;
}

std::vector<std::string> selected_hosts(const ParsedArgs& args) {
    return split_list(args.get("-H"));
}

std::optional<int> int_option(const ParsedArgs& args, const std::string& name, int fallback) {
    std::string v = args.get(name);
    if (v.empty()) return fallback;
    try {
        size_t used = 0;
        int n = std::stoi(v, &used);
        if (used == v.size()) return n;
    } catch (const std::exception&) {
    }
    std::cout << theme::fail("Not a number for " + name + ": " + v);
    return std::nullopt;
}

std::optional<double> double_option(const ParsedArgs& args, const std::string& name, double fallback) {
    std::string v = args.get(name);
    if (v.empty()) return fallback;
    try {
        size_t used = 0;
        double d = std::stod(v, &used);
        if (used == v.size()) return d;
    } catch (const std::exception&) {
    }
    std::cout << theme::fail("Not a number for " + name + ": " + v);
    return std::nullopt;
}

namespace {

ExportFormat format_for(const std::string& explicit_format, const std::string& path) {
    if (!explicit_format.empty()) {
        auto f = export_format_from_string(explicit_format);
        if (f) return *f;
        std::cout << theme::warn("Unknown format " + explicit_format + ", writing JSON");
        return ExportFormat::Json;
    }
    std::string ext = to_lower(fs::path(path).extension().string());
    if (ext == ".csv") return ExportFormat::Csv;
    if (ext == ".prom") return ExportFormat::Prometheus;
    return ExportFormat::Json;
}

} // namespace

void finish(BaseCLI& cli, const std::string& title, const ResultMap& results,
            const ParsedArgs& args) {
    print_results(title, results);

    std::string out = args.get("-o");
    if (!out.empty()) {
        auto written = write_export(results_document(results), format_for(args.get("--format"), out),
                                    expand_home(out));
        if (written.is_ok()) {
            std::cout << theme::ok("Results exported to " + out);
        } else {
            std::cout << theme::fail(written.error);
        }
    }
    cli.set_status(exit_status(results));
}
