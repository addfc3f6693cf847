#include <iostream>
#include <vector>
#include <string>
#include <optional>
#include "cli/fleet_cli.hpp"
#include "cli/theme.hpp"
#include <core/utils.hpp>

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");

    auto row = [](const std::string& cmd, const std::string& args, const std::string& help) {
        std::cout << theme::color::TEAL << "    fleetrun " << cmd << " "
                  << theme::color::RESET << theme::color::AMBER << fmt::format("{:<30}", args)
                  << theme::color::RESET << theme::color::DIM << help << theme::color::RESET << "\n";
    };
    row("", "", "Open the console");
    row("exec", "<command...>", "Run a command on every host");
    row("chain", "<cmd> [cmd...]", "Run commands in one shell");
    row("interactive", "<script-file>", "Answer prompts from a script");
    row("upload", "<local> <remote>", "Copy a file to every host");
    row("download", "<remote> [dir]", "Fetch a file from every host");
    row("tail", "<path>", "Stream a remote log");
    row("traffic", "-p <protocol> [...]", "Probe connectivity");
    row("metrics", "[clear]", "Show recorded metrics");
    row("export", "<format> <path>", "Write metrics to a file");
    row("config", "", "Validate the configuration");

    std::cout << theme::section("Global options");
    std::cout << theme::color::DIM
              << "    -c, --config <path>     Config file (default ./fleetrun.yaml, ~/.fleetrun/config.yaml)\n"
              << "    -H, --hosts <a,b,c>     Hosts to use instead of the configured ones\n"
              << "    -u, --user <name>       SSH user\n"
              << "    -p, --password <pw>     SSH password\n"
              << "    -k, --key-file <path>   SSH private key\n"
              << "        --port <n>          SSH port\n"
              << "        --timeout <secs>    Connect timeout\n"
              << "        --parallel <n>      Maximum hosts at once\n"
              << "    --version               Show version\n"
              << "    --help                  Show this help"
              << theme::color::RESET << "\n\n";
}

namespace {

bool parse_int_flag(const std::string& name, const std::string& value, std::optional<int>& out) {
    try {
        size_t used = 0;
        int n = std::stoi(value, &used);
        if (used == value.size()) {
            out = n;
            return true;
        }
    } catch (const std::exception&) {
    }
    std::cout << theme::fail("Not a number for " + name + ": " + value);
    return false;
}

} // namespace

int main(int argc, char** argv) {
    try {
        GlobalOptions options;
        std::vector<std::string> rest;

        // Global options come before the command.
        int i = 1;
        for (; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--version") {
                std::cout << theme::color::AMBER << theme::color::BOLD << "fleetrun"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << FLEETRUN_VERSION << theme::color::RESET << "\n";
                return 0;
            }
            if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            }
            if (arg.empty() || arg[0] != '-') break;

            if (i + 1 >= argc) {
                std::cout << theme::fail("Missing value for " + arg);
                return 2;
            }
            std::string value = argv[++i];

            if (arg == "-c" || arg == "--config") {
                options.config_path = value;
            } else if (arg == "-H" || arg == "--hosts") {
                options.hosts = split_list(value);
            } else if (arg == "-u" || arg == "--user") {
                options.overrides.user = value;
            } else if (arg == "-p" || arg == "--password") {
                options.overrides.password = value;
            } else if (arg == "-k" || arg == "--key-file") {
                options.overrides.key_file = expand_home(value);
            } else if (arg == "--port") {
                if (!parse_int_flag(arg, value, options.overrides.port)) return 2;
            } else if (arg == "--timeout") {
                if (!parse_int_flag(arg, value, options.overrides.timeout)) return 2;
            } else if (arg == "--parallel") {
                if (!parse_int_flag(arg, value, options.overrides.max_parallel)) return 2;
            } else {
                std::cout << theme::fail("Unknown option: " + arg);
                print_usage();
                return 2;
            }
        }
        for (; i < argc; i++) rest.push_back(argv[i]);

        FleetCLI cli(std::move(options));

        if (rest.empty()) {
            return cli.run_repl();
        }
        std::string cmd = rest[0];
        rest.erase(rest.begin());
        return cli.run_command(cmd, rest);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
