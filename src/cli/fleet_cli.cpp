#include "fleet_cli.hpp"
#include "result_view.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <cstdlib>
#include <fmt/format.h>
#include <readline/readline.h>
#include <readline/history.h>

FleetCLI::FleetCLI(GlobalOptions opts) : BaseCLI(std::move(opts)) {
    register_all_commands();
}

void FleetCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::vector<std::string>& args) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI& cli, const std::vector<std::string>& args) {
        quit_ = true;
    }, "Exit fleetrun");

    add_command("exit", [this](BaseCLI& cli, const std::vector<std::string>& args) {
        quit_ = true;
    }, "Exit fleetrun");

    add_command("clear", [](BaseCLI& cli, const std::vector<std::string>& args) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_remote_commands(*this);
    register_files_commands(*this);
    register_traffic_commands(*this);
    register_metrics_commands(*this);
    register_hosts_commands(*this);
}

int FleetCLI::run_repl() {
    std::cout << theme::banner();

    std::cout << theme::section("Configuration");
    if (!require_service()) {
        std::cout << theme::step("Fix the configuration, then run 'reload'.") << "\n";
    } else {
        std::cout << theme::ok(fmt::format("{} hosts, up to {} in parallel",
                                           config->hosts().size(), config->connection().max_parallel));
    }
    std::cout << theme::dim("    Type 'help' for available commands.") << "\n\n";

    while (!quit_) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            // Ctrl+D
            std::cout << "\n";
            break;
        }
        std::string line(raw);
        free(raw);

        auto words = tokenize(line);
        if (words.empty()) continue;
        add_history(line.c_str());

        std::string command = words[0];
        words.erase(words.begin());
        fleetrun_log("CLI: " + line);

        execute_command(command, words);
    }

    std::cout << theme::dim("Closing connections...") << "\n";
    if (service) service->shutdown();
    return status();
}

void FleetCLI::on_service_ready() {
    service->set_progress(retry_reporter());
}

int FleetCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    execute_command(command, args);
    if (service) service->shutdown();
    return status();
}
