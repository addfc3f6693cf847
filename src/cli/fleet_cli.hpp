#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_remote_commands(BaseCLI& cli);
void register_files_commands(BaseCLI& cli);
void register_traffic_commands(BaseCLI& cli);
void register_metrics_commands(BaseCLI& cli);
void register_hosts_commands(BaseCLI& cli);

class FleetCLI : public BaseCLI {
public:
    explicit FleetCLI(GlobalOptions options = {});

    // Interactive console. Returns the status of the last command.
    int run_repl();

    // One-shot invocation. Returns the process exit status.
    int run_command(const std::string& command, const std::vector<std::string>& args);

protected:
    void on_service_ready() override;

private:
    void register_all_commands();
    bool quit_ = false;
};
