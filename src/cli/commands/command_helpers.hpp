#pragma once

#include "../base_cli.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

// Options every fleet-wide command accepts.
extern const std::set<std::string> HOST_OPTIONS;

// Parse with HOST_OPTIONS plus `valued`. Prints usage and returns nullopt on error.
std::optional<ParsedArgs> parse_command(BaseCLI& cli, const std::vector<std::string>& args,
                                        std::set<std::string> valued,
                                        const std::set<std::string>& flags,
                                        const std::string& usage,
                                        bool stop_at_positional = false);

// -H/--hosts a,b,c; empty means the configured hosts.
std::vector<std::string> selected_hosts(const ParsedArgs& args);

// Integer option, printing an error and returning nullopt when malformed.
std::optional<int> int_option(const ParsedArgs& args, const std::string& name, int fallback);
std::optional<double> double_option(const ParsedArgs& args, const std::string& name, double fallback);

// Print the result table, honor -o/--format, set the exit status.
void finish(BaseCLI& cli, const std::string& title, const ResultMap& results,
            const ParsedArgs& args);
