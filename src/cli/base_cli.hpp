#pragma once

#include <string>
#include <map>
#include <set>
#include <memory>
#include <functional>
#include <optional>
#include <vector>
#include <core/config.hpp>
#include <managers/fleet_service.hpp>

// Options common to every invocation, taken from the command line.
struct GlobalOptions {
    std::string config_path;
    ConfigOverrides overrides;
    std::vector<std::string> hosts;     // replaces the configured hosts
};

// Split command arguments into options and positionals. Options listed in
// `valued` take the next argument (or --opt=value); `flags` take none.
// With stop_at_positional, everything from the first positional on is
// positional, so remote command words like "-la" pass through.
struct ParsedArgs {
    std::map<std::string, std::string> options;
    std::multimap<std::string, std::string> repeated;   // every occurrence, in order
    std::set<std::string> flags;
    std::vector<std::string> positional;
    std::string error;

    bool has(const std::string& name) const { return flags.count(name) > 0; }
    std::string get(const std::string& name, const std::string& fallback = "") const;
    std::vector<std::string> all(const std::string& name) const;
};

ParsedArgs parse_args(const std::vector<std::string>& args,
                      const std::set<std::string>& valued,
                      const std::set<std::string>& flags = {},
                      bool stop_at_positional = false);

// Split a console line into words. Single and double quotes group words;
// a backslash escapes the next character outside single quotes.
std::vector<std::string> tokenize(const std::string& line);

class BaseCLI {
public:
    explicit BaseCLI(GlobalOptions options = {});
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Load, override and validate the config, then build the service.
    // Prints the problem and sets status 2 when the config is invalid.
    bool require_service();

    // Drop the service so the next command reloads the config.
    void reset_service();

    void execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

    // Exit status of the last command: 0 ok, 1 some host failed, 2 bad config.
    int status() const { return status_; }
    void set_status(int status) { status_ = status; }

    GlobalOptions options;
    std::optional<Config> config;
    std::unique_ptr<FleetService> service;

protected:
    // Called once each time require_service() builds a new service.
    virtual void on_service_ready() {}

    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    int status_ = 0;
};

// Installs a SIGINT handler for its lifetime and runs on_interrupt (on a
// watcher thread) when Ctrl+C arrives.
class InterruptWatch {
public:
    explicit InterruptWatch(std::function<void()> on_interrupt);
    ~InterruptWatch();

    InterruptWatch(const InterruptWatch&) = delete;
    InterruptWatch& operator=(const InterruptWatch&) = delete;

    bool interrupted() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
