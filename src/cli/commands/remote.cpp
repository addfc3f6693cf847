#include "command_helpers.hpp"
#include "../result_view.hpp"
#include "../theme.hpp"
#include <managers/channel_manager.hpp>
#include <iostream>
#include <fmt/format.h>
#include <fmt/ranges.h>

static void do_exec(BaseCLI& cli, const std::vector<std::string>& args) {
    const std::string usage = "exec [-H hosts] [-t secs] [-P n] [-o file] <command...>";
    auto parsed = parse_command(cli, args, {"-t", "--timeout"}, {}, usage, true);
    if (!parsed) return;
    if (parsed->positional.empty()) {
        std::cout << theme::step("Usage: " + usage);
        cli.set_status(1);
        return;
    }
    auto timeout = int_option(*parsed, "-t", SSH_CMD_TIMEOUT_SECS);
    auto parallel = int_option(*parsed, "-P", 0);
    if (!timeout || !parallel) return cli.set_status(1);
    if (!cli.require_service()) return;

    std::string command = fmt::format("{}", fmt::join(parsed->positional, " "));
    auto hosts = selected_hosts(*parsed);
    std::cout << theme::step(fmt::format("Executing on {} hosts: {}",
                                         cli.service->addresses(hosts).size(), command));

    auto results = cli.service->execute(hosts, command, *timeout, *parallel);
    print_outputs(results);
    finish(cli, "Command results", results, *parsed);
}

static void do_chain(BaseCLI& cli, const std::vector<std::string>& args) {
    const std::string usage = "chain [-H hosts] [-t secs] [--new-channel] <cmd> [cmd...]";
    auto parsed = parse_command(cli, args, {"-t", "--timeout"}, {"--new-channel"}, usage);
    if (!parsed) return;
    if (parsed->positional.empty()) {
        std::cout << theme::step("Usage: " + usage);
        std::cout << theme::dim("    Quote each command: chain 'cd /var/log' 'ls -l'") << "\n";
        cli.set_status(1);
        return;
    }
    auto timeout = int_option(*parsed, "-t", SSH_CMD_TIMEOUT_SECS);
    auto parallel = int_option(*parsed, "-P", 0);
    if (!timeout || !parallel) return cli.set_status(1);
    if (!cli.require_service()) return;

    auto results = cli.service->chain(selected_hosts(*parsed), parsed->positional,
                                      parsed->has("--new-channel"), *timeout, *parallel);
    print_outputs(results);
    finish(cli, "Chain results", results, *parsed);
}

static void do_interactive(BaseCLI& cli, const std::vector<std::string>& args) {
    const std::string usage = "interactive [-H hosts] [-t secs] <script-file>";
    auto parsed = parse_command(cli, args, {"-t", "--timeout"}, {}, usage);
    if (!parsed) return;
    if (parsed->positional.size() != 1) {
        std::cout << theme::step("Usage: " + usage);
        std::cout << theme::dim("    Each line: command|expect1,expect2  (or a bare command)") << "\n";
        cli.set_status(1);
        return;
    }
    auto timeout = int_option(*parsed, "-t", DEFAULT_INTERACTIVE_TIMEOUT_SECS);
    auto parallel = int_option(*parsed, "-P", 0);
    if (!timeout || !parallel) return cli.set_status(1);

    auto steps = load_interactive_script(parsed->positional[0]);
    if (steps.is_err()) {
        std::cout << theme::fail(steps.error);
        cli.set_status(1);
        return;
    }
    if (!cli.require_service()) return;

    std::cout << theme::step(fmt::format("Running {} interactive steps", steps.value.size()));
    auto results = cli.service->interactive(selected_hosts(*parsed), steps.value, *timeout, *parallel);
    print_outputs(results);
    finish(cli, "Interactive results", results, *parsed);
}

void register_remote_commands(BaseCLI& cli) {
    cli.add_command("exec", do_exec, "Run a command on every host");
    cli.add_command("chain", do_chain, "Run commands in sequence, sharing one shell");
    cli.add_command("interactive", do_interactive, "Drive prompts from a script file");
}
