#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <fmt/ranges.h>

static void do_hosts(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_service()) return;

    auto addresses = cli.service->addresses({});
    std::cout << "\n" << theme::color::DIM
              << fmt::format("  {:<32} {:<16} {:<6} {}\n", "HOST", "USER", "PORT", "VIA")
              << theme::color::RESET;
    for (const auto& a : addresses) {
        std::cout << fmt::format("  {:<32} {:<16} {:<6} {}\n", a.host, a.user, a.port,
                                 a.jumphost ? a.jumphost->host : "-");
    }
    std::cout << "\n";
}

static void do_status(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_service()) return;

    std::cout << theme::section("Connections");
    bool any = false;
    for (const auto& a : cli.service->addresses({})) {
        PoolStats s = cli.service->pool_stats(a.host);
        if (s.opened == 0 && s.idle == 0 && s.in_use == 0) continue;
        any = true;
        std::cout << theme::kv(a.host, fmt::format("{} idle, {} in use, {} opened, {} reused, {} evicted",
                                                   s.idle, s.in_use, s.opened, s.reused, s.evicted));
    }
    if (!any) std::cout << theme::dim("    No connections opened yet.") << "\n";

    auto logs = cli.service->log_statistics();
    std::cout << theme::section("Log capture");
    std::cout << theme::kv("active", std::to_string(logs.active_captures));
    std::cout << theme::kv("lines", std::to_string(logs.total_lines));
    if (!logs.hosts.empty()) std::cout << theme::kv("hosts", fmt::format("{}", fmt::join(logs.hosts, ", ")));
    std::cout << "\n";
}

static void do_config(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_service()) return;

    const Config& c = *cli.config;
    const auto& conn = c.connection();
    std::cout << theme::ok(fmt::format("Configuration {} is valid",
                                       c.source().empty() ? "(defaults)" : c.source().string()));
    std::cout << theme::section("Configuration");
    std::cout << theme::kv("hosts", std::to_string(c.hosts().size()));
    std::cout << theme::kv("user", conn.user);
    std::cout << theme::kv("auth", conn.key_file.empty() ? "password" : "key " + conn.key_file);
    std::cout << theme::kv("port", std::to_string(conn.port));
    std::cout << theme::kv("timeout", fmt::format("{}s", conn.timeout));
    std::cout << theme::kv("parallel", std::to_string(conn.max_parallel));
    std::cout << theme::kv("pool size", std::to_string(conn.connection_pool_size));
    std::cout << theme::kv("retries", fmt::format("{} (delay {}s)", conn.max_retries, conn.retry_delay));
    std::cout << theme::kv("jumphost", c.jumphost() ? c.jumphost()->host : "no");
    std::cout << theme::kv("log file", c.log_file().empty() ? "(default)" : c.log_file());
    std::cout << "\n";
}

static void do_reload(BaseCLI& cli, const std::vector<std::string>& args) {
    cli.reset_service();
    if (cli.require_service()) {
        std::cout << theme::ok(fmt::format("Reloaded, {} hosts", cli.config->hosts().size()));
    }
}

void register_hosts_commands(BaseCLI& cli) {
    cli.add_command("hosts", do_hosts, "List the configured hosts");
    cli.add_command("status", do_status, "Show pool and capture state");
    cli.add_command("config", do_config, "Validate and show the configuration");
    cli.add_command("reload", do_reload, "Reload the configuration");
}
