#include "base_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <managers/metrics_store.hpp>
#include <iostream>
#include <atomic>
#include <csignal>
#include <thread>
#include <chrono>
#include <fmt/format.h>
#include <algorithm>

// ── Argument helpers ────────────────────────────────────────

std::string ParsedArgs::get(const std::string& name, const std::string& fallback) const {
    auto it = options.find(name);
    return it == options.end() ? fallback : it->second;
}

std::vector<std::string> ParsedArgs::all(const std::string& name) const {
    std::vector<std::string> values;
    auto range = repeated.equal_range(name);
    for (auto it = range.first; it != range.second; ++it) values.push_back(it->second);
    return values;
}

ParsedArgs parse_args(const std::vector<std::string>& args,
                      const std::set<std::string>& valued,
                      const std::set<std::string>& flags,
                      bool stop_at_positional) {
    ParsedArgs parsed;
    bool options_done = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (options_done || arg.size() < 2 || arg[0] != '-') {
            parsed.positional.push_back(arg);
            if (stop_at_positional) options_done = true;
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        std::string name = arg;
        std::string value;
        bool inline_value = false;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
            inline_value = true;
        }

        if (valued.count(name)) {
            if (!inline_value) {
                if (i + 1 >= args.size()) {
                    parsed.error = "Missing value for " + name;
                    return parsed;
                }
                value = args[++i];
            }
            parsed.options[name] = value;
            parsed.repeated.emplace(name, value);
        } else if (flags.count(name) && !inline_value) {
            parsed.flags.insert(name);
        } else {
            parsed.error = "Unknown option: " + arg;
            return parsed;
        }
    }
    return parsed;
}

std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = 0;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else if (c == '\\' && quote == '"' && i + 1 < line.size()) {
                current += line[++i];
            } else {
                current += c;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
        } else if (c == '\\' && i + 1 < line.size()) {
            current += line[++i];
            in_word = true;
        } else if (c == ' ' || c == '\t') {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
        } else {
            current += c;
            in_word = true;
        }
    }
    if (in_word) words.push_back(current);
    return words;
}

// ── BaseCLI ─────────────────────────────────────────────────

BaseCLI::BaseCLI(GlobalOptions opts) : options(std::move(opts)) {}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_service() {
    if (service) return true;

    auto config_result = Config::load(options.config_path);
    if (config_result.is_err()) {
        std::cout << theme::fail(config_result.error);
        status_ = 2;
        return false;
    }

    Config loaded = config_result.value;
    loaded.apply(options.overrides);
    if (!options.hosts.empty()) loaded.set_hosts(options.hosts);

    auto valid = loaded.validate();
    if (valid.is_err()) {
        std::cout << theme::fail("Invalid configuration: " + valid.error);
        if (loaded.source().empty()) {
            std::cout << theme::step("No config file found. Create ./fleetrun.yaml or pass --config.");
        }
        status_ = 2;
        return false;
    }

    set_fleetrun_log_path(loaded.log_file());
    fleetrun_log(fmt::format("CLI: config {} with {} hosts",
                             loaded.source().empty() ? "<defaults>" : loaded.source().string(),
                             loaded.hosts().size()));

    config = loaded;
    service = std::make_unique<FleetService>(loaded, nullptr,
                                             std::make_unique<MetricsStore>());
    on_service_ready();
    return true;
}

void BaseCLI::reset_service() {
    if (service) service->shutdown();
    service.reset();
    config.reset();
}

void BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        status_ = 1;
        return;
    }

    status_ = 0;
    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        status_ = 1;
    }
}

void BaseCLI::print_help() const {
    static const std::vector<std::pair<const char*, std::vector<const char*>>> groups = {
        {"Remote",  {"exec", "chain", "interactive"}},
        {"Files",   {"upload", "download", "tail", "logs"}},
        {"Traffic", {"traffic", "iperf"}},
        {"Metrics", {"metrics", "export"}},
        {"Fleet",   {"hosts", "status", "config", "reload"}},
        {"General", {"help", "clear", "quit", "exit"}},
    };

    size_t width = 0;
    for (const auto& entry : commands_) width = std::max(width, entry.first.size());

    for (const auto& group : groups) {
        std::string rows;
        for (const char* name : group.second) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;
            rows += fmt::format("    {}{:<{}}{}  {}\n", theme::color::TEAL, name, width,
                                theme::color::RESET, theme::dim(it->second.second));
        }
        if (rows.empty()) continue;
        std::cout << "\n" << theme::color::AMBER << theme::color::BOLD << "  " << group.first
                  << theme::color::RESET << "\n" << rows;
    }
    std::cout << "\n";
}

// "fleetrun[3]> ", or "fleetrun> " before a config is loaded. Escapes are
// wrapped in \001/\002 so readline leaves them out of the prompt width.
std::string BaseCLI::get_prompt_string() const {
    auto invisible = [](const std::string& esc) {
        return esc.empty() ? esc : "\001" + esc + "\002";
    };
    std::string prompt = invisible(theme::color::AMBER) + "fleetrun" + invisible(theme::color::RESET);
    if (config) {
        prompt += invisible(theme::color::TEAL) + "[" + std::to_string(config->hosts().size()) + "]"
                + invisible(theme::color::RESET);
    }
    return prompt + "> ";
}

// ── InterruptWatch ──────────────────────────────────────────

namespace {
volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void on_sigint(int) {
    g_interrupted = 1;
}
} // namespace

struct InterruptWatch::Impl {
    std::function<void()> on_interrupt;
    struct sigaction previous {};
    std::atomic<bool> done{false};
    std::atomic<bool> fired{false};
    std::thread watcher;
};

InterruptWatch::InterruptWatch(std::function<void()> on_interrupt)
    : impl_(std::make_unique<Impl>()) {
    impl_->on_interrupt = std::move(on_interrupt);
    g_interrupted = 0;

    struct sigaction sa {};
    sa.sa_handler = on_sigint;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, &impl_->previous);

    Impl* impl = impl_.get();
    impl_->watcher = std::thread([impl]() {
        while (!impl->done) {
            if (g_interrupted && !impl->fired) {
                impl->fired = true;
                fleetrun_log("CLI: interrupted");
                if (impl->on_interrupt) impl->on_interrupt();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });
}

InterruptWatch::~InterruptWatch() {
    impl_->done = true;
    if (impl_->watcher.joinable()) impl_->watcher.join();
    sigaction(SIGINT, &impl_->previous, nullptr);
    g_interrupted = 0;
}

bool InterruptWatch::interrupted() const {
    return impl_->fired;
}
