#pragma once

// Scripted stand-in for the libssh2 transport. Each host has a small fake
// shell that understands the BEGIN/DONE marker wrapping, cd/pwd, echo,
// prompts for interactive steps, and the stat/tail commands the log
// capture issues.

#include <ssh/transport.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

struct FakeFile {
    uint64_t inode = 1;
    std::string content;
};

struct FakeHost {
    int connect_failures = 0;                       // first N opens fail
    ErrorKind connect_error = ErrorKind::ConnectFailed;
    bool ping_ok = true;
    bool shell_fails = false;                       // open_shell errors
    int disconnect_after = -1;                      // shell dies after N marker commands
    int exec_delay_ms = 0;
    std::string whoami = "tester";

    // Interactive: a line containing the key is answered with the value.
    std::map<std::string, std::string> prompts;

    // Commands run by exec() that return a fixed result.
    std::map<std::string, SSHResult> exec_results;

    // Any exec() command containing the key returns the value.
    std::map<std::string, SSHResult> exec_containing;
};

// Shared state behind every fake session: host scripts, remote files and
// counters the tests assert on.
class FakeWorld {
public:
    FakeHost& host(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex);
        return hosts[name];
    }

    void set_file(const std::string& path, const std::string& content, uint64_t inode = 1) {
        std::lock_guard<std::mutex> lock(mutex);
        files[path] = FakeFile{inode, content};
    }

    void append_file(const std::string& path, const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex);
        files[path].content += text;
    }

    std::string file(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = files.find(path);
        return it == files.end() ? "" : it->second.content;
    }

    void exec_started() {
        int now = ++active_execs;
        int seen = max_active_execs.load();
        while (now > seen && !max_active_execs.compare_exchange_weak(seen, now)) {}
    }

    std::mutex mutex;
    std::map<std::string, FakeHost> hosts;
    std::map<std::string, FakeFile> files;          // shared by all hosts

    std::atomic<int> opens{0};
    std::atomic<int> failed_opens{0};
    std::atomic<int> closes{0};
    std::atomic<int> shells{0};
    std::atomic<int> pings{0};
    std::atomic<int> active_execs{0};
    std::atomic<int> max_active_execs{0};
    std::map<std::string, int> open_attempts;       // by host, under mutex
    std::vector<std::string> exec_commands;         // every exec(), under mutex
};

// Marker command as written by build_marker_command(); returns the inner
// command, or false for a raw interactive line.
inline bool unwrap_marker_command(const std::string& data, std::string& cmd) {
    const std::string prefix = "echo __FLEETRUN_BEG''IN__; ";
    const std::string suffix_inline = "; echo __FLEETRUN_DO''NE__ $?\n";
    const std::string suffix_multi = "\necho __FLEETRUN_DO''NE__ $?\n";
    if (data.rfind(prefix, 0) != 0) return false;
    std::string rest = data.substr(prefix.size());
    for (const auto& suffix : {suffix_inline, suffix_multi}) {
        if (rest.size() >= suffix.size() &&
            rest.compare(rest.size() - suffix.size(), suffix.size(), suffix) == 0) {
            cmd = rest.substr(0, rest.size() - suffix.size());
            return true;
        }
    }
    return false;
}

// Tiny shell: enough to observe state carried between commands.
struct FakeShellState {
    std::string cwd = "/home/tester";
    std::string user = "tester";

    // Returns output and sets exit_code. A negative delay_ms hangs forever.
    std::string run(const std::string& cmd, int& exit_code, int& delay_ms) {
        exit_code = 0;
        delay_ms = 0;
        std::string c = cmd;
        trim(c);
        if (c == "true" || c.empty()) return "";
        if (c == "false") {
            exit_code = 1;
            return "";
        }
        if (c == "pwd") return cwd + "\n";
        if (c == "whoami") return user + "\n";
        if (c.rfind("cd ", 0) == 0) {
            std::string dir = c.substr(3);
            trim(dir);
            if (dir == "/nonexistent") {
                exit_code = 1;
                return "cd: " + dir + ": No such file or directory\n";
            }
            cwd = dir.empty() || dir[0] == '/' ? dir : cwd + "/" + dir;
            return "";
        }
        if (c.rfind("sudo su", 0) == 0 || c.rfind("su ", 0) == 0) {
            user = "root";
            return "";
        }
        if (c.rfind("echo ", 0) == 0) return c.substr(5) + "\n";
        if (c.rfind("exit ", 0) == 0) {
            exit_code = safe_stoi(c.substr(5), 1);
            return "";
        }
        if (c.rfind("sleep ", 0) == 0) {
            delay_ms = -1;
            return "";
        }
        exit_code = 127;
        return c + ": command not found\n";
    }
};

class FakeShellStream : public ChannelStream {
public:
    FakeShellStream(FakeWorld& world, FakeHost host) : world_(world), host_(std::move(host)) {
        state_.user = host_.whoami;
    }

    bool write(const std::string& data) override {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) return false;

        std::string cmd;
        if (unwrap_marker_command(data, cmd)) {
            commands_++;
            if (host_.disconnect_after >= 0 && commands_ > host_.disconnect_after) {
                closed_ = true;
                cv_.notify_all();
                return true;
            }
            int code = 0, delay = 0;
            std::string out = state_.run(cmd, code, delay);
            if (delay < 0) return true;     // never answers
            buffer_ += "__FLEETRUN_BEGIN__\r\n" + out + "__FLEETRUN_DONE__ " + std::to_string(code) + "\r\n";
        } else {
            // Interactive line: echo it, then any scripted reply.
            std::string line = data;
            trim(line);
            buffer_ += line + "\r\n";
            for (const auto& [needle, reply] : host_.prompts) {
                if (line.find(needle) != std::string::npos) buffer_ += reply;
            }
        }
        cv_.notify_all();
        return true;
    }

    int read(std::string& out, int wait_ms) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(std::max(wait_ms, 0)),
                     [&] { return !buffer_.empty() || closed_; });
        if (!buffer_.empty()) {
            int n = static_cast<int>(buffer_.size());
            out += buffer_;
            buffer_.clear();
            return n;
        }
        return closed_ ? -1 : 0;
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return !closed_;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

private:
    FakeWorld& world_;
    FakeHost host_;
    FakeShellState state_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::string buffer_;
    bool closed_ = false;
    int commands_ = 0;
};

class FakeSession : public RemoteSession {
public:
    FakeSession(FakeWorld& world, HostAddress address) : world_(world), address_(std::move(address)) {}

    const HostAddress& address() const override { return address_; }

    SSHResult exec(const std::string& command, int timeout_secs) override {
        if (!active_) return SSHResult{-1, "", "Session closed", ErrorKind::ChannelClosed};
        FakeHost host = world_.host(address_.host);

        world_.exec_started();
        {
            std::lock_guard<std::mutex> lock(world_.mutex);
            world_.exec_commands.push_back(command);
        }
        if (host.exec_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(host.exec_delay_ms));
        }
        SSHResult r = run_exec(host, command);
        world_.active_execs--;
        return r;
    }

    Result<std::unique_ptr<ChannelStream>> open_shell() override {
        using R = Result<std::unique_ptr<ChannelStream>>;
        FakeHost host = world_.host(address_.host);
        if (!active_ || host.shell_fails) return R::Err("Failed to open shell", ErrorKind::ChannelClosed);
        world_.shells++;
        return R::Ok(std::make_unique<FakeShellStream>(world_, host));
    }

    Result<std::unique_ptr<ChannelStream>> open_forward(const std::string& host, int port) override {
        return Result<std::unique_ptr<ChannelStream>>::Err("Forwarding not scripted",
                                                           ErrorKind::ConnectFailed);
    }

    Result<uint64_t> upload(const std::filesystem::path& local, const std::string& remote,
                            const TransferOptions& opts) override {
        std::ifstream in(local, std::ios::binary);
        if (!in) return Result<uint64_t>::Err("Cannot open " + local.string(), ErrorKind::CommandFailed);
        std::stringstream ss;
        ss << in.rdbuf();
        world_.set_file(remote, ss.str());
        return Result<uint64_t>::Ok(ss.str().size());
    }

    Result<uint64_t> download(const std::string& remote, const std::filesystem::path& local,
                              const TransferOptions& opts) override {
        std::string content;
        {
            std::lock_guard<std::mutex> lock(world_.mutex);
            auto it = world_.files.find(remote);
            if (it == world_.files.end()) {
                return Result<uint64_t>::Err("No such file: " + remote, ErrorKind::CommandFailed);
            }
            content = it->second.content;
        }
        std::ofstream out(local, std::ios::binary);
        out << content;
        return Result<uint64_t>::Ok(content.size());
    }

    bool ping() override {
        world_.pings++;
        return active_ && world_.host(address_.host).ping_ok;
    }

    bool is_active() const override { return active_; }

    void close() override {
        if (active_.exchange(false)) world_.closes++;
    }

private:
    FakeWorld& world_;
    HostAddress address_;
    std::atomic<bool> active_{true};

    // The n-th single-quoted word of a command (0-based).
    static std::string quoted_word(const std::string& cmd, int n) {
        size_t pos = 0;
        for (int i = 0; ; i++) {
            auto a = cmd.find('\'', pos);
            if (a == std::string::npos) return "";
            auto b = cmd.find('\'', a + 1);
            if (b == std::string::npos) return "";
            if (i == n) return cmd.substr(a + 1, b - a - 1);
            pos = b + 1;
        }
    }

    SSHResult run_exec(const FakeHost& host, const std::string& command) {
        auto fixed = host.exec_results.find(command);
        if (fixed != host.exec_results.end()) return fixed->second;
        for (const auto& [needle, result] : host.exec_containing) {
            if (command.find(needle) != std::string::npos) return result;
        }

        if (command.rfind("stat -L -c ", 0) == 0) {
            std::lock_guard<std::mutex> lock(world_.mutex);
            auto it = world_.files.find(quoted_word(command, 1));
            if (it == world_.files.end()) return SSHResult{1, "", ""};
            return SSHResult{0, std::to_string(it->second.inode) + " " +
                                    std::to_string(it->second.content.size()) + "\n", ""};
        }

        if (command.rfind("tail -c +", 0) == 0) {
            uint64_t from = static_cast<uint64_t>(safe_stoi(command.substr(9), 1));
            auto head = command.find("head -c ");
            uint64_t len = head == std::string::npos ? 0 : static_cast<uint64_t>(safe_stoi(command.substr(head + 8)));
            std::lock_guard<std::mutex> lock(world_.mutex);
            auto it = world_.files.find(quoted_word(command, 0));
            if (it == world_.files.end()) return SSHResult{1, "", ""};
            const std::string& content = it->second.content;
            if (from - 1 >= content.size()) return SSHResult{0, "", ""};
            return SSHResult{0, content.substr(from - 1, len), ""};
        }

        if (command.rfind("md5sum ", 0) == 0) {
            return SSHResult{1, "", "md5sum not scripted"};
        }

        FakeShellState shell;
        shell.user = host.whoami;
        int code = 0, delay = 0;
        std::string out = shell.run(command, code, delay);
        return SSHResult{code, out, ""};
    }
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(FakeWorld& world) : world_(world) {}

    Result<std::unique_ptr<RemoteSession>> open(const HostAddress& address, RemoteSession* via) override {
        using R = Result<std::unique_ptr<RemoteSession>>;
        {
            std::lock_guard<std::mutex> lock(world_.mutex);
            int attempt = world_.open_attempts[address.host]++;
            const FakeHost& host = world_.hosts[address.host];
            if (attempt < host.connect_failures) {
                world_.failed_opens++;
                return R::Err("Connection refused by " + address.host, host.connect_error);
            }
        }
        world_.opens++;
        last_via = via;
        return R::Ok(std::make_unique<FakeSession>(world_, address));
    }

    std::atomic<RemoteSession*> last_via{nullptr};

private:
    FakeWorld& world_;
};

// Config with hosts h1..hN, password auth and fast retries.
inline std::string fake_config_yaml(int hosts, int max_retries = 2) {
    std::string yaml = "hosts:\n";
    for (int i = 1; i <= hosts; i++) yaml += "  - h" + std::to_string(i) + "\n";
    yaml += "user: tester\npassword: secret\ntimeout: 2\nmax_retries: " + std::to_string(max_retries) +
            "\nretry_delay: 0.01\nfile_transfer:\n  verify_checksum: false\n";
    return yaml;
}
