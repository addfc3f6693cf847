#include "channel_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <ssh/expect.hpp>
#include <ssh/marker_protocol.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>

using Clock = std::chrono::steady_clock;

static double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

// ── Channel state machine ───────────────────────────────────

ChannelState transition(ChannelState state, ChannelEvent event) {
    switch (event) {
    case ChannelEvent::CommandSent:
        return state == ChannelState::Open ? ChannelState::Busy : state;
    case ChannelEvent::CommandDone:
        return state == ChannelState::Busy ? ChannelState::Open : state;
    case ChannelEvent::StreamLost:
    case ChannelEvent::CloseRequested:
        return ChannelState::Closed;
    }
    return state;
}

const char* to_string(ChannelState state) {
    switch (state) {
    case ChannelState::Open:   return "open";
    case ChannelState::Busy:   return "busy";
    case ChannelState::Closed: return "closed";
    }
    return "unknown";
}

Channel::Channel(std::unique_ptr<ChannelStream> stream)
    : stream_(std::move(stream)) {}

Channel::~Channel() {
    close();
}

ChannelState Channel::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void Channel::apply(ChannelEvent event) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = transition(state_, event);
}

void Channel::close() {
    apply(ChannelEvent::CloseRequested);
    if (stream_) stream_->close();
}

void Channel::drain() {
    std::string stale;
    while (stream_->read(stale, 0) > 0) stale.clear();
}

SSHResult Channel::run(const std::string& command, int timeout_secs) {
    std::lock_guard<std::mutex> cmd_lock(cmd_mutex_);

    if (state() != ChannelState::Open) {
        return SSHResult{-1, "", "Channel is closed", ErrorKind::ChannelClosed};
    }
    apply(ChannelEvent::CommandSent);

    // Drain any stale data sitting in the channel buffer
    drain();

    if (!stream_->write(build_marker_command(command))) {
        apply(ChannelEvent::StreamLost);
        return SSHResult{-1, "", "Failed to send command (channel write error)", ErrorKind::ChannelClosed};
    }

    std::string raw;
    int effective_timeout = (timeout_secs > 0) ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = Clock::now() + std::chrono::seconds(effective_timeout);

    while (!marker_complete(raw)) {
        auto now = Clock::now();
        if (now >= deadline) {
            fleetrun_log(fmt::format("Channel: '{}' timed out after {}s, closing", command, effective_timeout));
            close();
            return SSHResult{-1, raw, fmt::format("Command timed out after {}s", effective_timeout),
                             ErrorKind::TimeoutExceeded};
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int n = stream_->read(raw, static_cast<int>(std::min<long long>(remaining, 50)));
        if (n < 0 && !marker_complete(raw)) {
            apply(ChannelEvent::StreamLost);
            fleetrun_log(fmt::format("Channel: stream lost during '{}'", command));
            return SSHResult{-1, raw, "Channel closed by remote", ErrorKind::ChannelClosed};
        }
    }

    auto parsed = parse_marker_output(raw);
    apply(ChannelEvent::CommandDone);
    return SSHResult{parsed.exit_code, parsed.output, ""};
}

// ── Interactive state machine ───────────────────────────────

const char* to_string(InteractiveState state) {
    switch (state) {
    case InteractiveState::Ready:     return "ready";
    case InteractiveState::Waiting:   return "waiting";
    case InteractiveState::Completed: return "completed";
    case InteractiveState::TimedOut:  return "timed_out";
    case InteractiveState::Failed:    return "failed";
    }
    return "unknown";
}

InteractiveSession::InteractiveSession(std::vector<InteractiveStep> steps)
    : steps_(std::move(steps)) {
    if (steps_.empty()) state_ = InteractiveState::Completed;
}

bool InteractiveSession::finished() const {
    return state_ == InteractiveState::Completed || state_ == InteractiveState::TimedOut ||
           state_ == InteractiveState::Failed;
}

void InteractiveSession::advance() {
    std::string cmd = steps_[cursor_].command;
    trim(cmd);
    cursor_++;
    if (cmd == "exit" || cursor_ >= steps_.size()) {
        state_ = InteractiveState::Completed;
    } else {
        state_ = InteractiveState::Ready;
    }
}

bool InteractiveSession::apply(InteractiveEvent event) {
    if (finished()) return false;

    switch (event) {
    case InteractiveEvent::Sent:
        if (state_ != InteractiveState::Ready) return false;
        state_ = InteractiveState::Waiting;
        return true;
    case InteractiveEvent::SentNoWait:
        if (state_ != InteractiveState::Ready) return false;
        advance();
        return true;
    case InteractiveEvent::Matched:
        if (state_ != InteractiveState::Waiting) return false;
        advance();
        return true;
    case InteractiveEvent::Timeout:
        if (state_ != InteractiveState::Waiting) return false;
        state_ = InteractiveState::TimedOut;
        return true;
    case InteractiveEvent::StreamLost:
        state_ = InteractiveState::Failed;
        return true;
    }
    return false;
}

Result<std::vector<InteractiveStep>> parse_interactive_script(const std::string& text) {
    std::vector<InteractiveStep> steps;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto bar = line.find('|');
        InteractiveStep step;
        if (bar == std::string::npos) {
            step.command = line;
        } else {
            step.command = line.substr(0, bar);
            trim(step.command);
            std::string rest = line.substr(bar + 1);
            // Only the first field after the command holds patterns
            auto next_bar = rest.find('|');
            if (next_bar != std::string::npos) rest = rest.substr(0, next_bar);
            step.patterns = split_list(rest, ',');
        }
        steps.push_back(std::move(step));
    }

    if (steps.empty()) {
        return Result<std::vector<InteractiveStep>>::Err("No valid commands found",
                                                         ErrorKind::ConfigInvalid);
    }
    return Result<std::vector<InteractiveStep>>::Ok(std::move(steps));
}

Result<std::vector<InteractiveStep>> load_interactive_script(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<std::vector<InteractiveStep>>::Err("Cannot read commands file: " + path,
                                                         ErrorKind::ConfigInvalid);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse_interactive_script(ss.str());
}

// ── ChannelManager ──────────────────────────────────────────

Result<std::unique_ptr<Channel>> ChannelManager::open_channel(RemoteSession& session) {
    using R = Result<std::unique_ptr<Channel>>;

    auto shell = session.open_shell();
    if (shell.is_err()) return R::Err(shell.error, shell.kind);

    auto channel = std::make_unique<Channel>(std::move(shell.value));

    // Wait until the shell answers before handing the channel out
    auto sync = channel->run("true", SSH_OPEN_TIMEOUT_SECS);
    if (sync.kind != ErrorKind::None) {
        return R::Err("Shell did not become ready: " + sync.stderr_data, ErrorKind::ChannelClosed);
    }
    return R::Ok(std::move(channel));
}

SequenceResult ChannelManager::chain_execute(Channel& channel,
                                             const std::vector<std::string>& commands,
                                             int timeout_secs) {
    SequenceResult seq;
    for (size_t i = 0; i < commands.size(); i++) {
        const auto& cmd = commands[i];
        auto start = Clock::now();
        auto r = channel.run(cmd, timeout_secs);

        CommandResult c;
        c.command = cmd;
        c.output = r.stdout_data;
        c.error = r.stderr_data;
        c.duration = seconds_since(start);
        c.success = r.success();

        if (r.kind != ErrorKind::None) {
            seq.commands.push_back(std::move(c));
            seq.error_kind = r.kind;
            seq.error = r.stderr_data;
            seq.exit_code.reset();
            break;
        }

        c.exit_code = r.exit_code;
        if (r.exit_code != 0 && seq.error_kind == ErrorKind::None) {
            seq.error_kind = ErrorKind::CommandFailed;
            seq.exit_code = r.exit_code;
            seq.error = fmt::format("'{}' exited with {}", cmd, r.exit_code);
        }
        seq.commands.push_back(std::move(c));

        if (i + 1 < commands.size()) platform::sleep_ms(SHELL_SETTLE_MS);
    }
    return seq;
}

SequenceResult ChannelManager::chain(RemoteSession& session, const std::vector<std::string>& commands,
                                     const ChainOptions& options) {
    if (!options.new_channel) {
        SequenceResult seq;
        auto channel = open_channel(session);
        if (channel.is_err()) {
            seq.error_kind = channel.kind;
            seq.error = channel.error;
            return seq;
        }
        return chain_execute(*channel.value, commands, options.timeout_secs);
    }

    // One throwaway shell per command
    SequenceResult seq;
    for (size_t i = 0; i < commands.size(); i++) {
        auto channel = open_channel(session);
        if (channel.is_err()) {
            seq.error_kind = channel.kind;
            seq.error = channel.error;
            break;
        }
        auto one = chain_execute(*channel.value, {commands[i]}, options.timeout_secs);
        for (auto& c : one.commands) seq.commands.push_back(std::move(c));
        if (one.error_kind != ErrorKind::None &&
            (seq.error_kind == ErrorKind::None || one.error_kind != ErrorKind::CommandFailed)) {
            seq.error_kind = one.error_kind;
            seq.error = one.error;
            seq.exit_code = one.exit_code;
        }
        if (one.error_kind != ErrorKind::None && one.error_kind != ErrorKind::CommandFailed) break;
        if (i + 1 < commands.size()) platform::sleep_ms(SHELL_SETTLE_MS);
    }
    return seq;
}

SequenceResult ChannelManager::run_interactive(RemoteSession& session,
                                               const std::vector<InteractiveStep>& steps,
                                               int timeout_secs) {
    SequenceResult seq;
    if (steps.empty()) return seq;

    auto shell = session.open_shell();
    if (shell.is_err()) {
        seq.error_kind = shell.kind;
        seq.error = shell.error;
        return seq;
    }
    Channel channel(std::move(shell.value));
    ChannelStream& stream = channel.stream();

    auto step_timeout = std::max(std::chrono::milliseconds(1000),
                                 std::chrono::milliseconds(static_cast<long long>(timeout_secs) * 1000 /
                                                           static_cast<long long>(steps.size())));

    InteractiveSession isess(steps);
    ExpectMatcher matcher;

    while (!isess.finished()) {
        const InteractiveStep& step = isess.current();
        auto start = Clock::now();

        CommandResult c;
        c.command = step.command;

        // Drop output that belongs to earlier steps
        std::string stale;
        while (stream.read(stale, 0) > 0) stale.clear();
        matcher.reset();

        if (!stream.write(step.command + "\n")) {
            isess.apply(InteractiveEvent::StreamLost);
            c.error = "Channel closed by remote";
            c.duration = seconds_since(start);
            seq.commands.push_back(std::move(c));
            seq.error_kind = ErrorKind::ChannelClosed;
            seq.error = "Channel closed while sending '" + step.command + "'";
            break;
        }

        std::string bare = step.command;
        trim(bare);
        if (step.patterns.empty() || bare == "exit") {
            isess.apply(InteractiveEvent::SentNoWait);
            c.success = true;
            c.duration = seconds_since(start);
            seq.commands.push_back(std::move(c));
            continue;
        }

        isess.apply(InteractiveEvent::Sent);
        std::vector<Pattern> patterns(step.patterns.begin(), step.patterns.end());
        auto m = matcher.expect(stream, patterns, step_timeout);
        c.duration = seconds_since(start);

        if (m.status == ExpectStatus::Matched) {
            isess.apply(InteractiveEvent::Matched);
            c.output = m.before + m.match;
            c.success = true;
            seq.commands.push_back(std::move(c));
        } else if (m.status == ExpectStatus::StreamLost) {
            isess.apply(InteractiveEvent::StreamLost);
            c.output = m.before;
            c.error = "Channel closed by remote";
            seq.commands.push_back(std::move(c));
            seq.error_kind = ErrorKind::ChannelClosed;
            seq.error = "Channel closed while waiting on '" + step.command + "'";
        } else {
            isess.apply(InteractiveEvent::Timeout);
            c.output = m.before;
            c.error = fmt::format("No pattern matched within {}ms", step_timeout.count());
            seq.commands.push_back(std::move(c));
            seq.error_kind = ErrorKind::InteractivePatternTimeout;
            seq.error = fmt::format("'{}': expected one of [{}]", step.command,
                                    fmt::join(step.patterns, ", "));
        }
    }

    fleetrun_log(fmt::format("Interactive {}: {} after {}/{} steps", session.address().identity(),
                             to_string(isess.state()), seq.commands.size(), steps.size()));
    return seq;
}
