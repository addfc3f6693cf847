#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/transport.hpp>

// ── Channel ─────────────────────────────────────────────────

enum class ChannelState { Open, Busy, Closed };
enum class ChannelEvent { CommandSent, CommandDone, StreamLost, CloseRequested };

// Busy only follows Open; anything may close. Returns the state unchanged
// for events that do not apply.
ChannelState transition(ChannelState state, ChannelEvent event);

const char* to_string(ChannelState state);

// A persistent PTY shell on one connection. Commands run strictly one at a
// time and see the working directory and environment left by earlier ones.
class Channel {
public:
    explicit Channel(std::unique_ptr<ChannelStream> stream);
    ~Channel();

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Run one command wrapped in BEGIN/DONE markers. A timeout closes the
    // channel: the shell is left in an unknown state.
    SSHResult run(const std::string& command, int timeout_secs);

    ChannelState state() const;
    ChannelStream& stream() { return *stream_; }
    void close();

private:
    std::unique_ptr<ChannelStream> stream_;
    ChannelState state_ = ChannelState::Open;
    mutable std::mutex state_mutex_;
    std::mutex cmd_mutex_;

    void apply(ChannelEvent event);
    void drain();
};

// ── Interactive ─────────────────────────────────────────────

struct InteractiveStep {
    std::string command;
    std::vector<std::string> patterns;   // empty: send and advance
};

enum class InteractiveState { Ready, Waiting, Completed, TimedOut, Failed };
enum class InteractiveEvent { Sent, SentNoWait, Matched, Timeout, StreamLost };

const char* to_string(InteractiveState state);

// Ordered steps plus a cursor, driven by explicit events.
class InteractiveSession {
public:
    explicit InteractiveSession(std::vector<InteractiveStep> steps);

    InteractiveState state() const { return state_; }
    size_t cursor() const { return cursor_; }
    bool finished() const;
    const InteractiveStep& current() const { return steps_[cursor_]; }
    size_t size() const { return steps_.size(); }

    // Apply one event. Returns false if it is not valid in the current state.
    bool apply(InteractiveEvent event);

private:
    std::vector<InteractiveStep> steps_;
    size_t cursor_ = 0;
    InteractiveState state_ = InteractiveState::Ready;

    void advance();
};

// Parse "command|pattern1,pattern2" lines. Bare lines are send-only steps;
// blank lines and # comments are skipped.
Result<std::vector<InteractiveStep>> parse_interactive_script(const std::string& text);
Result<std::vector<InteractiveStep>> load_interactive_script(const std::string& path);

// ── ChannelManager ──────────────────────────────────────────

// Per-command results plus the first failure that stopped or marked the run.
struct SequenceResult {
    std::vector<CommandResult> commands;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::optional<int> exit_code;

    bool success() const { return error_kind == ErrorKind::None; }
};

struct ChainOptions {
    bool new_channel = false;   // fresh shell per command, nothing shared
    int timeout_secs = SSH_CMD_TIMEOUT_SECS;
};

class ChannelManager {
public:
    ChannelManager() = default;

    Result<std::unique_ptr<Channel>> open_channel(RemoteSession& session);

    // Run commands in order on one channel. A non-zero exit does not stop
    // the chain; a lost or timed-out channel does.
    SequenceResult chain_execute(Channel& channel, const std::vector<std::string>& commands,
                                 int timeout_secs);

    SequenceResult chain(RemoteSession& session, const std::vector<std::string>& commands,
                         const ChainOptions& options);

    // Send each step and wait for one of its patterns. Each step gets
    // max(1s, timeout / steps).
    SequenceResult run_interactive(RemoteSession& session, const std::vector<InteractiveStep>& steps,
                                   int timeout_secs);
};
