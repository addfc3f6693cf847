#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>
#include "errors.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err, ErrorKind kind = ErrorKind::CommandFailed) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err, ErrorKind kind = ErrorKind::CommandFailed) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote command execution result. kind is set when the command could not
// be run to completion (transport failure, timeout); a command that ran and
// exited non-zero keeps kind == None.
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;
    ErrorKind kind = ErrorKind::None;

    bool success() const { return exit_code == 0 && kind == ErrorKind::None; }
    bool failed() const { return !success(); }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Where and how to reach one host.
struct HostAddress {
    std::string host;
    int port = 22;
    std::string user;
    std::string password;
    std::string key_file;
    int timeout = 30;                                  // connect timeout, seconds
    std::shared_ptr<const HostAddress> jumphost;
    std::string label;                                 // result key, set by the executor

    // Pool identity: user@host:port
    std::string identity() const {
        return user + "@" + host + ":" + std::to_string(port);
    }

    const std::string& name() const { return label.empty() ? host : label; }
};

// One command of a chain or one interactive step.
struct CommandResult {
    std::string command;
    std::string output;
    std::string error;
    std::optional<int> exit_code;
    double duration = 0.0;
    bool success = false;
};

struct TransferRecord {
    std::string operation;          // "upload" or "download"
    std::string local_path;
    std::string remote_path;
    uint64_t size = 0;
    std::string checksum;
};

// Per-host outcome of any dispatched operation.
struct OperationResult {
    std::string host;
    std::string operation;
    bool success = false;
    std::string output;
    std::string error;
    ErrorKind error_kind = ErrorKind::None;
    std::optional<int> exit_code;
    double duration = 0.0;          // seconds, all attempts included
    int retry_count = 0;
    std::string timestamp;          // ISO 8601, when the operation finished
    std::vector<CommandResult> commands;
    std::optional<TransferRecord> transfer;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
