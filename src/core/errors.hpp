#pragma once

#include <string>

// Failure taxonomy shared by every module. Per-host failures carry one of
// these in their result; nothing here is thrown.
enum class ErrorKind {
    None,
    ConnectFailed,
    AuthFailed,
    PoolExhausted,
    TimeoutExceeded,
    ChannelClosed,
    CommandFailed,
    InteractivePatternTimeout,
    ProbeFailed,
    TransferChecksumMismatch,
    ConfigInvalid,
};

// Stable snake_case name used in logs and exports.
const char* to_string(ErrorKind kind);

// Parse the name produced by to_string(). Unknown names map to None.
ErrorKind error_kind_from_string(const std::string& name);

// Kinds worth another attempt: the remote side may recover on its own.
bool is_retryable(ErrorKind kind);
