#include "errors.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                      return "none";
        case ErrorKind::ConnectFailed:             return "connect_failed";
        case ErrorKind::AuthFailed:                return "auth_failed";
        case ErrorKind::PoolExhausted:             return "pool_exhausted";
        case ErrorKind::TimeoutExceeded:           return "timeout_exceeded";
        case ErrorKind::ChannelClosed:             return "channel_closed";
        case ErrorKind::CommandFailed:             return "command_failed";
        case ErrorKind::InteractivePatternTimeout: return "interactive_pattern_timeout";
        case ErrorKind::ProbeFailed:               return "probe_failed";
        case ErrorKind::TransferChecksumMismatch:  return "transfer_checksum_mismatch";
        case ErrorKind::ConfigInvalid:             return "config_invalid";
    }
    return "none";
}

ErrorKind error_kind_from_string(const std::string& name) {
    static const ErrorKind all[] = {
        ErrorKind::ConnectFailed, ErrorKind::AuthFailed, ErrorKind::PoolExhausted,
        ErrorKind::TimeoutExceeded, ErrorKind::ChannelClosed, ErrorKind::CommandFailed,
        ErrorKind::InteractivePatternTimeout, ErrorKind::ProbeFailed,
        ErrorKind::TransferChecksumMismatch, ErrorKind::ConfigInvalid,
    };
    for (auto kind : all) {
        if (name == to_string(kind)) return kind;
    }
    return ErrorKind::None;
}

bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::ConnectFailed ||
           kind == ErrorKind::TimeoutExceeded ||
           kind == ErrorKind::ChannelClosed;
}
