#pragma once

#include <memory>
#include <string>
#include <cstdint>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>

// Byte stream over one remote channel (PTY shell or direct-tcpip forward).
class ChannelStream {
public:
    virtual ~ChannelStream() = default;

    // Write everything or fail.
    virtual bool write(const std::string& data) = 0;

    // Wait up to wait_ms for data and append it to out.
    // Returns bytes read (>0), 0 if nothing arrived, -1 once the stream is closed.
    virtual int read(std::string& out, int wait_ms) = 0;

    virtual bool is_open() const = 0;
    virtual void close() = 0;
};

struct TransferOptions {
    std::size_t chunk_size = DEFAULT_TRANSFER_CHUNK;
    bool preserve_permissions = true;
};

// One authenticated session to one host.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    virtual const HostAddress& address() const = 0;

    // Run a command on a fresh exec channel and wait for it to exit.
    virtual SSHResult exec(const std::string& command, int timeout_secs = SSH_CMD_TIMEOUT_SECS) = 0;

    // Interactive shell with a PTY.
    virtual Result<std::unique_ptr<ChannelStream>> open_shell() = 0;

    // direct-tcpip stream to host:port as seen from this session's host.
    virtual Result<std::unique_ptr<ChannelStream>> open_forward(const std::string& host, int port) = 0;

    // SFTP. Both return the number of bytes moved.
    virtual Result<uint64_t> upload(const std::filesystem::path& local, const std::string& remote,
                                    const TransferOptions& opts) = 0;
    virtual Result<uint64_t> download(const std::string& remote, const std::filesystem::path& local,
                                      const TransferOptions& opts) = 0;

    // Cheap remote no-op. False means the session should be discarded.
    virtual bool ping() = 0;

    virtual bool is_active() const = 0;
    virtual void close() = 0;
};

// Factory for sessions. via, when set, is an open session to the jump host
// that the new session is tunneled through.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<std::unique_ptr<RemoteSession>> open(const HostAddress& address,
                                                        RemoteSession* via) = 0;
};
