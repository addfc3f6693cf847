#pragma once

#include <core/config.hpp>
#include "transport.hpp"
#include "ssh_session.hpp"

// Transport that opens libssh2 sessions configured from the connection and
// security sections of the config.
class Libssh2Transport : public Transport {
public:
    explicit Libssh2Transport(const SessionOptions& options);

    static SessionOptions options_from(const Config& config);

    Result<std::unique_ptr<RemoteSession>> open(const HostAddress& address,
                                                RemoteSession* via) override;

private:
    SessionOptions options_;
};
