#include "ssh_transport.hpp"
#include <core/log.hpp>

Libssh2Transport::Libssh2Transport(const SessionOptions& options)
    : options_(options) {}

SessionOptions Libssh2Transport::options_from(const Config& config) {
    SessionOptions o;
    const auto& c = config.connection();
    const auto& s = config.security();
    o.banner_timeout = c.banner_timeout;
    o.keep_alive = c.keep_alive;
    o.compression = c.compression;
    o.host_key_verification = c.host_key_verification;
    o.strict_host_key_checking = s.strict_host_key_checking;
    o.known_hosts_file = s.known_hosts_file;
    o.key_types = s.key_types;
    o.cipher_preferences = s.cipher_preferences;
    return o;
}

Result<std::unique_ptr<RemoteSession>> Libssh2Transport::open(const HostAddress& address,
                                                              RemoteSession* via) {
    using R = Result<std::unique_ptr<RemoteSession>>;

    auto session = std::make_unique<Libssh2Session>(address, options_);
    auto rc = session->establish(via);
    if (rc.is_err()) {
        fleetrun_log(fmt::format("Transport: open {} failed ({}): {}", address.identity(),
                                 to_string(rc.kind), rc.error));
        return R::Err(rc.error, rc.kind);
    }
    return R::Ok(std::move(session));
}
