#include "ssh_session.hpp"
#include "libssh2_channel.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <cstring>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;

namespace {

std::once_flag g_libssh2_init;

void init_libssh2() {
    std::call_once(g_libssh2_init, [] {
        libssh2_init(0);
    });
}

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += ",";
        out += p;
    }
    return out;
}

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// Every prompt gets the password.
void kbd_callback(const char* /*name*/, int /*name_len*/,
                  const char* /*instruction*/, int /*instruction_len*/,
                  int num_prompts,
                  const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                  void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

} // namespace

Libssh2Session::Libssh2Session(const HostAddress& address, const SessionOptions& options)
    : address_(address), options_(options), io_mutex_(std::make_shared<std::mutex>()) {
}

Libssh2Session::~Libssh2Session() {
    close();
}

// ── Helpers ──────────────────────────────────────────────────

std::string Libssh2Session::last_error() {
    if (!session_) return "no session";
    char* msg = nullptr;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    libssh2_session_last_error(session_, &msg, nullptr, 0);
    return msg ? msg : "unknown error";
}

void Libssh2Session::wait_socket(int timeout_ms) {
    int dir;
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        dir = libssh2_session_block_directions(session_);
    }
    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;
    platform::poll_socket(sock_, events, timeout_ms);
}

template <typename Fn>
int Libssh2Session::call_rc(Fn fn, Clock::time_point deadline) {
    int rc;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = fn();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (Clock::now() >= deadline) return LIBSSH2_ERROR_TIMEOUT;
        wait_socket(10);
    }
}

template <typename Fn>
auto Libssh2Session::call_ptr(Fn fn, Clock::time_point deadline) -> decltype(fn()) {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            auto p = fn();
            if (p) return p;
            if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) return nullptr;
        }
        if (Clock::now() >= deadline) return nullptr;
        wait_socket(10);
    }
}

// ── Establish ────────────────────────────────────────────────

Result<void> Libssh2Session::establish(RemoteSession* via) {
    init_libssh2();
    fleetrun_log(fmt::format("Session {}: connecting{}", address_.identity(),
                             via ? " via " + via->address().identity() : ""));

    auto sock_result = open_socket(via);
    if (sock_result.is_err()) return sock_result;

    auto hs = handshake();
    if (hs.is_err()) {
        close();
        return hs;
    }

    if (options_.host_key_verification) {
        auto hk = verify_host_key();
        if (hk.is_err()) {
            close();
            return hk;
        }
    }

    auto auth = authenticate();
    if (auth.is_err()) {
        close();
        return auth;
    }

    libssh2_keepalive_config(session_, 1, static_cast<unsigned>(options_.keep_alive));
    active_ = true;
    fleetrun_log(fmt::format("Session {}: established", address_.identity()));
    return Result<void>::Ok();
}

Result<void> Libssh2Session::open_socket(RemoteSession* via) {
    if (via) {
        auto fwd = via->open_forward(address_.host, address_.port);
        if (fwd.is_err()) {
            return Result<void>::Err(fmt::format("Tunnel to {}:{} failed: {}",
                                                 address_.host, address_.port, fwd.error),
                                     ErrorKind::ConnectFailed);
        }
        pump_ = std::make_unique<TunnelPump>(std::move(fwd.value));
        std::string err;
        if (!pump_->start(err)) {
            pump_.reset();
            return Result<void>::Err(err, ErrorKind::ConnectFailed);
        }
        sock_ = pump_->inner_socket();
        owns_socket_ = false;
        platform::set_nonblocking(sock_);
        return Result<void>::Ok();
    }

    auto dialed = platform::connect_socket(address_.host, address_.port,
                                           platform::SocketKind::Stream, address_.timeout * 1000);
    if (!dialed.connected()) {
        return Result<void>::Err(dialed.error, dialed.status == platform::ConnectStatus::TimedOut
                                                   ? ErrorKind::TimeoutExceeded
                                                   : ErrorKind::ConnectFailed);
    }
    sock_ = dialed.fd;
    owns_socket_ = true;
    platform::enable_tcp_keepalive(sock_);
    return Result<void>::Ok();
}

Result<void> Libssh2Session::handshake() {
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return Result<void>::Err("Failed to create SSH session", ErrorKind::ConnectFailed);
    }
    libssh2_session_set_blocking(session_, 0);

    if (options_.compression) {
        libssh2_session_flag(session_, LIBSSH2_FLAG_COMPRESS, 1);
    }
    if (!options_.key_types.empty()) {
        std::string prefs = join(options_.key_types);
        if (libssh2_session_method_pref(session_, LIBSSH2_METHOD_HOSTKEY, prefs.c_str()) != 0)
            fleetrun_log("Session: host key preference not supported: " + prefs);
    }
    if (!options_.cipher_preferences.empty()) {
        std::string prefs = join(options_.cipher_preferences);
        if (libssh2_session_method_pref(session_, LIBSSH2_METHOD_CRYPT_CS, prefs.c_str()) != 0 ||
            libssh2_session_method_pref(session_, LIBSSH2_METHOD_CRYPT_SC, prefs.c_str()) != 0)
            fleetrun_log("Session: cipher preference not supported: " + prefs);
    }

    auto deadline = Clock::now() + std::chrono::seconds(options_.banner_timeout);
    int rc = call_rc([&] { return libssh2_session_handshake(session_, sock_); }, deadline);
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        return Result<void>::Err("SSH handshake timed out: " + address_.host,
                                 ErrorKind::TimeoutExceeded);
    }
    if (rc != 0) {
        return Result<void>::Err("SSH handshake failed: " + last_error(), ErrorKind::ConnectFailed);
    }
    return Result<void>::Ok();
}

Result<void> Libssh2Session::verify_host_key() {
    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session_, &key_len, &key_type);
    if (!key) {
        return Result<void>::Err("Server sent no host key", ErrorKind::AuthFailed);
    }

    LIBSSH2_KNOWNHOSTS* known = libssh2_knownhost_init(session_);
    if (!known) {
        return Result<void>::Err("Failed to initialize known hosts", ErrorKind::AuthFailed);
    }

    std::string path = expand_home(options_.known_hosts_file);
    if (libssh2_knownhost_readfile(known, path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        fleetrun_log("Session: cannot read known hosts file " + path);
    }

    struct libssh2_knownhost* entry = nullptr;
    int check = libssh2_knownhost_checkp(known, address_.host.c_str(), address_.port,
                                         key, key_len,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW,
                                         &entry);
    libssh2_knownhost_free(known);

    switch (check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
        return Result<void>::Ok();
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
        return Result<void>::Err("Host key mismatch for " + address_.host, ErrorKind::AuthFailed);
    default:
        if (options_.strict_host_key_checking) {
            return Result<void>::Err("Host key not known for " + address_.host + " (" + path + ")",
                                     ErrorKind::AuthFailed);
        }
        fleetrun_log("Session: accepting unknown host key for " + address_.host);
        return Result<void>::Ok();
    }
}

Result<void> Libssh2Session::authenticate() {
    auto deadline = Clock::now() + std::chrono::seconds(address_.timeout);
    const std::string& user = address_.user;

    char* auth_list = call_ptr([&] {
        return libssh2_userauth_list(session_, user.c_str(), static_cast<unsigned>(user.length()));
    }, deadline);
    std::string methods = auth_list ? auth_list : "";
    fleetrun_log(fmt::format("Session {}: auth methods '{}'", address_.identity(), methods));

    if (!address_.key_file.empty() &&
        (methods.empty() || methods.find("publickey") != std::string::npos)) {
        std::string pub = address_.key_file + ".pub";
        bool have_pub = fs::exists(pub);
        const char* passphrase = address_.password.empty() ? nullptr : address_.password.c_str();
        int rc = call_rc([&] {
            return libssh2_userauth_publickey_fromfile(session_, user.c_str(),
                                                       have_pub ? pub.c_str() : nullptr,
                                                       address_.key_file.c_str(), passphrase);
        }, deadline);
        if (rc == 0) return Result<void>::Ok();
        fleetrun_log(fmt::format("Session {}: publickey auth failed: {}", address_.identity(), last_error()));
    }

    if (!address_.password.empty() && methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data{address_.password, 0};
        *libssh2_session_abstract(session_) = &kbd_data;
        int rc = call_rc([&] {
            return libssh2_userauth_keyboard_interactive(session_, user.c_str(), kbd_callback);
        }, deadline);
        *libssh2_session_abstract(session_) = nullptr;
        if (rc == 0) return Result<void>::Ok();
    }

    if (!address_.password.empty() &&
        (methods.empty() || methods.find("password") != std::string::npos)) {
        int rc = call_rc([&] {
            return libssh2_userauth_password(session_, user.c_str(), address_.password.c_str());
        }, deadline);
        if (rc == 0) return Result<void>::Ok();
        if (rc == LIBSSH2_ERROR_TIMEOUT) {
            return Result<void>::Err("Authentication timed out for " + address_.identity(),
                                     ErrorKind::TimeoutExceeded);
        }
    }

    return Result<void>::Err("Authentication failed for " + address_.identity(),
                             ErrorKind::AuthFailed);
}

// ── Exec ─────────────────────────────────────────────────────

SSHResult Libssh2Session::exec(const std::string& command, int timeout_secs) {
    if (!active_ || !session_) {
        return SSHResult{-1, "", "Session is closed", ErrorKind::ChannelClosed};
    }

    // Open a new exec channel (no PTY)
    auto open_deadline = Clock::now() + std::chrono::seconds(SSH_OPEN_TIMEOUT_SECS);
    LIBSSH2_CHANNEL* ch = call_ptr([&] { return libssh2_channel_open_session(session_); },
                                   open_deadline);
    if (!ch) {
        return SSHResult{-1, "", "Failed to open exec channel: " + last_error(), ErrorKind::ChannelClosed};
    }

    auto free_channel = [&] {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(ch);
    };

    int rc = call_rc([&] { return libssh2_channel_exec(ch, command.c_str()); }, open_deadline);
    if (rc != 0) {
        free_channel();
        return SSHResult{-1, "", "Failed to exec command on channel", ErrorKind::ChannelClosed};
    }

    // Read stdout and stderr until the channel closes
    std::string out, err;
    char buf[SSH_READ_BUF_SIZE];
    int effective_timeout = (timeout_secs > 0) ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = Clock::now() + std::chrono::seconds(effective_timeout);
    bool timed_out = true;
    bool broken = false;

    while (Clock::now() < deadline) {
        ssize_t n, e;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read(ch, buf, sizeof(buf));
            if (n > 0) out.append(buf, static_cast<size_t>(n));
            e = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
            if (e > 0) err.append(buf, static_cast<size_t>(e));
            eof = libssh2_channel_eof(ch) != 0;
        }
        if ((n < 0 && n != LIBSSH2_ERROR_EAGAIN) || (e < 0 && e != LIBSSH2_ERROR_EAGAIN)) {
            broken = true;
            timed_out = false;
            break;
        }
        if (n > 0 || e > 0) continue;
        if (eof) {
            timed_out = false;
            break;
        }
        wait_socket(10);
    }

    if (timed_out || broken) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_channel_close(ch);
        }
        free_channel();
        if (timed_out) {
            return SSHResult{-1, out, fmt::format("Command timed out after {}s", effective_timeout),
                             ErrorKind::TimeoutExceeded};
        }
        active_ = false;
        return SSHResult{-1, out, "SSH channel read error", ErrorKind::ChannelClosed};
    }

    // Get exit status
    int exit_status = -1;
    auto close_deadline = Clock::now() + std::chrono::seconds(SSH_OPEN_TIMEOUT_SECS);
    rc = call_rc([&] { return libssh2_channel_close(ch); }, close_deadline);
    if (rc == 0) {
        call_rc([&] { return libssh2_channel_wait_closed(ch); }, close_deadline);
        std::lock_guard<std::mutex> lock(*io_mutex_);
        exit_status = libssh2_channel_get_exit_status(ch);
    }
    free_channel();

    return SSHResult{exit_status, out, err};
}

// ── Channels ─────────────────────────────────────────────────

Result<std::unique_ptr<ChannelStream>> Libssh2Session::open_shell() {
    using R = Result<std::unique_ptr<ChannelStream>>;
    if (!active_ || !session_) return R::Err("Session is closed", ErrorKind::ChannelClosed);

    auto deadline = Clock::now() + std::chrono::seconds(SSH_OPEN_TIMEOUT_SECS);
    LIBSSH2_CHANNEL* ch = call_ptr([&] { return libssh2_channel_open_session(session_); }, deadline);
    if (!ch) return R::Err("Failed to open shell channel: " + last_error(), ErrorKind::ChannelClosed);

    // Owns ch from here; destruction closes it
    auto shell = std::make_unique<Libssh2Channel>(ch, io_mutex_, sock_);

    int rc = call_rc([&] {
        return libssh2_channel_request_pty_ex(ch, "xterm", 5, nullptr, 0, 80, 24, 0, 0);
    }, deadline);
    if (rc != 0) return R::Err("PTY request failed", ErrorKind::ChannelClosed);

    rc = call_rc([&] { return libssh2_channel_shell(ch); }, deadline);
    if (rc != 0) return R::Err("Failed to request shell", ErrorKind::ChannelClosed);

    return R::Ok(std::move(shell));
}

Result<std::unique_ptr<ChannelStream>> Libssh2Session::open_forward(const std::string& host, int port) {
    using R = Result<std::unique_ptr<ChannelStream>>;
    if (!active_ || !session_) return R::Err("Session is closed", ErrorKind::ChannelClosed);

    auto deadline = Clock::now() + std::chrono::seconds(SSH_OPEN_TIMEOUT_SECS);
    LIBSSH2_CHANNEL* ch = call_ptr([&] {
        return libssh2_channel_direct_tcpip_ex(session_, host.c_str(), port, "127.0.0.1", 22);
    }, deadline);
    if (!ch) {
        return R::Err(fmt::format("direct-tcpip to {}:{} failed: {}", host, port, last_error()),
                      ErrorKind::ConnectFailed);
    }
    fleetrun_log(fmt::format("Session {}: forward to {}:{} open", address_.identity(), host, port));
    return R::Ok(std::make_unique<Libssh2Channel>(ch, io_mutex_, sock_));
}

// ── SFTP ─────────────────────────────────────────────────────

Result<uint64_t> Libssh2Session::upload(const fs::path& local, const std::string& remote,
                                        const TransferOptions& opts) {
    using R = Result<uint64_t>;
    if (!active_ || !session_) return R::Err("Session is closed", ErrorKind::ChannelClosed);

    std::ifstream in(local, std::ios::binary);
    if (!in) return R::Err("Cannot read local file: " + local.string());

    long mode = LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR | LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH;
    if (opts.preserve_permissions) {
        std::error_code ec;
        auto perms = fs::status(local, ec).permissions();
        if (!ec) mode = static_cast<long>(perms) & 0777;
    }

    auto deadline = Clock::now() + std::chrono::seconds(SSH_OPEN_TIMEOUT_SECS);
    LIBSSH2_SFTP* sftp = call_ptr([&] { return libssh2_sftp_init(session_); }, deadline);
    if (!sftp) return R::Err("SFTP init failed: " + last_error(), ErrorKind::ChannelClosed);

    auto shutdown_sftp = [&] {
        call_rc([&] { return libssh2_sftp_shutdown(sftp); },
                Clock::now() + std::chrono::seconds(SSH_OPEN_TIMEOUT_SECS));
    };

    LIBSSH2_SFTP_HANDLE* fh = call_ptr([&] {
        return libssh2_sftp_open_ex(sftp, remote.c_str(), static_cast<unsigned>(remote.size()),
                                    LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                    mode, LIBSSH2_SFTP_OPENFILE);
    }, deadline);
    if (!fh) {
        std::string msg = "Cannot open remote file for writing: " + remote;
        shutdown_sftp();
        return R::Err(msg);
    }

    uint64_t total = 0;
    std::vector<char> buf(opts.chunk_size > 0 ? opts.chunk_size : DEFAULT_TRANSFER_CHUNK);
    bool ok = true;
    std::string error;
    while (ok && in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = in.gcount();
        size_t sent = 0;
        while (sent < static_cast<size_t>(got)) {
            auto chunk_deadline = Clock::now() + std::chrono::seconds(SSH_CMD_TIMEOUT_SECS);
            int w = call_rc([&] {
                return static_cast<int>(libssh2_sftp_write(fh, buf.data() + sent,
                                                           static_cast<size_t>(got) - sent));
            }, chunk_deadline);
            if (w < 0) {
                ok = false;
                error = (w == LIBSSH2_ERROR_TIMEOUT) ? "SFTP write timed out" : "SFTP write failed";
                break;
            }
            sent += static_cast<size_t>(w);
        }
        total += sent;
    }

    call_rc([&] { return libssh2_sftp_close_handle(fh); },
            Clock::now() + std::chrono::seconds(SSH_OPEN_TIMEOUT_SECS));
    shutdown_sftp();

    if (!ok) return R::Err(error, ErrorKind::ChannelClosed);
    return R::Ok(total);
}

Result<uint64_t> Libssh2Session::download(const std::string& remote, const fs::path& local,
                                          const TransferOptions& opts) {
    using R = Result<uint64_t>;
    if (!active_ || !session_) return R::Err("Session is closed", ErrorKind::ChannelClosed);

    auto deadline = Clock::now() + std::chrono::seconds(SSH_OPEN_TIMEOUT_SECS);
    LIBSSH2_SFTP* sftp = call_ptr([&] { return libssh2_sftp_init(session_); }, deadline);
    if (!sftp) return R::Err("SFTP init failed: " + last_error(), ErrorKind::ChannelClosed);

    auto shutdown_sftp = [&] {
        call_rc([&] { return libssh2_sftp_shutdown(sftp); },
                Clock::now() + std::chrono::seconds(SSH_OPEN_TIMEOUT_SECS));
    };

    LIBSSH2_SFTP_HANDLE* fh = call_ptr([&] {
        return libssh2_sftp_open_ex(sftp, remote.c_str(), static_cast<unsigned>(remote.size()),
                                    LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    }, deadline);
    if (!fh) {
        shutdown_sftp();
        return R::Err("Cannot open remote file: " + remote);
    }

    LIBSSH2_SFTP_ATTRIBUTES attrs;
    std::memset(&attrs, 0, sizeof(attrs));
    int stat_rc = call_rc([&] { return libssh2_sftp_fstat_ex(fh, &attrs, 0); }, deadline);

    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out) {
        call_rc([&] { return libssh2_sftp_close_handle(fh); }, deadline);
        shutdown_sftp();
        return R::Err("Cannot write local file: " + local.string());
    }

    uint64_t total = 0;
    std::vector<char> buf(opts.chunk_size > 0 ? opts.chunk_size : DEFAULT_TRANSFER_CHUNK);
    std::string error;
    while (true) {
        auto chunk_deadline = Clock::now() + std::chrono::seconds(SSH_CMD_TIMEOUT_SECS);
        int n = call_rc([&] {
            return static_cast<int>(libssh2_sftp_read(fh, buf.data(), buf.size()));
        }, chunk_deadline);
        if (n == 0) break;
        if (n < 0) {
            error = (n == LIBSSH2_ERROR_TIMEOUT) ? "SFTP read timed out" : "SFTP read failed";
            break;
        }
        out.write(buf.data(), n);
        total += static_cast<uint64_t>(n);
    }
    out.close();

    call_rc([&] { return libssh2_sftp_close_handle(fh); },
            Clock::now() + std::chrono::seconds(SSH_OPEN_TIMEOUT_SECS));
    shutdown_sftp();

    if (!error.empty()) return R::Err(error, ErrorKind::ChannelClosed);

    if (opts.preserve_permissions && stat_rc == 0 &&
        (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)) {
        std::error_code ec;
        fs::permissions(local, static_cast<fs::perms>(attrs.permissions & 0777),
                        fs::perm_options::replace, ec);
        if (ec) fleetrun_log("Download: could not set permissions on " + local.string());
    }
    return R::Ok(total);
}

// ── Liveness / teardown ──────────────────────────────────────

bool Libssh2Session::ping() {
    if (!is_active()) return false;
    return exec("true", PING_TIMEOUT_SECS).success();
}

bool Libssh2Session::is_active() const {
    if (!active_) return false;
    if (pump_ && !pump_->running()) return false;
    return true;
}

void Libssh2Session::close() {
    // Mark inactive first so concurrent operations bail out early
    active_ = false;

    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    // Pump owns the socketpair when tunneled
    if (pump_) {
        pump_->stop();
        pump_.reset();
        sock_ = -1;
    }

    if (sock_ >= 0 && owns_socket_) {
        platform::close_socket(sock_);
    }
    sock_ = -1;
}
