#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

struct ConnectionSettings {
    std::string user;
    std::string password;
    std::string key_file;
    int port = DEFAULT_SSH_PORT;
    int timeout = DEFAULT_CONNECT_TIMEOUT_SECS;
    int max_parallel = DEFAULT_MAX_PARALLEL;
    int banner_timeout = DEFAULT_BANNER_TIMEOUT_SECS;
    int keep_alive = DEFAULT_KEEP_ALIVE_SECS;
    bool compression = false;
    bool host_key_verification = true;
    int connection_pool_size = DEFAULT_POOL_SIZE;
    int connection_idle_timeout = DEFAULT_IDLE_TIMEOUT_SECS;
    int max_retries = DEFAULT_MAX_RETRIES;
    double retry_delay = DEFAULT_RETRY_DELAY_SECS;
};

struct LogCaptureSettings {
    std::size_t buffer_size = DEFAULT_CAPTURE_BUFFER_BYTES;
    double flush_interval = DEFAULT_CAPTURE_FLUSH_SECS;
    std::size_t max_file_size = DEFAULT_CAPTURE_MAX_FILE;
    int rotation_count = DEFAULT_CAPTURE_ROTATIONS;
    bool compression = true;
};

struct FileTransferSettings {
    std::size_t chunk_size = DEFAULT_TRANSFER_CHUNK;
    bool verify_checksum = true;
    bool preserve_permissions = true;
};

struct SecuritySettings {
    bool strict_host_key_checking = true;
    std::string known_hosts_file = "~/.ssh/known_hosts";
    std::vector<std::string> key_types = {"ssh-rsa", "ssh-ed25519", "ecdsa-sha2-nistp256"};
    std::vector<std::string> cipher_preferences = {"aes256-gcm@openssh.com",
                                                   "aes128-gcm@openssh.com"};
};

// Command-line values that take precedence over the file.
struct ConfigOverrides {
    std::optional<std::string> user;
    std::optional<std::string> password;
    std::optional<std::string> key_file;
    std::optional<int> port;
    std::optional<int> timeout;
    std::optional<int> max_parallel;
};

class Config {
public:
    // Load from an explicit path, else ./fleetrun.yaml, else
    // ~/.fleetrun/config.yaml, else built-in defaults.
    static Result<Config> load(const std::string& explicit_path = "");

    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml_text);

    void apply(const ConfigOverrides& overrides);

    // Fails with ConfigInvalid; nothing may be dispatched on failure.
    Result<void> validate() const;

    // Accessors
    const std::vector<std::string>& hosts() const { return hosts_; }
    const ConnectionSettings& connection() const { return connection_; }
    const std::optional<HostAddress>& jumphost() const { return jumphost_; }
    const LogCaptureSettings& log_capture() const { return log_capture_; }
    const FileTransferSettings& file_transfer() const { return file_transfer_; }
    const SecuritySettings& security() const { return security_; }
    const std::string& log_file() const { return log_file_; }
    const fs::path& source() const { return source_; }

    void set_hosts(std::vector<std::string> hosts) { hosts_ = std::move(hosts); }

    // Resolve "host", "user@host" or "user@host:port" against the defaults.
    HostAddress address_for(const std::string& host_spec) const;
    std::vector<HostAddress> addresses(const std::vector<std::string>& host_specs) const;

    Config() = default;

private:
    std::vector<std::string> hosts_;
    ConnectionSettings connection_;
    std::optional<HostAddress> jumphost_;
    LogCaptureSettings log_capture_;
    FileTransferSettings file_transfer_;
    SecuritySettings security_;
    std::string log_file_;
    fs::path source_;

    friend class ConfigParser;
};

fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_local_config_path(const fs::path& dir = fs::current_path());

// Split "user@host:port" into its parts. Missing parts are left untouched.
void parse_host_spec(const std::string& spec, std::string& user, std::string& host, int& port);
