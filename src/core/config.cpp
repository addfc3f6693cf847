#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / ".fleetrun";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_local_config_path(const fs::path& dir) {
    return dir / "fleetrun.yaml";
}

void parse_host_spec(const std::string& spec, std::string& user, std::string& host, int& port) {
    std::string rest = spec;
    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        user = rest.substr(0, at);
        rest = rest.substr(at + 1);
    }

    // [v6addr]:port
    if (!rest.empty() && rest[0] == '[') {
        auto close = rest.find(']');
        if (close != std::string::npos) {
            host = rest.substr(1, close - 1);
            if (close + 1 < rest.size() && rest[close + 1] == ':') {
                port = safe_stoi(rest.substr(close + 2), port);
            }
            return;
        }
    }

    auto colon = rest.find(':');
    if (colon != std::string::npos && rest.find(':', colon + 1) == std::string::npos) {
        host = rest.substr(0, colon);
        port = safe_stoi(rest.substr(colon + 1), port);
    } else {
        host = rest;
    }
}

// ── YAML section parsers ─────────────────────────────────────

static std::vector<std::string> string_list(const YAML::Node& node,
                                            const std::vector<std::string>& fallback) {
    if (!node) return fallback;
    if (node.IsScalar()) return split_list(node.as<std::string>(""));
    if (node.IsSequence()) return node.as<std::vector<std::string>>(fallback);
    return fallback;
}

class ConfigParser {
public:
    static Config from_node(const YAML::Node& root) {
        Config config;
        if (!root || root.IsNull()) return config;

        config.hosts_ = string_list(root["hosts"], {});
        config.connection_ = parse_connection(root);
        if (root["jumphost"] && root["jumphost"].IsMap()) {
            config.jumphost_ = parse_jumphost(root["jumphost"]);
        }
        if (root["log_capture"]) config.log_capture_ = parse_log_capture(root["log_capture"]);
        if (root["file_transfer"]) config.file_transfer_ = parse_file_transfer(root["file_transfer"]);
        if (root["security"]) config.security_ = parse_security(root["security"]);
        if (root["logging"] && root["logging"].IsMap()) {
            config.log_file_ = root["logging"]["file"].as<std::string>("");
        }
        return config;
    }

private:
    static ConnectionSettings parse_connection(const YAML::Node& node) {
        ConnectionSettings c;
        c.user = node["user"].as<std::string>("");
        c.password = node["password"].as<std::string>("");
        c.key_file = node["key_file"].as<std::string>("");
        c.port = node["port"].as<int>(DEFAULT_SSH_PORT);
        c.timeout = node["timeout"].as<int>(DEFAULT_CONNECT_TIMEOUT_SECS);
        c.max_parallel = node["max_parallel"].as<int>(DEFAULT_MAX_PARALLEL);
        c.banner_timeout = node["banner_timeout"].as<int>(DEFAULT_BANNER_TIMEOUT_SECS);
        c.keep_alive = node["keep_alive"].as<int>(DEFAULT_KEEP_ALIVE_SECS);
        c.compression = node["compression"].as<bool>(false);
        c.host_key_verification = node["host_key_verification"].as<bool>(true);
        c.connection_pool_size = node["connection_pool_size"].as<int>(DEFAULT_POOL_SIZE);
        c.connection_idle_timeout = node["connection_idle_timeout"].as<int>(DEFAULT_IDLE_TIMEOUT_SECS);
        c.max_retries = node["max_retries"].as<int>(DEFAULT_MAX_RETRIES);
        c.retry_delay = node["retry_delay"].as<double>(DEFAULT_RETRY_DELAY_SECS);
        return c;
    }

    static HostAddress parse_jumphost(const YAML::Node& node) {
        HostAddress j;
        j.host = node["host"].as<std::string>("");
        j.user = node["user"].as<std::string>("");
        j.password = node["password"].as<std::string>("");
        j.key_file = node["key_file"].as<std::string>("");
        j.port = node["port"].as<int>(DEFAULT_SSH_PORT);
        j.timeout = node["timeout"].as<int>(DEFAULT_CONNECT_TIMEOUT_SECS);
        return j;
    }

    static LogCaptureSettings parse_log_capture(const YAML::Node& node) {
        LogCaptureSettings l;
        l.buffer_size = node["buffer_size"].as<std::size_t>(DEFAULT_CAPTURE_BUFFER_BYTES);
        l.flush_interval = node["flush_interval"].as<double>(DEFAULT_CAPTURE_FLUSH_SECS);
        l.max_file_size = node["max_file_size"].as<std::size_t>(DEFAULT_CAPTURE_MAX_FILE);
        l.rotation_count = node["rotation_count"].as<int>(DEFAULT_CAPTURE_ROTATIONS);
        l.compression = node["compression"].as<bool>(true);
        return l;
    }

    static FileTransferSettings parse_file_transfer(const YAML::Node& node) {
        FileTransferSettings f;
        f.chunk_size = node["chunk_size"].as<std::size_t>(DEFAULT_TRANSFER_CHUNK);
        f.verify_checksum = node["verify_checksum"].as<bool>(true);
        f.preserve_permissions = node["preserve_permissions"].as<bool>(true);
        return f;
    }

    static SecuritySettings parse_security(const YAML::Node& node) {
        SecuritySettings s;
        s.strict_host_key_checking = node["strict_host_key_checking"].as<bool>(true);
        s.known_hosts_file = node["known_hosts_file"].as<std::string>(s.known_hosts_file);
        s.key_types = string_list(node["key_types"], s.key_types);
        s.cipher_preferences = string_list(node["cipher_preferences"], s.cipher_preferences);
        return s;
    }
};

// ── Loading ──────────────────────────────────────────────────

Result<Config> Config::load(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        fs::path p = expand_home(explicit_path);
        if (!fs::exists(p)) {
            return Result<Config>::Err("Config file not found: " + p.string(),
                                       ErrorKind::ConfigInvalid);
        }
        return load_file(p);
    }

    if (fs::exists(get_local_config_path())) {
        return load_file(get_local_config_path());
    }
    if (fs::exists(get_global_config_path())) {
        return load_file(get_global_config_path());
    }
    return Result<Config>::Ok(Config{});
}

Result<Config> Config::load_file(const fs::path& path) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        Config config = ConfigParser::from_node(root);
        config.source_ = path;
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse config {}: {}", path.string(), e.what()),
                                   ErrorKind::ConfigInvalid);
    }
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        return Result<Config>::Ok(ConfigParser::from_node(YAML::Load(yaml_text)));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what(),
                                   ErrorKind::ConfigInvalid);
    }
}

void Config::apply(const ConfigOverrides& o) {
    if (o.user) connection_.user = *o.user;
    if (o.password) connection_.password = *o.password;
    if (o.key_file) connection_.key_file = *o.key_file;
    if (o.port) connection_.port = *o.port;
    if (o.timeout) connection_.timeout = *o.timeout;
    if (o.max_parallel) connection_.max_parallel = *o.max_parallel;
}

// ── Validation ───────────────────────────────────────────────

Result<void> Config::validate() const {
    auto invalid = [](const std::string& msg) {
        return Result<void>::Err(msg, ErrorKind::ConfigInvalid);
    };

    if (hosts_.empty()) return invalid("No hosts specified");

    for (const auto& spec : hosts_) {
        HostAddress addr = address_for(spec);
        if (addr.host.empty()) return invalid("Empty host in host list");
        if (addr.user.empty()) return invalid("No user specified for " + addr.host);
        if (addr.port <= 0 || addr.port > 65535) {
            return invalid(fmt::format("Invalid port {} for {}", addr.port, addr.host));
        }
    }

    if (connection_.password.empty() && connection_.key_file.empty()) {
        return invalid("Either password or key_file must be specified");
    }
    if (!connection_.key_file.empty() && !fs::exists(expand_home(connection_.key_file))) {
        return invalid("Key file not found: " + connection_.key_file);
    }

    if (jumphost_) {
        if (jumphost_->host.empty()) return invalid("Jumphost host not specified");
        if (jumphost_->user.empty()) return invalid("Jumphost user not specified");
        if (jumphost_->password.empty() && jumphost_->key_file.empty()) {
            return invalid("Either jumphost password or key_file must be specified");
        }
        if (!jumphost_->key_file.empty() && !fs::exists(expand_home(jumphost_->key_file))) {
            return invalid("Jumphost key file not found: " + jumphost_->key_file);
        }
    }

    if (connection_.max_parallel < 1) return invalid("max_parallel must be at least 1");
    if (connection_.connection_pool_size < 1) return invalid("connection_pool_size must be at least 1");
    if (connection_.max_retries < 0) return invalid("max_retries must not be negative");
    if (connection_.retry_delay < 0) return invalid("retry_delay must not be negative");
    if (connection_.timeout <= 0) return invalid("timeout must be positive");
    if (log_capture_.flush_interval <= 0) return invalid("log_capture.flush_interval must be positive");
    if (file_transfer_.chunk_size == 0) return invalid("file_transfer.chunk_size must be positive");

    return Result<void>::Ok();
}

// ── Host resolution ──────────────────────────────────────────

HostAddress Config::address_for(const std::string& host_spec) const {
    HostAddress addr;
    addr.user = connection_.user;
    addr.port = connection_.port;
    addr.password = connection_.password;
    addr.key_file = expand_home(connection_.key_file);
    addr.timeout = connection_.timeout;
    parse_host_spec(host_spec, addr.user, addr.host, addr.port);

    if (jumphost_) {
        auto jump = std::make_shared<HostAddress>(*jumphost_);
        jump->key_file = expand_home(jump->key_file);
        addr.jumphost = jump;
    }
    return addr;
}

std::vector<HostAddress> Config::addresses(const std::vector<std::string>& host_specs) const {
    std::vector<HostAddress> out;
    out.reserve(host_specs.size());
    for (const auto& spec : host_specs) {
        out.push_back(address_for(spec));
    }
    return out;
}
