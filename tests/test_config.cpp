#include <gtest/gtest.h>
#include <core/config.hpp>

static Config parse_ok(const std::string& yaml) {
    auto r = Config::parse(yaml);
    EXPECT_TRUE(r.is_ok()) << r.error;
    return r.value;
}

// ── Parsing ─────────────────────────────────────────────────

TEST(Config, Defaults) {
    Config c = parse_ok("hosts: [a]\nuser: u\npassword: p\n");
    EXPECT_EQ(c.connection().port, 22);
    EXPECT_EQ(c.connection().timeout, 30);
    EXPECT_EQ(c.connection().max_parallel, 10);
    EXPECT_EQ(c.connection().connection_pool_size, 50);
    EXPECT_EQ(c.connection().connection_idle_timeout, 300);
    EXPECT_EQ(c.connection().max_retries, 3);
    EXPECT_DOUBLE_EQ(c.connection().retry_delay, 1.0);
    EXPECT_EQ(c.log_capture().buffer_size, 8192u);
    EXPECT_EQ(c.log_capture().max_file_size, 10u * 1024 * 1024);
    EXPECT_EQ(c.log_capture().rotation_count, 5);
    EXPECT_TRUE(c.log_capture().compression);
    EXPECT_EQ(c.file_transfer().chunk_size, 32768u);
    EXPECT_TRUE(c.file_transfer().verify_checksum);
    EXPECT_EQ(c.security().known_hosts_file, "~/.ssh/known_hosts");
    EXPECT_EQ(c.security().key_types.size(), 3u);
    EXPECT_FALSE(c.jumphost().has_value());
    EXPECT_TRUE(c.validate().is_ok());
}

TEST(Config, FullFile) {
    Config c = parse_ok(R"(
hosts:
  - web1
  - admin@db1:2222
user: deploy
key_file: /dev/null
port: 2200
timeout: 10
max_parallel: 4
max_retries: 0
retry_delay: 0.5
jumphost:
  host: bastion
  user: jump
  password: hop
log_capture:
  buffer_size: 1024
  rotation_count: 2
  compression: false
file_transfer:
  chunk_size: 4096
  verify_checksum: false
logging:
  file: /tmp/fleetrun-test.log
)");
    ASSERT_EQ(c.hosts().size(), 2u);
    EXPECT_EQ(c.connection().max_parallel, 4);
    EXPECT_EQ(c.connection().max_retries, 0);
    EXPECT_EQ(c.log_capture().buffer_size, 1024u);
    EXPECT_FALSE(c.log_capture().compression);
    EXPECT_EQ(c.file_transfer().chunk_size, 4096u);
    EXPECT_FALSE(c.file_transfer().verify_checksum);
    EXPECT_EQ(c.log_file(), "/tmp/fleetrun-test.log");
    ASSERT_TRUE(c.jumphost().has_value());
    EXPECT_EQ(c.jumphost()->host, "bastion");
    EXPECT_TRUE(c.validate().is_ok()) << c.validate().error;
}

TEST(Config, HostsAsCommaString) {
    Config c = parse_ok("hosts: a, b ,c\nuser: u\npassword: p\n");
    ASSERT_EQ(c.hosts().size(), 3u);
    EXPECT_EQ(c.hosts()[1], "b");
}

TEST(Config, MalformedYamlIsConfigInvalid) {
    auto r = Config::parse("hosts: [a\n");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConfigInvalid);
}

TEST(Config, MissingExplicitFileIsConfigInvalid) {
    auto r = Config::load("/nonexistent/fleetrun.yaml");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConfigInvalid);
}

// ── Host specs ──────────────────────────────────────────────

TEST(Config, AddressForUsesDefaults) {
    Config c = parse_ok("hosts: [a]\nuser: u\npassword: p\nport: 2022\n");
    HostAddress a = c.address_for("web1");
    EXPECT_EQ(a.host, "web1");
    EXPECT_EQ(a.user, "u");
    EXPECT_EQ(a.port, 2022);
    EXPECT_EQ(a.identity(), "u@web1:2022");
}

TEST(Config, AddressForUserHostPort) {
    Config c = parse_ok("hosts: [a]\nuser: u\npassword: p\n");
    HostAddress a = c.address_for("root@db1:2222");
    EXPECT_EQ(a.user, "root");
    EXPECT_EQ(a.host, "db1");
    EXPECT_EQ(a.port, 2222);
}

TEST(Config, BracketedIpv6) {
    std::string user = "u", host;
    int port = 22;
    parse_host_spec("[fe80::1]:2200", user, host, port);
    EXPECT_EQ(host, "fe80::1");
    EXPECT_EQ(port, 2200);

    port = 22;
    parse_host_spec("fe80::2", user, host, port);
    EXPECT_EQ(host, "fe80::2");
    EXPECT_EQ(port, 22);
}

TEST(Config, JumphostAttachedToEveryAddress) {
    Config c = parse_ok("hosts: [a, b]\nuser: u\npassword: p\njumphost: {host: j, user: ju, password: jp}\n");
    auto addrs = c.addresses(c.hosts());
    ASSERT_EQ(addrs.size(), 2u);
    ASSERT_TRUE(addrs[0].jumphost);
    EXPECT_EQ(addrs[0].jumphost->identity(), "ju@j:22");
    EXPECT_EQ(addrs[1].jumphost->host, "j");
}

// ── Overrides ───────────────────────────────────────────────

TEST(Config, OverridesReplaceFileValues) {
    Config c = parse_ok("hosts: [a]\nuser: u\npassword: p\nmax_parallel: 3\n");
    ConfigOverrides o;
    o.user = "other";
    o.max_parallel = 7;
    o.port = 2022;
    c.apply(o);
    EXPECT_EQ(c.connection().user, "other");
    EXPECT_EQ(c.connection().max_parallel, 7);
    EXPECT_EQ(c.connection().port, 2022);
    EXPECT_EQ(c.connection().password, "p");
}

// ── Validation ──────────────────────────────────────────────

static void expect_invalid(const std::string& yaml) {
    auto r = Config::parse(yaml);
    ASSERT_TRUE(r.is_ok());
    auto v = r.value.validate();
    EXPECT_TRUE(v.is_err()) << yaml;
    EXPECT_EQ(v.kind, ErrorKind::ConfigInvalid);
}

TEST(Config, ValidateNoHosts) {
    expect_invalid("user: u\npassword: p\n");
}

TEST(Config, ValidateNoUser) {
    expect_invalid("hosts: [a]\npassword: p\n");
}

TEST(Config, ValidateNoAuth) {
    expect_invalid("hosts: [a]\nuser: u\n");
}

TEST(Config, ValidateMissingKeyFile) {
    expect_invalid("hosts: [a]\nuser: u\nkey_file: /nonexistent/id_rsa\n");
}

TEST(Config, ValidateIncompleteJumphost) {
    expect_invalid("hosts: [a]\nuser: u\npassword: p\njumphost: {host: j, user: ju}\n");
    expect_invalid("hosts: [a]\nuser: u\npassword: p\njumphost: {user: ju, password: x}\n");
}

TEST(Config, ValidateRanges) {
    expect_invalid("hosts: [a]\nuser: u\npassword: p\nmax_parallel: 0\n");
    expect_invalid("hosts: [a]\nuser: u\npassword: p\nconnection_pool_size: 0\n");
    expect_invalid("hosts: [a]\nuser: u\npassword: p\nmax_retries: -1\n");
    expect_invalid("hosts: [a]\nuser: u\npassword: p\nretry_delay: -0.5\n");
}

TEST(Config, UserFromHostSpecSatisfiesValidation) {
    Config c = parse_ok("hosts: [root@a]\npassword: p\n");
    EXPECT_TRUE(c.validate().is_ok());
}
