#include <gtest/gtest.h>
#include <cli/base_cli.hpp>
#include <cli/result_view.hpp>
#include <cli/commands/command_helpers.hpp>
#include <stdexcept>

// ── tokenize ────────────────────────────────────────────────

TEST(Tokenize, SplitsOnWhitespace) {
    auto w = tokenize("  exec   uptime\t-a ");
    ASSERT_EQ(w.size(), 3u);
    EXPECT_EQ(w[0], "exec");
    EXPECT_EQ(w[2], "-a");
}

TEST(Tokenize, QuotesGroupWords) {
    auto w = tokenize("chain 'cd /tmp' \"echo \\\"hi\\\"\" ''");
    ASSERT_EQ(w.size(), 4u);
    EXPECT_EQ(w[1], "cd /tmp");
    EXPECT_EQ(w[2], "echo \"hi\"");
    EXPECT_EQ(w[3], "");
}

TEST(Tokenize, BackslashEscapesOutsideSingleQuotes) {
    auto w = tokenize("a\\ b 'c\\d'");
    ASSERT_EQ(w.size(), 2u);
    EXPECT_EQ(w[0], "a b");
    EXPECT_EQ(w[1], "c\\d");
}

// ── parse_args ──────────────────────────────────────────────

TEST(ParseArgs, ValuedFlagsAndPositionals) {
    auto p = parse_args({"-H", "a,b", "--no-follow", "/var/log/x", "--filter=err"},
                        {"-H", "--filter"}, {"--no-follow"});
    EXPECT_TRUE(p.error.empty());
    EXPECT_EQ(p.get("-H"), "a,b");
    EXPECT_EQ(p.get("--filter"), "err");
    EXPECT_TRUE(p.has("--no-follow"));
    ASSERT_EQ(p.positional.size(), 1u);
    EXPECT_EQ(p.positional[0], "/var/log/x");
}

TEST(ParseArgs, RepeatedOptionsKeepEveryValue) {
    auto p = parse_args({"--filter", "a", "--filter", "b"}, {"--filter"});
    auto all = p.all("--filter");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0], "a");
    EXPECT_EQ(all[1], "b");
    EXPECT_EQ(p.get("--filter"), "b");
}

TEST(ParseArgs, StopAtPositionalPassesRemoteFlagsThrough) {
    auto p = parse_args({"-t", "5", "ls", "-la", "-H", "x"}, {"-t", "-H"}, {}, true);
    EXPECT_TRUE(p.error.empty());
    EXPECT_EQ(p.get("-t"), "5");
    ASSERT_EQ(p.positional.size(), 4u);
    EXPECT_EQ(p.positional[1], "-la");
    EXPECT_EQ(p.get("-H"), "");
}

TEST(ParseArgs, DoubleDashEndsOptions) {
    auto p = parse_args({"--", "-x"}, {});
    EXPECT_TRUE(p.error.empty());
    ASSERT_EQ(p.positional.size(), 1u);
    EXPECT_EQ(p.positional[0], "-x");
}

TEST(ParseArgs, Errors) {
    EXPECT_EQ(parse_args({"--bogus"}, {}).error, "Unknown option: --bogus");
    EXPECT_EQ(parse_args({"-H"}, {"-H"}).error, "Missing value for -H");
    EXPECT_FALSE(parse_args({"--flag=1"}, {}, {"--flag"}).error.empty());
}

TEST(ParseArgs, LoneDashIsPositional) {
    auto p = parse_args({"-"}, {});
    EXPECT_TRUE(p.error.empty());
    EXPECT_EQ(p.positional.size(), 1u);
}

// ── Command helpers ─────────────────────────────────────────

TEST(CommandHelpers, LongSpellingsNormalized) {
    BaseCLI cli;
    auto p = parse_command(cli, {"--hosts", "a, b", "--parallel=4", "--timeout", "9"},
                           {"-t", "--timeout"}, {}, "x");
    ASSERT_TRUE(p.has_value());
    auto hosts = selected_hosts(*p);
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[1], "b");
    EXPECT_EQ(int_option(*p, "-P", 10), 4);
    EXPECT_EQ(int_option(*p, "-t", 30), 9);
}

TEST(CommandHelpers, BadOptionSetsStatus) {
    BaseCLI cli;
    auto p = parse_command(cli, {"--nope"}, {}, {}, "x");
    EXPECT_FALSE(p.has_value());
    EXPECT_EQ(cli.status(), 1);
}

TEST(CommandHelpers, MalformedNumbers) {
    auto p = parse_args({"-P", "four", "--interval", "0.5"}, {"-P", "--interval"});
    EXPECT_FALSE(int_option(p, "-P", 1).has_value());
    EXPECT_EQ(int_option(p, "-missing", 7), 7);
    EXPECT_DOUBLE_EQ(*double_option(p, "--interval", 1.0), 0.5);
}

// ── CLI dispatch ────────────────────────────────────────────

TEST(BaseCLI, UnknownCommandFails) {
    BaseCLI cli;
    cli.execute_command("frobnicate", {});
    EXPECT_EQ(cli.status(), 1);
}

TEST(BaseCLI, ThrowingHandlerBecomesStatusOne) {
    BaseCLI cli;
    cli.add_command("boom", [](BaseCLI&, const std::vector<std::string>&) {
        throw std::runtime_error("handler failed");
    }, "x");
    cli.execute_command("boom", {});
    EXPECT_EQ(cli.status(), 1);
}

TEST(BaseCLI, MissingConfigIsStatusTwo) {
    GlobalOptions opts;
    opts.config_path = "/nonexistent/fleetrun.yaml";
    BaseCLI cli(opts);
    EXPECT_FALSE(cli.require_service());
    EXPECT_EQ(cli.status(), 2);
    EXPECT_FALSE(cli.service);
}

// ── Outcome text ────────────────────────────────────────────

TEST(ResultView, DescribeOutcome) {
    OperationResult r;
    r.success = true;
    EXPECT_EQ(describe_outcome(r), "ok");
    r.retry_count = 2;
    EXPECT_EQ(describe_outcome(r), "ok after 2 retries");

    r.success = false;
    r.error_kind = ErrorKind::ConnectFailed;
    r.error = "refused";
    EXPECT_EQ(describe_outcome(r), "failed after 2 retries with connect_failed: refused");
}
