#include <gtest/gtest.h>
#include "cli/Args.hpp"
#include "cli/Invocation.hpp"
#include "config/Config.hpp"
#include "util/errors.hpp"

using namespace lb::cli;

TEST(InvocationTest, DirectoryOnly) {
    const auto inv = parseInvocation({"/photos/trip"});
    EXPECT_EQ(inv.directory, std::filesystem::path("/photos/trip"));
    EXPECT_FALSE(inv.setName.has_value());
    EXPECT_FALSE(inv.threads.has_value());
    EXPECT_FALSE(inv.isPublic);
}

TEST(InvocationTest, ShortAndLongOptions) {
    const auto inv = parseInvocation({"-s", "Trip", "--tags", "sea sun", "--threads=8", "-pv",
                                      "--max-error-percent", "5.5", "-c", "/etc/lightbox.yaml", "/photos/trip"});
    EXPECT_EQ(inv.setName, "Trip");
    EXPECT_EQ(inv.tags, "sea sun");
    EXPECT_EQ(inv.threads, 8u);
    EXPECT_TRUE(inv.isPublic);
    EXPECT_TRUE(inv.verbose);
    ASSERT_TRUE(inv.maxErrorPercent.has_value());
    EXPECT_DOUBLE_EQ(*inv.maxErrorPercent, 5.5);
    EXPECT_EQ(inv.configPath, std::filesystem::path("/etc/lightbox.yaml"));
    EXPECT_EQ(inv.directory, std::filesystem::path("/photos/trip"));
}

TEST(InvocationTest, HelpNeedsNoDirectory) {
    EXPECT_TRUE(parseInvocation({"--help"}).help);
    EXPECT_TRUE(parseInvocation({"-h"}).help);
}

TEST(InvocationTest, UsageErrors) {
    EXPECT_THROW(parseInvocation({}), lb::ConfigurationError);
    EXPECT_THROW(parseInvocation({"a", "b"}), lb::ConfigurationError);
    EXPECT_THROW(parseInvocation({"--bogus", "dir"}), lb::ConfigurationError);
    EXPECT_THROW(parseInvocation({"dir", "--setname"}), lb::ConfigurationError);
    EXPECT_THROW(parseInvocation({"--public=yes", "dir"}), lb::ConfigurationError);
}

TEST(InvocationTest, WorkerCountMustBePositive) {
    EXPECT_THROW(parseInvocation({"--threads", "0", "dir"}), lb::ConfigurationError);
    EXPECT_THROW(parseInvocation({"--threads", "-3", "dir"}), lb::ConfigurationError);
    EXPECT_THROW(parseInvocation({"--threads", "four", "dir"}), lb::ConfigurationError);
}

TEST(InvocationTest, BudgetOverridesValidated) {
    EXPECT_THROW(parseInvocation({"--max-error-percent", "101", "dir"}), lb::ConfigurationError);
    EXPECT_THROW(parseInvocation({"--max-errors", "x", "dir"}), lb::ConfigurationError);
    EXPECT_EQ(parseInvocation({"--max-errors", "0", "dir"}).maxErrors, 0u);
}

TEST(InvocationTest, DoubleDashEndsOptions) {
    const auto inv = parseInvocation({"--", "-weird-dir"});
    EXPECT_EQ(inv.directory, std::filesystem::path("-weird-dir"));
}

TEST(BuildRunOptionsTest, CommandLineWinsOverConfig) {
    lb::config::Config cfg;
    cfg.upload.threads = 2;
    cfg.upload.tags = {"family"};
    cfg.upload.max_errors = 10u;

    auto inv = parseInvocation({"--threads", "6", "-t", "  sea   sun ", "--max-error-percent", "1", "-s", "  Trip ", "dir"});
    const auto opts = buildRunOptions(inv, cfg);

    EXPECT_EQ(opts.threads, 6u);
    EXPECT_EQ(opts.tags, (std::vector<std::string>{"family", "sea", "sun"}));
    EXPECT_DOUBLE_EQ(opts.budget.max_error_percent, 1.0);
    EXPECT_FALSE(opts.budget.max_errors.has_value());
    EXPECT_EQ(opts.collectionTitle, "Trip");
    EXPECT_EQ(opts.permission, lb::remote::Permission::Write);
}

TEST(BuildRunOptionsTest, ConfigFillsTheRest) {
    lb::config::Config cfg;
    cfg.upload.threads = 3;
    cfg.upload.is_public = true;
    cfg.upload.max_errors = 4u;
    cfg.flickr.perms = "delete";

    const auto opts = buildRunOptions(parseInvocation({"dir"}), cfg);
    EXPECT_EQ(opts.threads, 3u);
    EXPECT_TRUE(opts.isPublic);
    EXPECT_EQ(opts.budget.max_errors, 4u);
    EXPECT_TRUE(opts.collectionTitle.empty());
    EXPECT_EQ(opts.permission, lb::remote::Permission::Delete);
}

TEST(BuildRunOptionsTest, BlankSetNameRejected) {
    const lb::config::Config cfg;
    EXPECT_THROW(buildRunOptions(parseInvocation({"-s", "   ", "dir"}), cfg), lb::ConfigurationError);
}

TEST(ArgsTest, LastOccurrenceWins) {
    const auto call = parseArgs("x", {"--name", "a", "--name", "b"}, {{"name", 'n', true}});
    EXPECT_EQ(optVal(call, "name"), "b");
    EXPECT_EQ(call.options.size(), 1u);
}

TEST(ArgsTest, AttachedShortValue) {
    const auto call = parseArgs("x", {"-nfoo", "-f"}, {{"name", 'n', true}, {"flag", 'f', false}});
    EXPECT_EQ(optVal(call, "name"), "foo");
    EXPECT_TRUE(hasFlag(call, "flag"));
    EXPECT_FALSE(hasFlag(call, "name"));
}

TEST(ArgsTest, NumberParsing) {
    EXPECT_EQ(parseUInt("42"), 42u);
    EXPECT_FALSE(parseUInt("").has_value());
    EXPECT_FALSE(parseUInt("4294967296").has_value());
    EXPECT_EQ(parseDouble("2.5"), 2.5);
    EXPECT_FALSE(parseDouble("2.5x").has_value());
    EXPECT_FALSE(parseDouble("nan").has_value());
}
