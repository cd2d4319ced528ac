/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "test_support.hpp"
#include "leafjob/config.hpp"

namespace leafjob::test {
namespace {

ParseResult parse(std::vector<const char*> args) {
    args.insert(args.begin(), "leafjob");
    return parseArguments(static_cast<int>(args.size()), args.data());
}

TEST(ConfigTest, DefaultsToSubmitNew) {
    auto result = parse({});
    ASSERT_TRUE(result);
    EXPECT_TRUE(std::holds_alternative<SubmitNew>(result.command));
    EXPECT_EQ(result.config.quota, 100u);
    EXPECT_EQ(result.config.primaryOutput, "OUTCAR");
    EXPECT_EQ(result.config.secondaryOutput, "print_out");
    EXPECT_EQ(result.config.tailLines, 10u);
    EXPECT_FALSE(result.config.dryRun);
    EXPECT_TRUE(result.config.root.is_absolute());
}

TEST(ConfigTest, CommandWordsAndOpcodes) {
    EXPECT_TRUE(std::holds_alternative<ResubmitFailures>(parse({"resubmit"}).command));
    EXPECT_TRUE(std::holds_alternative<CheckResults>(parse({"check"}).command));
    EXPECT_TRUE(std::holds_alternative<SubmitNew>(parse({"-c", "0"}).command));
    EXPECT_TRUE(std::holds_alternative<ResubmitFailures>(parse({"-c", "1"}).command));
    EXPECT_EQ(parse({"-c", "2"}).status, ParseStatus::Error);
    EXPECT_EQ(parse({"launch"}).status, ParseStatus::Error);
}

TEST(ConfigTest, ParsesOptions) {
    auto result = parse({"submit", "-d", "/calc", "-m", "Fe_", "-q", "7", "--dry-run", "--verbose",
                         "-w", "/ledgers", "-s", "OUT", "-f", "OSZ", "--tail", "4",
                         "--require", "A, B,C", "--script", "job.sh", "--submit-cmd", "qsub"});
    ASSERT_TRUE(result) << result.message;
    const Config& c = result.config;
    EXPECT_EQ(c.root, std::filesystem::path("/calc"));
    EXPECT_EQ(c.pattern, "Fe_");
    EXPECT_EQ(c.quota, 7u);
    EXPECT_TRUE(c.dryRun);
    EXPECT_TRUE(c.verbose);
    EXPECT_EQ(c.workDir, std::filesystem::path("/ledgers"));
    EXPECT_EQ(c.primaryOutput, "OUT");
    EXPECT_EQ(c.secondaryOutput, "OSZ");
    EXPECT_EQ(c.tailLines, 4u);
    std::vector<std::string> required = {"A", "B", "C"};
    EXPECT_EQ(c.requiredFiles, required);
    EXPECT_EQ(c.script, "job.sh");
    EXPECT_EQ(c.submitCommand, "qsub");
}

TEST(ConfigTest, RejectsBadValues) {
    EXPECT_EQ(parse({"-q", "-3"}).status, ParseStatus::Error);
    EXPECT_EQ(parse({"-q", "many"}).status, ParseStatus::Error);
    EXPECT_EQ(parse({"-m"}).status, ParseStatus::Error);
    EXPECT_EQ(parse({"--tail", "x"}).status, ParseStatus::Error);
    EXPECT_EQ(parse({"--require", ","}).status, ParseStatus::Error);
    EXPECT_EQ(parse({"--bogus"}).status, ParseStatus::Error);
}

TEST(ConfigTest, CancelNeedsJobRange) {
    EXPECT_EQ(parse({"cancel"}).status, ParseStatus::Error);

    auto single = parse({"cancel", "-j", "42"});
    ASSERT_TRUE(single);
    EXPECT_EQ(std::get<CancelJobs>(single.command).first, 42u);
    EXPECT_EQ(std::get<CancelJobs>(single.command).last, 42u);

    auto range = parse({"cancel", "--job", "616242,616327"});
    ASSERT_TRUE(range);
    EXPECT_EQ(std::get<CancelJobs>(range.command).first, 616242u);
    EXPECT_EQ(std::get<CancelJobs>(range.command).last, 616327u);

    EXPECT_EQ(parse({"cancel", "-j", "9,3"}).status, ParseStatus::Error);
}

TEST(ConfigTest, HelpAndVersion) {
    EXPECT_EQ(parse({"--help"}).status, ParseStatus::Help);
    EXPECT_EQ(parse({"check", "-h"}).status, ParseStatus::Help);
    EXPECT_EQ(parse({"--version"}).status, ParseStatus::Version);
}

class ConfigValidationTest : public TempTreeTest {};

TEST_F(ConfigValidationTest, MissingRootIsAConfigurationError) {
    Config config = baseConfig();
    config.root = root_ / "missing";
    config.dryRun = true;
    EXPECT_FALSE(validateConfig(config, SubmitNew{}).empty());
}

TEST_F(ConfigValidationTest, SubmitCommandMustBeInstalled) {
    Config config = baseConfig();
    config.submitCommand = "leafjob-no-such-scheduler";
    EXPECT_FALSE(validateConfig(config, SubmitNew{}).empty());

    // A dry run never reaches the scheduler
    config.dryRun = true;
    EXPECT_TRUE(validateConfig(config, SubmitNew{}).empty());

    // check never submits
    config.dryRun = false;
    EXPECT_TRUE(validateConfig(config, CheckResults{}).empty());
}

TEST_F(ConfigValidationTest, InstalledCommandPasses) {
    Config config = baseConfig();
    config.submitCommand = "true";
    EXPECT_TRUE(validateConfig(config, SubmitNew{}).empty());
}

}
}
