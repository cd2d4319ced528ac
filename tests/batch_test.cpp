/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "test_support.hpp"
#include "leafjob/batch.hpp"
#include "leafjob/process.hpp"
#include "leafjob/selector.hpp"
#include <fstream>

namespace leafjob::test {
namespace {

class BatchTest : public TempTreeTest {
protected:
    int run(const Config& config, const Command& command, FakeSubmitter** out = nullptr) {
        auto submitter = std::make_unique<FakeSubmitter>();
        FakeSubmitter* raw = submitter.get();
        Batch batch(config, std::move(submitter));
        int code = batch.run(command);
        if (out) {
            last_ = *raw;
            *out = &last_;
        }
        return code;
    }

    FakeSubmitter last_;
};

TEST_F(BatchTest, ScenarioBSuccessGoesToGoodDatas) {
    auto dir = makeJob("job");
    writeFile("job/OUTCAR", "General timing\n reached required accuracy - stopping structural energy minimisation\n");
    writeFile("job/print_out", "   1 F= -.5E+02 E0= -.51E+02  d E =-.5E+02\nreached required accuracy\n");

    EXPECT_EQ(run(baseConfig(), CheckResults{}), kExitOk);

    auto datas = readLines(work_ / "datas");
    ASSERT_FALSE(datas.empty());
    EXPECT_EQ(datas.back(), "1 " + dir.string());

    auto good = readLines(work_ / "good_datas");
    ASSERT_GE(good.size(), 2u);
    EXPECT_EQ(good[good.size() - 2], dir.string());
    EXPECT_EQ(good.back(), "   1 F= -.5E+02 E0= -.51E+02  d E =-.5E+02");
}

TEST_F(BatchTest, ScenarioCMissingOutputGoesToBadDatas) {
    auto dir = makeJob("job");
    writeFile("job/print_out", "this tail must not be copied\n");

    EXPECT_EQ(run(baseConfig(), CheckResults{}), kExitOk);

    EXPECT_EQ(readLines(work_ / "datas").back(), "-1 " + dir.string());
    std::string bad = readFile(work_ / "bad_datas");
    EXPECT_NE(bad.find("file missing | " + dir.string()), std::string::npos);
    EXPECT_EQ(bad.find("this tail must not be copied"), std::string::npos);
}

TEST_F(BatchTest, ResubmitTakesExactlyTheFailuresFromCheck) {
    auto ok = makeJob("ok");
    writeFile("ok/OUTCAR", "reached\n");
    auto broken = makeJob("broken");
    writeFile("broken/OUTCAR", "killed\n");
    auto unconverged = makeJob("unconverged");
    writeFile("unconverged/OUTCAR", "reached\n");
    writeFile("unconverged/print_out", "E0= 1\n");

    ASSERT_EQ(run(baseConfig(), CheckResults{}), kExitOk);

    FakeSubmitter* submitter = nullptr;
    EXPECT_EQ(run(baseConfig(), ResubmitFailures{}, &submitter), kExitOk);
    ASSERT_NE(submitter, nullptr);
    std::vector<std::filesystem::path> expected = {broken, unconverged};
    EXPECT_EQ(submitter->submitted, expected);
}

TEST_F(BatchTest, ResubmitWithoutStatusLedgerIsFatal) {
    EXPECT_EQ(run(baseConfig(), ResubmitFailures{}), kExitFatal);
}

TEST_F(BatchTest, SubmitTwiceSubmitsNothingNew) {
    makeJob("a");
    makeJob("b");
    Config config = baseConfig();

    FakeSubmitter* submitter = nullptr;
    EXPECT_EQ(run(config, SubmitNew{}, &submitter), kExitOk);
    EXPECT_EQ(submitter->submitted.size(), 2u);

    EXPECT_EQ(run(config, SubmitNew{}, &submitter), kExitOk);
    EXPECT_TRUE(submitter->submitted.empty());
}

TEST_F(BatchTest, FailedSubmissionGivesPartialFailureExit) {
    makeJob("a");
    auto submitter = std::make_unique<FakeSubmitter>();
    submitter->failOn = {"/a"};
    Batch batch(baseConfig(), std::move(submitter));
    EXPECT_EQ(batch.run(SubmitNew{}), kExitPartialFailure);
}

TEST_F(BatchTest, UnwritableWorkDirIsFatal) {
    writeFile("blocker");
    Config config = baseConfig();
    config.workDir = root_ / "blocker" / "sub";
    EXPECT_EQ(run(config, SubmitNew{}), kExitFatal);
}

TEST_F(BatchTest, CancelRangeCallsSchedulerPerId) {
    FakeSubmitter* submitter = nullptr;
    EXPECT_EQ(run(baseConfig(), CancelJobs{10, 13}, &submitter), kExitOk);
    std::vector<ExternalJobId> expected = {"10", "11", "12", "13"};
    EXPECT_EQ(submitter->cancelled, expected);
}

TEST_F(BatchTest, CancelFailureIsCounted) {
    auto submitter = std::make_unique<FakeSubmitter>();
    submitter->failCancel = {"11"};
    Batch batch(baseConfig(), std::move(submitter));
    EXPECT_EQ(batch.run(CancelJobs{10, 12}), kExitPartialFailure);
}

TEST_F(BatchTest, InterruptedRunExitsNonZero) {
    makeJob("a");
    Batch batch(baseConfig(), std::make_unique<FakeSubmitter>(), [] { return true; });
    EXPECT_EQ(batch.run(SubmitNew{}), kExitInterrupted);
}

class SchedulerSubmitterTest : public TempTreeTest {};

TEST_F(SchedulerSubmitterTest, ParsesJobIdFromResponse) {
    EXPECT_EQ(SchedulerSubmitter::parseJobId("Submitted batch job 4242").value_or(""), "4242");
    EXPECT_EQ(SchedulerSubmitter::parseJobId("  77  ").value_or(""), "77");
    EXPECT_FALSE(SchedulerSubmitter::parseJobId("   ").has_value());
}

TEST_F(SchedulerSubmitterTest, RunsSubmitCommandInsideLeaf) {
    auto dir = makeJob("job");
    writeFile("job/submit.sh", "#!/bin/sh\necho \"Submitted batch job 99\"\npwd > where\n");
    std::filesystem::permissions(dir / "submit.sh", std::filesystem::perms::owner_all);

    SchedulerSubmitter submitter("sh", "submit.sh", "true");
    auto result = submitter.submit(dir);
    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(result.id.value_or(""), "99");
    EXPECT_EQ(result.response, "Submitted batch job 99");
    EXPECT_TRUE(std::filesystem::exists(dir / "where"));
}

TEST_F(SchedulerSubmitterTest, NonZeroExitIsAFailure) {
    auto dir = makeJob("job");
    SchedulerSubmitter submitter("false", "ignored", "false");
    auto result = submitter.submit(dir);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, SubmitError::CommandFailed);
    EXPECT_FALSE(submitter.cancel("1"));
}

TEST_F(SchedulerSubmitterTest, MissingCommandIsUnreachable) {
    auto dir = makeJob("job");
    SchedulerSubmitter submitter("leafjob-no-such-scheduler", "x", "x");
    auto result = submitter.submit(dir);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, SubmitError::Unreachable);
}

TEST(ProcessTest, FindsExecutablesOnPath) {
    EXPECT_TRUE(findExecutable("sh").has_value());
    EXPECT_FALSE(findExecutable("leafjob-no-such-scheduler").has_value());
    EXPECT_FALSE(findExecutable("").has_value());
}

TEST(ProcessTest, CapturesStandardOutput) {
    auto result = runCommand({"echo", "hello"});
    ASSERT_TRUE(result);
    EXPECT_EQ(result.output, "hello\n");
    EXPECT_EQ(result.exitCode, 0);
}

}
}
