/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "test_support.hpp"
#include "leafjob/dispatcher.hpp"
#include "leafjob/ledger.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>

namespace leafjob::test {
namespace {

class DispatcherTest : public TempTreeTest {
protected:
    void SetUp() override {
        TempTreeTest::SetUp();
        config_ = baseConfig();
        ledger_ = std::make_unique<Ledger>(work_);
        ASSERT_TRUE(ledger_->open());
    }

    std::vector<std::string> jobRecords() const {
        std::vector<std::string> records;
        for (const auto& line : readLines(ledger_->jobPath())) {
            if (!line.empty() && std::isdigit(static_cast<unsigned char>(line[0]))) {
                records.push_back(line);
            }
        }
        return records;
    }

    const JobDirectory& find(const Dispatcher& d, const std::filesystem::path& p) const {
        for (const auto& job : d.jobs()) {
            if (job.path == p) return job;
        }
        throw std::runtime_error("no job for " + p.string());
    }

    Config config_;
    std::unique_ptr<Ledger> ledger_;
    FakeSubmitter submitter_;
};

TEST_F(DispatcherTest, ScenarioA) {
    auto x = makeJob("X");
    auto y = makeJob("Y");
    writeFile("Y/OUTCAR", "reached required accuracy\n");
    auto z = makeJob("Z", {"POSCAR", "INCAR", "KPOINTS"});
    config_.quota = 10;

    Dispatcher dispatcher(config_, submitter_, *ledger_);
    auto summary = dispatcher.submitNew();

    EXPECT_EQ(find(dispatcher, x).state, SubmissionState::Submitted);
    EXPECT_EQ(find(dispatcher, y).state, SubmissionState::Skipped);
    EXPECT_EQ(find(dispatcher, y).skipReason, SkipReason::AlreadyHasOutput);
    EXPECT_EQ(find(dispatcher, z).state, SubmissionState::Skipped);
    EXPECT_EQ(find(dispatcher, z).skipReason, SkipReason::MissingFiles);
    EXPECT_EQ(find(dispatcher, z).missingFiles, std::set<std::string>{"POTCAR"});

    EXPECT_EQ(summary.processed, 3u);
    EXPECT_EQ(summary.submitted, 1u);
    EXPECT_EQ(summary.skipped, 2u);

    std::vector<std::string> expected = {"1 " + x.string()};
    EXPECT_EQ(jobRecords(), expected);
    ASSERT_EQ(dispatcher.records().size(), 1u);
    EXPECT_EQ(dispatcher.records()[0].jobId.value_or(""), "1000");
}

TEST_F(DispatcherTest, OutputDetectionMatchesNameFragments) {
    makeJob("a");
    writeFile("a/OUTCAR.bak");
    EXPECT_TRUE(Dispatcher::hasOutput(root_ / "a", "OUTCAR"));
    makeJob("b");
    EXPECT_FALSE(Dispatcher::hasOutput(root_ / "b", "OUTCAR"));
}

TEST_F(DispatcherTest, QuotaBoundsSubmittedPlusFailed) {
    for (int i = 0; i < 6; ++i) {
        makeJob("job" + std::to_string(i));
    }
    submitter_.failOn = {"job1"};
    config_.quota = 3;

    Dispatcher dispatcher(config_, submitter_, *ledger_);
    auto summary = dispatcher.submitNew();

    EXPECT_EQ(summary.submitted + summary.failed, 3u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.skippedBy[SkipReason::QuotaExceeded], 3u);
    EXPECT_EQ(submitter_.submitted.size(), 3u);
    EXPECT_EQ(dispatcher.quota().used, 3u);

    // Walker order decides which leaves are chosen
    std::vector<std::filesystem::path> expected = {root_ / "job0", root_ / "job1", root_ / "job2"};
    EXPECT_EQ(submitter_.submitted, expected);
}

TEST_F(DispatcherTest, SubmissionFailureDoesNotAbortBatch) {
    makeJob("a");
    makeJob("b");
    makeJob("c");
    submitter_.failOn = {"/a"};

    Dispatcher dispatcher(config_, submitter_, *ledger_);
    auto summary = dispatcher.submitNew();

    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.submitted, 2u);
    EXPECT_EQ(find(dispatcher, root_ / "a").state, SubmissionState::Failed);
    // The failed leaf's record was committed before the attempt
    EXPECT_EQ(jobRecords().size(), 3u);
}

TEST_F(DispatcherTest, SecondRunIsIdempotentOnceOutputAppears) {
    makeJob("a");
    makeJob("b");

    Dispatcher first(config_, submitter_, *ledger_);
    EXPECT_EQ(first.submitNew().submitted, 2u);

    // The scheduler ran the jobs; each leaf now has its primary output
    writeFile("a/OUTCAR", "running\n");
    writeFile("b/OUTCAR", "running\n");

    Dispatcher second(config_, submitter_, *ledger_);
    auto summary = second.submitNew();
    EXPECT_EQ(summary.submitted, 0u);
    EXPECT_EQ(summary.skippedBy[SkipReason::AlreadyHasOutput], 2u);
    EXPECT_EQ(submitter_.submitted.size(), 2u);
}

TEST_F(DispatcherTest, SecondRunWithoutChangesSubmitsNothing) {
    makeJob("a");
    makeJob("b");

    Dispatcher first(config_, submitter_, *ledger_);
    EXPECT_EQ(first.submitNew().submitted, 2u);

    Dispatcher second(config_, submitter_, *ledger_);
    auto summary = second.submitNew();
    EXPECT_EQ(summary.submitted, 0u);
    EXPECT_EQ(summary.skippedBy[SkipReason::AlreadySubmitted], 2u);
    EXPECT_EQ(submitter_.submitted.size(), 2u);
    EXPECT_EQ(jobRecords().size(), 2u);
}

TEST_F(DispatcherTest, CheckedLeafWithoutOutputIsSubmittedAgain) {
    auto a = makeJob("a");
    auto b = makeJob("b");
    const auto submittedAt = std::chrono::system_clock::now() - std::chrono::hours(1);

    ASSERT_TRUE(ledger_->beginSubmissionRun(root_, "", submittedAt));
    SubmissionRecord record;
    record.sequence = 1;
    record.directory = a;
    ASSERT_TRUE(ledger_->appendSubmission(record));
    record.sequence = 2;
    record.directory = b;
    ASSERT_TRUE(ledger_->appendSubmission(record));

    // Only a was checked after its submission
    ASSERT_TRUE(ledger_->beginClassificationRun(submittedAt + std::chrono::minutes(30)));
    ClassificationEntry entry;
    entry.directory = a;
    entry.status = Classification::MissingOutput;
    entry.reason = "OUTCAR file missing";
    ASSERT_TRUE(ledger_->appendClassification(entry));

    Dispatcher dispatcher(config_, submitter_, *ledger_);
    auto summary = dispatcher.submitNew();
    EXPECT_EQ(summary.submitted, 1u);
    EXPECT_EQ(find(dispatcher, b).skipReason, SkipReason::AlreadySubmitted);
    EXPECT_EQ(submitter_.submitted, std::vector<std::filesystem::path>{a});
}

TEST_F(DispatcherTest, DryRunDoesNotBlockARealRun) {
    makeJob("a");
    makeJob("b");

    config_.dryRun = true;
    Dispatcher preview(config_, submitter_, *ledger_);
    EXPECT_EQ(preview.submitNew().submitted, 2u);

    config_.dryRun = false;
    Dispatcher real(config_, submitter_, *ledger_);
    EXPECT_EQ(real.submitNew().submitted, 2u);
    EXPECT_EQ(submitter_.submitted.size(), 2u);
}

TEST_F(DispatcherTest, LocalFailuresAreWrittenToJobLedger) {
    auto a = makeJob("a");
    auto z = makeJob("z", {"POSCAR", "INCAR", "KPOINTS"});
    submitter_.failOn = {"/a"};

    Dispatcher dispatcher(config_, submitter_, *ledger_);
    auto summary = dispatcher.submitNew();
    ASSERT_EQ(summary.failed, 1u);

    auto lines = readLines(ledger_->jobPath());
    auto record = std::find(lines.begin(), lines.end(), "1 " + a.string());
    ASSERT_NE(record, lines.end());
    ASSERT_NE(record + 1, lines.end());
    EXPECT_EQ(*(record + 1), "FAILED: queue unreachable");
    EXPECT_NE(std::find(lines.begin(), lines.end(), "SKIPPED: " + z.string() + " (missing POTCAR)"), lines.end());

    // A refused submission is not waiting on the scheduler
    Dispatcher retry(config_, submitter_, *ledger_);
    submitter_.failOn.clear();
    EXPECT_EQ(retry.submitNew().submitted, 1u);
}

TEST_F(DispatcherTest, LedgerLossMidRunCountsTheLeafAndStops) {
    makeJob("a");
    makeJob("b");
    auto stop = [this] {
        std::error_code ec;
        std::filesystem::remove_all(work_, ec);
        return false;
    };

    Dispatcher dispatcher(config_, submitter_, *ledger_, stop);
    auto summary = dispatcher.submitNew();

    EXPECT_TRUE(summary.ledgerError);
    EXPECT_EQ(summary.processed, 1u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(dispatcher.quota().used, 1u);
    EXPECT_TRUE(submitter_.submitted.empty());
}

TEST_F(DispatcherTest, SameTreeAndQuotaChooseSameSubset) {
    for (const char* name : {"d", "a", "c", "b", "e"}) {
        makeJob(name);
    }
    config_.quota = 2;
    config_.dryRun = true;

    Dispatcher first(config_, submitter_, *ledger_);
    (void)first.submitNew();
    Dispatcher second(config_, submitter_, *ledger_);
    (void)second.submitNew();

    ASSERT_EQ(first.records().size(), 2u);
    ASSERT_EQ(second.records().size(), 2u);
    for (std::size_t i = 0; i < 2; ++i) {
        EXPECT_EQ(first.records()[i].directory, second.records()[i].directory);
    }
    EXPECT_EQ(first.records()[0].directory, root_ / "a");
    EXPECT_EQ(first.records()[1].directory, root_ / "b");
}

TEST_F(DispatcherTest, DryRunRecordsButNeverSubmits) {
    makeJob("a");
    makeJob("b");
    config_.dryRun = true;

    Dispatcher dispatcher(config_, submitter_, *ledger_);
    auto summary = dispatcher.submitNew();

    EXPECT_TRUE(submitter_.submitted.empty());
    EXPECT_EQ(summary.submitted, 2u);
    std::vector<std::string> expected = {"1 " + (root_ / "a").string(), "2 " + (root_ / "b").string()};
    EXPECT_EQ(jobRecords(), expected);
}

TEST_F(DispatcherTest, NonMatchingLeavesAreSkipped) {
    makeJob("Fe_1");
    makeJob("Co_1");
    config_.pattern = "Fe_";

    Dispatcher dispatcher(config_, submitter_, *ledger_);
    auto summary = dispatcher.submitNew();

    EXPECT_EQ(summary.submitted, 1u);
    EXPECT_EQ(find(dispatcher, root_ / "Co_1").skipReason, SkipReason::NonMatching);
}

TEST_F(DispatcherTest, ResubmitIgnoresExistingOutputButKeepsQuota) {
    auto a = makeJob("a");
    auto b = makeJob("b");
    auto c = makeJob("c");
    writeFile("a/OUTCAR", "partial\n");
    writeFile("b/OUTCAR", "partial\n");
    writeFile("c/OUTCAR", "partial\n");
    config_.quota = 2;

    Dispatcher dispatcher(config_, submitter_, *ledger_);
    auto summary = dispatcher.resubmit({a, b, c, root_ / "gone"});

    EXPECT_EQ(summary.submitted, 2u);
    EXPECT_EQ(summary.skippedBy[SkipReason::QuotaExceeded], 1u);
    EXPECT_EQ(summary.skippedBy[SkipReason::NotFound], 1u);
    std::vector<std::filesystem::path> expected = {a, b};
    EXPECT_EQ(submitter_.submitted, expected);
}

TEST_F(DispatcherTest, StopRequestEndsTheRunEarly) {
    makeJob("a");
    makeJob("b");
    int calls = 0;

    Dispatcher dispatcher(config_, submitter_, *ledger_, [&calls] { return ++calls > 1; });
    auto summary = dispatcher.submitNew();

    EXPECT_TRUE(summary.interrupted);
    EXPECT_EQ(summary.processed, 1u);
    EXPECT_EQ(submitter_.submitted.size(), 1u);
}

TEST_F(DispatcherTest, JobLedgerIsStampedPerRun) {
    makeJob("a");
    config_.pattern = "zzz";

    Dispatcher first(config_, submitter_, *ledger_);
    (void)first.submitNew();
    Dispatcher second(config_, submitter_, *ledger_);
    (void)second.submitNew();

    int headers = 0;
    for (const auto& line : readLines(ledger_->jobPath())) {
        if (line.rfind("# Job submission log - ", 0) == 0) ++headers;
        if (line.rfind("# Pattern: ", 0) == 0) EXPECT_EQ(line, "# Pattern: zzz");
    }
    EXPECT_EQ(headers, 2);
}

}
}
