/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "leafjob/dispatcher.hpp"
#include "leafjob/console.hpp"
#include "leafjob/ledger.hpp"
#include "leafjob/logger.hpp"
#include "leafjob/selector.hpp"
#include "leafjob/submitter.hpp"
#include "leafjob/walker.hpp"

namespace leafjob {

namespace {
std::string joinNames(const std::set<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += " ";
        out += name;
    }
    return out;
}
}

Dispatcher::Dispatcher(const Config& config, Submitter& submitter, Ledger& ledger, StopRequested stop)
    : config_(config), submitter_(submitter), ledger_(ledger), stop_(std::move(stop)),
      validator_(config.requiredFiles) {
}

void Dispatcher::reset() noexcept {
    quota_ = Quota{config_.quota, 0};
    sequence_ = 0;
    jobs_.clear();
    records_.clear();
    awaiting_.clear();
}

DispatchSummary Dispatcher::submitNew() {
    reset();
    Walker walker(config_.root);
    jobs_ = walker.leaves(config_.pattern);
    awaiting_ = selectAwaitingResults(ledger_.jobPath(), ledger_.statusPath());
    LOG_INFO("Submitting new jobs under " + config_.root.string() + " (" +
             std::to_string(jobs_.size()) + " leaves, quota " + std::to_string(quota_.cap) + ")");
    return dispatch(true);
}

DispatchSummary Dispatcher::resubmit(const std::vector<std::filesystem::path>& dirs) {
    reset();
    for (const auto& dir : dirs) {
        JobDirectory job;
        job.path = dir;
        std::error_code ec;
        job.leaf = std::filesystem::is_directory(dir, ec);
        job.matches = Walker::matches(dir, config_.pattern);
        jobs_.push_back(std::move(job));
    }
    LOG_INFO("Resubmitting " + std::to_string(jobs_.size()) + " failed jobs (quota " +
             std::to_string(quota_.cap) + ")");
    return dispatch(false);
}

DispatchSummary Dispatcher::dispatch(bool skipExistingOutput) {
    DispatchSummary summary;
    const auto start = std::chrono::steady_clock::now();

    if (!ledger_.beginSubmissionRun(config_.root, config_.pattern, std::chrono::system_clock::now(), config_.dryRun)) {
        summary.ledgerError = true;
        summary.elapsed = std::chrono::steady_clock::now() - start;
        return summary;
    }

    if (config_.dryRun) {
        LOG_INFO("[DRY RUN] No job will reach the scheduler");
    }

    for (auto& job : jobs_) {
        if (stop_ && stop_()) {
            LOG_WARN("Interrupted; " + std::to_string(summary.processed) + " of " +
                     std::to_string(jobs_.size()) + " leaves processed");
            summary.interrupted = true;
            break;
        }

        ++summary.processed;
        evaluate(job, skipExistingOutput);

        bool recorded = true;
        if (job.state == SubmissionState::Eligible) {
            recorded = submitOne(job);
        } else if (job.skipReason == SkipReason::MissingFiles) {
            recorded = ledger_.appendSkip(job.path, "missing " + joinNames(job.missingFiles));
        }

        switch (job.state) {
            case SubmissionState::Submitted:
                ++summary.submitted;
                break;
            case SubmissionState::Failed:
                ++summary.failed;
                break;
            case SubmissionState::Skipped:
                ++summary.skipped;
                ++summary.skippedBy[job.skipReason];
                break;
            default:
                break;
        }

        if (!recorded) {
            LOG_ERROR("Cannot write job ledger; stopping the run");
            summary.ledgerError = true;
            break;
        }
    }

    summary.elapsed = std::chrono::steady_clock::now() - start;
    LOG_INFO("Processed " + std::to_string(summary.processed) + ", submitted " + std::to_string(summary.submitted) +
             ", failed " + std::to_string(summary.failed) + ", skipped " + std::to_string(summary.skipped));
    return summary;
}

void Dispatcher::evaluate(JobDirectory& job, bool skipExistingOutput) const {
    auto skip = [&job](SkipReason reason) {
        job.state = SubmissionState::Skipped;
        job.skipReason = reason;
    };

    if (!job.leaf) {
        LOG_WARN("Directory not found: " + job.path.string());
        skip(SkipReason::NotFound);
        return;
    }
    if (!job.matches) {
        LOG_TRACE("Not matching pattern: " + job.path.string());
        skip(SkipReason::NonMatching);
        return;
    }

    job.missingFiles = validator_.validate(job.path);
    if (!job.missingFiles.empty()) {
        LOG_WARN("Missing required files in " + job.path.string() + ": " + joinNames(job.missingFiles));
        skip(SkipReason::MissingFiles);
        printProgress(job.path.string(), "skipped", Tone::Dim, "missing " + joinNames(job.missingFiles));
        return;
    }

    if (skipExistingOutput && hasOutput(job.path, config_.primaryOutput)) {
        LOG_DEBUG("Skipping " + job.path.string() + ": output file exists");
        skip(SkipReason::AlreadyHasOutput);
        return;
    }

    if (skipExistingOutput && awaiting_.count(job.path) != 0) {
        LOG_DEBUG("Skipping " + job.path.string() + ": submitted earlier, not yet checked");
        skip(SkipReason::AlreadySubmitted);
        return;
    }

    if (quota_.exhausted()) {
        LOG_DEBUG("Quota reached, not submitting: " + job.path.string());
        skip(SkipReason::QuotaExceeded);
        return;
    }

    job.state = SubmissionState::Eligible;
}

bool Dispatcher::submitOne(JobDirectory& job) {
    SubmissionRecord record;
    record.sequence = ++sequence_;
    record.directory = job.path;
    record.timestamp = std::chrono::system_clock::now();
    ++quota_.used;

    // The record is committed before the scheduler is contacted.
    if (!ledger_.appendSubmission(record)) {
        LOG_ERROR("Cannot record submission of " + job.path.string());
        job.state = SubmissionState::Failed;
        return false;
    }

    if (config_.dryRun) {
        LOG_INFO("[DRY RUN] Would submit job in: " + job.path.string());
        printProgress(job.path.string(), "dry-run", Tone::Warn, "#" + std::to_string(record.sequence));
        job.state = SubmissionState::Submitted;
        records_.push_back(std::move(record));
        return true;
    }

    SubmitResult result = submitter_.submit(job.path);
    if (!result) {
        LOG_ERROR("Failed to submit job in " + job.path.string() + ": " + result.message);
        printProgress(job.path.string(), "failed", Tone::Bad, result.message);
        job.state = SubmissionState::Failed;
        records_.push_back(std::move(record));
        return ledger_.appendSubmissionFailure(result.message);
    }

    record.jobId = result.id;
    if (!ledger_.appendSchedulerResponse(result.response)) {
        LOG_WARN("Scheduler response not recorded for " + job.path.string());
    }
    LOG_INFO("Successfully submitted job in: " + job.path.string());
    printProgress(job.path.string(), "submitted", Tone::Good, record.jobId.value_or(""));
    job.state = SubmissionState::Submitted;
    records_.push_back(std::move(record));
    return true;
}

bool Dispatcher::hasOutput(const std::filesystem::path& dir, const std::string& primaryOutput) noexcept {
    try {
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            std::error_code fileEc;
            if (entry.is_regular_file(fileEc) &&
                entry.path().filename().string().find(primaryOutput) != std::string::npos) {
                return true;
            }
        }
        if (ec) {
            LOG_WARN("Cannot list " + dir.string() + ": " + ec.message());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Output check failed for " + dir.string() + ": " + e.what());
    }
    return false;
}

}
