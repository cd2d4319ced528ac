/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "leafjob/batch.hpp"
#include "leafjob/classifier.hpp"
#include "leafjob/console.hpp"
#include "leafjob/dispatcher.hpp"
#include "leafjob/logger.hpp"
#include "leafjob/selector.hpp"
#include "leafjob/submitter.hpp"
#include <iostream>

namespace leafjob {

namespace {
int exitCodeFor(const DispatchSummary& summary) {
    if (summary.ledgerError) return kExitFatal;
    if (summary.interrupted) return kExitInterrupted;
    if (summary.failed > 0) return kExitPartialFailure;
    return kExitOk;
}

void printDispatchSummary(const std::string& title, const DispatchSummary& summary) {
    std::vector<std::pair<std::string, std::string>> rows = {
        {"Processed", std::to_string(summary.processed)},
        {"Submitted", std::to_string(summary.submitted)},
        {"Failed", std::to_string(summary.failed)},
        {"Skipped", std::to_string(summary.skipped)},
    };
    for (const auto& [reason, count] : summary.skippedBy) {
        rows.emplace_back(std::string("  ") + toString(reason), std::to_string(count));
    }
    if (summary.interrupted) {
        rows.emplace_back("Interrupted", "yes");
    }
    printSummary(title, rows, summary.elapsed);
}
}

Batch::Batch(Config config, std::unique_ptr<Submitter> submitter, std::function<bool()> stop)
    : config_(std::move(config)), ledger_(config_.workDir), submitter_(std::move(submitter)), stop_(std::move(stop)) {
    LOG_DEBUG("Batch created - root: " + config_.root.string() + ", work dir: " + config_.workDir.string() +
              ", pattern: '" + config_.pattern + "', quota: " + std::to_string(config_.quota));
}

Batch::~Batch() = default;

int Batch::run(const Command& command) {
    LOG_DEBUG("========================================");
    LOG_DEBUG(std::string("Command: ") + describe(command));
    LOG_DEBUG("Root: " + config_.root.string());
    LOG_DEBUG("Pattern: " + (config_.pattern.empty() ? std::string("(all)") : config_.pattern));
    LOG_DEBUG("Dry run: " + std::string(config_.dryRun ? "yes" : "no"));
    LOG_DEBUG("========================================");

    if (!ledger_.open()) {
        std::cerr << "Error: ledger directory not writable: " << config_.workDir.string() << std::endl;
        return kExitFatal;
    }

    if (config_.dryRun) {
        LOG_INFO(std::string("[DRY RUN] ") + describe(command));
    }
    std::cout << "  " << describe(command) << "  " << config_.root.string() << "\n" << std::flush;

    try {
        return std::visit([this](const auto& cmd) { return handle(cmd); }, command);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Failed to execute command: ") + describe(command) + ": " + e.what());
        return kExitFatal;
    }
}

int Batch::handle(const SubmitNew&) {
    Dispatcher dispatcher(config_, *submitter_, ledger_, stop_);
    DispatchSummary summary = dispatcher.submitNew();
    printDispatchSummary("Submission summary", summary);
    return exitCodeFor(summary);
}

int Batch::handle(const ResubmitFailures&) {
    auto failures = selectFailures(ledger_.statusPath());
    if (!failures) {
        std::cerr << "Error: no status ledger at " << ledger_.statusPath().string() << "; run check first" << std::endl;
        return kExitFatal;
    }
    LOG_INFO("Resubmitting " + std::to_string(failures->size()) + " failed jobs");

    Dispatcher dispatcher(config_, *submitter_, ledger_, stop_);
    DispatchSummary summary = dispatcher.resubmit(*failures);
    printDispatchSummary("Resubmission summary", summary);
    return exitCodeFor(summary);
}

int Batch::handle(const CheckResults&) {
    Classifier classifier(config_);
    ClassifySummary summary = classifier.run(ledger_, stop_);

    printSummary("Check summary", {
        {"Total", std::to_string(summary.total)},
        {"Success", std::to_string(summary.success)},
        {"Failed", std::to_string(summary.failed)},
        {"  missing", std::to_string(summary.missingOutput)},
        {"  unexpected", std::to_string(summary.unexpectedTermination)},
        {"  unconverged", std::to_string(summary.nonConverged)},
    }, summary.elapsed);

    if (summary.ledgerError) return kExitFatal;
    if (summary.interrupted) return kExitInterrupted;
    return kExitOk;
}

int Batch::handle(const CancelJobs& command) {
    const auto start = std::chrono::steady_clock::now();
    std::size_t cancelled = 0;
    std::size_t failed = 0;
    bool interrupted = false;

    LOG_INFO("Cancelling jobs " + std::to_string(command.first) + " to " + std::to_string(command.last));
    for (std::uint64_t id = command.first; id <= command.last; ++id) {
        if (stop_ && stop_()) {
            interrupted = true;
            break;
        }
        const std::string jobId = std::to_string(id);
        if (config_.dryRun) {
            LOG_INFO("[DRY RUN] Would cancel job " + jobId);
            printProgress(jobId, "dry-run", Tone::Warn);
            ++cancelled;
        } else if (CancelResult result = submitter_->cancel(jobId)) {
            printProgress(jobId, "cancelled", Tone::Good);
            ++cancelled;
        } else {
            LOG_ERROR("Failed to cancel job " + jobId + ": " + result.message);
            printProgress(jobId, "failed", Tone::Bad, result.message);
            ++failed;
        }
        if (id == command.last) {
            break;
        }
    }

    printSummary("Cancel summary", {
        {"Cancelled", std::to_string(cancelled)},
        {"Failed", std::to_string(failed)},
    }, std::chrono::steady_clock::now() - start);

    if (interrupted) return kExitInterrupted;
    return failed > 0 ? kExitPartialFailure : kExitOk;
}

}
