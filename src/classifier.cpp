/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "leafjob/classifier.hpp"
#include "leafjob/console.hpp"
#include "leafjob/ledger.hpp"
#include "leafjob/logger.hpp"
#include "leafjob/walker.hpp"

namespace leafjob {

Classification decide(bool primaryPresent, bool primaryHasMarker,
                      bool secondaryPresent, bool secondaryHasMarker) noexcept {
    if (!primaryPresent) {
        return Classification::MissingOutput;
    }
    if (!primaryHasMarker) {
        return Classification::UnexpectedTermination;
    }
    if (secondaryPresent && !secondaryHasMarker) {
        return Classification::NonConverged;
    }
    // An absent secondary output with a converged primary still counts as success.
    return Classification::Success;
}

Classifier::Classifier(const Config& config)
    : config_(config),
      primaryParser_(config.convergenceMarker, "", 0),
      secondaryParser_(config.convergenceMarker, config.resultMarker, config.tailLines) {
}

ClassificationEntry Classifier::classify(const std::filesystem::path& dir) const {
    const auto primaryFile = dir / config_.primaryOutput;
    const auto secondaryFile = dir / config_.secondaryOutput;

    ClassificationEntry entry;
    entry.directory = dir;
    entry.timestamp = std::chrono::system_clock::now();

    OutputScan primary = primaryParser_.scan(primaryFile);
    if (!primary.present) {
        entry.status = Classification::MissingOutput;
        entry.reason = config_.primaryOutput + " file missing";
        return entry;
    }

    OutputScan secondary = secondaryParser_.scan(secondaryFile);
    entry.status = decide(primary.present, primary.hasMarker, secondary.present, secondary.hasMarker);

    switch (entry.status) {
        case Classification::UnexpectedTermination:
            entry.reason = "Unexpected end of calculation";
            entry.diagnostic = diagnosticTail(secondary, secondaryFile);
            break;
        case Classification::NonConverged:
            entry.reason = "Convergence not reached";
            entry.diagnostic = diagnosticTail(secondary, secondaryFile);
            break;
        case Classification::Success:
            entry.resultLine = secondary.present ? secondary.lastResultLine.value_or("") : std::string();
            break;
        case Classification::MissingOutput:
            break;
    }
    return entry;
}

std::string Classifier::diagnosticTail(const OutputScan& secondary, const std::filesystem::path& file) const {
    if (!secondary.present) {
        return "Missing output file: " + file.string();
    }
    std::string tail;
    for (const auto& line : secondary.tail) {
        if (!tail.empty()) tail += "\n";
        tail += line;
    }
    return tail;
}

ClassifySummary Classifier::run(Ledger& ledger, const std::function<bool()>& stop) const {
    ClassifySummary summary;
    const auto start = std::chrono::steady_clock::now();

    if (!ledger.beginClassificationRun(std::chrono::system_clock::now())) {
        summary.ledgerError = true;
        summary.elapsed = std::chrono::steady_clock::now() - start;
        return summary;
    }

    Walker walker(config_.root);
    for (const auto& dir : walker.walk(config_.pattern)) {
        if (stop && stop()) {
            LOG_WARN("Interrupted after " + std::to_string(summary.total) + " classified leaves");
            summary.interrupted = true;
            break;
        }

        ClassificationEntry entry = classify(dir);
        ++summary.total;

        if (!ledger.appendClassification(entry)) {
            LOG_ERROR("Cannot write classification ledgers; stopping");
            summary.ledgerError = true;
            break;
        }

        switch (entry.status) {
            case Classification::Success:
                ++summary.success;
                LOG_DEBUG("Success: " + dir.string());
                printProgress(dir.string(), "success", Tone::Good, entry.resultLine.value_or(""));
                break;
            case Classification::MissingOutput:
                ++summary.failed;
                ++summary.missingOutput;
                break;
            case Classification::UnexpectedTermination:
                ++summary.failed;
                ++summary.unexpectedTermination;
                break;
            case Classification::NonConverged:
                ++summary.failed;
                ++summary.nonConverged;
                break;
        }
        if (entry.status != Classification::Success) {
            LOG_WARN(entry.reason + " | " + dir.string());
            printProgress(dir.string(), toString(entry.status), Tone::Bad, std::to_string(statusCode(entry.status)));
        }
    }

    summary.elapsed = std::chrono::steady_clock::now() - start;
    return summary;
}

}
