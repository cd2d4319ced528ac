/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "leafjob/types.hpp"

namespace leafjob {

// Fixed ledger file names inside the work directory.
inline constexpr const char* kJobLedger = "job";
inline constexpr const char* kStatusLedger = "datas";
inline constexpr const char* kSuccessLedger = "good_datas";
inline constexpr const char* kFailureLedger = "bad_datas";

// Line prefixes shared by the ledger writers and readers.
inline constexpr const char* kSubmissionRunPrefix = "# Job submission log - ";
inline constexpr const char* kDryRunMarker = "# Dry run";
inline constexpr const char* kSubmissionFailedPrefix = "FAILED: ";
inline constexpr const char* kSubmissionSkippedPrefix = "SKIPPED: ";
inline constexpr const char* kClassificationTimePrefix = "Time: ";

[[nodiscard]] std::string formatTimestamp(std::chrono::system_clock::time_point tp);

// Append-only, line-oriented ledgers. Every write is flushed before returning so
// an interrupted run keeps everything already committed.
class Ledger {
public:
    explicit Ledger(const std::filesystem::path& workDir) noexcept;

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;
    Ledger(Ledger&&) noexcept = default;
    Ledger& operator=(Ledger&&) noexcept = default;

    // Creates the work directory and checks it is writable.
    [[nodiscard]] bool open() noexcept;

    // Dry-run sections are marked so their records never count as real submissions.
    [[nodiscard]] bool beginSubmissionRun(const std::filesystem::path& root, const std::string& pattern,
                                          std::chrono::system_clock::time_point when, bool dryRun = false) noexcept;
    [[nodiscard]] bool appendSubmission(const SubmissionRecord& record) noexcept;
    [[nodiscard]] bool appendSchedulerResponse(const std::string& response) noexcept;
    // Follows the record of a submission the scheduler refused.
    [[nodiscard]] bool appendSubmissionFailure(const std::string& message) noexcept;
    [[nodiscard]] bool appendSkip(const std::filesystem::path& dir, const std::string& detail) noexcept;

    [[nodiscard]] bool beginClassificationRun(std::chrono::system_clock::time_point when) noexcept;
    [[nodiscard]] bool appendClassification(const ClassificationEntry& entry) noexcept;

    [[nodiscard]] const std::filesystem::path& workDir() const noexcept { return workDir_; }
    [[nodiscard]] std::filesystem::path jobPath() const { return workDir_ / kJobLedger; }
    [[nodiscard]] std::filesystem::path statusPath() const { return workDir_ / kStatusLedger; }
    [[nodiscard]] std::filesystem::path successPath() const { return workDir_ / kSuccessLedger; }
    [[nodiscard]] std::filesystem::path failurePath() const { return workDir_ / kFailureLedger; }

private:
    std::filesystem::path workDir_;

    [[nodiscard]] bool append(const std::filesystem::path& file, const std::vector<std::string>& lines) noexcept;
};

}
