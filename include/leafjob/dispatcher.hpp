/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "leafjob/config.hpp"
#include "leafjob/types.hpp"
#include "leafjob/validator.hpp"

namespace leafjob {

class Ledger;
class Submitter;

using StopRequested = std::function<bool()>;

struct DispatchSummary {
    std::size_t processed = 0;
    std::size_t submitted = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::map<SkipReason, std::size_t> skippedBy;
    std::chrono::steady_clock::duration elapsed{};
    bool interrupted = false;
    bool ledgerError = false;
};

// Drives leaves through Unvisited -> Eligible -> Submitted|Failed, or Skipped,
// strictly in the given order and within one quota.
class Dispatcher final {
public:
    Dispatcher(const Config& config, Submitter& submitter, Ledger& ledger, StopRequested stop = {});

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // New submissions: walk the root, skip leaves that already have output or
    // whose last submission has not been checked since.
    [[nodiscard]] DispatchSummary submitNew();

    // Explicit resubmission of the given directories; existing output is ignored.
    [[nodiscard]] DispatchSummary resubmit(const std::vector<std::filesystem::path>& dirs);

    [[nodiscard]] const std::vector<JobDirectory>& jobs() const noexcept { return jobs_; }
    [[nodiscard]] const std::vector<SubmissionRecord>& records() const noexcept { return records_; }
    [[nodiscard]] const Quota& quota() const noexcept { return quota_; }

    // True when dir holds a regular file whose name contains the primary output name.
    [[nodiscard]] static bool hasOutput(const std::filesystem::path& dir, const std::string& primaryOutput) noexcept;

private:
    const Config& config_;
    Submitter& submitter_;
    Ledger& ledger_;
    StopRequested stop_;
    Validator validator_;

    Quota quota_;
    std::uint64_t sequence_ = 0;
    std::vector<JobDirectory> jobs_;
    std::vector<SubmissionRecord> records_;
    std::set<std::filesystem::path> awaiting_;

    [[nodiscard]] DispatchSummary dispatch(bool skipExistingOutput);
    void evaluate(JobDirectory& job, bool skipExistingOutput) const;
    [[nodiscard]] bool submitOne(JobDirectory& job);
    void reset() noexcept;
};

}
