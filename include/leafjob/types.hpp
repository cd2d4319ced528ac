/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace leafjob {

// Per-leaf submission lifecycle.
enum class SubmissionState : std::uint8_t { Unvisited, Eligible, Submitted, Failed, Skipped };

enum class SkipReason : std::uint8_t {
    None = 0,
    NonMatching,
    MissingFiles,
    AlreadyHasOutput,
    QuotaExceeded,
    NotFound,
    AlreadySubmitted
};

// Terminal classification of a leaf after external execution.
enum class Classification : std::uint8_t { Success, MissingOutput, UnexpectedTermination, NonConverged };

// Opaque identifier handed back by the external scheduler.
using ExternalJobId = std::string;

struct JobDirectory {
    std::filesystem::path path;
    bool leaf = false;
    bool matches = false;
    std::set<std::string> missingFiles;
    SubmissionState state = SubmissionState::Unvisited;
    SkipReason skipReason = SkipReason::None;
};

struct SubmissionRecord {
    std::uint64_t sequence = 0;
    std::filesystem::path directory;
    std::optional<ExternalJobId> jobId;
    std::chrono::system_clock::time_point timestamp;
};

struct ClassificationEntry {
    std::filesystem::path directory;
    Classification status = Classification::MissingOutput;
    std::optional<std::string> resultLine;
    std::string reason;
    std::string diagnostic;
    std::chrono::system_clock::time_point timestamp;
};

// Submissions allowed within one invocation.
struct Quota {
    std::size_t cap = 100;
    std::size_t used = 0;

    [[nodiscard]] bool exhausted() const noexcept { return used >= cap; }
};

// Ledger status code: +1 success, -1 missing/unexpected termination, -2 non-converged.
[[nodiscard]] int statusCode(Classification status) noexcept;

[[nodiscard]] const char* toString(SubmissionState state) noexcept;
[[nodiscard]] const char* toString(SkipReason reason) noexcept;
[[nodiscard]] const char* toString(Classification status) noexcept;

} // namespace leafjob
