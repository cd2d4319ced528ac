/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <istream>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace leafjob {

struct StatusLine {
    int code = 0;
    std::filesystem::path directory;
};

// Parses one `<code> <path>` line of the status ledger; headers and blank lines yield nothing.
[[nodiscard]] std::optional<StatusLine> parseStatusLine(const std::string& line);

// Directories whose latest status entry carries a negative code, ordered by
// the position of that latest entry.
[[nodiscard]] std::vector<std::filesystem::path> selectFailures(std::istream& ledger);
[[nodiscard]] std::optional<std::vector<std::filesystem::path>> selectFailures(const std::filesystem::path& ledger);

// Directories whose latest real submission in the job ledger has no status
// entry stamped after it. Dry-run sections and refused submissions do not
// count; a status stamped in the same second as the submission does not clear it.
[[nodiscard]] std::set<std::filesystem::path> selectAwaitingResults(std::istream& jobLedger, std::istream& statusLedger);
[[nodiscard]] std::set<std::filesystem::path> selectAwaitingResults(const std::filesystem::path& jobLedger,
                                                                    const std::filesystem::path& statusLedger);

}
