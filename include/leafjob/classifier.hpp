/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <functional>

#include "leafjob/config.hpp"
#include "leafjob/output_parser.hpp"
#include "leafjob/types.hpp"

namespace leafjob {

class Ledger;

struct ClassifySummary {
    std::size_t total = 0;
    std::size_t success = 0;
    std::size_t failed = 0;
    std::size_t missingOutput = 0;
    std::size_t unexpectedTermination = 0;
    std::size_t nonConverged = 0;
    std::chrono::steady_clock::duration elapsed{};
    bool interrupted = false;
    bool ledgerError = false;
};

// Decision on the four observable facts about a leaf's two output artifacts.
// Precedence: primary missing, primary unconverged, secondary unconverged, success.
[[nodiscard]] Classification decide(bool primaryPresent, bool primaryHasMarker,
                                    bool secondaryPresent, bool secondaryHasMarker) noexcept;

class Classifier final {
public:
    explicit Classifier(const Config& config);

    // Pure inspection of one leaf; nothing is written.
    [[nodiscard]] ClassificationEntry classify(const std::filesystem::path& dir) const;

    // Classifies every matching leaf under the root and appends to the ledgers.
    [[nodiscard]] ClassifySummary run(Ledger& ledger, const std::function<bool()>& stop = {}) const;

private:
    const Config& config_;
    OutputParser primaryParser_;
    OutputParser secondaryParser_;

    [[nodiscard]] std::string diagnosticTail(const OutputScan& secondary, const std::filesystem::path& file) const;
};

}
