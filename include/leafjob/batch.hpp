/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <memory>

#include "leafjob/config.hpp"
#include "leafjob/ledger.hpp"

namespace leafjob {

class Submitter;

// Process exit codes.
inline constexpr int kExitOk = 0;
inline constexpr int kExitFatal = 1;
inline constexpr int kExitPartialFailure = 2;
inline constexpr int kExitInterrupted = 130;

// One invocation: opens the ledgers, runs the selected command and prints the summary.
class Batch final {
public:
    Batch(Config config, std::unique_ptr<Submitter> submitter, std::function<bool()> stop = {});
    ~Batch();

    Batch(const Batch&) = delete;
    Batch& operator=(const Batch&) = delete;
    Batch(Batch&&) = delete;
    Batch& operator=(Batch&&) = delete;

    [[nodiscard]] int run(const Command& command);

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] const Ledger& ledger() const noexcept { return ledger_; }

private:
    [[nodiscard]] int handle(const SubmitNew& command);
    [[nodiscard]] int handle(const ResubmitFailures& command);
    [[nodiscard]] int handle(const CheckResults& command);
    [[nodiscard]] int handle(const CancelJobs& command);

    const Config config_;
    Ledger ledger_;
    std::unique_ptr<Submitter> submitter_;
    std::function<bool()> stop_;
};

}
