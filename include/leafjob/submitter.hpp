/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "leafjob/types.hpp"

namespace leafjob {

enum class SubmitError : uint8_t {
    None = 0,
    CommandFailed,
    Unreachable,
    NoJobId
};

struct SubmitResult {
    bool ok = false;
    std::optional<ExternalJobId> id;
    std::string response;
    SubmitError error = SubmitError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct CancelResult {
    bool ok = false;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Boundary to the external job scheduler.
class Submitter {
public:
    virtual ~Submitter() = default;

    [[nodiscard]] virtual SubmitResult submit(const std::filesystem::path& dir) = 0;
    [[nodiscard]] virtual CancelResult cancel(const ExternalJobId& id) = 0;
};

// Submits by running `<submitCommand> <script>` inside the leaf directory and
// cancels with `<cancelCommand> <id>`.
class SchedulerSubmitter final : public Submitter {
public:
    SchedulerSubmitter(std::string submitCommand, std::string script, std::string cancelCommand);

    [[nodiscard]] SubmitResult submit(const std::filesystem::path& dir) override;
    [[nodiscard]] CancelResult cancel(const ExternalJobId& id) override;

    // Last whitespace-separated token of the scheduler's reply, e.g. "Submitted batch job 4242" -> "4242".
    [[nodiscard]] static std::optional<ExternalJobId> parseJobId(const std::string& response);

private:
    std::string submitCommand_;
    std::string script_;
    std::string cancelCommand_;
};

}
