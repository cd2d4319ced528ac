/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "leafjob/submitter.hpp"
#include "leafjob/process.hpp"
#include "leafjob/logger.hpp"
#include <sstream>

namespace leafjob {

namespace {
std::string lastLine(const std::string& text) {
    std::istringstream in(text);
    std::string line, last;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            last = line;
        }
    }
    if (!last.empty() && last.back() == '\r') {
        last.pop_back();
    }
    return last;
}
}

SchedulerSubmitter::SchedulerSubmitter(std::string submitCommand, std::string script, std::string cancelCommand)
    : submitCommand_(std::move(submitCommand)), script_(std::move(script)), cancelCommand_(std::move(cancelCommand)) {
}

SubmitResult SchedulerSubmitter::submit(const std::filesystem::path& dir) {
    CommandResult run = runCommand({submitCommand_, script_}, dir);
    if (!run) {
        LOG_DEBUG("Submit command failed in " + dir.string() + ": " + run.error);
        SubmitError code = run.exitCode == 127 || run.exitCode < 0 ? SubmitError::Unreachable : SubmitError::CommandFailed;
        return {false, std::nullopt, lastLine(run.output), code, run.error};
    }

    std::string response = lastLine(run.output);
    auto id = parseJobId(response);
    if (!id) {
        LOG_WARN("Scheduler returned no job id for " + dir.string());
        return {true, std::nullopt, response, SubmitError::NoJobId, "No job id in scheduler response"};
    }
    return {true, id, response, SubmitError::None, ""};
}

CancelResult SchedulerSubmitter::cancel(const ExternalJobId& id) {
    CommandResult run = runCommand({cancelCommand_, id});
    if (!run) {
        return {false, run.error};
    }
    return {true, ""};
}

std::optional<ExternalJobId> SchedulerSubmitter::parseJobId(const std::string& response) {
    std::istringstream in(response);
    std::string token, last;
    while (in >> token) {
        last = token;
    }
    if (last.empty()) {
        return std::nullopt;
    }
    return last;
}

}
