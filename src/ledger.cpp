/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "leafjob/ledger.hpp"
#include "leafjob/logger.hpp"
#include <ctime>
#include <fstream>
#include <unistd.h>

namespace leafjob {

namespace {
const std::string kRunRule(100, '=');
const std::string kFailureSeparator(53, '=');
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", std::localtime(&time));
    return buf;
}

Ledger::Ledger(const std::filesystem::path& workDir) noexcept
    : workDir_(workDir) {
}

bool Ledger::open() noexcept {
    try {
        std::error_code ec;
        std::filesystem::create_directories(workDir_, ec);
        if (ec) {
            LOG_ERROR("Failed to create work directory " + workDir_.string() + ": " + ec.message());
            return false;
        }
        if (!std::filesystem::is_directory(workDir_)) {
            LOG_ERROR("Work directory is not a directory: " + workDir_.string());
            return false;
        }
        if (::access(workDir_.c_str(), W_OK) != 0) {
            LOG_ERROR("Work directory is not writable: " + workDir_.string());
            return false;
        }
        LOG_DEBUG("Ledgers in: " + workDir_.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to open ledgers: " + std::string(e.what()));
        return false;
    }
}

bool Ledger::beginSubmissionRun(const std::filesystem::path& root, const std::string& pattern,
                                std::chrono::system_clock::time_point when, bool dryRun) noexcept {
    try {
        std::vector<std::string> header = {
            kSubmissionRunPrefix + formatTimestamp(when),
            "# Directory: " + root.string(),
            "# Pattern: " + (pattern.empty() ? std::string("'all'") : pattern)
        };
        if (dryRun) {
            header.emplace_back(kDryRunMarker);
        }
        header.emplace_back("---");
        return append(jobPath(), header);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to stamp job ledger: " + std::string(e.what()));
        return false;
    }
}

bool Ledger::appendSubmission(const SubmissionRecord& record) noexcept {
    try {
        return append(jobPath(), {std::to_string(record.sequence) + " " + record.directory.string()});
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record submission: " + std::string(e.what()));
        return false;
    }
}

bool Ledger::appendSchedulerResponse(const std::string& response) noexcept {
    try {
        if (response.empty()) {
            return true;
        }
        return append(jobPath(), {response});
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record scheduler response: " + std::string(e.what()));
        return false;
    }
}

bool Ledger::appendSubmissionFailure(const std::string& message) noexcept {
    try {
        return append(jobPath(), {kSubmissionFailedPrefix + (message.empty() ? std::string("submission failed") : message)});
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record submission failure: " + std::string(e.what()));
        return false;
    }
}

bool Ledger::appendSkip(const std::filesystem::path& dir, const std::string& detail) noexcept {
    try {
        return append(jobPath(), {kSubmissionSkippedPrefix + dir.string() + " (" + detail + ")"});
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record skipped leaf: " + std::string(e.what()));
        return false;
    }
}

bool Ledger::beginClassificationRun(std::chrono::system_clock::time_point when) noexcept {
    try {
        const std::vector<std::string> header = {kRunRule, kClassificationTimePrefix + formatTimestamp(when), ""};
        bool ok = append(statusPath(), header);
        ok = append(successPath(), header) && ok;
        ok = append(failurePath(), header) && ok;
        return ok;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to stamp classification ledgers: " + std::string(e.what()));
        return false;
    }
}

bool Ledger::appendClassification(const ClassificationEntry& entry) noexcept {
    try {
        const std::string dir = entry.directory.string();
        const int code = statusCode(entry.status);

        if (!append(statusPath(), {std::to_string(code) + " " + dir})) {
            return false;
        }

        if (entry.status == Classification::Success) {
            std::vector<std::string> lines = {dir};
            if (entry.resultLine && !entry.resultLine->empty()) {
                lines.push_back(*entry.resultLine);
            }
            return append(successPath(), lines);
        }

        std::vector<std::string> lines = {kFailureSeparator, entry.reason + " | " + dir, ""};
        if (!entry.diagnostic.empty()) {
            lines.push_back(entry.diagnostic);
        }
        return append(failurePath(), lines);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record classification for " + entry.directory.string() + ": " + e.what());
        return false;
    }
}

bool Ledger::append(const std::filesystem::path& file, const std::vector<std::string>& lines) noexcept {
    try {
        std::ofstream out(file, std::ios::app | std::ios::binary);
        if (!out) {
            LOG_ERROR("Cannot open ledger for append: " + file.string());
            return false;
        }
        for (const auto& line : lines) {
            out << line << '\n';
        }
        out.flush();
        if (!out.good()) {
            LOG_ERROR("Write failed on ledger: " + file.string());
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Ledger write error on " + file.string() + ": " + e.what());
        return false;
    }
}

}
