/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "leafjob/selector.hpp"
#include "leafjob/ledger.hpp"
#include "leafjob/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <map>
#include <unordered_map>

namespace leafjob {

std::optional<StatusLine> parseStatusLine(const std::string& line) {
    std::size_t pos = line.find_first_not_of(" \t");
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    std::size_t end = line.find_first_of(" \t", pos);
    if (end == std::string::npos) {
        return std::nullopt;
    }

    const std::string token = line.substr(pos, end - pos);
    std::size_t digits = token[0] == '-' || token[0] == '+' ? 1 : 0;
    if (digits >= token.size() || !std::all_of(token.begin() + static_cast<std::ptrdiff_t>(digits), token.end(),
                                                [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }

    std::string path = line.substr(end);
    path.erase(0, path.find_first_not_of(" \t"));
    while (!path.empty() && (path.back() == ' ' || path.back() == '\t' || path.back() == '\r')) {
        path.pop_back();
    }
    if (path.empty()) {
        return std::nullopt;
    }

    try {
        return StatusLine{std::stoi(token), std::filesystem::path(path)};
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::vector<std::filesystem::path> selectFailures(std::istream& ledger) {
    std::vector<StatusLine> entries;
    std::unordered_map<std::string, std::size_t> latest;

    std::string line;
    while (std::getline(ledger, line)) {
        auto parsed = parseStatusLine(line);
        if (!parsed) {
            continue;
        }
        latest[parsed->directory.string()] = entries.size();
        entries.push_back(std::move(*parsed));
    }

    std::vector<std::filesystem::path> failures;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        if (latest[entry.directory.string()] == i && entry.code < 0) {
            failures.push_back(entry.directory);
        }
    }

    LOG_DEBUG("Selected " + std::to_string(failures.size()) + " failed directories from " +
              std::to_string(latest.size()) + " recorded");
    return failures;
}

std::optional<std::vector<std::filesystem::path>> selectFailures(const std::filesystem::path& ledger) {
    std::ifstream in(ledger);
    if (!in) {
        LOG_ERROR("Data file not found: " + ledger.string());
        return std::nullopt;
    }
    return selectFailures(in);
}

namespace {
bool startsWith(const std::string& line, const char* prefix) {
    return line.compare(0, std::strlen(prefix), prefix) == 0;
}
}

std::set<std::filesystem::path> selectAwaitingResults(std::istream& jobLedger, std::istream& statusLedger) {
    // Stamps are "YYYY-mm-dd HH:MM:SS" and order lexicographically.
    std::map<std::filesystem::path, std::string> submitted;
    std::optional<std::filesystem::path> last;
    std::string stamp;
    bool dryRun = false;

    std::string line;
    while (std::getline(jobLedger, line)) {
        if (startsWith(line, kSubmissionRunPrefix)) {
            stamp = line.substr(std::strlen(kSubmissionRunPrefix));
            dryRun = false;
            last.reset();
            continue;
        }
        if (startsWith(line, kDryRunMarker)) {
            dryRun = true;
            continue;
        }
        if (startsWith(line, kSubmissionFailedPrefix)) {
            if (last) {
                submitted.erase(*last);
            }
            last.reset();
            continue;
        }
        auto record = parseStatusLine(line);
        if (!record || record->code <= 0 || !record->directory.is_absolute()) {
            continue;
        }
        last = record->directory;
        if (!dryRun) {
            submitted[record->directory] = stamp;
        }
    }

    std::map<std::filesystem::path, std::string> classified;
    stamp.clear();
    while (std::getline(statusLedger, line)) {
        if (startsWith(line, kClassificationTimePrefix)) {
            stamp = line.substr(std::strlen(kClassificationTimePrefix));
            continue;
        }
        if (auto entry = parseStatusLine(line)) {
            classified[entry->directory] = stamp;
        }
    }

    std::set<std::filesystem::path> awaiting;
    for (const auto& [dir, when] : submitted) {
        auto it = classified.find(dir);
        if (it == classified.end() || it->second <= when) {
            awaiting.insert(dir);
        }
    }

    LOG_DEBUG(std::to_string(awaiting.size()) + " submitted directories await classification");
    return awaiting;
}

std::set<std::filesystem::path> selectAwaitingResults(const std::filesystem::path& jobLedger,
                                                      const std::filesystem::path& statusLedger) {
    std::ifstream jobs(jobLedger);
    if (!jobs) {
        return {};
    }
    // A missing status ledger reads as empty: nothing classified yet.
    std::ifstream status(statusLedger);
    return selectAwaitingResults(jobs, status);
}

}
