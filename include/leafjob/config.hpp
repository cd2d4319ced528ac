/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace leafjob {

// Run settings, built once from the command line and passed by const reference.
struct Config {
    std::filesystem::path root;
    std::string pattern;
    std::size_t quota = 100;
    bool dryRun = false;
    bool verbose = false;
    std::filesystem::path workDir;
    std::filesystem::path logFile;

    std::vector<std::string> requiredFiles = {"POSCAR", "INCAR", "KPOINTS", "POTCAR"};
    std::string primaryOutput = "OUTCAR";
    std::string secondaryOutput = "print_out";
    std::string convergenceMarker = "reached";
    std::string resultMarker = "E0";
    std::size_t tailLines = 10;

    std::string script = "vasp.sbatch";
    std::string submitCommand = "sbatch";
    std::string cancelCommand = "scancel";
};

struct SubmitNew {};
struct ResubmitFailures {};
struct CheckResults {};
struct CancelJobs {
    std::uint64_t first = 0;
    std::uint64_t last = 0;
};

using Command = std::variant<SubmitNew, ResubmitFailures, CheckResults, CancelJobs>;

[[nodiscard]] const char* describe(const Command& command) noexcept;

enum class ParseStatus : uint8_t { Ok, Help, Version, Error };

struct ParseResult {
    ParseStatus status = ParseStatus::Error;
    Config config;
    Command command;
    std::string message;
    explicit operator bool() const noexcept { return status == ParseStatus::Ok; }
};

// Parses `leafjob <command> [options]`; never touches the filesystem.
[[nodiscard]] ParseResult parseArguments(int argc, const char* const argv[]);

// Environment checks that must pass before any processing: root exists,
// external commands are installed (unless dry-run).
[[nodiscard]] std::string validateConfig(const Config& config, const Command& command);

void printUsage(const char* progName);

}
