/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace leafjob {

struct CommandResult {
    bool ok = false;
    int exitCode = -1;
    std::string output;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Runs argv[0] (looked up on PATH) in workDir and blocks until it exits.
// Standard output is captured; standard error is inherited.
[[nodiscard]] CommandResult runCommand(const std::vector<std::string>& argv,
                                       const std::filesystem::path& workDir = {}) noexcept;

// Resolves a command name against PATH; names containing '/' are checked as given.
[[nodiscard]] std::optional<std::filesystem::path> findExecutable(const std::string& name) noexcept;

}
