/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace leafjob {

enum class FileProblem : uint8_t { None, Missing, NotRegular, Unreadable };

// Checks that every required input file of a leaf is present and readable.
class Validator {
public:
    explicit Validator(std::vector<std::string> requiredFiles) noexcept;

    // Names of required files that are missing or unreadable; empty means satisfied.
    [[nodiscard]] std::set<std::string> validate(const std::filesystem::path& dir) const noexcept;

    [[nodiscard]] const std::vector<std::string>& requiredFiles() const noexcept { return required_; }

    [[nodiscard]] static FileProblem inspect(const std::filesystem::path& file) noexcept;

private:
    std::vector<std::string> required_;
};

}
