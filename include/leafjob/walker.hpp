/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "leafjob/types.hpp"

namespace leafjob {

// Enumerates the leaf directories (no subdirectory at any depth) below a root.
// The root itself is never reported. Order is the sorted path order, so an
// unchanged tree always enumerates identically.
class Walker {
public:
    explicit Walker(const std::filesystem::path& root) noexcept;

    Walker(const Walker&) = delete;
    Walker& operator=(const Walker&) = delete;
    Walker(Walker&&) noexcept = default;
    Walker& operator=(Walker&&) noexcept = default;

    // Every leaf, with the match flag set against pattern.
    [[nodiscard]] std::vector<JobDirectory> leaves(const std::string& pattern) const noexcept;

    // Only the matching leaves.
    [[nodiscard]] std::vector<std::filesystem::path> walk(const std::string& pattern) const noexcept;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    // Plain substring containment on the full path; empty pattern matches all.
    [[nodiscard]] static bool matches(const std::filesystem::path& dir, const std::string& pattern) noexcept;

private:
    std::filesystem::path root_;

    [[nodiscard]] std::vector<std::filesystem::path> collectDirectories() const;
};

}
