/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace leafjob {

struct OutputScan {
    bool present = false;
    bool hasMarker = false;
    std::optional<std::string> lastResultLine;
    std::vector<std::string> tail;
};

// Line-oriented scan of a simulation output artifact. A marker matches when it
// occurs anywhere in a line; for the result marker the last matching line wins.
class OutputParser {
public:
    OutputParser(std::string marker, std::string resultMarker, std::size_t tailLines) noexcept;

    [[nodiscard]] OutputScan scan(const std::filesystem::path& file) const;
    [[nodiscard]] OutputScan scan(std::istream& in) const;

private:
    std::string marker_;
    std::string resultMarker_;
    std::size_t tailLines_;
};

}
