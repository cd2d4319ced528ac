/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace leafjob {

enum class Tone : uint8_t { Plain, Good, Warn, Bad, Dim };

// Per-leaf progress on stdout: "    HH:MM:SS  <subject>  <state>  <detail>".
void printProgress(const std::string& subject, const std::string& state, Tone tone,
                   const std::string& detail = "");

// End-of-run block of aligned label/value rows plus the elapsed time.
void printSummary(const std::string& title, const std::vector<std::pair<std::string, std::string>>& rows,
                  std::chrono::steady_clock::duration elapsed);

}
