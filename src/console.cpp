/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "leafjob/console.hpp"
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace leafjob {

namespace {
std::string wallClock() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", std::localtime(&time));
    return buf;
}

bool colorEnabled() {
    static const bool enabled = ::isatty(fileno(stdout)) != 0;
    return enabled;
}

const char* color(Tone tone) {
    if (!colorEnabled()) return "";
    switch (tone) {
        case Tone::Good: return "\033[32m";
        case Tone::Warn: return "\033[33m";
        case Tone::Bad:  return "\033[31m";
        case Tone::Dim:  return "\033[90m";
        default: return "";
    }
}

const char* reset() {
    return colorEnabled() ? "\033[0m" : "";
}
}

void printProgress(const std::string& subject, const std::string& state, Tone tone,
                   const std::string& detail) {
    std::cout << "    " << color(Tone::Dim) << wallClock() << reset() << "  " << subject
              << "  " << color(tone) << state << reset();
    if (!detail.empty()) {
        std::cout << "  " << detail;
    }
    std::cout << "\n" << std::flush;
}

void printSummary(const std::string& title, const std::vector<std::pair<std::string, std::string>>& rows,
                  std::chrono::steady_clock::duration elapsed) {
    std::cout << "\n  " << title << "\n\n";
    for (const auto& [label, value] : rows) {
        std::cout << "    " << std::left << std::setw(12) << label << value << "\n";
    }
    auto seconds = std::chrono::duration<double>(elapsed).count();
    std::cout << "    " << std::left << std::setw(12) << "Duration"
              << std::fixed << std::setprecision(1) << seconds << "s\n\n" << std::flush;
}

}
