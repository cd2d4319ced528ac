/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "leafjob/logger.hpp"
#include <iostream>
#include <fstream>
#include <cstdlib>
#include <cstdio>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>

namespace leafjob {

static LogLevel g_level = LogLevel::INFO;
static std::mutex g_log_mutex;
static bool g_level_initialized = false;
static std::ofstream g_log_file;

static constexpr const char* kLevelEnv = "LEAFJOB_LOG_LEVEL";

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parseEnvLevel();
        g_level_initialized = true;
    }
    return g_level;
}

bool Logger::levelFromEnv() noexcept {
    const char* env_val = std::getenv(kLevelEnv);
    return env_val != nullptr && *env_val != '\0';
}

bool Logger::setLogFile(const std::filesystem::path& path) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    try {
        if (g_log_file.is_open()) {
            g_log_file.close();
        }
        if (path.empty()) {
            return true;
        }
        g_log_file.clear();
        g_log_file.open(path, std::ios::app);
        return g_log_file.is_open();
    } catch (const std::exception& e) {
        std::cerr << "Failed to open log file " << path.string() << ": " << e.what() << std::endl;
        return false;
    }
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
            return; // Skip if below threshold
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::stringstream ss;
        ss << "[" << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        ss << " [" << levelToString(level) << "]";
        ss << " " << message;

        {
            // All logs go to stderr - keep stdout for progress and summary
            std::lock_guard<std::mutex> lock(g_log_mutex);
            std::cerr << ss.str() << std::endl;
            if (g_log_file.is_open()) {
                g_log_file << ss.str() << std::endl;
            }
        }
    } catch (const std::exception&) {
        // Never throw from logging; report the formatting failure once, unformatted
        std::fputs("leafjob: log write failed\n", stderr);
    }
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env_val = std::getenv(kLevelEnv);
    if (!env_val) return LogLevel::INFO;

    // Case-insensitive comparison
    std::string level_str(env_val);
    for (char& c : level_str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (level_str == "error") return LogLevel::ERROR;
    if (level_str == "warn" || level_str == "warning") return LogLevel::WARN;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "trace") return LogLevel::TRACE;

    return LogLevel::INFO; // Default fallback
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

}
