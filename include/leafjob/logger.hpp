/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace leafjob {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool levelFromEnv() noexcept;

    // Mirror every emitted line into an append-only file. Empty path closes the sink.
    [[nodiscard]] static bool setLogFile(const std::filesystem::path& path) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::leafjob::Logger::error(msg)
#define LOG_WARN(msg)  ::leafjob::Logger::warn(msg)
#define LOG_INFO(msg)  ::leafjob::Logger::info(msg)
#define LOG_DEBUG(msg) ::leafjob::Logger::debug(msg)
#define LOG_TRACE(msg) ::leafjob::Logger::trace(msg)
