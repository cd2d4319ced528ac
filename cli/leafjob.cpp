/*
 * leafjob - Batch orchestration CLI
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "leafjob/batch.hpp"
#include "leafjob/config.hpp"
#include "leafjob/logger.hpp"
#include "leafjob/submitter.hpp"
#include <csignal>
#include <iostream>
#include <memory>

using namespace leafjob;

constexpr const char* VERSION = "1.0.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

int main(int argc, char* argv[]) {
    // Default to WARN so stdout stays readable; LEAFJOB_LOG_LEVEL overrides
    if (!Logger::levelFromEnv())
        Logger::setLevel(LogLevel::WARN);

    ParseResult parsed = parseArguments(argc, argv);
    switch (parsed.status) {
        case ParseStatus::Help:
            printUsage(argv[0]);
            return kExitOk;
        case ParseStatus::Version:
            std::cout << VERSION << "\n";
            return kExitOk;
        case ParseStatus::Error:
            std::cerr << "Error: " << parsed.message << "\n\n";
            printUsage(argv[0]);
            return kExitFatal;
        case ParseStatus::Ok:
            break;
    }

    const Config& config = parsed.config;
    if (config.verbose && !Logger::levelFromEnv()) {
        Logger::setLevel(LogLevel::DEBUG);
    }
    if (!config.logFile.empty() && !Logger::setLogFile(config.logFile)) {
        std::cerr << "Error: cannot open log file: " << config.logFile.string() << std::endl;
        return kExitFatal;
    }

    std::string problem = validateConfig(config, parsed.command);
    if (!problem.empty()) {
        LOG_ERROR("Configuration error: " + problem);
        std::cerr << "Error: " << problem << std::endl;
        return kExitFatal;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        auto submitter = std::make_unique<SchedulerSubmitter>(config.submitCommand, config.script, config.cancelCommand);
        Batch batch(config, std::move(submitter), [] { return g_shutdown_requested != 0; });

        int code = batch.run(parsed.command);
        if (g_shutdown_requested) {
            std::cerr << "\nInterrupted; ledgers keep every entry written so far" << std::endl;
            return code == kExitOk ? kExitInterrupted : code;
        }
        return code;
    } catch (const std::exception& e) {
        LOG_ERROR("leafjob error: " + std::string(e.what()));
        return kExitFatal;
    }
}
