/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "leafjob/config.hpp"
#include "leafjob/process.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <optional>
#include <sstream>

namespace leafjob {

namespace {
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::optional<std::uint64_t> parseNumber(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::optional<Command> commandFromWord(const std::string& word) {
    if (word == "submit") return Command{SubmitNew{}};
    if (word == "resubmit") return Command{ResubmitFailures{}};
    if (word == "check") return Command{CheckResults{}};
    if (word == "cancel") return Command{CancelJobs{}};
    return std::nullopt;
}

ParseResult fail(std::string message) {
    ParseResult result;
    result.status = ParseStatus::Error;
    result.message = std::move(message);
    return result;
}
}

const char* describe(const Command& command) noexcept {
    return std::visit(overloaded{
        [](const SubmitNew&) { return "Submit new jobs"; },
        [](const ResubmitFailures&) { return "Resubmit failed jobs"; },
        [](const CheckResults&) { return "Check calculation status"; },
        [](const CancelJobs&) { return "Cancel queued jobs"; },
    }, command);
}

ParseResult parseArguments(int argc, const char* const argv[]) {
    ParseResult result;
    result.command = SubmitNew{};
    Config& cfg = result.config;

    bool commandSeen = false;
    bool jobSeen = false;
    std::uint64_t jobFirst = 0;
    std::uint64_t jobLast = 0;

    std::string root = ".";
    std::string workDir = ".";

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto value = [&](std::string& out) -> bool {
            if (i + 1 >= argc) {
                return false;
            }
            out = argv[++i];
            return true;
        };
        std::string v;

        if (arg == "-h" || arg == "--help") {
            result.status = ParseStatus::Help;
            return result;
        } else if (arg == "--version") {
            result.status = ParseStatus::Version;
            return result;
        } else if (arg == "-c" || arg == "--command") {
            if (!value(v)) return fail("Command number required for " + arg);
            auto op = parseNumber(v);
            if (!op || *op > 1) return fail("Invalid command number: " + v);
            result.command = *op == 0 ? Command{SubmitNew{}} : Command{ResubmitFailures{}};
            commandSeen = true;
        } else if (arg == "-d" || arg == "--dir" || arg == "-to") {
            if (!value(root) || root.empty()) return fail("Directory path required for " + arg);
        } else if (arg == "-m" || arg == "--match") {
            if (!value(cfg.pattern)) return fail("Match pattern required for " + arg);
        } else if (arg == "-q" || arg == "--quota" || arg == "--max-jobs") {
            if (!value(v)) return fail("Quota required for " + arg);
            auto quota = parseNumber(v);
            if (!quota) return fail("Quota must be a non-negative number: " + v);
            cfg.quota = static_cast<std::size_t>(*quota);
        } else if (arg == "-n" || arg == "--dry-run") {
            cfg.dryRun = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "-w" || arg == "--work-dir") {
            if (!value(workDir) || workDir.empty()) return fail("Directory path required for " + arg);
        } else if (arg == "--log") {
            if (!value(v) || v.empty()) return fail("Log file required for " + arg);
            cfg.logFile = v;
        } else if (arg == "-s" || arg == "--screen") {
            if (!value(cfg.primaryOutput) || cfg.primaryOutput.empty()) return fail("Screen file required for " + arg);
        } else if (arg == "-f" || arg == "--file") {
            if (!value(cfg.secondaryOutput) || cfg.secondaryOutput.empty()) return fail("File name required for " + arg);
        } else if (arg == "--marker") {
            if (!value(cfg.convergenceMarker) || cfg.convergenceMarker.empty()) return fail("Marker required for " + arg);
        } else if (arg == "--result-marker") {
            if (!value(cfg.resultMarker) || cfg.resultMarker.empty()) return fail("Marker required for " + arg);
        } else if (arg == "--tail") {
            if (!value(v)) return fail("Line count required for " + arg);
            auto lines = parseNumber(v);
            if (!lines) return fail("Tail line count must be a number: " + v);
            cfg.tailLines = static_cast<std::size_t>(*lines);
        } else if (arg == "--require") {
            if (!value(v)) return fail("File list required for " + arg);
            cfg.requiredFiles = splitList(v);
            if (cfg.requiredFiles.empty()) return fail("Required file list is empty");
        } else if (arg == "--script") {
            if (!value(cfg.script) || cfg.script.empty()) return fail("Script name required for " + arg);
        } else if (arg == "--submit-cmd") {
            if (!value(cfg.submitCommand) || cfg.submitCommand.empty()) return fail("Command required for " + arg);
        } else if (arg == "--cancel-cmd") {
            if (!value(cfg.cancelCommand) || cfg.cancelCommand.empty()) return fail("Command required for " + arg);
        } else if (arg == "-j" || arg == "--job") {
            if (!value(v)) return fail("Job id or range required for " + arg);
            auto parts = splitList(v);
            if (parts.empty() || parts.size() > 2) return fail("Job range must be START or START,END: " + v);
            auto first = parseNumber(parts[0]);
            auto last = parts.size() == 2 ? parseNumber(parts[1]) : first;
            if (!first || !last) return fail("Job ids must be numbers: " + v);
            if (*last < *first) return fail("Job range end precedes start: " + v);
            jobFirst = *first;
            jobLast = *last;
            jobSeen = true;
        } else if (!arg.empty() && arg[0] != '-' && !commandSeen) {
            auto command = commandFromWord(arg);
            if (!command) return fail("Unknown command: " + arg);
            result.command = *command;
            commandSeen = true;
        } else {
            return fail(arg + " is not a valid option");
        }
    }

    if (auto* cancel = std::get_if<CancelJobs>(&result.command)) {
        if (!jobSeen) return fail("cancel requires --job START[,END]");
        cancel->first = jobFirst;
        cancel->last = jobLast;
    }

    cfg.root = std::filesystem::absolute(root).lexically_normal();
    cfg.workDir = std::filesystem::absolute(workDir).lexically_normal();
    result.status = ParseStatus::Ok;
    return result;
}

std::string validateConfig(const Config& config, const Command& command) {
    const bool needsTree = !std::holds_alternative<CancelJobs>(command);
    if (needsTree) {
        std::error_code ec;
        if (!std::filesystem::is_directory(config.root, ec)) {
            return "Root directory does not exist: " + config.root.string();
        }
    }

    if (config.dryRun) {
        return "";
    }

    if (std::holds_alternative<SubmitNew>(command) || std::holds_alternative<ResubmitFailures>(command)) {
        if (!findExecutable(config.submitCommand)) {
            return "Submit command not found: " + config.submitCommand;
        }
    }
    if (std::holds_alternative<CancelJobs>(command)) {
        if (!findExecutable(config.cancelCommand)) {
            return "Cancel command not found: " + config.cancelCommand;
        }
    }
    return "";
}

void printUsage(const char* progName) {
    std::cout << "leafjob - batch submission and result checking for leaf-directory jobs\n\n";
    std::cout << "Usage: " << progName << " [submit|resubmit|check|cancel] [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  submit        Submit every eligible leaf that has no output yet (default, -c 0)\n";
    std::cout << "  resubmit      Resubmit leaves whose latest status in 'datas' is negative (-c 1)\n";
    std::cout << "  check         Classify finished leaves into datas/good_datas/bad_datas\n";
    std::cout << "  cancel        Cancel scheduler jobs by id or id range\n\n";
    std::cout << "Options:\n";
    std::cout << "  -d, --dir DIR          Root of the job tree (default: current directory)\n";
    std::cout << "  -m, --match PAT        Only leaves whose path contains PAT\n";
    std::cout << "  -q, --quota N          Maximum submissions per run (default: 100)\n";
    std::cout << "  -n, --dry-run          Record and report, but submit nothing\n";
    std::cout << "      --verbose          Debug logging\n";
    std::cout << "  -w, --work-dir DIR     Ledger directory (default: current directory)\n";
    std::cout << "      --log FILE         Also append log lines to FILE\n";
    std::cout << "  -s, --screen NAME      Primary output file (default: OUTCAR)\n";
    std::cout << "  -f, --file NAME        Secondary output file (default: print_out)\n";
    std::cout << "      --marker TOKEN     Convergence marker (default: reached)\n";
    std::cout << "      --result-marker T  Result line marker (default: E0)\n";
    std::cout << "      --tail N           Diagnostic lines kept for failures (default: 10)\n";
    std::cout << "      --require LIST     Comma-separated required inputs (default: POSCAR,INCAR,KPOINTS,POTCAR)\n";
    std::cout << "      --script NAME      Submission script (default: vasp.sbatch)\n";
    std::cout << "      --submit-cmd CMD   Scheduler submit command (default: sbatch)\n";
    std::cout << "      --cancel-cmd CMD   Scheduler cancel command (default: scancel)\n";
    std::cout << "  -j, --job A[,B]        Job id or inclusive id range for cancel\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "      --version          Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  LEAFJOB_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " submit -d ./calcs -m Fe_ -q 50\n";
    std::cout << "  " << progName << " check -d ./calcs\n";
    std::cout << "  " << progName << " resubmit -d ./calcs --dry-run\n";
    std::cout << "  " << progName << " cancel -j 616242,616327\n";
}

}
