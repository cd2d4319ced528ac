/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "leafjob/process.hpp"
#include "leafjob/logger.hpp"
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace leafjob {

namespace {
std::string errnoMessage(const std::string& what) {
    return what + ": " + std::strerror(errno);
}
}

CommandResult runCommand(const std::vector<std::string>& argv, const std::filesystem::path& workDir) noexcept {
    CommandResult result;

    if (argv.empty()) {
        result.error = "Empty command";
        return result;
    }

    try {
        int fds[2];
        if (::pipe(fds) != 0) {
            result.error = errnoMessage("pipe failed");
            return result;
        }

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);

        pid_t pid = ::fork();
        if (pid == -1) {
            result.error = errnoMessage("fork failed");
            ::close(fds[0]);
            ::close(fds[1]);
            return result;
        }

        if (pid == 0) {
            // Child: only async-signal-safe calls from here on
            ::close(fds[0]);
            ::dup2(fds[1], STDOUT_FILENO);
            ::close(fds[1]);
            if (!workDir.empty() && ::chdir(workDir.c_str()) != 0) {
                _exit(126);
            }
            ::execvp(args[0], args.data());
            _exit(127);
        }

        ::close(fds[1]);
        std::array<char, 4096> buf;
        while (true) {
            ssize_t n = ::read(fds[0], buf.data(), buf.size());
            if (n > 0) {
                result.output.append(buf.data(), static_cast<std::size_t>(n));
            } else if (n == 0) {
                break;
            } else if (errno != EINTR) {
                LOG_WARN(errnoMessage("Reading output of " + argv[0] + " failed"));
                break;
            }
        }
        ::close(fds[0]);

        int status = 0;
        while (::waitpid(pid, &status, 0) == -1) {
            if (errno != EINTR) {
                result.error = errnoMessage("waitpid failed");
                return result;
            }
        }

        if (WIFEXITED(status)) {
            result.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exitCode = 128 + WTERMSIG(status);
        }

        result.ok = result.exitCode == 0;
        if (result.exitCode == 126) {
            result.error = "Cannot enter directory " + workDir.string();
        } else if (result.exitCode == 127) {
            result.error = "Cannot execute " + argv[0];
        } else if (!result.ok) {
            result.error = argv[0] + " exited with status " + std::to_string(result.exitCode);
        }
        LOG_TRACE(argv[0] + " exited " + std::to_string(result.exitCode));
        return result;
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = "Command error: " + std::string(e.what());
        return result;
    }
}

std::optional<std::filesystem::path> findExecutable(const std::string& name) noexcept {
    try {
        if (name.empty()) {
            return std::nullopt;
        }
        if (name.find('/') != std::string::npos) {
            if (::access(name.c_str(), X_OK) == 0) {
                return std::filesystem::path(name);
            }
            return std::nullopt;
        }

        const char* pathEnv = std::getenv("PATH");
        if (!pathEnv) {
            return std::nullopt;
        }

        std::stringstream ss(pathEnv);
        std::string dir;
        while (std::getline(ss, dir, ':')) {
            if (dir.empty()) {
                dir = ".";
            }
            auto candidate = std::filesystem::path(dir) / name;
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
                return candidate;
            }
        }
        return std::nullopt;
    } catch (const std::exception& e) {
        LOG_ERROR("PATH lookup failed for " + name + ": " + e.what());
        return std::nullopt;
    }
}

}
