/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "leafjob/validator.hpp"
#include "leafjob/logger.hpp"
#include <unistd.h>

namespace leafjob {

Validator::Validator(std::vector<std::string> requiredFiles) noexcept
    : required_(std::move(requiredFiles)) {
}

std::set<std::string> Validator::validate(const std::filesystem::path& dir) const noexcept {
    std::set<std::string> missing;

    try {
        for (const auto& name : required_) {
            switch (inspect(dir / name)) {
                case FileProblem::None:
                    break;
                case FileProblem::Missing:
                    LOG_DEBUG("Required file missing: " + (dir / name).string());
                    missing.insert(name);
                    break;
                case FileProblem::NotRegular:
                    LOG_WARN("Required file is not a regular file: " + (dir / name).string());
                    missing.insert(name);
                    break;
                case FileProblem::Unreadable:
                    LOG_WARN("Required file present but unreadable: " + (dir / name).string());
                    missing.insert(name);
                    break;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Validator error in " + dir.string() + ": " + e.what());
    }

    return missing;
}

FileProblem Validator::inspect(const std::filesystem::path& file) noexcept {
    std::error_code ec;
    auto st = std::filesystem::status(file, ec);
    if (st.type() == std::filesystem::file_type::not_found) {
        return FileProblem::Missing;
    }
    // Present but cannot be resolved (symlink loop, unsearchable parent).
    if (ec || !std::filesystem::exists(st)) {
        return FileProblem::Unreadable;
    }
    if (!std::filesystem::is_regular_file(st)) {
        return FileProblem::NotRegular;
    }
    if (::access(file.c_str(), R_OK) != 0) {
        return FileProblem::Unreadable;
    }
    return FileProblem::None;
}

}
