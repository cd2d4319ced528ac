/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "leafjob/walker.hpp"
#include "leafjob/logger.hpp"
#include <algorithm>
#include <unordered_set>

namespace leafjob {

namespace {
bool isRealDirectory(const std::filesystem::directory_entry& entry) {
    // Symlinked directories are not descended into, so they do not count as subdirectories either.
    std::error_code ec;
    auto st = entry.symlink_status(ec);
    return !ec && std::filesystem::is_directory(st);
}
}

Walker::Walker(const std::filesystem::path& root) noexcept {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(root, ec);
    root_ = ec ? root : absolute.lexically_normal();
    if (!root_.has_filename() && root_.has_parent_path() && root_ != root_.root_path()) {
        root_ = root_.parent_path();
    }
}

std::vector<std::filesystem::path> Walker::collectDirectories() const {
    std::vector<std::filesystem::path> dirs;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        root_, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_ERROR("Cannot read directory " + root_.string() + ": " + ec.message());
        return dirs;
    }

    for (auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            LOG_WARN("Directory walk stopped below " + root_.string() + ": " + ec.message());
            break;
        }
        if (isRealDirectory(*it)) {
            dirs.push_back(it->path());
        }
    }
    return dirs;
}

std::vector<JobDirectory> Walker::leaves(const std::string& pattern) const noexcept {
    std::vector<JobDirectory> result;

    try {
        if (!std::filesystem::is_directory(root_)) {
            LOG_ERROR("Root is not a directory: " + root_.string());
            return result;
        }

        std::vector<std::filesystem::path> dirs = collectDirectories();

        // Any directory that is the parent of another directory has a descendant and is not a leaf.
        std::unordered_set<std::string> parents;
        for (const auto& dir : dirs) {
            parents.insert(dir.parent_path().string());
        }

        std::sort(dirs.begin(), dirs.end());

        for (const auto& dir : dirs) {
            if (parents.count(dir.string()) > 0) {
                continue;
            }
            JobDirectory job;
            job.path = dir;
            job.leaf = true;
            job.matches = matches(dir, pattern);
            result.push_back(std::move(job));
            LOG_TRACE("Found leaf: " + dir.string());
        }

        LOG_DEBUG("Walker found " + std::to_string(result.size()) + " leaves under " + root_.string());
    } catch (const std::exception& e) {
        LOG_ERROR("Walker error: " + std::string(e.what()));
        result.clear();
    }

    return result;
}

std::vector<std::filesystem::path> Walker::walk(const std::string& pattern) const noexcept {
    std::vector<std::filesystem::path> paths;
    for (auto& job : leaves(pattern)) {
        if (job.matches) {
            paths.push_back(std::move(job.path));
        }
    }
    return paths;
}

bool Walker::matches(const std::filesystem::path& dir, const std::string& pattern) noexcept {
    if (pattern.empty()) {
        return true;
    }
    return dir.string().find(pattern) != std::string::npos;
}

}
