/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "leafjob/output_parser.hpp"
#include "leafjob/logger.hpp"
#include <deque>
#include <fstream>

namespace leafjob {

OutputParser::OutputParser(std::string marker, std::string resultMarker, std::size_t tailLines) noexcept
    : marker_(std::move(marker)), resultMarker_(std::move(resultMarker)), tailLines_(tailLines) {
}

OutputScan OutputParser::scan(const std::filesystem::path& file) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return {};
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        LOG_WARN("Output file present but unreadable: " + file.string());
        OutputScan unreadable;
        unreadable.present = true;
        return unreadable;
    }
    return scan(in);
}

OutputScan OutputParser::scan(std::istream& in) const {
    OutputScan result;
    result.present = true;

    std::deque<std::string> tail;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!marker_.empty() && !result.hasMarker && line.find(marker_) != std::string::npos) {
            result.hasMarker = true;
            // Nothing else to collect; primary outputs can be very large.
            if (resultMarker_.empty() && tailLines_ == 0) {
                break;
            }
        }
        if (!resultMarker_.empty() && line.find(resultMarker_) != std::string::npos) {
            result.lastResultLine = line;
        }
        if (tailLines_ > 0) {
            tail.push_back(line);
            if (tail.size() > tailLines_) {
                tail.pop_front();
            }
        }
    }

    result.tail.assign(tail.begin(), tail.end());
    return result;
}

}
