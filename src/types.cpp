/*
 * leafjob - Leaf-directory batch orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "leafjob/types.hpp"

namespace leafjob {

int statusCode(Classification status) noexcept {
    switch (status) {
        case Classification::Success: return 1;
        case Classification::MissingOutput: return -1;
        case Classification::UnexpectedTermination: return -1;
        case Classification::NonConverged: return -2;
    }
    return -1;
}

const char* toString(SubmissionState state) noexcept {
    switch (state) {
        case SubmissionState::Unvisited: return "unvisited";
        case SubmissionState::Eligible: return "eligible";
        case SubmissionState::Submitted: return "submitted";
        case SubmissionState::Failed: return "failed";
        case SubmissionState::Skipped: return "skipped";
        default: return "unknown";
    }
}

const char* toString(SkipReason reason) noexcept {
    switch (reason) {
        case SkipReason::None: return "none";
        case SkipReason::NonMatching: return "non-matching";
        case SkipReason::MissingFiles: return "missing-files";
        case SkipReason::AlreadyHasOutput: return "already-has-output";
        case SkipReason::QuotaExceeded: return "quota-exceeded";
        case SkipReason::NotFound: return "not-found";
        case SkipReason::AlreadySubmitted: return "already-submitted";
        default: return "unknown";
    }
}

const char* toString(Classification status) noexcept {
    switch (status) {
        case Classification::Success: return "success";
        case Classification::MissingOutput: return "missing-output";
        case Classification::UnexpectedTermination: return "unexpected-termination";
        case Classification::NonConverged: return "non-converged";
        default: return "unknown";
    }
}

}
