/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/types.hpp"
#include <algorithm>
#include <cctype>

namespace vidflow {

const char* toString(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Processing: return "processing";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        case JobStatus::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

const char* toString(StageKind stage) noexcept {
    switch (stage) {
        case StageKind::Preprocess: return "preprocess";
        case StageKind::Generate: return "generate";
        case StageKind::Interpolate: return "interpolate";
        case StageKind::Upscale: return "upscale";
        case StageKind::Postprocess: return "postprocess";
        default: return "unknown";
    }
}

std::optional<JobStatus> parseStatus(const std::string& value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "pending") return JobStatus::Pending;
    if (lower == "processing") return JobStatus::Processing;
    if (lower == "completed") return JobStatus::Completed;
    if (lower == "failed") return JobStatus::Failed;
    if (lower == "cancelled") return JobStatus::Cancelled;
    return std::nullopt;
}

}
