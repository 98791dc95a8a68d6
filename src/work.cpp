/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/work.hpp"
#include "vidflow/logger.hpp"
#include "vidflow/store.hpp"

namespace vidflow {

Work::Work(JobStateStore& store) noexcept
    : store_(store) {}

SubmitResult Work::submit(const GenerationSpec& spec, const std::optional<std::string>& owner) {
    if (spec.prompt.size() > maxBytes_) {
        LOG_DEBUG("Prompt exceeds size limit: " + std::to_string(spec.prompt.size()) + " > " +
                  std::to_string(maxBytes_));
        return {false, "", SubmissionError::InvalidSize,
                "Prompt exceeds maximum size limit (" + std::to_string(maxBytes_) + " bytes)"};
    }
    if (auto problem = spec.validate()) {
        LOG_DEBUG("Invalid spec: " + *problem);
        return {false, "", SubmissionError::InvalidContent, *problem};
    }

    auto id = store_.createJob(spec, owner);
    if (!id) {
        LOG_ERROR("Failed to create job");
        return {false, "", SubmissionError::StoreError, "Failed to create job"};
    }

    LOG_INFO("Job submitted successfully: " + *id);
    return {true, *id, SubmissionError::None, ""};
}

bool Work::cancel(const JobId& id) noexcept {
    return store_.requestCancel(id);
}

bool Work::markAsRead(const JobId& id) noexcept {
    return store_.markAsRead(id);
}

bool Work::remove(const JobId& id) noexcept {
    return store_.removeJob(id);
}

}
