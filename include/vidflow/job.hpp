/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "vidflow/types.hpp"

namespace vidflow {

using Timestamp = std::chrono::system_clock::time_point;

// Where the finished video landed.
struct JobResult {
    std::string objectKey;
    std::string bucket;
    std::uintmax_t sizeBytes = 0;
    Timestamp createdAt;
};

// Persisted job record.
struct Job {
    JobId id;
    std::optional<std::string> owner;
    std::string name;
    JobStatus status = JobStatus::Pending;
    int progress = 0;
    std::string currentStep;
    std::optional<std::string> errorMessage;
    Timestamp createdAt;
    std::optional<Timestamp> startedAt;
    std::optional<Timestamp> completedAt;
    bool markedAsRead = false;
    std::optional<JobResult> result;
};

// Status triple read on every checkpoint.
struct JobSnapshot {
    JobStatus status = JobStatus::Pending;
    int progress = 0;
    std::string step;
};

}
