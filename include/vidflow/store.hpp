/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "vidflow/generation_spec.hpp"
#include "vidflow/job.hpp"
#include "vidflow/types.hpp"

namespace vidflow {

// True for the edges of the job state machine:
// Pending->Processing, Processing->Completed|Failed, Pending|Processing->Cancelled.
[[nodiscard]] bool isAllowedTransition(JobStatus from, JobStatus to) noexcept;

// Unique, time-ordered job identifier.
[[nodiscard]] JobId generateJobId();

// Authoritative job state. Every write is individually atomic; a record in a
// terminal status is never mutated again. A Cancelled job reports no error
// message, even when a failing stage recorded one just before the cancel.
class JobStateStore {
public:
    virtual ~JobStateStore() = default;

    [[nodiscard]] virtual std::optional<JobId> createJob(
        const GenerationSpec& spec,
        const std::optional<std::string>& owner = std::nullopt) noexcept = 0;

    [[nodiscard]] virtual std::optional<JobSnapshot> getStatus(const JobId& id) const noexcept = 0;
    [[nodiscard]] virtual std::optional<Job> getJob(const JobId& id) const noexcept = 0;
    [[nodiscard]] virtual std::optional<GenerationSpec> getSpec(const JobId& id) const noexcept = 0;

    // Ids in creation order, optionally filtered by status.
    [[nodiscard]] virtual std::vector<JobId> listJobs(
        std::optional<JobStatus> status = std::nullopt) const noexcept = 0;

    // Compare-and-set on status. With `from` unset the current status is used.
    // Returns false when the edge is not allowed or the job moved meanwhile.
    [[nodiscard]] virtual bool transitionStatus(const JobId& id, std::optional<JobStatus> from,
                                                JobStatus to) noexcept = 0;

    // The three writers below only succeed while the job is Processing.
    [[nodiscard]] virtual bool setProgress(const JobId& id, int percent, const std::string& step) noexcept = 0;
    [[nodiscard]] virtual bool setError(const JobId& id, const std::string& message) noexcept = 0;
    [[nodiscard]] virtual bool saveResult(const JobId& id, const std::string& objectKey,
                                          const std::string& bucket, std::uintmax_t sizeBytes) noexcept = 0;

    // Acknowledges a finished job. The read flag is the only field written
    // after a terminal status.
    [[nodiscard]] virtual bool markAsRead(const JobId& id) noexcept = 0;

    // Deletes a finished job and everything recorded for it. Active jobs
    // are never removed.
    [[nodiscard]] virtual bool removeJob(const JobId& id) noexcept = 0;

    // False when the job is unknown or unreadable.
    [[nodiscard]] bool isCancelled(const JobId& id) const noexcept;
    [[nodiscard]] bool isCompleted(const JobId& id) const noexcept;

    // Pending or Processing -> Cancelled. False from any terminal status.
    [[nodiscard]] bool requestCancel(const JobId& id) noexcept;
};

class MemoryJobStore final : public JobStateStore {
public:
    MemoryJobStore() = default;

    MemoryJobStore(const MemoryJobStore&) = delete;
    MemoryJobStore& operator=(const MemoryJobStore&) = delete;

    [[nodiscard]] std::optional<JobId> createJob(
        const GenerationSpec& spec,
        const std::optional<std::string>& owner = std::nullopt) noexcept override;

    [[nodiscard]] std::optional<JobSnapshot> getStatus(const JobId& id) const noexcept override;
    [[nodiscard]] std::optional<Job> getJob(const JobId& id) const noexcept override;
    [[nodiscard]] std::optional<GenerationSpec> getSpec(const JobId& id) const noexcept override;
    [[nodiscard]] std::vector<JobId> listJobs(
        std::optional<JobStatus> status = std::nullopt) const noexcept override;

    [[nodiscard]] bool transitionStatus(const JobId& id, std::optional<JobStatus> from,
                                        JobStatus to) noexcept override;
    [[nodiscard]] bool setProgress(const JobId& id, int percent, const std::string& step) noexcept override;
    [[nodiscard]] bool setError(const JobId& id, const std::string& message) noexcept override;
    [[nodiscard]] bool saveResult(const JobId& id, const std::string& objectKey,
                                  const std::string& bucket, std::uintmax_t sizeBytes) noexcept override;
    [[nodiscard]] bool markAsRead(const JobId& id) noexcept override;
    [[nodiscard]] bool removeJob(const JobId& id) noexcept override;

private:
    struct Record {
        Job job;
        GenerationSpec spec;
    };

    Record* find(const JobId& id);
    const Record* find(const JobId& id) const;

    mutable std::mutex mutex_;
    std::unordered_map<JobId, Record> records_;
    std::vector<JobId> order_;
};

}
