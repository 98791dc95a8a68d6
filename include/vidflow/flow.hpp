/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "vidflow/generation_spec.hpp"
#include "vidflow/job.hpp"
#include "vidflow/types.hpp"

namespace vidflow {

class JobStateStore;

// Per-owner counts. Active covers Pending and Processing.
struct JobStats {
    std::size_t total = 0;
    std::size_t active = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t unread = 0;
};

// Read side of the job API.
class Flow {
public:
    explicit Flow(const JobStateStore& store) noexcept;

    Flow(const Flow&) = delete;
    Flow& operator=(const Flow&) = delete;

    [[nodiscard]] std::optional<Job> latest() const noexcept;
    [[nodiscard]] std::optional<Job> get(const JobId& id) const noexcept;

    // Newest first.
    [[nodiscard]] std::vector<Job> list(std::optional<JobStatus> status = std::nullopt,
                                        std::size_t max = 10) const noexcept;
    [[nodiscard]] std::optional<JobStatus> status(const JobId& id) const noexcept;

    // Jobs submitted by `owner`, newest first.
    [[nodiscard]] std::vector<Job> listByOwner(const std::string& owner,
                                               std::size_t max = 10) const noexcept;
    // Every job of `owner` not yet marked as read, newest first. Active jobs
    // are included.
    [[nodiscard]] std::vector<Job> unread(const std::string& owner) const noexcept;
    [[nodiscard]] JobStats stats(const std::string& owner) const noexcept;

    [[nodiscard]] bool exists(const JobId& id) const noexcept;
    [[nodiscard]] std::optional<std::string> error(const JobId& id) const noexcept;
    [[nodiscard]] std::optional<GenerationSpec> spec(const JobId& id) const noexcept;

private:
    // All jobs matching `keep`, newest first, at most `max`.
    template <typename Pred>
    std::vector<Job> collect(std::optional<JobStatus> status, std::size_t max, Pred keep) const noexcept;

    const JobStateStore& store_;
};

}
