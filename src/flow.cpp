/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/flow.hpp"
#include "vidflow/logger.hpp"
#include "vidflow/store.hpp"
#include <algorithm>
#include <limits>

namespace vidflow {

Flow::Flow(const JobStateStore& store) noexcept
    : store_(store) {}

std::optional<Job> Flow::latest() const noexcept {
    std::vector<Job> jobs = list(std::nullopt, 1);
    if (jobs.empty()) {
        return std::nullopt;
    }
    return jobs.front();
}

std::optional<Job> Flow::get(const JobId& id) const noexcept {
    return store_.getJob(id);
}

template <typename Pred>
std::vector<Job> Flow::collect(std::optional<JobStatus> status, std::size_t max, Pred keep) const noexcept {
    std::vector<Job> jobs;
    try {
        auto ids = store_.listJobs(status);
        // Ids sort by creation time.
        for (auto it = ids.rbegin(); it != ids.rend() && jobs.size() < max; ++it) {
            auto job = store_.getJob(*it);
            if (job && keep(*job)) {
                jobs.push_back(std::move(*job));
            }
        }
        std::stable_sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
            return a.createdAt > b.createdAt;
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing jobs: " + std::string(e.what()));
    }
    return jobs;
}

std::vector<Job> Flow::list(std::optional<JobStatus> status, std::size_t max) const noexcept {
    return collect(status, max, [](const Job&) { return true; });
}

std::vector<Job> Flow::listByOwner(const std::string& owner, std::size_t max) const noexcept {
    return collect(std::nullopt, max, [&owner](const Job& job) {
        return job.owner && *job.owner == owner;
    });
}

std::vector<Job> Flow::unread(const std::string& owner) const noexcept {
    return collect(std::nullopt, std::numeric_limits<std::size_t>::max(), [&owner](const Job& job) {
        return job.owner && *job.owner == owner && !job.markedAsRead;
    });
}

JobStats Flow::stats(const std::string& owner) const noexcept {
    JobStats stats;
    for (const Job& job : listByOwner(owner, std::numeric_limits<std::size_t>::max())) {
        ++stats.total;
        switch (job.status) {
            case JobStatus::Pending:
            case JobStatus::Processing:
                ++stats.active;
                break;
            case JobStatus::Completed:
                ++stats.completed;
                break;
            case JobStatus::Failed:
                ++stats.failed;
                break;
            case JobStatus::Cancelled:
                break;
        }
        if (!job.markedAsRead) {
            ++stats.unread;
        }
    }
    return stats;
}

std::optional<JobStatus> Flow::status(const JobId& id) const noexcept {
    auto snapshot = store_.getStatus(id);
    if (!snapshot) {
        return std::nullopt;
    }
    return snapshot->status;
}

bool Flow::exists(const JobId& id) const noexcept {
    return status(id).has_value();
}

std::optional<std::string> Flow::error(const JobId& id) const noexcept {
    auto job = store_.getJob(id);
    if (!job) {
        return std::nullopt;
    }
    return job->errorMessage;
}

std::optional<GenerationSpec> Flow::spec(const JobId& id) const noexcept {
    return store_.getSpec(id);
}

}
