/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/store.hpp"
#include "vidflow/logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <sstream>
#include <unistd.h>

namespace vidflow {

bool isAllowedTransition(JobStatus from, JobStatus to) noexcept {
    switch (from) {
        case JobStatus::Pending:
            return to == JobStatus::Processing || to == JobStatus::Cancelled;
        case JobStatus::Processing:
            return to == JobStatus::Completed || to == JobStatus::Failed ||
                   to == JobStatus::Cancelled;
        default:
            return false;
    }
}

JobId generateJobId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

bool JobStateStore::isCancelled(const JobId& id) const noexcept {
    auto snapshot = getStatus(id);
    return snapshot && snapshot->status == JobStatus::Cancelled;
}

bool JobStateStore::isCompleted(const JobId& id) const noexcept {
    auto snapshot = getStatus(id);
    return snapshot && snapshot->status == JobStatus::Completed;
}

bool JobStateStore::requestCancel(const JobId& id) noexcept {
    // Two explicit compare-and-sets so a concurrent Pending->Processing
    // move cannot make the request miss.
    if (transitionStatus(id, JobStatus::Pending, JobStatus::Cancelled) ||
        transitionStatus(id, JobStatus::Processing, JobStatus::Cancelled)) {
        LOG_INFO("Cancellation requested for job " + id);
        return true;
    }
    LOG_DEBUG("Cancellation refused for job " + id);
    return false;
}

MemoryJobStore::Record* MemoryJobStore::find(const JobId& id) {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

const MemoryJobStore::Record* MemoryJobStore::find(const JobId& id) const {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

std::optional<JobId> MemoryJobStore::createJob(const GenerationSpec& spec,
                                               const std::optional<std::string>& owner) noexcept {
    try {
        Record record;
        record.job.id = generateJobId();
        record.job.owner = owner;
        record.job.name = spec.jobName();
        record.job.createdAt = std::chrono::system_clock::now();
        record.spec = spec;

        JobId id = record.job.id;
        std::lock_guard<std::mutex> lock(mutex_);
        records_.emplace(id, std::move(record));
        order_.push_back(id);
        return id;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create job: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::optional<JobSnapshot> MemoryJobStore::getStatus(const JobId& id) const noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        const Record* record = find(id);
        if (!record) return std::nullopt;
        return JobSnapshot{record->job.status, record->job.progress, record->job.currentStep};
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read status for " + id + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<Job> MemoryJobStore::getJob(const JobId& id) const noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        const Record* record = find(id);
        if (!record) return std::nullopt;
        Job job = record->job;
        if (job.status == JobStatus::Cancelled) {
            job.errorMessage.reset();
        }
        return job;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read job " + id + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<GenerationSpec> MemoryJobStore::getSpec(const JobId& id) const noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        const Record* record = find(id);
        if (!record) return std::nullopt;
        return record->spec;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read spec for " + id + ": " + e.what());
        return std::nullopt;
    }
}

std::vector<JobId> MemoryJobStore::listJobs(std::optional<JobStatus> status) const noexcept {
    std::vector<JobId> ids;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : order_) {
            const Record* record = find(id);
            if (record && (!status || record->job.status == *status)) {
                ids.push_back(id);
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to list jobs: " + std::string(e.what()));
    }
    return ids;
}

bool MemoryJobStore::transitionStatus(const JobId& id, std::optional<JobStatus> from,
                                      JobStatus to) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    Record* record = find(id);
    if (!record) {
        return false;
    }

    Job& job = record->job;
    if (from && job.status != *from) {
        return false;
    }
    if (!isAllowedTransition(job.status, to)) {
        return false;
    }

    auto now = std::chrono::system_clock::now();
    if (to == JobStatus::Processing) {
        job.startedAt = now;
    } else if (isTerminal(to)) {
        job.completedAt = now;
    }
    job.status = to;
    return true;
}

bool MemoryJobStore::setProgress(const JobId& id, int percent, const std::string& step) noexcept {
    if (percent < 0 || percent > 100) {
        LOG_WARN("Rejected out-of-range progress " + std::to_string(percent) + " for job " + id);
        return false;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        Record* record = find(id);
        if (!record || record->job.status != JobStatus::Processing) {
            return false;
        }
        record->job.progress = percent;
        record->job.currentStep = step;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to set progress for " + id + ": " + e.what());
        return false;
    }
}

bool MemoryJobStore::setError(const JobId& id, const std::string& message) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        Record* record = find(id);
        if (!record || record->job.status != JobStatus::Processing) {
            return false;
        }
        record->job.errorMessage = message;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to set error for " + id + ": " + e.what());
        return false;
    }
}

bool MemoryJobStore::saveResult(const JobId& id, const std::string& objectKey,
                                const std::string& bucket, std::uintmax_t sizeBytes) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        Record* record = find(id);
        if (!record || record->job.status != JobStatus::Processing) {
            return false;
        }
        record->job.result = JobResult{objectKey, bucket, sizeBytes, std::chrono::system_clock::now()};
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save result for " + id + ": " + e.what());
        return false;
    }
}

bool MemoryJobStore::markAsRead(const JobId& id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    Record* record = find(id);
    if (!record || !isTerminal(record->job.status)) {
        return false;
    }
    record->job.markedAsRead = true;
    return true;
}

bool MemoryJobStore::removeJob(const JobId& id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    Record* record = find(id);
    if (!record || !isTerminal(record->job.status)) {
        return false;
    }
    records_.erase(id);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    LOG_INFO("Removed job " + id);
    return true;
}

}
