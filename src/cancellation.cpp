/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/cancellation.hpp"
#include "vidflow/store.hpp"

namespace vidflow {

CancellableExecutor::CancellableExecutor(const JobStateStore& store, std::string replicaId)
    : store_(store), replicaId_(std::move(replicaId)) {}

bool CancellableExecutor::isCancelled(const JobId& jobId) const noexcept {
    auto snapshot = store_.getStatus(jobId);
    if (!snapshot) {
        LOG_WARN("[" + replicaId_ + "] Could not read status of job " + jobId +
                 ", assuming not cancelled");
        return false;
    }
    if (snapshot->status == JobStatus::Cancelled) {
        LOG_INFO("[" + replicaId_ + "] Job " + jobId + " has been cancelled");
        return true;
    }
    return false;
}

void CancellableExecutor::checkpoint(const JobId& jobId, const std::string& where) const {
    if (isCancelled(jobId)) {
        throw JobCancelled(jobId, where);
    }
}

std::optional<JobId> CancellableExecutor::currentJob() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentJob_;
}

CancellableExecutor::Tracking::Tracking(CancellableExecutor& owner, const JobId& jobId)
    : owner_(owner) {
    std::lock_guard<std::mutex> lock(owner_.mutex_);
    owner_.currentJob_ = jobId;
}

CancellableExecutor::Tracking::~Tracking() {
    std::lock_guard<std::mutex> lock(owner_.mutex_);
    owner_.currentJob_.reset();
}

}
