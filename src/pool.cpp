/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/pool.hpp"
#include "vidflow/logger.hpp"

namespace vidflow {

Pool::Pool(int workers) noexcept : workers_(workers) {
    LOG_DEBUG("Pool created with " + std::to_string(workers) + " job threads");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid job processor provided");
        return false;
    }
    if (workers_ < 1) {
        LOG_ERROR("Pool needs at least one job thread");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }

        LOG_INFO("Pool started with " + std::to_string(workers_) + " job threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    jobAvailable_.notify_all();

    // Running jobs finish; queued ones stay Pending in the store.
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        while (!jobQueue_.empty()) {
            jobQueue_.pop();
        }
        accepted_.clear();
    }
    idle_.notify_all();

    LOG_INFO("Pool stopped");
}

bool Pool::submit(const JobId& jobId) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit job to stopped pool: " + jobId);
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!accepted_.insert(jobId).second) {
                return false;
            }
            jobQueue_.push(jobId);
        }

        jobAvailable_.notify_one();
        LOG_DEBUG("Job queued: " + jobId);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue job " + jobId + ": " + e.what());
        return false;
    }
}

bool Pool::waitIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(queueMutex_);
    return idle_.wait_for(lock, timeout, [this] { return jobQueue_.empty() && active_ == 0; });
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return jobQueue_.size();
}

std::size_t Pool::activeCount() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return active_;
}

void Pool::workerLoop(int workerId) {
    setThreadName(getThreadName(workerId));
    LOG_DEBUG(getThreadName(workerId) + " thread started");

    while (true) {
        JobId jobId;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            jobAvailable_.wait(lock, [this] {
                return !jobQueue_.empty() || shutdown_.load();
            });

            if (shutdown_.load()) {
                break;
            }

            jobId = jobQueue_.front();
            jobQueue_.pop();
            ++active_;
        }

        LOG_DEBUG(getThreadName(workerId) + " claimed job: " + jobId);
        try {
            processor_(jobId, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Job thread " + std::to_string(workerId) + " processing error: " +
                      std::string(e.what()) + " (job: " + jobId + ")");
        } catch (...) {
            LOG_ERROR("Job thread " + std::to_string(workerId) + " unknown processing error (job: " +
                      jobId + ")");
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            --active_;
            accepted_.erase(jobId);
        }
        idle_.notify_all();
    }

    LOG_DEBUG(getThreadName(workerId) + " stopped");
}

}
