/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_set>
#include <vector>

#include "vidflow/types.hpp"

namespace vidflow {

using JobProcessor = std::function<void(const JobId&, int workerId)>;

// Fixed set of job threads. Each thread runs one job end to end; a job id is
// accepted once while it is queued or running.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobProcessor processor);
    void stop() noexcept;

    // False when stopped or when the id is already queued or running.
    [[nodiscard]] bool submit(const JobId& jobId) noexcept;

    // Blocks until nothing is queued or running, or the timeout passes.
    [[nodiscard]] bool waitIdle(std::chrono::milliseconds timeout) const;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] std::size_t activeCount() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);

    int workers_;
    JobProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    mutable std::condition_variable idle_;
    std::queue<JobId> jobQueue_;
    std::unordered_set<JobId> accepted_;
    std::size_t active_ = 0;

    std::vector<std::thread> workerThreads_;
};

}
