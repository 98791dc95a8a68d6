/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>

#include "vidflow/config.hpp"
#include "vidflow/types.hpp"

namespace vidflow {

class JobStateStore;
class ObjectStore;
class Pool;
class StagePools;
class Orchestrator;

// Long-running host for the pipeline: owns the stores, the stage pools, the
// orchestrator and the job threads, and feeds Pending jobs to the threads.
class Server final {
public:
    // File-backed job store rooted at `workspace`, object store at config.bucketDir.
    Server(const std::filesystem::path& workspace, Config config);
    Server(std::shared_ptr<JobStateStore> store, std::shared_ptr<ObjectStore> objects, Config config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;

    // Triggers a scan now instead of at the next interval.
    void wake() noexcept;

    // Blocks until no job is queued or running.
    [[nodiscard]] bool waitIdle(std::chrono::milliseconds timeout) const;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] JobStateStore& store() noexcept { return *store_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    [[nodiscard]] bool recoverOrphanedJobs() noexcept;
    void scanLoop();
    void scanOnce();
    void processJob(const JobId& jobId);

    Config config_;
    std::shared_ptr<JobStateStore> store_;
    std::shared_ptr<ObjectStore> objects_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    std::mutex wakeMutex_;
    std::condition_variable wakeup_;
    bool wakeRequested_ = false;

    std::unique_ptr<StagePools> stages_;
    std::unique_ptr<Orchestrator> orchestrator_;
    std::unique_ptr<Pool> pool_;

    std::thread scannerThread_;
};

}
