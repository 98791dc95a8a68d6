/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/server.hpp"
#include "vidflow/file_store.hpp"
#include "vidflow/logger.hpp"
#include "vidflow/object_store.hpp"
#include "vidflow/orchestrator.hpp"
#include "vidflow/pipeline.hpp"
#include "vidflow/pool.hpp"
#include "vidflow/store.hpp"
#include <chrono>

namespace vidflow {

// Signal handling is done by the CLI (vidflowd.cpp), not by Server

Server::Server(const std::filesystem::path& workspace, Config config)
    : Server(std::make_shared<FileJobStore>(workspace),
             std::make_shared<FileObjectStore>(config.bucketDir, config.bucket),
             config) {
    LOG_DEBUG("Server created - workspace: " + workspace.string());
}

Server::Server(std::shared_ptr<JobStateStore> store, std::shared_ptr<ObjectStore> objects, Config config)
    : config_(std::move(config)), store_(std::move(store)), objects_(std::move(objects)) {
    LOG_DEBUG("Server created - workers: " + std::to_string(config_.workers) +
              ", output: " + config_.outputDir.string());
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    if (auto error = config_.validate()) {
        LOG_ERROR("Invalid configuration: " + *error);
        return false;
    }
    if (auto* fileStore = dynamic_cast<FileJobStore*>(store_.get()); fileStore && !fileStore->valid()) {
        LOG_ERROR("Job store is not usable: " + fileStore->root().string());
        return false;
    }

    LOG_INFO("Starting vidflow server...");
    setThreadName("Main");

    if (!recoverOrphanedJobs()) {
        LOG_WARN("Some orphaned jobs could not be recovered");
    }

    LOG_DEBUG("========================================");
    LOG_DEBUG("Workers: " + std::to_string(config_.workers));
    LOG_DEBUG("Scan interval: " + std::to_string(config_.scanInterval.count()) + "ms");
    LOG_DEBUG("Output dir: " + config_.outputDir.string());
    LOG_DEBUG("Bucket: " + config_.bucket + " at " + config_.bucketDir.string());
    LOG_DEBUG("Budgets: " + std::to_string(config_.budgets.preprocessing) + "/" +
              std::to_string(config_.budgets.generation) + "/" +
              std::to_string(config_.budgets.interpolation) + "/" +
              std::to_string(config_.budgets.upscaling) + "/" +
              std::to_string(config_.budgets.saving));
    LOG_DEBUG("========================================");

    try {
        shutdown_.store(false);
        stages_ = std::make_unique<StagePools>(*store_, config_);
        if (!stages_->start()) {
            LOG_ERROR("Failed to start stage pools");
            stages_.reset();
            return false;
        }

        orchestrator_ = std::make_unique<Orchestrator>(*store_, *objects_, stages_->stages(),
                                                       orchestratorSettings(config_));

        pool_ = std::make_unique<Pool>(config_.workers);
        if (!pool_->start([this](const JobId& jobId, int) { processJob(jobId); })) {
            LOG_ERROR("Failed to start job threads");
            pool_.reset();
            orchestrator_.reset();
            stages_.reset();
            return false;
        }

        running_.store(true);
        scannerThread_ = std::thread(&Server::scanLoop, this);

        LOG_INFO("Server started");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        pool_.reset();
        orchestrator_.reset();
        stages_.reset();
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down server...");

    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    wakeup_.notify_all();

    if (scannerThread_.joinable()) {
        scannerThread_.join();
    }

    // Lets running jobs finish; queued ones remain Pending for the next start.
    if (pool_) {
        pool_->stop();
    }

    pool_.reset();
    orchestrator_.reset();
    stages_.reset();

    LOG_INFO("Server shutdown complete");
}

void Server::wake() noexcept {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        wakeRequested_ = true;
    }
    wakeup_.notify_all();
}

bool Server::waitIdle(std::chrono::milliseconds timeout) const {
    if (!pool_) {
        return true;
    }
    return pool_->waitIdle(timeout);
}

bool Server::recoverOrphanedJobs() noexcept {
    // Stages are never retried, so work cut off by a previous exit is failed
    // rather than re-run.
    bool allRecovered = true;
    int recovered = 0;
    for (const auto& jobId : store_->listJobs(JobStatus::Processing)) {
        LOG_WARN("Failing orphaned job: " + jobId);
        if (!store_->setError(jobId, "Interrupted by daemon restart")) {
            LOG_WARN("Could not record error for orphaned job " + jobId);
        }
        if (store_->transitionStatus(jobId, JobStatus::Processing, JobStatus::Failed)) {
            ++recovered;
        } else if (!store_->isCancelled(jobId)) {
            LOG_ERROR("Failed to fail orphaned job " + jobId);
            allRecovered = false;
        }
    }
    if (recovered > 0) {
        LOG_INFO("Marked " + std::to_string(recovered) + " orphaned job(s) as failed");
    }
    return allRecovered;
}

void Server::scanLoop() {
    setThreadName("Scanner");
    LOG_DEBUG("Scanner loop started");

    while (!shutdown_.load()) {
        try {
            scanOnce();
        } catch (const std::exception& e) {
            LOG_ERROR("Scanner loop error: " + std::string(e.what()));
        }

        std::unique_lock<std::mutex> lock(wakeMutex_);
        wakeup_.wait_for(lock, config_.scanInterval,
                         [this] { return wakeRequested_ || shutdown_.load(); });
        wakeRequested_ = false;
    }

    LOG_DEBUG("Scanner loop stopped");
}

void Server::scanOnce() {
    int newCount = 0;
    for (const auto& jobId : store_->listJobs(JobStatus::Pending)) {
        if (shutdown_.load()) break;
        if (pool_->submit(jobId)) {
            ++newCount;
        }
    }
    if (newCount > 0) {
        LOG_DEBUG("Submitted " + std::to_string(newCount) + " new jobs to pool");
    }
}

void Server::processJob(const JobId& jobId) {
    auto spec = store_->getSpec(jobId);
    if (!spec) {
        LOG_ERROR("Job " + jobId + " has no readable parameters");
        if (store_->transitionStatus(jobId, JobStatus::Pending, JobStatus::Processing)) {
            if (!store_->setError(jobId, "Job parameters could not be read")) {
                LOG_WARN("Could not record error for job " + jobId);
            }
            if (!store_->transitionStatus(jobId, JobStatus::Processing, JobStatus::Failed)) {
                LOG_WARN("Could not mark job " + jobId + " as failed");
            }
        }
        return;
    }
    orchestrator_->run(*spec, jobId);
}

}
