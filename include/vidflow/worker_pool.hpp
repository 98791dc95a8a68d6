/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "vidflow/cancellation.hpp"
#include "vidflow/config.hpp"
#include "vidflow/logger.hpp"
#include "vidflow/progress.hpp"
#include "vidflow/stage.hpp"
#include "vidflow/store.hpp"

namespace vidflow {

// Elastic set of worker replicas serving one stage for many jobs. Each
// replica runs one job at a time; callers block while every replica is busy
// and the pool is at its maximum size. Idle replicas above the minimum are
// dropped once they have been idle for the downscale delay.
template <typename Request, typename Result>
class WorkerPool final : public Stage<Request, Result> {
public:
    using Worker = StageWorker<Request, Result>;
    using Factory = std::function<std::unique_ptr<Worker>()>;

    WorkerPool(StageKind kind, JobStateStore& store, Factory factory, PoolConfig config)
        : kind_(kind), store_(store), factory_(std::move(factory)), config_(config) {}

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    // Brings the pool up to its minimum size.
    [[nodiscard]] bool start() noexcept {
        try {
            std::lock_guard<std::mutex> lock(mutex_);
            while (static_cast<int>(replicas_.size()) < config_.minReplicas) {
                replicas_.push_back(makeReplica(nextReplicaName()));
            }
            LOG_DEBUG(std::string(toString(kind_)) + " pool started with " +
                      std::to_string(replicas_.size()) + " replica(s), max " +
                      std::to_string(config_.maxReplicas));
            return true;
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Failed to start ") + toString(kind_) + " pool: " + e.what());
            return false;
        }
    }

    [[nodiscard]] StageResult<Result> execute(const Request& request, const JobId& jobId,
                                              int progressStart, int progressEnd) override {
        Lease lease(*this);
        Replica& replica = lease.replica();

        ProgressReporter reporter(store_, jobId, ProgressRange{progressStart, progressEnd},
                                  progressLabel(kind_));
        CancellableExecutor& executor = replica.executor;
        StageContext ctx(
            jobId,
            [&executor, &jobId](const std::string& where) { executor.checkpoint(jobId, where); },
            [&reporter](int current, int total) { reporter.report(current, total); });

        return executor.run<Result>(jobId, operationName(kind_), [&]() {
            return replica.worker->execute(request, ctx);
        });
    }

    [[nodiscard]] std::size_t replicaCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return replicas_.size() + static_cast<std::size_t>(creating_);
    }

    [[nodiscard]] std::size_t busyCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count_if(replicas_.begin(), replicas_.end(),
            [](const std::unique_ptr<Replica>& r) { return r->busy; })) +
            static_cast<std::size_t>(creating_);
    }

    [[nodiscard]] const PoolConfig& config() const noexcept { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    struct Replica {
        Replica(std::unique_ptr<Worker> w, const JobStateStore& store, std::string id)
            : worker(std::move(w)), executor(store, std::move(id)) {}

        std::unique_ptr<Worker> worker;
        CancellableExecutor executor;
        bool busy = false;
        Clock::time_point idleSince = Clock::now();
    };

    // Holds one replica for the duration of an execute call.
    class Lease {
    public:
        explicit Lease(WorkerPool& pool) : pool_(pool), replica_(pool.acquire()) {}
        ~Lease() { pool_.release(replica_); }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        [[nodiscard]] Replica& replica() noexcept { return replica_; }

    private:
        WorkerPool& pool_;
        Replica& replica_;
    };

    // Caller holds mutex_.
    std::string nextReplicaName() {
        return std::string(toString(kind_)) + "-" + std::to_string(nextReplicaId_++);
    }

    std::unique_ptr<Replica> makeReplica(std::string id) {
        std::unique_ptr<Worker> worker = factory_();
        if (!worker) {
            throw std::runtime_error(std::string("Failed to create ") + toString(kind_) + " worker");
        }
        LOG_DEBUG("Created replica " + id);
        return std::make_unique<Replica>(std::move(worker), store_, std::move(id));
    }

    Replica& acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            reapIdle();

            auto it = std::find_if(replicas_.begin(), replicas_.end(),
                                   [](const std::unique_ptr<Replica>& r) { return !r->busy; });
            if (it != replicas_.end()) {
                (*it)->busy = true;
                return **it;
            }

            if (static_cast<int>(replicas_.size()) + creating_ < config_.maxReplicas) {
                // Scale up. Worker construction may be slow, so run it unlocked.
                ++creating_;
                std::string id = nextReplicaName();
                lock.unlock();
                std::unique_ptr<Replica> replica;
                try {
                    replica = makeReplica(std::move(id));
                } catch (...) {
                    lock.lock();
                    --creating_;
                    available_.notify_one();
                    throw;
                }
                lock.lock();
                --creating_;
                replica->busy = true;
                replicas_.push_back(std::move(replica));
                LOG_INFO(std::string(toString(kind_)) + " pool scaled up to " +
                         std::to_string(replicas_.size()) + " replica(s)");
                return *replicas_.back();
            }

            available_.wait(lock);
        }
    }

    void release(Replica& replica) noexcept {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            replica.busy = false;
            replica.idleSince = Clock::now();
        }
        available_.notify_one();
    }

    // Caller holds mutex_.
    void reapIdle() {
        const auto now = Clock::now();
        for (auto it = replicas_.begin(); it != replicas_.end();) {
            if (static_cast<int>(replicas_.size()) <= config_.minReplicas) {
                break;
            }
            const Replica& r = **it;
            if (!r.busy && now - r.idleSince >= config_.downscaleDelay) {
                LOG_INFO(std::string(toString(kind_)) + " pool dropping idle replica " +
                         r.executor.replicaId());
                it = replicas_.erase(it);
            } else {
                ++it;
            }
        }
    }

    StageKind kind_;
    JobStateStore& store_;
    Factory factory_;
    PoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<Replica>> replicas_;
    int creating_ = 0;
    int nextReplicaId_ = 0;
};

}
