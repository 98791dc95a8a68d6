/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "vidflow/logger.hpp"
#include "vidflow/types.hpp"

namespace vidflow {

class JobStateStore;

// Raised inside a stage when the persisted status says Cancelled.
class JobCancelled : public std::runtime_error {
public:
    JobCancelled(const JobId& jobId, const std::string& where)
        : std::runtime_error("Job " + jobId + " cancelled " + where), jobId_(jobId) {}

    [[nodiscard]] const JobId& jobId() const noexcept { return jobId_; }

private:
    JobId jobId_;
};

// Outcome of one stage invocation: a value, or the cancellation sentinel.
// Faults travel as exceptions, never through this type.
template <typename T>
class StageResult {
public:
    [[nodiscard]] static StageResult of(T value) {
        StageResult result;
        result.value_ = std::move(value);
        return result;
    }
    [[nodiscard]] static StageResult cancelled() { return StageResult(); }

    [[nodiscard]] bool isCancelled() const noexcept { return !value_.has_value(); }
    explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] T& value() { return *value_; }
    [[nodiscard]] const T& value() const { return *value_; }

private:
    StageResult() = default;
    std::optional<T> value_;
};

// Per-invocation channel handed to every worker call.
class StageContext {
public:
    using Checkpoint = std::function<void(const std::string& where)>;
    using ProgressCallback = std::function<void(int current, int total)>;

    StageContext(JobId jobId, Checkpoint checkpoint, ProgressCallback progress)
        : jobId_(std::move(jobId)), checkpoint_(std::move(checkpoint)), progress_(std::move(progress)) {}

    [[nodiscard]] const JobId& jobId() const noexcept { return jobId_; }

    // Throws JobCancelled when the job was cancelled.
    void checkpoint(const std::string& where) const {
        if (checkpoint_) checkpoint_(where);
    }

    // `current` is 0-based within `total` units.
    void progress(int current, int total) const {
        if (progress_) progress_(current, total);
    }

private:
    JobId jobId_;
    Checkpoint checkpoint_;
    ProgressCallback progress_;
};

// One per worker replica. Brackets each operation with cancellation checks,
// turns JobCancelled into the sentinel and remembers the job in flight.
class CancellableExecutor {
public:
    CancellableExecutor(const JobStateStore& store, std::string replicaId);

    CancellableExecutor(const CancellableExecutor&) = delete;
    CancellableExecutor& operator=(const CancellableExecutor&) = delete;

    // False on store errors; a flaky read never aborts a job.
    [[nodiscard]] bool isCancelled(const JobId& jobId) const noexcept;

    void checkpoint(const JobId& jobId, const std::string& where) const;

    template <typename Result, typename Operation>
    [[nodiscard]] StageResult<Result> run(const JobId& jobId, const std::string& operation, Operation&& op) {
        Tracking tracking(*this, jobId);
        LOG_INFO("[" + replicaId_ + "] Starting " + operation + " for job " + jobId);
        try {
            checkpoint(jobId, "before " + operation);
            Result result = op();
            checkpoint(jobId, "after " + operation);
            LOG_DEBUG("[" + replicaId_ + "] Finished " + operation + " for job " + jobId);
            return StageResult<Result>::of(std::move(result));
        } catch (const JobCancelled& e) {
            LOG_INFO("[" + replicaId_ + "] " + e.what());
            return StageResult<Result>::cancelled();
        } catch (const std::exception& e) {
            LOG_ERROR("[" + replicaId_ + "] " + operation + " failed for job " + jobId + ": " + e.what());
            throw;
        }
    }

    [[nodiscard]] std::optional<JobId> currentJob() const;
    [[nodiscard]] const std::string& replicaId() const noexcept { return replicaId_; }

private:
    class Tracking {
    public:
        Tracking(CancellableExecutor& owner, const JobId& jobId);
        ~Tracking();
        Tracking(const Tracking&) = delete;
        Tracking& operator=(const Tracking&) = delete;

    private:
        CancellableExecutor& owner_;
    };

    const JobStateStore& store_;
    std::string replicaId_;

    mutable std::mutex mutex_;
    std::optional<JobId> currentJob_;
};

}
