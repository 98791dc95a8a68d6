/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <unistd.h>

#include "vidflow/generation_spec.hpp"
#include "vidflow/store.hpp"

namespace vidflow::test {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("vidflow_" + tag + "_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

inline GenerationSpec smallSpec(const std::string& prompt = "a lighthouse at dusk") {
    GenerationSpec spec;
    spec.prompt = prompt;
    spec.width = 32;
    spec.height = 24;
    spec.lengthSeconds = 1;
    spec.fps = 8;
    spec.inferenceSteps = 3;
    spec.seed = 7;
    return spec;
}

// Pending job moved straight to Processing.
inline JobId processingJob(JobStateStore& store, const GenerationSpec& spec = smallSpec()) {
    auto id = store.createJob(spec);
    if (!id || !store.transitionStatus(*id, JobStatus::Pending, JobStatus::Processing)) {
        return "";
    }
    return *id;
}

// Polls `condition` until it holds or `timeout` passes.
inline bool eventually(const std::function<bool()>& condition,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

// Delegating store that records every accepted progress write.
class RecordingStore final : public JobStateStore {
public:
    RecordingStore() = default;

    [[nodiscard]] std::optional<JobId> createJob(
        const GenerationSpec& spec, const std::optional<std::string>& owner = std::nullopt) noexcept override {
        return inner_.createJob(spec, owner);
    }
    [[nodiscard]] std::optional<JobSnapshot> getStatus(const JobId& id) const noexcept override {
        return inner_.getStatus(id);
    }
    [[nodiscard]] std::optional<Job> getJob(const JobId& id) const noexcept override {
        return inner_.getJob(id);
    }
    [[nodiscard]] std::optional<GenerationSpec> getSpec(const JobId& id) const noexcept override {
        return inner_.getSpec(id);
    }
    [[nodiscard]] std::vector<JobId> listJobs(std::optional<JobStatus> status = std::nullopt) const noexcept override {
        return inner_.listJobs(status);
    }
    [[nodiscard]] bool transitionStatus(const JobId& id, std::optional<JobStatus> from,
                                        JobStatus to) noexcept override {
        return inner_.transitionStatus(id, from, to);
    }
    [[nodiscard]] bool setProgress(const JobId& id, int percent, const std::string& step) noexcept override {
        if (!inner_.setProgress(id, percent, step)) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        progress_.push_back(percent);
        steps_.push_back(step);
        return true;
    }
    [[nodiscard]] bool setError(const JobId& id, const std::string& message) noexcept override {
        if (!inner_.setError(id, message)) {
            return false;
        }
        if (onSetError) {
            onSetError(id);
        }
        return true;
    }
    [[nodiscard]] bool saveResult(const JobId& id, const std::string& objectKey,
                                  const std::string& bucket, std::uintmax_t sizeBytes) noexcept override {
        return inner_.saveResult(id, objectKey, bucket, sizeBytes);
    }
    [[nodiscard]] bool markAsRead(const JobId& id) noexcept override {
        return inner_.markAsRead(id);
    }
    [[nodiscard]] bool removeJob(const JobId& id) noexcept override {
        return inner_.removeJob(id);
    }

    // Runs after each accepted error write.
    std::function<void(const JobId&)> onSetError;

    [[nodiscard]] std::vector<int> progressWrites() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return progress_;
    }
    [[nodiscard]] std::vector<std::string> stepWrites() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return steps_;
    }

private:
    MemoryJobStore inner_;
    mutable std::mutex mutex_;
    std::vector<int> progress_;
    std::vector<std::string> steps_;
};

}
