/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <mutex>
#include <string>

#include "vidflow/types.hpp"

namespace vidflow {

class JobStateStore;

// Percentage of the job each stage is worth. Must sum to 100.
struct StageBudgets {
    int preprocessing = 1;
    int generation = 70;
    int interpolation = 14;
    int upscaling = 14;
    int saving = 1;

    [[nodiscard]] int total() const noexcept {
        return preprocessing + generation + interpolation + upscaling + saving;
    }
};

// Closed-open [start, end) window of the overall job progress.
struct ProgressRange {
    int start = 0;
    int end = 0;

    [[nodiscard]] int width() const noexcept { return end - start; }
    [[nodiscard]] bool empty() const noexcept { return end <= start; }
};

struct ProgressPlan {
    ProgressRange preprocessing;
    ProgressRange generation;
    ProgressRange interpolation;
    ProgressRange upscaling;
    ProgressRange saving;
};

// Lays the stage windows out back to back. The budget of a skipped optional
// stage collapses to zero and is added to generation.
[[nodiscard]] ProgressPlan allocateProgress(const StageBudgets& budgets,
                                            bool needsInterpolation,
                                            bool needsUpscaling) noexcept;

// Maps unit `current` of `total` (0-based) into the window:
// start + round(current / (total - 1) * width), clamped to [start, end).
// A single-unit stage maps to the end of its window.
[[nodiscard]] int mapProgress(const ProgressRange& window, int current, int total) noexcept;

// Writes one stage's fractional progress into the job record. Writes only
// when the mapped percentage exceeds the last persisted value, except for the
// final unit which is always flushed.
class ProgressReporter {
public:
    ProgressReporter(JobStateStore& store, JobId jobId, ProgressRange window, std::string label);

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void report(int current, int total);

    [[nodiscard]] int lastWritten() const;
    [[nodiscard]] int writes() const;

private:
    JobStateStore& store_;
    JobId jobId_;
    ProgressRange window_;
    std::string label_;

    mutable std::mutex mutex_;
    int last_ = 0;
    int writes_ = 0;
};

}
