/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/progress.hpp"
#include "vidflow/logger.hpp"
#include "vidflow/store.hpp"
#include <algorithm>
#include <cmath>

namespace vidflow {

ProgressPlan allocateProgress(const StageBudgets& budgets,
                              bool needsInterpolation,
                              bool needsUpscaling) noexcept {
    int generation = budgets.generation;
    int interpolation = budgets.interpolation;
    int upscaling = budgets.upscaling;

    if (!needsInterpolation) {
        generation += interpolation;
        interpolation = 0;
    }
    if (!needsUpscaling) {
        generation += upscaling;
        upscaling = 0;
    }

    ProgressPlan plan;
    int cursor = 0;
    auto next = [&cursor](int width) {
        ProgressRange range{cursor, cursor + width};
        cursor += width;
        return range;
    };

    plan.preprocessing = next(budgets.preprocessing);
    plan.generation = next(generation);
    plan.interpolation = next(interpolation);
    plan.upscaling = next(upscaling);
    plan.saving = next(budgets.saving);
    return plan;
}

int mapProgress(const ProgressRange& window, int current, int total) noexcept {
    if (window.empty()) {
        return window.start;
    }

    double fraction = 1.0;
    if (total > 1) {
        fraction = static_cast<double>(std::clamp(current, 0, total - 1)) /
                   static_cast<double>(total - 1);
    }

    int value = window.start + static_cast<int>(std::lround(fraction * window.width()));
    return std::clamp(value, window.start, window.end - 1);
}

ProgressReporter::ProgressReporter(JobStateStore& store, JobId jobId,
                                   ProgressRange window, std::string label)
    : store_(store), jobId_(std::move(jobId)), window_(window), label_(std::move(label)) {
    // Seed from the persisted value so a restarted stage never writes backwards.
    if (auto snapshot = store_.getStatus(jobId_)) {
        last_ = snapshot->progress;
    }
}

void ProgressReporter::report(int current, int total) {
    const bool final_unit = total <= 1 || current >= total - 1;
    const int mapped = mapProgress(window_, current, total);

    std::lock_guard<std::mutex> lock(mutex_);
    if (mapped <= last_ && !final_unit) {
        return;
    }

    const int value = std::max(mapped, last_);
    std::string step = label_;
    if (total > 1) {
        step += " (" + std::to_string(std::clamp(current, 0, total - 1) + 1) + "/" +
                std::to_string(total) + ")";
    }

    if (!store_.setProgress(jobId_, value, step)) {
        LOG_DEBUG("Progress write rejected for job " + jobId_ + " at " + std::to_string(value) + "%");
        return;
    }

    last_ = value;
    ++writes_;
    LOG_TRACE("Job " + jobId_ + " progress " + std::to_string(value) + "% - " + step);
}

int ProgressReporter::lastWritten() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_;
}

int ProgressReporter::writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

}
