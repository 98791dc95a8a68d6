/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/orchestrator.hpp"
#include "vidflow/logger.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace vidflow {

namespace {
std::string describe(const ProgressRange& range) {
    return "[" + std::to_string(range.start) + "," + std::to_string(range.end) + ")";
}
}

const char* toString(RunOutcome outcome) noexcept {
    switch (outcome) {
        case RunOutcome::Skipped: return "skipped";
        case RunOutcome::Completed: return "completed";
        case RunOutcome::Cancelled: return "cancelled";
        case RunOutcome::Failed: return "failed";
        default: return "unknown";
    }
}

Orchestrator::Orchestrator(JobStateStore& store, ObjectStore& objects, PipelineStages stages,
                           OrchestratorSettings settings)
    : store_(store), objects_(objects), stages_(stages), settings_(std::move(settings)) {}

RunOutcome Orchestrator::run(const GenerationSpec& spec, const JobId& jobId) noexcept {
    if (!store_.transitionStatus(jobId, JobStatus::Pending, JobStatus::Processing)) {
        LOG_DEBUG("Job not pending or already claimed: " + jobId);
        return RunOutcome::Skipped;
    }

    LOG_INFO("JOB STARTED: " + jobId + " \"" + spec.jobName() + "\"");
    const auto startTime = std::chrono::steady_clock::now();

    std::filesystem::path artifact;
    RunOutcome outcome = RunOutcome::Failed;
    try {
        outcome = execute(spec, jobId, artifact);
    } catch (const std::exception& e) {
        outcome = handleFault(jobId, e.what());
    } catch (...) {
        outcome = handleFault(jobId, "Unknown internal error");
    }

    cleanup(jobId, artifact);

    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << elapsed;
    LOG_INFO("JOB " + std::string(toString(outcome)) + ": " + jobId + " in " + ss.str() + "s");
    return outcome;
}

RunOutcome Orchestrator::execute(const GenerationSpec& spec, const JobId& jobId,
                                 std::filesystem::path& artifact) {
    const StageBudgets& budgets = settings_.budgets;

    enterStep(jobId, 0, progressLabel(StageKind::Preprocess));
    auto pre = stages_.preprocess.execute(toPreprocessRequest(spec), jobId, 0, budgets.preprocessing);
    if (pre.isCancelled()) {
        return RunOutcome::Cancelled;
    }
    const PreprocessResult params = pre.value();

    const bool needsInterpolation = params.fpsFactor > 1;
    const bool needsUpscaling = params.scaleFactor > 1;
    const ProgressPlan plan = allocateProgress(budgets, needsInterpolation, needsUpscaling);
    LOG_DEBUG("Job " + jobId + " progress plan: generate " + describe(plan.generation) +
              " interpolate " + describe(plan.interpolation) + " upscale " + describe(plan.upscaling) +
              " save " + describe(plan.saving));

    auto generated = stages_.generate.execute(toGenerateRequest(spec, params, settings_.baseFps), jobId,
                                              plan.generation.start, plan.generation.end);
    if (generated.isCancelled()) {
        return RunOutcome::Cancelled;
    }
    FrameBatch frames = std::move(generated.value());
    if (frames.empty()) {
        throw std::runtime_error("Video generation failed: no frames were generated");
    }

    if (needsInterpolation) {
        enterStep(jobId, plan.interpolation.start, "Starting frame interpolation");
        auto interpolated = stages_.interpolate.execute(
            InterpolateRequest{std::move(frames), params.fpsFactor}, jobId,
            plan.interpolation.start, plan.interpolation.end);
        if (interpolated.isCancelled()) {
            return RunOutcome::Cancelled;
        }
        frames = std::move(interpolated.value());
    } else {
        LOG_DEBUG("Skipping interpolation for job " + jobId);
    }

    if (needsUpscaling) {
        enterStep(jobId, plan.upscaling.start, "Starting frame upscaling");
        auto upscaled = stages_.upscale.execute(
            UpscaleRequest{std::move(frames), params.scaleFactor}, jobId,
            plan.upscaling.start, plan.upscaling.end);
        if (upscaled.isCancelled()) {
            return RunOutcome::Cancelled;
        }
        frames = std::move(upscaled.value());
    } else {
        LOG_DEBUG("Skipping upscaling for job " + jobId);
    }

    if (frames.empty()) {
        throw std::runtime_error("No frames available for saving");
    }

    enterStep(jobId, plan.saving.start, progressLabel(StageKind::Postprocess));
    PostprocessRequest request;
    request.frames = std::move(frames);
    request.targetDuration = spec.lengthSeconds;
    request.fps = settings_.baseFps * params.fpsFactor;
    request.targetWidth = spec.width;
    request.targetHeight = spec.height;
    request.prompt = spec.prompt;
    request.seed = spec.seed;
    request.videoLength = spec.lengthSeconds;
    request.outputFormat = spec.outputFormat;
    request.outputDir = settings_.outputDir / jobId;

    auto saved = stages_.postprocess.execute(request, jobId, plan.saving.start, plan.saving.end);
    if (saved.isCancelled()) {
        return RunOutcome::Cancelled;
    }
    artifact = saved.value().outputPath;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(artifact, ec)) {
        throw std::runtime_error("Output file not found: " + artifact.string());
    }

    enterStep(jobId, plan.saving.start, "Uploading to storage");
    UploadResult upload = objects_.upload(artifact, jobId);
    if (!upload) {
        throw std::runtime_error("Upload failed: " + upload.error);
    }

    if (!store_.saveResult(jobId, upload.objectKey, objects_.bucket(), upload.sizeBytes)) {
        throw std::runtime_error("Failed to save result metadata");
    }
    if (!store_.setProgress(jobId, 100, "Completed")) {
        LOG_DEBUG("Final progress write rejected for job " + jobId);
    }
    if (!store_.transitionStatus(jobId, JobStatus::Processing, JobStatus::Completed)) {
        throw std::runtime_error("Failed to mark job as completed");
    }
    return RunOutcome::Completed;
}

RunOutcome Orchestrator::handleFault(const JobId& jobId, const std::string& message) noexcept {
    // A cancel that raced the fault wins.
    if (store_.isCancelled(jobId)) {
        LOG_INFO("Job " + jobId + " was cancelled during processing");
        return RunOutcome::Cancelled;
    }

    // setError only lands while the job is Processing. A cancel after it
    // lands leaves error.txt behind, which readers hide for Cancelled jobs.
    if (!store_.setError(jobId, message)) {
        if (store_.isCancelled(jobId)) {
            LOG_INFO("Job " + jobId + " was cancelled during processing");
            return RunOutcome::Cancelled;
        }
        LOG_WARN("Failed to record error message for job " + jobId);
    }
    LOG_ERROR("Job " + jobId + " failed: " + message);
    if (!store_.transitionStatus(jobId, JobStatus::Processing, JobStatus::Failed)) {
        if (store_.isCancelled(jobId)) {
            LOG_INFO("Job " + jobId + " was cancelled during processing");
            return RunOutcome::Cancelled;
        }
        LOG_ERROR("Failed to mark job " + jobId + " as failed");
    }
    return RunOutcome::Failed;
}

void Orchestrator::cleanup(const JobId& jobId, const std::filesystem::path& artifact) noexcept {
    if (!artifact.empty() && !objects_.cleanupLocal(artifact)) {
        LOG_WARN("Failed to clean up local file " + artifact.string() + " for job " + jobId);
    }

    // Anything a cancelled postprocess left behind lives in the job's own directory.
    if (settings_.outputDir.empty()) {
        return;
    }
    const auto jobDir = settings_.outputDir / jobId;
    std::error_code ec;
    if (!std::filesystem::exists(jobDir, ec)) {
        return;
    }
    std::filesystem::remove_all(jobDir, ec);
    if (ec) {
        LOG_WARN("Failed to remove output directory " + jobDir.string() + ": " + ec.message());
    }
}

void Orchestrator::enterStep(const JobId& jobId, int percent, const std::string& step) noexcept {
    int value = percent;
    if (auto snapshot = store_.getStatus(jobId)) {
        value = std::max(value, snapshot->progress);
    }
    if (!store_.setProgress(jobId, value, step)) {
        LOG_DEBUG("Progress write rejected for job " + jobId + " at step: " + step);
    }
}

}
