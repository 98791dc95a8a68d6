/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <utility>

#include "vidflow/cancellation.hpp"
#include "vidflow/frame.hpp"
#include "vidflow/generation_spec.hpp"
#include "vidflow/logger.hpp"
#include "vidflow/types.hpp"

namespace vidflow {

struct PreprocessRequest {
    int width = 0;
    int height = 0;
    int lengthSeconds = 0;
    int targetFps = 0;
};

struct PreprocessResult {
    int fpsFactor = 1;
    int scaleFactor = 1;
    int adjustedWidth = 0;
    int adjustedHeight = 0;
    int adjustedLength = 0;
};

struct GenerateRequest {
    std::string prompt;
    std::string negativePrompt;
    int width = 0;
    int height = 0;
    int lengthSeconds = 0;
    int fps = 0;
    int inferenceSteps = 0;
    double guidanceScale = 0.0;
    std::int64_t seed = 0;
    std::string baseModel;
    std::string motionAdapter;
    std::map<std::string, double> loras;
};

struct InterpolateRequest {
    FrameBatch frames;
    int fpsFactor = 1;
};

struct UpscaleRequest {
    FrameBatch frames;
    int scaleFactor = 1;
};

struct PostprocessRequest {
    FrameBatch frames;
    int targetDuration = 0;
    int fps = 0;
    int targetWidth = 0;
    int targetHeight = 0;
    std::string prompt;
    std::int64_t seed = 0;
    int videoLength = 0;
    std::string outputFormat;
    std::filesystem::path outputDir;
};

// Path of the encoded artifact on local disk.
struct PostprocessResult {
    std::filesystem::path outputPath;
};

[[nodiscard]] PreprocessRequest toPreprocessRequest(const GenerationSpec& spec);
[[nodiscard]] GenerateRequest toGenerateRequest(const GenerationSpec& spec,
                                                const PreprocessResult& pre, int baseFps);

// What one stage does to a request. Implementations may call
// ctx.checkpoint() and ctx.progress() as often as they like.
template <typename Request, typename Result>
class StageWorker {
public:
    virtual ~StageWorker() = default;
    [[nodiscard]] virtual Result execute(const Request& request, const StageContext& ctx) = 0;
};

// A stage as the orchestrator sees it.
template <typename Request, typename Result>
class Stage {
public:
    virtual ~Stage() = default;
    [[nodiscard]] virtual StageResult<Result> execute(const Request& request, const JobId& jobId,
                                                      int progressStart, int progressEnd) = 0;
};

using PreprocessStage = Stage<PreprocessRequest, PreprocessResult>;
using GenerateStage = Stage<GenerateRequest, FrameBatch>;
using InterpolateStage = Stage<InterpolateRequest, FrameBatch>;
using UpscaleStage = Stage<UpscaleRequest, FrameBatch>;
using PostprocessStage = Stage<PostprocessRequest, PostprocessResult>;

[[nodiscard]] const char* operationName(StageKind kind) noexcept;
[[nodiscard]] const char* progressLabel(StageKind kind) noexcept;

// Frame stages that may degrade: any fault except cancellation yields the
// request's input frames unchanged.
template <typename Request>
class FallbackToInput final : public StageWorker<Request, FrameBatch> {
public:
    FallbackToInput(std::unique_ptr<StageWorker<Request, FrameBatch>> inner, std::string name)
        : inner_(std::move(inner)), name_(std::move(name)) {}

    [[nodiscard]] FrameBatch execute(const Request& request, const StageContext& ctx) override {
        try {
            return inner_->execute(request, ctx);
        } catch (const JobCancelled&) {
            throw;
        } catch (const std::exception& e) {
            LOG_ERROR(name_ + " failed for job " + ctx.jobId() + ", continuing with " +
                      std::to_string(request.frames.size()) + " input frames: " + e.what());
            return request.frames;
        }
    }

private:
    std::unique_ptr<StageWorker<Request, FrameBatch>> inner_;
    std::string name_;
};

}
