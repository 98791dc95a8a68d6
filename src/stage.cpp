/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/stage.hpp"

namespace vidflow {

PreprocessRequest toPreprocessRequest(const GenerationSpec& spec) {
    PreprocessRequest request;
    request.width = spec.width;
    request.height = spec.height;
    request.lengthSeconds = spec.lengthSeconds;
    request.targetFps = spec.fps;
    return request;
}

GenerateRequest toGenerateRequest(const GenerationSpec& spec, const PreprocessResult& pre, int baseFps) {
    GenerateRequest request;
    request.prompt = spec.prompt;
    request.negativePrompt = spec.negativePrompt.value_or(kDefaultNegativePrompt);
    request.width = pre.adjustedWidth;
    request.height = pre.adjustedHeight;
    request.lengthSeconds = pre.adjustedLength;
    request.fps = baseFps;
    request.inferenceSteps = spec.inferenceSteps;
    request.guidanceScale = spec.guidanceScale;
    request.seed = spec.seed;
    request.baseModel = spec.baseModel;
    request.motionAdapter = spec.motionAdapter;
    request.loras = spec.loras;
    return request;
}

const char* operationName(StageKind kind) noexcept {
    switch (kind) {
        case StageKind::Preprocess: return "parameter processing";
        case StageKind::Generate: return "frame generation";
        case StageKind::Interpolate: return "frame interpolation";
        case StageKind::Upscale: return "frame upscaling";
        case StageKind::Postprocess: return "postprocessing";
        default: return "stage";
    }
}

const char* progressLabel(StageKind kind) noexcept {
    switch (kind) {
        case StageKind::Preprocess: return "Processing parameters";
        case StageKind::Generate: return "Generating frames";
        case StageKind::Interpolate: return "Interpolating frames";
        case StageKind::Upscale: return "Upscaling frames";
        case StageKind::Postprocess: return "Post-processing and saving video";
        default: return "Working";
    }
}

}
