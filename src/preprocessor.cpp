/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/preprocessor.hpp"
#include "vidflow/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace vidflow {

Preprocessor::Preprocessor(PreprocessSettings settings) noexcept
    : settings_(settings) {}

PreprocessResult Preprocessor::execute(const PreprocessRequest& request, const StageContext& ctx) {
    if (request.width < settings_.minDimension || request.height < settings_.minDimension) {
        throw std::invalid_argument("Video dimensions below minimum of " +
                                    std::to_string(settings_.minDimension));
    }
    if (request.lengthSeconds < 1 || request.targetFps < 1) {
        throw std::invalid_argument("Video length and fps must be positive");
    }

    LOG_DEBUG("Preprocessing " + std::to_string(request.width) + "x" + std::to_string(request.height) +
              ", " + std::to_string(request.lengthSeconds) + "s @ " +
              std::to_string(request.targetFps) + "fps for job " + ctx.jobId());

    PreprocessResult result;
    result.fpsFactor = fpsFactor(request.targetFps);
    result.scaleFactor = scaleFactor(request.width, request.height);
    result.adjustedWidth = adjustDimension(request.width, result.scaleFactor);
    result.adjustedHeight = adjustDimension(request.height, result.scaleFactor);
    result.adjustedLength = adjustLength(request.lengthSeconds, result.fpsFactor);

    ctx.progress(0, 1);

    LOG_INFO("Job " + ctx.jobId() + " plan: fps x" + std::to_string(result.fpsFactor) +
             ", scale x" + std::to_string(result.scaleFactor) + ", generate " +
             std::to_string(result.adjustedWidth) + "x" + std::to_string(result.adjustedHeight) +
             " for " + std::to_string(result.adjustedLength) + "s");
    return result;
}

int Preprocessor::fpsFactor(int targetFps) const noexcept {
    if (targetFps <= settings_.baseFps) {
        return 1;
    }
    return std::max(1, targetFps / settings_.baseFps);
}

int Preprocessor::scaleFactor(int width, int height) const noexcept {
    const int maxDim = std::max(width, height);
    if (maxDim <= settings_.maxGenerationDimension) {
        return 1;
    }
    // ceil(maxDim / maxGenerationDimension)
    const int ratio = (maxDim + settings_.maxGenerationDimension - 1) / settings_.maxGenerationDimension;
    return roundToPowerOfTwo(ratio);
}

int Preprocessor::adjustDimension(int dimension, int scaleFactor) const noexcept {
    const int scaled = dimension / std::max(1, scaleFactor);
    const int aligned = (scaled / settings_.dimensionAlignment) * settings_.dimensionAlignment;
    return std::max(settings_.minDimension, aligned);
}

int Preprocessor::adjustLength(int lengthSeconds, int fpsFactor) const noexcept {
    // Interpolation needs frames past the end to blend toward.
    if (fpsFactor > 1) {
        return lengthSeconds + settings_.extraGenerationSeconds;
    }
    return lengthSeconds;
}

int Preprocessor::roundToPowerOfTwo(int n) noexcept {
    if (n <= 0) {
        return 1;
    }
    int power = 1;
    while (power < (1 << 29) && power * 2 < n) {
        power *= 2;
    }
    const int upper = power * 2;
    return (n - power) < (upper - n) ? power : upper;
}

}
