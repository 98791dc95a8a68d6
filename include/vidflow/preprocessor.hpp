/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include "vidflow/config.hpp"
#include "vidflow/stage.hpp"

namespace vidflow {

// Derives the generation plan: how much to interpolate and upscale, and
// the reduced size and length actually generated.
class Preprocessor final : public StageWorker<PreprocessRequest, PreprocessResult> {
public:
    explicit Preprocessor(PreprocessSettings settings) noexcept;

    [[nodiscard]] PreprocessResult execute(const PreprocessRequest& request,
                                           const StageContext& ctx) override;

    [[nodiscard]] int fpsFactor(int targetFps) const noexcept;
    [[nodiscard]] int scaleFactor(int width, int height) const noexcept;
    [[nodiscard]] int adjustDimension(int dimension, int scaleFactor) const noexcept;
    [[nodiscard]] int adjustLength(int lengthSeconds, int fpsFactor) const noexcept;

    // Nearest power of two; ties resolve to the larger one.
    [[nodiscard]] static int roundToPowerOfTwo(int n) noexcept;

private:
    PreprocessSettings settings_;
};

}
