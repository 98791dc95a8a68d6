/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include "vidflow/stage.hpp"

namespace vidflow {

// Raises the frame rate by `fpsFactor` by blending `fpsFactor - 1` frames
// between every neighbouring pair.
class Interpolator final : public StageWorker<InterpolateRequest, FrameBatch> {
public:
    Interpolator() = default;

    [[nodiscard]] FrameBatch execute(const InterpolateRequest& request, const StageContext& ctx) override;

    // Linear blend at t in [0, 1]. `b` is resampled to the size of `a` first.
    [[nodiscard]] static Frame blend(const Frame& a, const Frame& b, double t);
};

}
