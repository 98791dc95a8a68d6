/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include "vidflow/config.hpp"
#include "vidflow/stage.hpp"

namespace vidflow {

// Nearest-neighbour upscaler. A factor outside the supported set is
// replaced by the closest supported one (first listed wins a tie).
class Upscaler final : public StageWorker<UpscaleRequest, FrameBatch> {
public:
    explicit Upscaler(UpscaleSettings settings);

    [[nodiscard]] FrameBatch execute(const UpscaleRequest& request, const StageContext& ctx) override;

    [[nodiscard]] int effectiveScale(int requested) const noexcept;
    [[nodiscard]] static Frame upscale(const Frame& frame, int scale);

private:
    UpscaleSettings settings_;
};

}
