/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include "vidflow/config.hpp"
#include "vidflow/stage.hpp"

namespace vidflow {

// Deterministic frame synthesizer standing in for a diffusion model. Runs
// one iteration per inference step over a per-frame latent color, checking
// for cancellation and reporting progress after every step, then renders
// `lengthSeconds * fps` frames. Same request, same frames.
class Generator final : public StageWorker<GenerateRequest, FrameBatch> {
public:
    explicit Generator(GeneratorSettings settings);

    [[nodiscard]] FrameBatch execute(const GenerateRequest& request, const StageContext& ctx) override;

    [[nodiscard]] bool supportsModel(const std::string& baseModel) const noexcept;

private:
    GeneratorSettings settings_;
};

}
