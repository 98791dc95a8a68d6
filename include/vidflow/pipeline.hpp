/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <memory>

#include "vidflow/config.hpp"
#include "vidflow/orchestrator.hpp"
#include "vidflow/worker_pool.hpp"

namespace vidflow {

// Worker factories per stage. An empty factory selects the reference worker.
struct StageFactories {
    WorkerPool<PreprocessRequest, PreprocessResult>::Factory preprocess;
    WorkerPool<GenerateRequest, FrameBatch>::Factory generate;
    WorkerPool<InterpolateRequest, FrameBatch>::Factory interpolate;
    WorkerPool<UpscaleRequest, FrameBatch>::Factory upscale;
    WorkerPool<PostprocessRequest, PostprocessResult>::Factory postprocess;
};

// The five stage pools. Interpolate and Upscale workers, reference or
// supplied, are wrapped so a fault passes their input frames through.
class StagePools final {
public:
    StagePools(JobStateStore& store, const Config& config, StageFactories factories = {});

    StagePools(const StagePools&) = delete;
    StagePools& operator=(const StagePools&) = delete;

    // Creates every pool's minimum replicas.
    [[nodiscard]] bool start() noexcept;

    [[nodiscard]] PipelineStages stages() noexcept;

    WorkerPool<PreprocessRequest, PreprocessResult> preprocess;
    WorkerPool<GenerateRequest, FrameBatch> generate;
    WorkerPool<InterpolateRequest, FrameBatch> interpolate;
    WorkerPool<UpscaleRequest, FrameBatch> upscale;
    WorkerPool<PostprocessRequest, PostprocessResult> postprocess;
};

[[nodiscard]] OrchestratorSettings orchestratorSettings(const Config& config);

}
