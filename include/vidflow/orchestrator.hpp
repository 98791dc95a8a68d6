/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <cstdint>
#include <filesystem>

#include "vidflow/generation_spec.hpp"
#include "vidflow/object_store.hpp"
#include "vidflow/progress.hpp"
#include "vidflow/stage.hpp"
#include "vidflow/store.hpp"

namespace vidflow {

struct PipelineStages {
    PreprocessStage& preprocess;
    GenerateStage& generate;
    InterpolateStage& interpolate;
    UpscaleStage& upscale;
    PostprocessStage& postprocess;
};

struct OrchestratorSettings {
    StageBudgets budgets;
    int baseFps = 8;
    std::filesystem::path outputDir;
};

enum class RunOutcome : std::uint8_t {
    Skipped = 0,    // job was not Pending
    Completed,
    Cancelled,
    Failed
};

[[nodiscard]] const char* toString(RunOutcome outcome) noexcept;

// Drives one job through the stages, strictly in order, and records every
// outcome in the job store.
class Orchestrator final {
public:
    Orchestrator(JobStateStore& store, ObjectStore& objects, PipelineStages stages,
                 OrchestratorSettings settings);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Claims the job (Pending -> Processing) and runs it to a terminal
    // status. A second call for the same job is a no-op.
    RunOutcome run(const GenerationSpec& spec, const JobId& jobId) noexcept;

private:
    JobStateStore& store_;
    ObjectStore& objects_;
    PipelineStages stages_;
    OrchestratorSettings settings_;

    RunOutcome execute(const GenerationSpec& spec, const JobId& jobId,
                       std::filesystem::path& artifact);
    RunOutcome handleFault(const JobId& jobId, const std::string& message) noexcept;
    void cleanup(const JobId& jobId, const std::filesystem::path& artifact) noexcept;

    // Writes a step label without moving progress backwards.
    void enterStep(const JobId& jobId, int percent, const std::string& step) noexcept;
};

}
