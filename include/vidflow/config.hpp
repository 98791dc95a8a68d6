/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "vidflow/progress.hpp"

namespace vidflow {

// Elasticity of one stage pool.
struct PoolConfig {
    int minReplicas = 1;
    int maxReplicas = 1;
    std::chrono::seconds downscaleDelay{300};
};

struct PreprocessSettings {
    int baseFps = 8;
    int maxGenerationDimension = 1024;
    int dimensionAlignment = 8;
    int minDimension = 8;
    int extraGenerationSeconds = 1;
};

struct GeneratorSettings {
    std::vector<std::string> baseModels{"sd15"};
    int dimensionAlignment = 8;
};

struct UpscaleSettings {
    std::vector<int> supportedScales{2, 4, 8};
};

struct PostprocessSettings {
    std::vector<std::string> supportedFormats{"y4m"};
    std::string defaultFormat = "y4m";
};

struct Config {
    int workers = 4;
    std::chrono::milliseconds scanInterval{1000};
    std::filesystem::path outputDir;
    std::filesystem::path bucketDir;
    std::string bucket = "videos";

    StageBudgets budgets;
    PreprocessSettings preprocess;
    GeneratorSettings generator;
    UpscaleSettings upscale;
    PostprocessSettings postprocess;

    PoolConfig preprocessPool{1, 3, std::chrono::seconds(180)};
    PoolConfig generatePool{1, 1, std::chrono::seconds(600)};
    PoolConfig interpolatePool{1, 5, std::chrono::seconds(300)};
    PoolConfig upscalePool{1, 4, std::chrono::seconds(300)};
    PoolConfig postprocessPool{1, 3, std::chrono::seconds(180)};

    // Defaults with directories placed under `workspace`.
    [[nodiscard]] static Config defaults(const std::filesystem::path& workspace);

    // Defaults overridden by VIDFLOW_* environment variables.
    [[nodiscard]] static Config fromEnv(const std::filesystem::path& workspace);

    [[nodiscard]] std::optional<std::string> validate() const;
};

}
