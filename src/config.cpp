/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/config.hpp"
#include "vidflow/logger.hpp"
#include <cstdlib>
#include <sstream>
#include <utility>

namespace vidflow {

namespace {
int env_int(const char* name, int defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stoi(val);
    } catch (const std::logic_error&) {
        LOG_WARN(std::string("Ignoring malformed ") + name + "=" + val);
        return defv;
    }
}

std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}

std::vector<std::string> env_list(const char* name, const std::vector<std::string>& defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    std::vector<std::string> items;
    std::stringstream ss(val);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items.empty() ? defv : items;
}

std::vector<int> env_int_list(const char* name, const std::vector<int>& defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    std::vector<int> items;
    std::stringstream ss(val);
    std::string item;
    try {
        while (std::getline(ss, item, ',')) {
            if (!item.empty()) items.push_back(std::stoi(item));
        }
    } catch (const std::logic_error&) {
        LOG_WARN(std::string("Ignoring malformed ") + name + "=" + val);
        return defv;
    }
    return items.empty() ? defv : items;
}

PoolConfig env_pool(const std::string& stage, PoolConfig defv) {
    const std::string prefix = "VIDFLOW_" + stage;
    PoolConfig pool;
    pool.minReplicas = env_int((prefix + "_MIN_REPLICAS").c_str(), defv.minReplicas);
    pool.maxReplicas = env_int((prefix + "_MAX_REPLICAS").c_str(), defv.maxReplicas);
    pool.downscaleDelay = std::chrono::seconds(
        env_int((prefix + "_DOWNSCALE_DELAY_S").c_str(), static_cast<int>(defv.downscaleDelay.count())));
    return pool;
}

std::optional<std::string> checkPool(const char* stage, const PoolConfig& pool) {
    if (pool.minReplicas < 0 || pool.maxReplicas < 1 || pool.minReplicas > pool.maxReplicas) {
        return std::string(stage) + " pool replicas must satisfy 0 <= min <= max, max >= 1";
    }
    if (pool.downscaleDelay.count() < 0) {
        return std::string(stage) + " pool downscale delay must not be negative";
    }
    return std::nullopt;
}
}

Config Config::defaults(const std::filesystem::path& workspace) {
    Config config;
    config.outputDir = workspace / "outputs";
    config.bucketDir = workspace / "bucket";
    return config;
}

Config Config::fromEnv(const std::filesystem::path& workspace) {
    Config config = defaults(workspace);

    config.workers = env_int("VIDFLOW_WORKERS", config.workers);
    config.scanInterval = std::chrono::milliseconds(
        env_int("VIDFLOW_SCAN_INTERVAL_MS", static_cast<int>(config.scanInterval.count())));
    config.outputDir = env_string("VIDFLOW_OUTPUT_DIR", config.outputDir.string());
    config.bucketDir = env_string("VIDFLOW_BUCKET_DIR", config.bucketDir.string());
    config.bucket = env_string("VIDFLOW_BUCKET", config.bucket);

    config.budgets.preprocessing = env_int("VIDFLOW_PROGRESS_PREPROCESSING", config.budgets.preprocessing);
    config.budgets.generation = env_int("VIDFLOW_PROGRESS_GENERATION", config.budgets.generation);
    config.budgets.interpolation = env_int("VIDFLOW_PROGRESS_INTERPOLATION", config.budgets.interpolation);
    config.budgets.upscaling = env_int("VIDFLOW_PROGRESS_UPSCALING", config.budgets.upscaling);
    config.budgets.saving = env_int("VIDFLOW_PROGRESS_SAVING", config.budgets.saving);

    config.preprocess.baseFps = env_int("VIDFLOW_BASE_FPS", config.preprocess.baseFps);
    config.preprocess.maxGenerationDimension =
        env_int("VIDFLOW_MAX_GENERATION_DIM", config.preprocess.maxGenerationDimension);
    config.preprocess.dimensionAlignment =
        env_int("VIDFLOW_DIMENSION_ALIGNMENT", config.preprocess.dimensionAlignment);
    config.preprocess.minDimension = env_int("VIDFLOW_MIN_DIMENSION", config.preprocess.minDimension);
    config.preprocess.extraGenerationSeconds =
        env_int("VIDFLOW_EXTRA_GENERATION_SECONDS", config.preprocess.extraGenerationSeconds);

    config.generator.baseModels = env_list("VIDFLOW_BASE_MODELS", config.generator.baseModels);
    config.generator.dimensionAlignment = config.preprocess.dimensionAlignment;
    config.upscale.supportedScales = env_int_list("VIDFLOW_SUPPORTED_SCALES", config.upscale.supportedScales);

    config.preprocessPool = env_pool("PREPROCESS", config.preprocessPool);
    config.generatePool = env_pool("GENERATE", config.generatePool);
    config.interpolatePool = env_pool("INTERPOLATE", config.interpolatePool);
    config.upscalePool = env_pool("UPSCALE", config.upscalePool);
    config.postprocessPool = env_pool("POSTPROCESS", config.postprocessPool);

    return config;
}

std::optional<std::string> Config::validate() const {
    if (workers < 1) {
        return std::string("workers must be at least 1");
    }
    if (scanInterval.count() <= 0) {
        return std::string("scan interval must be positive");
    }
    if (bucket.empty() || bucket.find('/') != std::string::npos) {
        return std::string("bucket name must be non-empty and contain no '/'");
    }

    if (budgets.preprocessing < 0 || budgets.generation < 0 || budgets.interpolation < 0 ||
        budgets.upscaling < 0 || budgets.saving < 0) {
        return std::string("progress budgets must not be negative");
    }
    if (budgets.total() != 100) {
        return "progress budgets must sum to 100, got " + std::to_string(budgets.total());
    }

    if (preprocess.baseFps < 1) {
        return std::string("base fps must be positive");
    }
    if (preprocess.maxGenerationDimension < 1 || preprocess.dimensionAlignment < 1 ||
        preprocess.minDimension < 1) {
        return std::string("generation dimensions must be positive");
    }
    if (preprocess.extraGenerationSeconds < 0) {
        return std::string("extra generation seconds must not be negative");
    }
    if (generator.baseModels.empty()) {
        return std::string("at least one base model must be configured");
    }
    if (upscale.supportedScales.empty()) {
        return std::string("at least one upscale factor must be configured");
    }
    for (int scale : upscale.supportedScales) {
        if (scale < 2) {
            return "unsupported upscale factor " + std::to_string(scale);
        }
    }

    for (const auto& [stage, pool] : {std::make_pair("preprocess", &preprocessPool),
                                      std::make_pair("generate", &generatePool),
                                      std::make_pair("interpolate", &interpolatePool),
                                      std::make_pair("upscale", &upscalePool),
                                      std::make_pair("postprocess", &postprocessPool)}) {
        if (auto error = checkPool(stage, *pool)) {
            return error;
        }
    }
    return std::nullopt;
}

}
