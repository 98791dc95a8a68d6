/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/pipeline.hpp"
#include "vidflow/generator.hpp"
#include "vidflow/interpolator.hpp"
#include "vidflow/postprocessor.hpp"
#include "vidflow/preprocessor.hpp"
#include "vidflow/upscaler.hpp"
#include <string>
#include <utility>

namespace vidflow {

namespace {

template <typename Factory, typename Reference>
Factory orReference(Factory factory, Reference reference) {
    if (factory) {
        return factory;
    }
    return Factory(std::move(reference));
}

template <typename Request>
typename WorkerPool<Request, FrameBatch>::Factory degradable(
    typename WorkerPool<Request, FrameBatch>::Factory factory, std::string name) {
    return [factory = std::move(factory), name = std::move(name)]() {
        return std::make_unique<FallbackToInput<Request>>(factory(), name);
    };
}

}

StagePools::StagePools(JobStateStore& store, const Config& config, StageFactories factories)
    : preprocess(StageKind::Preprocess, store,
                 orReference(std::move(factories.preprocess),
                             [settings = config.preprocess]() { return std::make_unique<Preprocessor>(settings); }),
                 config.preprocessPool),
      generate(StageKind::Generate, store,
               orReference(std::move(factories.generate),
                           [settings = config.generator]() { return std::make_unique<Generator>(settings); }),
               config.generatePool),
      interpolate(StageKind::Interpolate, store,
                  degradable<InterpolateRequest>(
                      orReference(std::move(factories.interpolate),
                                  []() { return std::make_unique<Interpolator>(); }),
                      "Frame interpolation"),
                  config.interpolatePool),
      upscale(StageKind::Upscale, store,
              degradable<UpscaleRequest>(
                  orReference(std::move(factories.upscale),
                              [settings = config.upscale]() { return std::make_unique<Upscaler>(settings); }),
                  "Frame upscaling"),
              config.upscalePool),
      postprocess(StageKind::Postprocess, store,
                  orReference(std::move(factories.postprocess),
                              [settings = config.postprocess]() { return std::make_unique<Postprocessor>(settings); }),
                  config.postprocessPool) {}

bool StagePools::start() noexcept {
    return preprocess.start() && generate.start() && interpolate.start() &&
           upscale.start() && postprocess.start();
}

PipelineStages StagePools::stages() noexcept {
    return PipelineStages{preprocess, generate, interpolate, upscale, postprocess};
}

OrchestratorSettings orchestratorSettings(const Config& config) {
    OrchestratorSettings settings;
    settings.budgets = config.budgets;
    settings.baseFps = config.preprocess.baseFps;
    settings.outputDir = config.outputDir;
    return settings;
}

}
