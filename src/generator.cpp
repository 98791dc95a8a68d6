/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/generator.hpp"
#include "vidflow/logger.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <random>
#include <stdexcept>

namespace vidflow {

namespace {
constexpr double kPi = 3.14159265358979323846;

// FNV-1a, stable across builds.
std::uint64_t hashText(const std::string& text) {
    std::uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

using Color = std::array<double, 3>;

Color targetColor(std::uint64_t promptHash, int frame, int frameCount) {
    const double base = static_cast<double>(promptHash % 360) / 360.0;
    const double drift = frameCount > 1 ? static_cast<double>(frame) / static_cast<double>(frameCount) : 0.0;
    const double hue = (base + 0.25 * drift) * 2.0 * kPi;
    return {0.5 + 0.4 * std::cos(hue),
            0.5 + 0.4 * std::cos(hue - 2.0 * kPi / 3.0),
            0.5 + 0.4 * std::cos(hue + 2.0 * kPi / 3.0)};
}

std::uint8_t toByte(double v) {
    return static_cast<std::uint8_t>(std::clamp(std::lround(v * 255.0), 0L, 255L));
}

Frame render(const Color& color, int width, int height, int frame, int frameCount) {
    Frame out(width, height);
    // A soft band sweeping left to right over the clip.
    const double bandCenter = frameCount > 1 ? static_cast<double>(frame) / (frameCount - 1) : 0.5;
    for (int y = 0; y < height; ++y) {
        const double vy = 0.75 + 0.25 * static_cast<double>(y) / height;
        for (int x = 0; x < width; ++x) {
            const double fx = static_cast<double>(x) / width;
            const double band = std::exp(-std::pow((fx - bandCenter) * 6.0, 2.0));
            const double shade = vy * (0.8 + 0.2 * band);
            std::uint8_t* px = out.pixel(x, y);
            px[0] = toByte(color[0] * shade);
            px[1] = toByte(color[1] * shade);
            px[2] = toByte(color[2] * shade);
        }
    }
    return out;
}
}

Generator::Generator(GeneratorSettings settings)
    : settings_(std::move(settings)) {}

bool Generator::supportsModel(const std::string& baseModel) const noexcept {
    return std::find(settings_.baseModels.begin(), settings_.baseModels.end(), baseModel) !=
           settings_.baseModels.end();
}

FrameBatch Generator::execute(const GenerateRequest& request, const StageContext& ctx) {
    if (!supportsModel(request.baseModel)) {
        throw std::invalid_argument("Unknown base model: " + request.baseModel);
    }
    if (request.inferenceSteps < 1) {
        throw std::invalid_argument("Inference steps must be positive");
    }

    const int align = std::max(1, settings_.dimensionAlignment);
    const int width = (request.width / align) * align;
    const int height = (request.height / align) * align;
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Generation size " + std::to_string(request.width) + "x" +
                                    std::to_string(request.height) + " too small");
    }
    if (width != request.width || height != request.height) {
        LOG_DEBUG("Adjusted dimensions: " + std::to_string(request.width) + "x" +
                  std::to_string(request.height) + " -> " + std::to_string(width) + "x" +
                  std::to_string(height));
    }

    const int frameCount = request.lengthSeconds * request.fps;
    if (frameCount < 1) {
        throw std::invalid_argument("Nothing to generate for " + std::to_string(request.lengthSeconds) +
                                    "s at " + std::to_string(request.fps) + "fps");
    }

    for (const auto& [name, weight] : request.loras) {
        LOG_DEBUG("LoRA " + name + " weight " + std::to_string(weight) + " for job " + ctx.jobId());
    }
    LOG_INFO("Generating " + std::to_string(frameCount) + " frames at " + std::to_string(width) + "x" +
             std::to_string(height) + " with " + request.baseModel + "/" + request.motionAdapter +
             ", " + std::to_string(request.inferenceSteps) + " steps, guidance " +
             std::to_string(request.guidanceScale));

    const std::uint64_t promptHash = hashText(request.prompt) ^ (hashText(request.negativePrompt) >> 1);
    std::mt19937_64 rng(static_cast<std::uint64_t>(request.seed) ^ promptHash);
    std::uniform_real_distribution<double> noise(0.0, 1.0);

    // Seeded start points, and a seeded offset around each frame's target.
    std::vector<Color> latents(static_cast<std::size_t>(frameCount));
    std::vector<Color> targets(static_cast<std::size_t>(frameCount));
    for (int f = 0; f < frameCount; ++f) {
        Color& latent = latents[static_cast<std::size_t>(f)];
        latent = {noise(rng), noise(rng), noise(rng)};
        Color& target = targets[static_cast<std::size_t>(f)];
        target = targetColor(promptHash, f, frameCount);
        for (std::size_t c = 0; c < 3; ++c) {
            target[c] += 0.1 * (noise(rng) - 0.5);
        }
    }

    const int steps = request.inferenceSteps;
    for (int step = 0; step < steps; ++step) {
        // Move each latent a share of the remaining distance; the last step lands on target.
        const double rate = 1.0 / static_cast<double>(steps - step);
        for (int f = 0; f < frameCount; ++f) {
            const Color& target = targets[static_cast<std::size_t>(f)];
            Color& latent = latents[static_cast<std::size_t>(f)];
            for (std::size_t c = 0; c < 3; ++c) {
                latent[c] += (target[c] - latent[c]) * rate;
            }
        }
        ctx.progress(step, steps);
        ctx.checkpoint("at denoising step " + std::to_string(step));
    }

    FrameBatch frames;
    frames.reserve(static_cast<std::size_t>(frameCount));
    for (int f = 0; f < frameCount; ++f) {
        frames.push_back(render(latents[static_cast<std::size_t>(f)], width, height, f, frameCount));
    }
    LOG_DEBUG("Generated " + std::to_string(frames.size()) + " frames for job " + ctx.jobId());
    return frames;
}

}
