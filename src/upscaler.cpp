/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/upscaler.hpp"
#include "vidflow/logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace vidflow {

Upscaler::Upscaler(UpscaleSettings settings)
    : settings_(std::move(settings)) {}

int Upscaler::effectiveScale(int requested) const noexcept {
    const auto& scales = settings_.supportedScales;
    if (scales.empty() || std::find(scales.begin(), scales.end(), requested) != scales.end()) {
        return requested;
    }
    int closest = scales.front();
    for (int candidate : scales) {
        if (std::abs(candidate - requested) < std::abs(closest - requested)) {
            closest = candidate;
        }
    }
    return closest;
}

Frame Upscaler::upscale(const Frame& frame, int scale) {
    if (!frame.valid()) {
        throw std::invalid_argument("Cannot upscale malformed frame");
    }
    Frame out(frame.width * scale, frame.height * scale);
    const std::size_t rowBytes = static_cast<std::size_t>(out.width) * 3;
    for (int y = 0; y < frame.height; ++y) {
        std::uint8_t* row = out.pixel(0, y * scale);
        for (int x = 0; x < frame.width; ++x) {
            const std::uint8_t* in = frame.pixel(x, y);
            for (int k = 0; k < scale; ++k) {
                std::uint8_t* px = row + (static_cast<std::size_t>(x) * scale + k) * 3;
                px[0] = in[0];
                px[1] = in[1];
                px[2] = in[2];
            }
        }
        for (int k = 1; k < scale; ++k) {
            std::memcpy(out.pixel(0, y * scale + k), row, rowBytes);
        }
    }
    return out;
}

FrameBatch Upscaler::execute(const UpscaleRequest& request, const StageContext& ctx) {
    const FrameBatch& frames = request.frames;
    if (frames.empty() || request.scaleFactor <= 1) {
        return frames;
    }

    const int scale = effectiveScale(request.scaleFactor);
    if (scale != request.scaleFactor) {
        LOG_WARN("Scale " + std::to_string(request.scaleFactor) + " not supported, using " +
                 std::to_string(scale));
    }

    const int total = static_cast<int>(frames.size());
    const int midpoint = total / 2;
    LOG_INFO("Upscaling " + std::to_string(total) + " frames x" + std::to_string(scale) +
             " for job " + ctx.jobId());

    FrameBatch out;
    out.reserve(frames.size());
    for (int i = 0; i < total; ++i) {
        ctx.checkpoint("at frame " + std::to_string(i));
        if (i == midpoint) {
            ctx.progress(i, total);
        }
        out.push_back(upscale(frames[static_cast<std::size_t>(i)], scale));
    }
    return out;
}

}
