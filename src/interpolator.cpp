/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/interpolator.hpp"
#include "vidflow/logger.hpp"
#include <cmath>
#include <stdexcept>

namespace vidflow {

namespace {
Frame resizeNearest(const Frame& src, int width, int height) {
    Frame out(width, height);
    for (int y = 0; y < height; ++y) {
        const int sy = static_cast<int>(static_cast<long long>(y) * src.height / height);
        for (int x = 0; x < width; ++x) {
            const int sx = static_cast<int>(static_cast<long long>(x) * src.width / width);
            const std::uint8_t* in = src.pixel(sx, sy);
            std::uint8_t* px = out.pixel(x, y);
            px[0] = in[0];
            px[1] = in[1];
            px[2] = in[2];
        }
    }
    return out;
}
}

Frame Interpolator::blend(const Frame& a, const Frame& b, double t) {
    if (!a.valid() || !b.valid()) {
        throw std::invalid_argument("Cannot interpolate malformed frame");
    }
    if (a.width != b.width || a.height != b.height) {
        return blend(a, resizeNearest(b, a.width, a.height), t);
    }

    Frame out(a.width, a.height);
    for (std::size_t i = 0; i < a.rgb.size(); ++i) {
        const double v = (1.0 - t) * a.rgb[i] + t * b.rgb[i];
        out.rgb[i] = static_cast<std::uint8_t>(std::lround(v));
    }
    return out;
}

FrameBatch Interpolator::execute(const InterpolateRequest& request, const StageContext& ctx) {
    const FrameBatch& frames = request.frames;
    const int factor = request.fpsFactor;
    if (frames.size() < 2 || factor < 2) {
        LOG_DEBUG("Nothing to interpolate for job " + ctx.jobId());
        return frames;
    }

    const int pairs = static_cast<int>(frames.size()) - 1;
    const int midpoint = pairs / 2;
    LOG_INFO("Interpolating " + std::to_string(frames.size()) + " frames x" + std::to_string(factor) +
             " for job " + ctx.jobId());

    FrameBatch out;
    out.reserve(frames.size() + static_cast<std::size_t>(pairs) * static_cast<std::size_t>(factor - 1));
    out.push_back(frames.front());

    for (int i = 0; i < pairs; ++i) {
        ctx.checkpoint("at frame pair " + std::to_string(i));
        if (i == midpoint) {
            ctx.progress(i, pairs);
        }

        const Frame& first = frames[static_cast<std::size_t>(i)];
        const Frame& second = frames[static_cast<std::size_t>(i) + 1];
        for (int j = 1; j < factor; ++j) {
            out.push_back(blend(first, second, static_cast<double>(j) / factor));
        }
        if (i < pairs - 1) {
            out.push_back(second);
        }
    }
    out.push_back(frames.back());

    LOG_DEBUG("Interpolated to " + std::to_string(out.size()) + " frames for job " + ctx.jobId());
    return out;
}

}
