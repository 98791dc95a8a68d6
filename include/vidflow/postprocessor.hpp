/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <chrono>
#include <filesystem>
#include <ostream>
#include <string>

#include "vidflow/config.hpp"
#include "vidflow/stage.hpp"

namespace vidflow {

// Fits frames to the requested duration and size and writes them to disk.
class Postprocessor final : public StageWorker<PostprocessRequest, PostprocessResult> {
public:
    explicit Postprocessor(PostprocessSettings settings);

    [[nodiscard]] PostprocessResult execute(const PostprocessRequest& request,
                                            const StageContext& ctx) override;

    // Keeps at most duration * fps frames.
    [[nodiscard]] static FrameBatch trim(FrameBatch frames, int targetDuration, int fps);

    // Center-crops along axes that are too large and centers on black along
    // axes that are too small.
    [[nodiscard]] static Frame fit(const Frame& frame, int targetWidth, int targetHeight);

    // Lower-cased format if supported, otherwise the default format.
    [[nodiscard]] std::string validateFormat(const std::string& format) const;

    // <YYYYmmdd_HHMMSS>_<safe prompt>_seed<seed>_len<len>s_fps<fps>.<format>
    [[nodiscard]] static std::string outputFilename(const std::string& prompt, std::int64_t seed,
                                                    int videoLength, int fps, const std::string& format,
                                                    std::chrono::system_clock::time_point when);

    // YUV4MPEG2, 4:4:4 full range.
    static void writeY4m(std::ostream& out, const FrameBatch& frames, int fps);

private:
    PostprocessSettings settings_;
};

}
