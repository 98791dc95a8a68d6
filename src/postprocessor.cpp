/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/postprocessor.hpp"
#include "vidflow/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace vidflow {

namespace {
constexpr std::size_t kPromptChars = 30;

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trimCopy(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::uint8_t clampByte(double v) {
    return static_cast<std::uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

// Removes a partially written file unless released.
class PartialFile {
public:
    explicit PartialFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~PartialFile() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }
    }
    PartialFile(const PartialFile&) = delete;
    PartialFile& operator=(const PartialFile&) = delete;

    void release() noexcept { path_.clear(); }

private:
    std::filesystem::path path_;
};
}

Postprocessor::Postprocessor(PostprocessSettings settings)
    : settings_(std::move(settings)) {}

FrameBatch Postprocessor::trim(FrameBatch frames, int targetDuration, int fps) {
    const long long target = static_cast<long long>(targetDuration) * fps;
    if (target >= 0 && static_cast<long long>(frames.size()) > target) {
        LOG_DEBUG("Trimmed frames from " + std::to_string(frames.size()) + " to " + std::to_string(target));
        frames.resize(static_cast<std::size_t>(target));
    }
    return frames;
}

Frame Postprocessor::fit(const Frame& frame, int targetWidth, int targetHeight) {
    if (!frame.valid()) {
        throw std::invalid_argument("Cannot post-process malformed frame");
    }
    if (frame.width == targetWidth && frame.height == targetHeight) {
        return frame;
    }

    // Per axis: crop offset into the source, paste offset into the target.
    const int srcX = frame.width > targetWidth ? (frame.width - targetWidth) / 2 : 0;
    const int srcY = frame.height > targetHeight ? (frame.height - targetHeight) / 2 : 0;
    const int dstX = frame.width < targetWidth ? (targetWidth - frame.width) / 2 : 0;
    const int dstY = frame.height < targetHeight ? (targetHeight - frame.height) / 2 : 0;
    const int copyW = std::min(frame.width, targetWidth);
    const int copyH = std::min(frame.height, targetHeight);

    Frame out(targetWidth, targetHeight);
    for (int y = 0; y < copyH; ++y) {
        const std::uint8_t* src = frame.pixel(srcX, srcY + y);
        std::uint8_t* dst = out.pixel(dstX, dstY + y);
        std::copy(src, src + static_cast<std::size_t>(copyW) * 3, dst);
    }
    return out;
}

std::string Postprocessor::validateFormat(const std::string& format) const {
    const std::string normalized = toLowerCopy(trimCopy(format));
    const auto& supported = settings_.supportedFormats;
    if (std::find(supported.begin(), supported.end(), normalized) == supported.end()) {
        LOG_WARN("Unsupported format '" + normalized + "', using '" + settings_.defaultFormat + "'");
        return settings_.defaultFormat;
    }
    return normalized;
}

std::string Postprocessor::outputFilename(const std::string& prompt, std::int64_t seed, int videoLength,
                                          int fps, const std::string& format,
                                          std::chrono::system_clock::time_point when) {
    std::string safe;
    for (char c : prompt.substr(0, kPromptChars)) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == ' ' || c == '_') {
            safe += c;
        }
    }
    while (!safe.empty() && safe.back() == ' ') {
        safe.pop_back();
    }
    std::replace(safe.begin(), safe.end(), ' ', '_');
    if (safe.empty()) {
        safe = "video";
    }

    auto time = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&time, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);

    return std::string(stamp) + "_" + safe + "_seed" + std::to_string(seed) + "_len" +
           std::to_string(videoLength) + "s_fps" + std::to_string(fps) + "." + format;
}

void Postprocessor::writeY4m(std::ostream& out, const FrameBatch& frames, int fps) {
    if (frames.empty()) {
        throw std::invalid_argument("Cannot save video: no frames provided");
    }
    const int width = frames.front().width;
    const int height = frames.front().height;
    out << "YUV4MPEG2 W" << width << " H" << height << " F" << fps
        << ":1 Ip A1:1 C444 XCOLORRANGE=FULL\n";

    const std::size_t plane = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    std::vector<char> yuv(plane * 3);
    for (const Frame& frame : frames) {
        if (frame.width != width || frame.height != height || !frame.valid()) {
            throw std::invalid_argument("Frame size changed mid-stream");
        }
        for (std::size_t i = 0; i < plane; ++i) {
            const double r = frame.rgb[i * 3];
            const double g = frame.rgb[i * 3 + 1];
            const double b = frame.rgb[i * 3 + 2];
            yuv[i] = static_cast<char>(clampByte(0.299 * r + 0.587 * g + 0.114 * b));
            yuv[plane + i] = static_cast<char>(clampByte(128.0 - 0.168736 * r - 0.331264 * g + 0.5 * b));
            yuv[2 * plane + i] = static_cast<char>(clampByte(128.0 + 0.5 * r - 0.418688 * g - 0.081312 * b));
        }
        out << "FRAME\n";
        out.write(yuv.data(), static_cast<std::streamsize>(yuv.size()));
    }
}

PostprocessResult Postprocessor::execute(const PostprocessRequest& request, const StageContext& ctx) {
    if (request.frames.empty()) {
        throw std::invalid_argument("Cannot postprocess: no frames provided");
    }
    if (request.targetWidth < 1 || request.targetHeight < 1 || request.fps < 1) {
        throw std::invalid_argument("Invalid output geometry");
    }

    LOG_INFO("Post-processing " + std::to_string(request.frames.size()) + " frames for job " + ctx.jobId());

    FrameBatch frames = trim(request.frames, request.targetDuration, request.fps);
    if (frames.empty()) {
        throw std::invalid_argument("Cannot save video: no frames left after trimming");
    }
    for (Frame& frame : frames) {
        frame = fit(frame, request.targetWidth, request.targetHeight);
    }
    ctx.checkpoint("before encoding");

    const std::string format = validateFormat(request.outputFormat);
    std::filesystem::create_directories(request.outputDir);
    const auto path = request.outputDir /
        outputFilename(request.prompt, request.seed, request.videoLength, request.fps, format,
                       std::chrono::system_clock::now());

    PartialFile partial(path);
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Failed to open " + path.string());
        }
        writeY4m(file, frames, request.fps);
        file.flush();
        if (!file.good()) {
            throw std::runtime_error("Video saving failed: write error on " + path.string());
        }
    }
    partial.release();

    ctx.progress(0, 1);
    LOG_INFO("Saved " + std::to_string(frames.size()) + " frames at " + std::to_string(request.fps) +
             " fps to " + path.string());
    return PostprocessResult{path};
}

}
