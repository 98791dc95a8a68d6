/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace vidflow {

// Packed 8-bit RGB image, row-major.
struct Frame {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> rgb;

    Frame() = default;
    Frame(int w, int h)
        : width(w), height(h),
          rgb(static_cast<std::size_t>(w > 0 ? w : 0) * static_cast<std::size_t>(h > 0 ? h : 0) * 3, 0) {}

    [[nodiscard]] bool valid() const noexcept {
        return width > 0 && height > 0 &&
               rgb.size() == static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 3;
    }

    [[nodiscard]] std::uint8_t* pixel(int x, int y) noexcept {
        return rgb.data() + (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) * 3;
    }
    [[nodiscard]] const std::uint8_t* pixel(int x, int y) const noexcept {
        return rgb.data() + (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) * 3;
    }
};

using FrameBatch = std::vector<Frame>;

}
