/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "vidflow/generation_spec.hpp"
#include "vidflow/types.hpp"

namespace vidflow {

class JobStateStore;

enum class SubmissionError : std::uint8_t {
    None = 0,
    InvalidSize,
    InvalidContent,
    StoreError
};

struct SubmitResult {
    bool ok = false;
    JobId id;
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Write side of the job API.
class Work final {
public:
    explicit Work(JobStateStore& store) noexcept;

    Work(const Work&) = delete;
    Work& operator=(const Work&) = delete;

    [[nodiscard]] SubmitResult submit(const GenerationSpec& spec,
                                      const std::optional<std::string>& owner = std::nullopt);

    // Flips a Pending or Processing job to Cancelled. Running stages notice
    // at their next checkpoint.
    [[nodiscard]] bool cancel(const JobId& id) noexcept;

    [[nodiscard]] bool markAsRead(const JobId& id) noexcept;

    // Deletes a finished job's record. Pending and Processing jobs stay.
    [[nodiscard]] bool remove(const JobId& id) noexcept;

    void setMaxSize(std::size_t maxBytes) noexcept { maxBytes_ = maxBytes; }
    [[nodiscard]] std::size_t maxSize() const noexcept { return maxBytes_; }

private:
    JobStateStore& store_;
    std::size_t maxBytes_ = 10'000;
};

}
