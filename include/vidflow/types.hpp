#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace vidflow {

// Persisted job lifecycle states. Completed, Failed and Cancelled are terminal.
enum class JobStatus : std::uint8_t { Pending, Processing, Completed, Failed, Cancelled };

// Pipeline stages in execution order.
enum class StageKind : std::uint8_t { Preprocess, Generate, Interpolate, Upscale, Postprocess };

// Opaque job identifier.
using JobId = std::string;

[[nodiscard]] const char* toString(JobStatus status) noexcept;
[[nodiscard]] const char* toString(StageKind stage) noexcept;
[[nodiscard]] std::optional<JobStatus> parseStatus(const std::string& value);

[[nodiscard]] inline bool isTerminal(JobStatus status) noexcept {
    return status == JobStatus::Completed || status == JobStatus::Failed ||
           status == JobStatus::Cancelled;
}

} // namespace vidflow
