/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "vidflow/store.hpp"

namespace vidflow {

// Job store laid out as one directory per status under a workspace root:
//   writing/     jobs being created, invisible to readers
//   pending/ processing/ completed/ failed/ cancelled/
// A status change is a rename of the job directory between two status
// directories, so two processes racing on the same edge see exactly one win.
// Record fields are small files replaced through temp-file + rename; temp
// files live in writing/ and never inside a job directory.
class FileJobStore final : public JobStateStore {
public:
    explicit FileJobStore(const std::filesystem::path& root, bool createIfMissing = true);

    FileJobStore(const FileJobStore&) = delete;
    FileJobStore& operator=(const FileJobStore&) = delete;

    [[nodiscard]] bool valid() const noexcept { return valid_; }
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    [[nodiscard]] std::optional<JobId> createJob(
        const GenerationSpec& spec,
        const std::optional<std::string>& owner = std::nullopt) noexcept override;

    [[nodiscard]] std::optional<JobSnapshot> getStatus(const JobId& id) const noexcept override;
    [[nodiscard]] std::optional<Job> getJob(const JobId& id) const noexcept override;
    [[nodiscard]] std::optional<GenerationSpec> getSpec(const JobId& id) const noexcept override;
    [[nodiscard]] std::vector<JobId> listJobs(
        std::optional<JobStatus> status = std::nullopt) const noexcept override;

    [[nodiscard]] bool transitionStatus(const JobId& id, std::optional<JobStatus> from,
                                        JobStatus to) noexcept override;
    [[nodiscard]] bool setProgress(const JobId& id, int percent, const std::string& step) noexcept override;
    [[nodiscard]] bool setError(const JobId& id, const std::string& message) noexcept override;
    [[nodiscard]] bool saveResult(const JobId& id, const std::string& objectKey,
                                  const std::string& bucket, std::uintmax_t sizeBytes) noexcept override;
    [[nodiscard]] bool markAsRead(const JobId& id) noexcept override;
    [[nodiscard]] bool removeJob(const JobId& id) noexcept override;

private:
    std::filesystem::path root_;
    bool valid_ = false;

    [[nodiscard]] bool createLayout(bool createIfMissing) noexcept;
    [[nodiscard]] std::filesystem::path tempDir() const;
    [[nodiscard]] std::filesystem::path statusDir(JobStatus status) const;
    [[nodiscard]] std::filesystem::path jobPath(JobStatus status, const JobId& id) const;
    [[nodiscard]] std::optional<std::pair<JobStatus, std::filesystem::path>> locate(const JobId& id) const;

    // Writes `name` inside the directory of a Processing job.
    [[nodiscard]] bool writeProcessingField(const JobId& id, const std::string& name,
                                            const std::string& content) const noexcept;
};

}
