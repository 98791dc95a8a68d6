/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

#include "vidflow/types.hpp"

namespace vidflow {

struct UploadResult {
    bool ok = false;
    std::string objectKey;
    std::uintmax_t sizeBytes = 0;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Durable home of finished artifacts.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Object key is "<jobId>/<jobId><ext>".
    [[nodiscard]] virtual UploadResult upload(const std::filesystem::path& localPath,
                                              const JobId& jobId) noexcept = 0;
    [[nodiscard]] virtual const std::string& bucket() const noexcept = 0;

    // Removes a local artifact. True when the file is gone afterwards,
    // including when it never existed.
    [[nodiscard]] virtual bool cleanupLocal(const std::filesystem::path& localPath) noexcept;
};

[[nodiscard]] std::string objectKeyFor(const JobId& jobId, const std::filesystem::path& localPath);

// Object store backed by a local directory: <root>/<bucket>/<objectKey>.
class FileObjectStore final : public ObjectStore {
public:
    FileObjectStore(const std::filesystem::path& root, std::string bucket);

    FileObjectStore(const FileObjectStore&) = delete;
    FileObjectStore& operator=(const FileObjectStore&) = delete;

    [[nodiscard]] UploadResult upload(const std::filesystem::path& localPath,
                                      const JobId& jobId) noexcept override;
    [[nodiscard]] const std::string& bucket() const noexcept override { return bucket_; }

    [[nodiscard]] std::filesystem::path pathFor(const std::string& objectKey) const;

private:
    std::filesystem::path root_;
    std::string bucket_;
};

}
