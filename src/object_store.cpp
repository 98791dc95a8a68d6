/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/object_store.hpp"
#include "vidflow/logger.hpp"

namespace vidflow {

std::string objectKeyFor(const JobId& jobId, const std::filesystem::path& localPath) {
    return jobId + "/" + jobId + localPath.extension().string();
}

bool ObjectStore::cleanupLocal(const std::filesystem::path& localPath) noexcept {
    std::error_code ec;
    if (!std::filesystem::exists(localPath, ec)) {
        return !ec;
    }
    std::filesystem::remove(localPath, ec);
    if (ec) {
        LOG_WARN("Failed to remove local file " + localPath.string() + ": " + ec.message());
        return false;
    }
    LOG_DEBUG("Removed local file " + localPath.string());
    return true;
}

FileObjectStore::FileObjectStore(const std::filesystem::path& root, std::string bucket)
    : root_(root), bucket_(std::move(bucket)) {
    LOG_DEBUG("Object store at " + (root_ / bucket_).string());
}

std::filesystem::path FileObjectStore::pathFor(const std::string& objectKey) const {
    return root_ / bucket_ / objectKey;
}

UploadResult FileObjectStore::upload(const std::filesystem::path& localPath,
                                     const JobId& jobId) noexcept {
    UploadResult result;
    try {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(localPath, ec)) {
            result.error = "Local file not found: " + localPath.string();
            return result;
        }

        const std::string key = objectKeyFor(jobId, localPath);
        const auto target = pathFor(key);
        std::filesystem::create_directories(target.parent_path());

        // Copy under a temp name so readers never see a partial object.
        auto temp = target;
        temp += ".part";
        std::filesystem::copy_file(localPath, temp, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            result.error = "Copy failed: " + ec.message();
            return result;
        }
        std::filesystem::rename(temp, target, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            result.error = "Publish failed: " + ec.message();
            return result;
        }

        result.sizeBytes = std::filesystem::file_size(target, ec);
        if (ec) {
            result.error = "Failed to stat uploaded object: " + ec.message();
            return result;
        }

        result.ok = true;
        result.objectKey = key;
        LOG_INFO("Uploaded " + localPath.filename().string() + " to " + bucket_ + "/" + key +
                 " (" + std::to_string(result.sizeBytes) + " bytes)");
        return result;
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = e.what();
        return result;
    }
}

}
