/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "vidflow/file_store.hpp"
#include "vidflow/logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>

namespace vidflow {

namespace {
constexpr JobStatus kAllStatuses[] = {
    JobStatus::Pending, JobStatus::Processing, JobStatus::Completed,
    JobStatus::Failed, JobStatus::Cancelled};

constexpr const char* kSpecFile = "spec.txt";
constexpr const char* kNameFile = "name.txt";
constexpr const char* kOwnerFile = "owner.txt";
constexpr const char* kCreatedFile = "created_at";
constexpr const char* kStartedFile = "started_at";
constexpr const char* kCompletedFile = "completed_at";
constexpr const char* kProgressFile = "progress.txt";
constexpr const char* kErrorFile = "error.txt";
constexpr const char* kResultFile = "result.txt";
constexpr const char* kReadFile = "read";

std::int64_t toMillis(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

Timestamp fromMillis(std::int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(ms)));
}

std::optional<std::string> readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Writes a temp file in `tempDir`, then renames it over `path`. Keeping the
// temp outside the job directory means a job renamed to another status
// mid-write never carries the temp file with it.
bool writeFileAtomic(const std::filesystem::path& path, const std::string& content,
                     const std::filesystem::path& tempDir) {
    static std::atomic<uint64_t> counter{0};
    const auto tempPath = tempDir / (path.parent_path().filename().string() + "." +
                                     path.filename().string() + ".tmp" +
                                     std::to_string(counter.fetch_add(1)));
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) return false;
        file << content;
        file.flush();
        if (!file.good()) {
            std::error_code ec;
            std::filesystem::remove(tempPath, ec);
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        return false;
    }
    return true;
}

std::optional<Timestamp> readTimestamp(const std::filesystem::path& path) {
    auto content = readFile(path);
    if (!content || content->empty()) {
        return std::nullopt;
    }
    try {
        return fromMillis(std::stoll(*content));
    } catch (const std::logic_error&) {
        LOG_WARN("Malformed timestamp file: " + path.string());
        return std::nullopt;
    }
}
}

FileJobStore::FileJobStore(const std::filesystem::path& root, bool createIfMissing)
    : root_(root) {
    valid_ = createLayout(createIfMissing);
    if (!valid_) {
        LOG_ERROR("Failed to initialize job store: " + root_.string());
    }
}

bool FileJobStore::createLayout(bool createIfMissing) noexcept {
    try {
        if (!std::filesystem::exists(root_) && !createIfMissing) {
            return false;
        }
        std::filesystem::create_directories(root_ / "writing");
        for (JobStatus status : kAllStatuses) {
            std::filesystem::create_directories(statusDir(status));
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create job store layout: " + std::string(e.what()));
        return false;
    }
}

std::filesystem::path FileJobStore::tempDir() const {
    return root_ / "writing";
}

std::filesystem::path FileJobStore::statusDir(JobStatus status) const {
    return root_ / toString(status);
}

std::filesystem::path FileJobStore::jobPath(JobStatus status, const JobId& id) const {
    return statusDir(status) / id;
}

std::optional<std::pair<JobStatus, std::filesystem::path>> FileJobStore::locate(const JobId& id) const {
    if (id.empty() || id.find('/') != std::string::npos || id == "." || id == "..") {
        return std::nullopt;
    }
    // Terminal directories first: a job caught mid-rename is reported in
    // its newer state.
    for (JobStatus status : {JobStatus::Completed, JobStatus::Failed, JobStatus::Cancelled,
                             JobStatus::Processing, JobStatus::Pending}) {
        auto path = jobPath(status, id);
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec)) {
            return std::make_pair(status, path);
        }
    }
    return std::nullopt;
}

std::optional<JobId> FileJobStore::createJob(const GenerationSpec& spec,
                                             const std::optional<std::string>& owner) noexcept {
    JobId id;
    std::filesystem::path staging;
    try {
        id = generateJobId();
        staging = root_ / "writing" / id;
        std::filesystem::create_directories(staging);

        bool ok = writeFileAtomic(staging / kSpecFile, serializeSpec(spec), tempDir()) &&
                  writeFileAtomic(staging / kNameFile, spec.jobName(), tempDir()) &&
                  writeFileAtomic(staging / kCreatedFile,
                                  std::to_string(toMillis(std::chrono::system_clock::now())), tempDir()) &&
                  writeFileAtomic(staging / kProgressFile, "0\n", tempDir());
        if (ok && owner) {
            ok = writeFileAtomic(staging / kOwnerFile, *owner, tempDir());
        }
        if (!ok) {
            LOG_ERROR("Failed to write job files for: " + id);
            std::error_code ec;
            std::filesystem::remove_all(staging, ec);
            return std::nullopt;
        }

        std::error_code ec;
        std::filesystem::rename(staging, jobPath(JobStatus::Pending, id), ec);
        if (ec) {
            LOG_ERROR("Failed to publish job " + id + ": " + ec.message());
            std::filesystem::remove_all(staging, ec);
            return std::nullopt;
        }

        LOG_DEBUG("Job published: " + id);
        return id;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create job: " + std::string(e.what()));
        if (!staging.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(staging, ec);
        }
        return std::nullopt;
    }
}

std::optional<JobSnapshot> FileJobStore::getStatus(const JobId& id) const noexcept {
    try {
        auto located = locate(id);
        if (!located) return std::nullopt;

        JobSnapshot snapshot;
        snapshot.status = located->first;
        if (auto content = readFile(located->second / kProgressFile)) {
            std::istringstream in(*content);
            std::string line;
            if (std::getline(in, line) && !line.empty()) {
                snapshot.progress = std::stoi(line);
            }
            std::getline(in, snapshot.step);
        }
        return snapshot;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read status for " + id + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<Job> FileJobStore::getJob(const JobId& id) const noexcept {
    try {
        auto located = locate(id);
        if (!located) return std::nullopt;
        const auto& dir = located->second;

        Job job;
        job.id = id;
        job.status = located->first;
        job.name = readFile(dir / kNameFile).value_or("");
        job.owner = readFile(dir / kOwnerFile);
        if (job.status != JobStatus::Cancelled) {
            job.errorMessage = readFile(dir / kErrorFile);
        }
        job.createdAt = readTimestamp(dir / kCreatedFile).value_or(Timestamp{});
        job.startedAt = readTimestamp(dir / kStartedFile);
        job.completedAt = readTimestamp(dir / kCompletedFile);

        std::error_code ec;
        job.markedAsRead = std::filesystem::exists(dir / kReadFile, ec);

        if (auto content = readFile(dir / kProgressFile)) {
            std::istringstream in(*content);
            std::string line;
            if (std::getline(in, line) && !line.empty()) {
                job.progress = std::stoi(line);
            }
            std::getline(in, job.currentStep);
        }

        if (auto content = readFile(dir / kResultFile)) {
            std::istringstream in(*content);
            JobResult result;
            std::string size;
            std::string created;
            if (std::getline(in, result.objectKey) && std::getline(in, result.bucket) &&
                std::getline(in, size) && std::getline(in, created)) {
                result.sizeBytes = static_cast<std::uintmax_t>(std::stoull(size));
                result.createdAt = fromMillis(std::stoll(created));
                job.result = result;
            } else {
                LOG_WARN("Malformed result file for job " + id);
            }
        }
        return job;
    } catch (const std::exception& e) {
        LOG_ERROR("Error retrieving job " + id + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<GenerationSpec> FileJobStore::getSpec(const JobId& id) const noexcept {
    try {
        auto located = locate(id);
        if (!located) return std::nullopt;
        auto content = readFile(located->second / kSpecFile);
        if (!content) {
            LOG_WARN("Spec file missing for job " + id);
            return std::nullopt;
        }
        auto spec = parseSpec(*content);
        if (!spec) {
            LOG_WARN("Malformed spec file for job " + id);
        }
        return spec;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read spec for " + id + ": " + e.what());
        return std::nullopt;
    }
}

std::vector<JobId> FileJobStore::listJobs(std::optional<JobStatus> status) const noexcept {
    std::vector<JobId> ids;
    try {
        for (JobStatus candidate : kAllStatuses) {
            if (status && *status != candidate) continue;
            std::error_code ec;
            for (const auto& entry : std::filesystem::directory_iterator(statusDir(candidate), ec)) {
                if (entry.is_directory()) {
                    ids.push_back(entry.path().filename().string());
                }
            }
            if (ec) {
                LOG_WARN("Failed to scan " + statusDir(candidate).string() + ": " + ec.message());
            }
        }
        // Ids lead with a microsecond timestamp.
        std::sort(ids.begin(), ids.end());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to list jobs: " + std::string(e.what()));
    }
    return ids;
}

bool FileJobStore::transitionStatus(const JobId& id, std::optional<JobStatus> from,
                                    JobStatus to) noexcept {
    try {
        JobStatus source;
        if (from) {
            source = *from;
        } else {
            auto located = locate(id);
            if (!located) return false;
            source = located->first;
        }
        if (!isAllowedTransition(source, to)) {
            return false;
        }

        auto target = jobPath(to, id);
        std::error_code ec;
        std::filesystem::rename(jobPath(source, id), target, ec);
        if (ec) {
            // Lost the race, or the job is not where the caller expected.
            LOG_DEBUG("Transition " + std::string(toString(source)) + "->" + toString(to) +
                      " refused for " + id + ": " + ec.message());
            return false;
        }

        const char* stampFile = to == JobStatus::Processing ? kStartedFile : kCompletedFile;
        if (!writeFileAtomic(target / stampFile,
                             std::to_string(toMillis(std::chrono::system_clock::now())), tempDir())) {
            LOG_WARN("Failed to record transition time for job " + id);
        }
        LOG_DEBUG("Job " + id + " moved to " + toString(to));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to transition job " + id + ": " + e.what());
        return false;
    }
}

bool FileJobStore::writeProcessingField(const JobId& id, const std::string& name,
                                        const std::string& content) const noexcept {
    try {
        auto path = jobPath(JobStatus::Processing, id);
        std::error_code ec;
        if (!std::filesystem::is_directory(path, ec)) {
            return false;
        }
        return writeFileAtomic(path / name, content, tempDir());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write " + name + " for job " + id + ": " + e.what());
        return false;
    }
}

bool FileJobStore::setProgress(const JobId& id, int percent, const std::string& step) noexcept {
    if (percent < 0 || percent > 100) {
        LOG_WARN("Rejected out-of-range progress " + std::to_string(percent) + " for job " + id);
        return false;
    }
    std::string line = step;
    std::replace(line.begin(), line.end(), '\n', ' ');
    return writeProcessingField(id, kProgressFile, std::to_string(percent) + "\n" + line + "\n");
}

bool FileJobStore::setError(const JobId& id, const std::string& message) noexcept {
    return writeProcessingField(id, kErrorFile, message);
}

bool FileJobStore::saveResult(const JobId& id, const std::string& objectKey,
                              const std::string& bucket, std::uintmax_t sizeBytes) noexcept {
    std::ostringstream out;
    out << objectKey << "\n" << bucket << "\n" << sizeBytes << "\n"
        << toMillis(std::chrono::system_clock::now()) << "\n";
    return writeProcessingField(id, kResultFile, out.str());
}

bool FileJobStore::markAsRead(const JobId& id) noexcept {
    try {
        auto located = locate(id);
        if (!located || !isTerminal(located->first)) {
            return false;
        }
        return writeFileAtomic(located->second / kReadFile, "1", tempDir());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to mark job " + id + " as read: " + e.what());
        return false;
    }
}

bool FileJobStore::removeJob(const JobId& id) noexcept {
    try {
        auto located = locate(id);
        if (!located || !isTerminal(located->first)) {
            return false;
        }
        // Move out of the status tree first so readers never see a half-deleted job.
        auto doomed = tempDir() / (id + ".removed");
        std::error_code ec;
        std::filesystem::rename(located->second, doomed, ec);
        if (ec) {
            LOG_WARN("Failed to remove job " + id + ": " + ec.message());
            return false;
        }
        std::filesystem::remove_all(doomed, ec);
        if (ec) {
            LOG_WARN("Leftover files for removed job " + id + ": " + ec.message());
        }
        LOG_INFO("Removed job " + id);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to remove job " + id + ": " + e.what());
        return false;
    }
}

}
