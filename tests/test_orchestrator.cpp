/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <fstream>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_support.hpp"
#include "vidflow/object_store.hpp"
#include "vidflow/orchestrator.hpp"
#include "vidflow/store.hpp"

namespace vidflow {
namespace {

using test::RecordingStore;
using test::TempDir;
using test::smallSpec;

// Stage stand-in: records each call and delegates to a scripted body.
template <typename Request, typename Result>
class FakeStage final : public Stage<Request, Result> {
public:
    using Body = std::function<StageResult<Result>(const Request&, const JobId&)>;

    explicit FakeStage(Body body) : body_(std::move(body)) {}

    StageResult<Result> execute(const Request& request, const JobId& jobId,
                                int progressStart, int progressEnd) override {
        ++calls;
        windows.push_back(ProgressRange{progressStart, progressEnd});
        last = request;
        return body_(request, jobId);
    }

    void setBody(Body body) { body_ = std::move(body); }

    int calls = 0;
    std::vector<ProgressRange> windows;
    Request last{};

private:
    Body body_;
};

// Object store that records uploads and can be told to fail.
class FakeObjectStore final : public ObjectStore {
public:
    UploadResult upload(const std::filesystem::path& localPath, const JobId& jobId) noexcept override {
        ++uploads;
        UploadResult result;
        if (fail) {
            result.error = "bucket unreachable";
            return result;
        }
        std::error_code ec;
        result.ok = true;
        result.objectKey = objectKeyFor(jobId, localPath);
        result.sizeBytes = std::filesystem::file_size(localPath, ec);
        return result;
    }
    const std::string& bucket() const noexcept override { return bucket_; }

    bool fail = false;
    int uploads = 0;

private:
    std::string bucket_ = "videos";
};

FrameBatch frames(std::size_t n) {
    return FrameBatch(n, Frame(4, 4));
}

class OrchestratorTest : public ::testing::Test {
protected:
    OrchestratorTest()
        : preprocess([this](const PreprocessRequest&, const JobId&) {
              return StageResult<PreprocessResult>::of(plan);
          }),
          generate([](const GenerateRequest& r, const JobId&) {
              return StageResult<FrameBatch>::of(frames(static_cast<std::size_t>(r.lengthSeconds * r.fps)));
          }),
          interpolate([](const InterpolateRequest& r, const JobId&) {
              return StageResult<FrameBatch>::of(frames(r.frames.size() * static_cast<std::size_t>(r.fpsFactor)));
          }),
          upscale([](const UpscaleRequest& r, const JobId&) {
              return StageResult<FrameBatch>::of(r.frames);
          }),
          postprocess([this](const PostprocessRequest& r, const JobId&) {
              return StageResult<PostprocessResult>::of(PostprocessResult{writeArtifact(r.outputDir)});
          }) {
        plan.fpsFactor = 1;
        plan.scaleFactor = 1;
        plan.adjustedWidth = 32;
        plan.adjustedHeight = 24;
        plan.adjustedLength = 1;
    }

    Orchestrator makeOrchestrator() {
        OrchestratorSettings settings;
        settings.outputDir = dir.path() / "outputs";
        return Orchestrator(store, objects,
                            PipelineStages{preprocess, generate, interpolate, upscale, postprocess},
                            settings);
    }

    static std::filesystem::path writeArtifact(const std::filesystem::path& outputDir) {
        std::filesystem::create_directories(outputDir);
        auto path = outputDir / "clip.y4m";
        std::ofstream(path) << "YUV4MPEG2 test payload";
        return path;
    }

    JobId submit() {
        auto id = store.createJob(smallSpec());
        EXPECT_TRUE(id.has_value());
        return id.value_or("");
    }

    Job job(const JobId& id) {
        auto found = store.getJob(id);
        EXPECT_TRUE(found.has_value());
        return found.value_or(Job{});
    }

    TempDir dir{"orchestrator"};
    RecordingStore store;
    FakeObjectStore objects;
    PreprocessResult plan;

    FakeStage<PreprocessRequest, PreprocessResult> preprocess;
    FakeStage<GenerateRequest, FrameBatch> generate;
    FakeStage<InterpolateRequest, FrameBatch> interpolate;
    FakeStage<UpscaleRequest, FrameBatch> upscale;
    FakeStage<PostprocessRequest, PostprocessResult> postprocess;
};

// -----------------------------------------------------------------------------
// Success paths
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, CompletesAndRecordsResult) {
    JobId id = submit();
    auto orchestrator = makeOrchestrator();
    EXPECT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Completed);

    Job done = job(id);
    EXPECT_EQ(done.status, JobStatus::Completed);
    EXPECT_EQ(done.progress, 100);
    EXPECT_EQ(done.currentStep, "Completed");
    ASSERT_TRUE(done.result.has_value());
    EXPECT_EQ(done.result->objectKey, id + "/" + id + ".y4m");
    EXPECT_EQ(done.result->bucket, "videos");
    EXPECT_GT(done.result->sizeBytes, 0u);
    EXPECT_FALSE(done.errorMessage.has_value());
    EXPECT_EQ(objects.uploads, 1);
}

TEST_F(OrchestratorTest, SkipsOptionalStagesAndWidensGeneration) {
    JobId id = submit();
    auto orchestrator = makeOrchestrator();
    ASSERT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Completed);

    EXPECT_EQ(interpolate.calls, 0);
    EXPECT_EQ(upscale.calls, 0);
    ASSERT_EQ(preprocess.windows.size(), 1u);
    EXPECT_EQ(preprocess.windows[0].start, 0);
    EXPECT_EQ(preprocess.windows[0].end, 1);
    ASSERT_EQ(generate.windows.size(), 1u);
    EXPECT_EQ(generate.windows[0].start, 1);
    EXPECT_EQ(generate.windows[0].end, 99);
    ASSERT_EQ(postprocess.windows.size(), 1u);
    EXPECT_EQ(postprocess.windows[0].start, 99);
    EXPECT_EQ(postprocess.windows[0].end, 100);
}

TEST_F(OrchestratorTest, RunsEveryStageInDefaultWindows) {
    plan.fpsFactor = 2;
    plan.scaleFactor = 2;
    plan.adjustedLength = 2;
    JobId id = submit();
    auto orchestrator = makeOrchestrator();
    ASSERT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Completed);

    ASSERT_EQ(generate.calls, 1);
    EXPECT_EQ(generate.windows[0].start, 1);
    EXPECT_EQ(generate.windows[0].end, 71);
    EXPECT_EQ(generate.last.lengthSeconds, 2);
    EXPECT_EQ(generate.last.fps, 8);

    ASSERT_EQ(interpolate.calls, 1);
    EXPECT_EQ(interpolate.windows[0].start, 71);
    EXPECT_EQ(interpolate.windows[0].end, 85);
    EXPECT_EQ(interpolate.last.fpsFactor, 2);
    EXPECT_EQ(interpolate.last.frames.size(), 16u);

    ASSERT_EQ(upscale.calls, 1);
    EXPECT_EQ(upscale.windows[0].start, 85);
    EXPECT_EQ(upscale.windows[0].end, 99);
    EXPECT_EQ(upscale.last.scaleFactor, 2);

    ASSERT_EQ(postprocess.calls, 1);
    EXPECT_EQ(postprocess.last.fps, 16);
    EXPECT_EQ(postprocess.last.frames.size(), 32u);
    EXPECT_EQ(postprocess.last.targetWidth, 32);
    EXPECT_EQ(postprocess.last.targetHeight, 24);
    EXPECT_EQ(postprocess.last.targetDuration, 1);
    EXPECT_EQ(postprocess.last.outputDir.string(), (dir.path() / "outputs" / id).string());
}

TEST_F(OrchestratorTest, ProgressNeverMovesBackwards) {
    plan.fpsFactor = 2;
    plan.scaleFactor = 2;
    JobId id = submit();
    // Stages that write inside their windows, as pooled workers do.
    generate.setBody([this](const GenerateRequest& r, const JobId& jobId) {
        EXPECT_TRUE(store.setProgress(jobId, 70, "Generating frames (25/25)"));
        return StageResult<FrameBatch>::of(frames(static_cast<std::size_t>(r.lengthSeconds * r.fps)));
    });
    interpolate.setBody([this](const InterpolateRequest& r, const JobId& jobId) {
        EXPECT_TRUE(store.setProgress(jobId, 84, "Interpolating frames (8/8)"));
        return StageResult<FrameBatch>::of(r.frames);
    });

    auto orchestrator = makeOrchestrator();
    ASSERT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Completed);

    auto writes = store.progressWrites();
    EXPECT_TRUE(std::is_sorted(writes.begin(), writes.end()));
    EXPECT_EQ(writes.back(), 100);
    auto steps = store.stepWrites();
    EXPECT_NE(std::find(steps.begin(), steps.end(), "Uploading to storage"), steps.end());
    EXPECT_NE(std::find(steps.begin(), steps.end(), "Starting frame interpolation"), steps.end());
    EXPECT_NE(std::find(steps.begin(), steps.end(), "Starting frame upscaling"), steps.end());
}

TEST_F(OrchestratorTest, SecondRunIsSkipped) {
    JobId id = submit();
    auto orchestrator = makeOrchestrator();
    ASSERT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Completed);
    EXPECT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Skipped);
    EXPECT_EQ(preprocess.calls, 1);
    EXPECT_EQ(objects.uploads, 1);
    EXPECT_EQ(job(id).status, JobStatus::Completed);
}

TEST_F(OrchestratorTest, CancelledBeforeClaimIsSkipped) {
    JobId id = submit();
    ASSERT_TRUE(store.requestCancel(id));
    auto orchestrator = makeOrchestrator();
    EXPECT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Skipped);
    EXPECT_EQ(preprocess.calls, 0);
    EXPECT_EQ(job(id).status, JobStatus::Cancelled);
}

// -----------------------------------------------------------------------------
// Cancellation
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, CancelledStageStopsPipeline) {
    plan.fpsFactor = 2;
    plan.scaleFactor = 2;
    JobId id = submit();
    generate.setBody([this](const GenerateRequest&, const JobId& jobId) {
        EXPECT_TRUE(store.requestCancel(jobId));
        return StageResult<FrameBatch>::cancelled();
    });

    auto orchestrator = makeOrchestrator();
    EXPECT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Cancelled);

    EXPECT_EQ(interpolate.calls, 0);
    EXPECT_EQ(upscale.calls, 0);
    EXPECT_EQ(postprocess.calls, 0);
    EXPECT_EQ(objects.uploads, 0);
    Job cancelled = job(id);
    EXPECT_EQ(cancelled.status, JobStatus::Cancelled);
    EXPECT_FALSE(cancelled.errorMessage.has_value());
    EXPECT_FALSE(cancelled.result.has_value());
}

TEST_F(OrchestratorTest, CancelRacingFaultLeavesJobCancelled) {
    JobId id = submit();
    generate.setBody([this](const GenerateRequest&, const JobId& jobId) -> StageResult<FrameBatch> {
        EXPECT_TRUE(store.requestCancel(jobId));
        throw std::runtime_error("CUDA out of memory");
    });

    auto orchestrator = makeOrchestrator();
    EXPECT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Cancelled);
    EXPECT_EQ(job(id).status, JobStatus::Cancelled);
    EXPECT_EQ(postprocess.calls, 0);
}

TEST_F(OrchestratorTest, CancelAfterErrorRecordedLeavesNoMessage) {
    JobId id = submit();
    generate.setBody([](const GenerateRequest&, const JobId&) -> StageResult<FrameBatch> {
        throw std::runtime_error("CUDA out of memory");
    });
    store.onSetError = [this](const JobId& jobId) {
        EXPECT_TRUE(store.requestCancel(jobId));
    };

    auto orchestrator = makeOrchestrator();
    EXPECT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Cancelled);
    Job cancelled = job(id);
    EXPECT_EQ(cancelled.status, JobStatus::Cancelled);
    EXPECT_FALSE(cancelled.errorMessage.has_value());
    EXPECT_EQ(postprocess.calls, 0);
}

TEST_F(OrchestratorTest, CancelDuringUploadWins) {
    JobId id = submit();
    postprocess.setBody([this](const PostprocessRequest& r, const JobId& jobId) {
        auto path = writeArtifact(r.outputDir);
        EXPECT_TRUE(store.requestCancel(jobId));
        return StageResult<PostprocessResult>::of(PostprocessResult{path});
    });

    auto orchestrator = makeOrchestrator();
    EXPECT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Cancelled);
    Job cancelled = job(id);
    EXPECT_EQ(cancelled.status, JobStatus::Cancelled);
    EXPECT_FALSE(cancelled.result.has_value());
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "outputs" / id));
}

// -----------------------------------------------------------------------------
// Faults
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, StageFaultFailsJobWithMessage) {
    JobId id = submit();
    preprocess.setBody([](const PreprocessRequest&, const JobId&) -> StageResult<PreprocessResult> {
        throw std::invalid_argument("Video dimensions below minimum of 8");
    });

    auto orchestrator = makeOrchestrator();
    EXPECT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Failed);
    Job failed = job(id);
    EXPECT_EQ(failed.status, JobStatus::Failed);
    ASSERT_TRUE(failed.errorMessage.has_value());
    EXPECT_EQ(*failed.errorMessage, "Video dimensions below minimum of 8");
    EXPECT_EQ(generate.calls, 0);
}

TEST_F(OrchestratorTest, EmptyGenerationFails) {
    JobId id = submit();
    generate.setBody([](const GenerateRequest&, const JobId&) {
        return StageResult<FrameBatch>::of(FrameBatch{});
    });

    auto orchestrator = makeOrchestrator();
    EXPECT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Failed);
    Job failed = job(id);
    ASSERT_TRUE(failed.errorMessage.has_value());
    EXPECT_EQ(*failed.errorMessage, "Video generation failed: no frames were generated");
    EXPECT_EQ(postprocess.calls, 0);
}

TEST_F(OrchestratorTest, UploadFailureFailsJob) {
    JobId id = submit();
    objects.fail = true;

    auto orchestrator = makeOrchestrator();
    EXPECT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Failed);
    Job failed = job(id);
    EXPECT_EQ(failed.status, JobStatus::Failed);
    ASSERT_TRUE(failed.errorMessage.has_value());
    EXPECT_EQ(*failed.errorMessage, "Upload failed: bucket unreachable");
    EXPECT_FALSE(failed.result.has_value());
}

// -----------------------------------------------------------------------------
// Cleanup
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, LocalArtifactRemovedAfterSuccess) {
    JobId id = submit();
    std::filesystem::path artifact;
    postprocess.setBody([&artifact](const PostprocessRequest& r, const JobId&) {
        artifact = writeArtifact(r.outputDir);
        return StageResult<PostprocessResult>::of(PostprocessResult{artifact});
    });

    auto orchestrator = makeOrchestrator();
    ASSERT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Completed);
    ASSERT_FALSE(artifact.empty());
    EXPECT_FALSE(std::filesystem::exists(artifact));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "outputs" / id));
}

TEST_F(OrchestratorTest, LocalArtifactRemovedAfterFailure) {
    JobId id = submit();
    objects.fail = true;
    std::filesystem::path artifact;
    postprocess.setBody([&artifact](const PostprocessRequest& r, const JobId&) {
        artifact = writeArtifact(r.outputDir);
        return StageResult<PostprocessResult>::of(PostprocessResult{artifact});
    });

    auto orchestrator = makeOrchestrator();
    ASSERT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Failed);
    ASSERT_FALSE(artifact.empty());
    EXPECT_FALSE(std::filesystem::exists(artifact));
}

TEST_F(OrchestratorTest, PartialOutputRemovedWhenPostprocessThrows) {
    JobId id = submit();
    std::filesystem::path partial;
    postprocess.setBody([&partial](const PostprocessRequest& r, const JobId&) -> StageResult<PostprocessResult> {
        partial = writeArtifact(r.outputDir);
        throw std::runtime_error("Video saving failed: disk full");
    });

    auto orchestrator = makeOrchestrator();
    ASSERT_EQ(orchestrator.run(smallSpec(), id), RunOutcome::Failed);
    ASSERT_FALSE(partial.empty());
    EXPECT_FALSE(std::filesystem::exists(partial));
}

}
}
