/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "test_support.hpp"
#include "vidflow/cancellation.hpp"
#include "vidflow/store.hpp"

namespace vidflow {
namespace {

using test::processingJob;

class CancellableExecutorTest : public ::testing::Test {
protected:
    MemoryJobStore store;
    CancellableExecutor executor{store, "generate-0"};
};

TEST_F(CancellableExecutorTest, ReturnsValueForLiveJob) {
    JobId id = processingJob(store);
    auto result = executor.run<int>(id, "frame generation", [] { return 42; });
    ASSERT_FALSE(result.isCancelled());
    EXPECT_EQ(result.value(), 42);
}

TEST_F(CancellableExecutorTest, CancelledBeforeStartSkipsOperation) {
    JobId id = processingJob(store);
    ASSERT_TRUE(store.requestCancel(id));

    bool invoked = false;
    auto result = executor.run<int>(id, "frame generation", [&] {
        invoked = true;
        return 1;
    });
    EXPECT_TRUE(result.isCancelled());
    EXPECT_FALSE(invoked);
}

TEST_F(CancellableExecutorTest, CancelDuringOperationIsCaughtAfterIt) {
    JobId id = processingJob(store);
    auto result = executor.run<int>(id, "frame upscaling", [&] {
        EXPECT_TRUE(store.requestCancel(id));
        return 3;
    });
    EXPECT_TRUE(result.isCancelled());
}

TEST_F(CancellableExecutorTest, CheckpointInsideOperationStopsIt) {
    JobId id = processingJob(store);
    int steps = 0;
    auto result = executor.run<int>(id, "frame generation", [&] {
        for (int i = 0; i < 10; ++i) {
            if (i == 4) {
                EXPECT_TRUE(store.requestCancel(id));
            }
            executor.checkpoint(id, "at denoising step " + std::to_string(i));
            ++steps;
        }
        return steps;
    });
    EXPECT_TRUE(result.isCancelled());
    EXPECT_EQ(steps, 4);
}

TEST_F(CancellableExecutorTest, FaultsPropagate) {
    JobId id = processingJob(store);
    EXPECT_THROW(
        (void)executor.run<int>(id, "postprocessing", []() -> int { throw std::runtime_error("disk full"); }),
        std::runtime_error);
    EXPECT_FALSE(executor.currentJob().has_value());
}

TEST_F(CancellableExecutorTest, TracksJobInFlight) {
    JobId id = processingJob(store);
    EXPECT_FALSE(executor.currentJob().has_value());
    auto result = executor.run<std::string>(id, "frame interpolation", [&] {
        auto current = executor.currentJob();
        return current.value_or("");
    });
    ASSERT_FALSE(result.isCancelled());
    EXPECT_EQ(result.value(), id);
    EXPECT_FALSE(executor.currentJob().has_value());
}

TEST_F(CancellableExecutorTest, UnreadableStatusIsNotCancellation) {
    EXPECT_FALSE(executor.isCancelled("missing-job"));
    EXPECT_NO_THROW(executor.checkpoint("missing-job", "anywhere"));
}

TEST(StageContextTest, ForwardsCheckpointAndProgress) {
    std::string lastCheckpoint;
    int lastCurrent = -1;
    int lastTotal = -1;
    StageContext ctx(
        "job-1",
        [&](const std::string& where) { lastCheckpoint = where; },
        [&](int current, int total) {
            lastCurrent = current;
            lastTotal = total;
        });

    ctx.checkpoint("before encoding");
    ctx.progress(2, 5);
    EXPECT_EQ(ctx.jobId(), "job-1");
    EXPECT_EQ(lastCheckpoint, "before encoding");
    EXPECT_EQ(lastCurrent, 2);
    EXPECT_EQ(lastTotal, 5);
}

TEST(StageContextTest, EmptyCallbacksAreNoOps) {
    StageContext ctx("job-2", nullptr, nullptr);
    EXPECT_NO_THROW(ctx.checkpoint("x"));
    EXPECT_NO_THROW(ctx.progress(0, 1));
}

}
}
