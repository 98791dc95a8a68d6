/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "test_support.hpp"
#include "vidflow/stage.hpp"
#include "vidflow/worker_pool.hpp"

namespace vidflow {
namespace {

using test::eventually;
using test::processingJob;

// Shared switch the test flips to let blocked workers finish.
class Gate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

struct Counters {
    std::atomic<int> created{0};
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::atomic<int> overlapping{0};
};

// Doubles the request; optionally blocks on a gate; records concurrency.
class DoublingWorker final : public StageWorker<int, int> {
public:
    DoublingWorker(Counters& counters, Gate* gate) : counters_(counters), gate_(gate) {
        ++counters_.created;
    }

    int execute(const int& request, const StageContext& ctx) override {
        if (inFlight_.exchange(true)) {
            ++counters_.overlapping;
        }
        int now = ++counters_.running;
        int peak = counters_.peak.load();
        while (now > peak && !counters_.peak.compare_exchange_weak(peak, now)) {
        }
        if (gate_) {
            gate_->wait();
        }
        ctx.progress(0, 2);
        ctx.checkpoint("midway");
        ctx.progress(1, 2);
        --counters_.running;
        inFlight_ = false;
        if (request < 0) {
            throw std::runtime_error("negative input");
        }
        return request * 2;
    }

private:
    Counters& counters_;
    Gate* gate_;
    std::atomic<bool> inFlight_{false};
};

using IntPool = WorkerPool<int, int>;

IntPool::Factory factoryFor(Counters& counters, Gate* gate = nullptr) {
    return [&counters, gate] { return std::make_unique<DoublingWorker>(counters, gate); };
}

TEST(WorkerPoolTest, StartCreatesMinimumReplicas) {
    MemoryJobStore store;
    Counters counters;
    IntPool pool(StageKind::Upscale, store, factoryFor(counters),
                 PoolConfig{2, 4, std::chrono::seconds(300)});
    ASSERT_TRUE(pool.start());
    EXPECT_EQ(pool.replicaCount(), 2u);
    EXPECT_EQ(pool.busyCount(), 0u);
    EXPECT_EQ(counters.created.load(), 2);
}

TEST(WorkerPoolTest, ExecuteReturnsResultAndReportsIntoWindow) {
    test::RecordingStore store;
    Counters counters;
    IntPool pool(StageKind::Generate, store, factoryFor(counters),
                 PoolConfig{1, 1, std::chrono::seconds(600)});
    ASSERT_TRUE(pool.start());

    JobId id = processingJob(store);
    auto result = pool.execute(21, id, 1, 71);
    ASSERT_FALSE(result.isCancelled());
    EXPECT_EQ(result.value(), 42);

    auto writes = store.progressWrites();
    ASSERT_EQ(writes.size(), 2u);
    EXPECT_EQ(writes.front(), 1);
    EXPECT_EQ(writes.back(), 70);
    EXPECT_EQ(store.stepWrites().back(), "Generating frames (2/2)");
}

TEST(WorkerPoolTest, CancelledJobYieldsSentinel) {
    MemoryJobStore store;
    Counters counters;
    IntPool pool(StageKind::Interpolate, store, factoryFor(counters),
                 PoolConfig{1, 2, std::chrono::seconds(300)});
    ASSERT_TRUE(pool.start());

    JobId id = processingJob(store);
    ASSERT_TRUE(store.requestCancel(id));
    auto result = pool.execute(5, id, 71, 85);
    EXPECT_TRUE(result.isCancelled());
    EXPECT_EQ(pool.busyCount(), 0u);
}

TEST(WorkerPoolTest, FaultPropagatesAndFreesReplica) {
    MemoryJobStore store;
    Counters counters;
    IntPool pool(StageKind::Postprocess, store, factoryFor(counters),
                 PoolConfig{1, 1, std::chrono::seconds(180)});
    ASSERT_TRUE(pool.start());

    JobId id = processingJob(store);
    EXPECT_THROW((void)pool.execute(-1, id, 99, 100), std::runtime_error);
    EXPECT_EQ(pool.busyCount(), 0u);

    JobId next = processingJob(store);
    auto result = pool.execute(4, next, 99, 100);
    ASSERT_FALSE(result.isCancelled());
    EXPECT_EQ(result.value(), 8);
}

TEST(WorkerPoolTest, ScalesUpToMaximumUnderLoad) {
    MemoryJobStore store;
    Counters counters;
    Gate gate;
    IntPool pool(StageKind::Interpolate, store, factoryFor(counters, &gate),
                 PoolConfig{1, 3, std::chrono::seconds(300)});
    ASSERT_TRUE(pool.start());

    std::vector<JobId> ids;
    for (int i = 0; i < 3; ++i) ids.push_back(processingJob(store));

    std::vector<std::thread> callers;
    std::atomic<int> completed{0};
    for (const auto& id : ids) {
        callers.emplace_back([&, id] {
            auto result = pool.execute(1, id, 0, 10);
            if (!result.isCancelled() && result.value() == 2) ++completed;
        });
    }

    EXPECT_TRUE(eventually([&] { return pool.busyCount() == 3u; }));
    EXPECT_EQ(pool.replicaCount(), 3u);

    gate.open();
    for (auto& t : callers) t.join();
    EXPECT_EQ(completed.load(), 3);
    EXPECT_EQ(counters.overlapping.load(), 0);
}

TEST(WorkerPoolTest, CallersQueueWhenAtMaximum) {
    MemoryJobStore store;
    Counters counters;
    IntPool pool(StageKind::Generate, store, factoryFor(counters),
                 PoolConfig{1, 1, std::chrono::seconds(600)});
    ASSERT_TRUE(pool.start());

    std::vector<std::thread> callers;
    for (int i = 0; i < 4; ++i) {
        JobId id = processingJob(store);
        callers.emplace_back([&pool, id] { (void)pool.execute(3, id, 1, 99); });
    }
    for (auto& t : callers) t.join();

    EXPECT_EQ(pool.replicaCount(), 1u);
    EXPECT_EQ(counters.created.load(), 1);
    EXPECT_EQ(counters.peak.load(), 1);
}

TEST(WorkerPoolTest, IdleReplicasAboveMinimumAreDropped) {
    MemoryJobStore store;
    Counters counters;
    Gate gate;
    IntPool pool(StageKind::Upscale, store, factoryFor(counters, &gate),
                 PoolConfig{1, 2, std::chrono::seconds(0)});
    ASSERT_TRUE(pool.start());

    std::vector<std::thread> callers;
    for (int i = 0; i < 2; ++i) {
        JobId id = processingJob(store);
        callers.emplace_back([&pool, id] { (void)pool.execute(1, id, 85, 99); });
    }
    EXPECT_TRUE(eventually([&] { return pool.busyCount() == 2u; }));
    gate.open();
    for (auto& t : callers) t.join();
    EXPECT_EQ(pool.replicaCount(), 2u);

    // The next acquire reaps the idle surplus.
    JobId id = processingJob(store);
    auto result = pool.execute(1, id, 85, 99);
    ASSERT_FALSE(result.isCancelled());
    EXPECT_EQ(pool.replicaCount(), 1u);
}

TEST(WorkerPoolTest, FactoryFailureFailsStart) {
    MemoryJobStore store;
    IntPool pool(StageKind::Preprocess, store,
                 [] { return std::unique_ptr<StageWorker<int, int>>(); },
                 PoolConfig{1, 3, std::chrono::seconds(180)});
    EXPECT_FALSE(pool.start());
}

}
}
