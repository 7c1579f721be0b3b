/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>
#include "AsyncOperations/TaskRegistry.h"

using namespace Shelf::Core::Async;
using namespace std::chrono_literals;

TEST(TaskRegistry, IdsAreMonotonicAndQueueIsFifo) {
    TaskRegistry registry;
    auto a = registry.create(Operation::pathExists("/a"));
    auto b = registry.create(Operation::pathExists("/b"));
    auto c = registry.create(Operation::pathExists("/c"));
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_EQ(registry.activeCount(), 3u);
    EXPECT_EQ(registry.pendingCount(), 3u);

    auto first = registry.tryClaimNext();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->id, a);
    EXPECT_EQ(registry.state(a), TaskState::Running);
    EXPECT_EQ(registry.pendingCount(), 2u);
    EXPECT_EQ(registry.activeCount(), 3u);
}

TEST(TaskRegistry, CompleteIsWriteOnce) {
    TaskRegistry registry;
    auto id = registry.create(Operation::getFileSize("/a"));
    ASSERT_TRUE(registry.tryClaimNext().has_value());

    EXPECT_TRUE(registry.complete(id, OperationResult::success(uint64_t{10})));
    EXPECT_FALSE(registry.complete(id, OperationResult::timeout()));
    EXPECT_FALSE(registry.complete(id, OperationResult::cancelled()));
    EXPECT_FALSE(registry.complete(id, OperationResult::error("late")));

    auto r = registry.poll(id);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, OperationResult::success(uint64_t{10}));
    EXPECT_EQ(registry.activeCount(), 0u);
}

TEST(TaskRegistry, CancelPendingRemovesFromQueue) {
    TaskRegistry registry;
    auto a = registry.create(Operation::deletePath("/a"));
    auto b = registry.create(Operation::deletePath("/b"));

    EXPECT_EQ(registry.cancel(a), CancelOutcome::RemovedPending);
    EXPECT_TRUE(registry.isCancelled(a));
    EXPECT_EQ(registry.pendingCount(), 1u);

    auto claim = registry.tryClaimNext();
    ASSERT_TRUE(claim.has_value());
    EXPECT_EQ(claim->id, b);
    EXPECT_FALSE(registry.tryClaimNext().has_value());

    auto r = registry.poll(a);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->isCancelled());
}

TEST(TaskRegistry, CancelRunningResolvesImmediatelyAndDiscardsLateResult) {
    TaskRegistry registry;
    auto id = registry.create(Operation::pathExists("/a"));
    ASSERT_TRUE(registry.tryClaimNext().has_value());

    EXPECT_EQ(registry.cancel(id), CancelOutcome::CancelledRunning);
    EXPECT_TRUE(registry.isTerminal(id));
    EXPECT_FALSE(registry.complete(id, OperationResult::success(true)));

    auto r = registry.poll(id);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->isCancelled());
}

TEST(TaskRegistry, CancelIsIdempotent) {
    TaskRegistry registry;
    auto id = registry.create(Operation::pathExists("/a"));
    EXPECT_EQ(registry.cancel(id), CancelOutcome::RemovedPending);
    EXPECT_EQ(registry.cancel(id), CancelOutcome::AlreadyFinished);
    EXPECT_EQ(registry.cancel(id), CancelOutcome::AlreadyFinished);
    EXPECT_EQ(registry.cancel(9999), CancelOutcome::NotFound);
}

TEST(TaskRegistry, CompletingPendingTaskPullsItFromQueue) {
    TaskRegistry registry;
    auto id = registry.create(Operation::pathExists("/a"));
    EXPECT_TRUE(registry.complete(id, OperationResult::timeout()));
    EXPECT_EQ(registry.pendingCount(), 0u);
    EXPECT_FALSE(registry.tryClaimNext().has_value());
}

TEST(TaskRegistry, WaitBlocksUntilComplete) {
    TaskRegistry registry;
    auto id = registry.create(Operation::pathExists("/a"));
    ASSERT_TRUE(registry.tryClaimNext().has_value());

    std::thread writer([&] {
        std::this_thread::sleep_for(30ms);
        registry.complete(id, OperationResult::success(true));
    });
    auto r = registry.wait(id);
    writer.join();
    EXPECT_EQ(r, OperationResult::success(true));
}

TEST(TaskRegistry, WaitForTimesOutWithoutResult) {
    TaskRegistry registry;
    auto id = registry.create(Operation::pathExists("/a"));
    auto r = registry.waitFor(id, 20ms);
    EXPECT_FALSE(r.has_value());
    EXPECT_FALSE(registry.isTerminal(id));
}

TEST(TaskRegistry, ClaimNextReturnsEmptyAfterShutdown) {
    TaskRegistry registry;
    std::atomic<bool> returned{false};
    std::thread worker([&] {
        auto claim = registry.claimNext();
        EXPECT_FALSE(claim.has_value());
        returned = true;
    });
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(returned.load());
    registry.shutdown();
    worker.join();
    EXPECT_TRUE(returned.load());
    EXPECT_THROW(registry.create(Operation::pathExists("/a")), std::runtime_error);
}

TEST(TaskRegistry, ConcurrentClaimersNeverShareATask) {
    TaskRegistry registry;
    constexpr int kTasks = 200;
    for (int i = 0; i < kTasks; ++i) {
        registry.create(Operation::pathExists("/p" + std::to_string(i)));
    }

    std::mutex seenMutex;
    std::set<TaskId> seen;
    std::atomic<int> duplicates{0};
    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w) {
        workers.emplace_back([&] {
            while (auto claim = registry.tryClaimNext()) {
                std::lock_guard<std::mutex> lock(seenMutex);
                if (!seen.insert(claim->id).second) ++duplicates;
            }
        });
    }
    for (auto& t : workers) t.join();

    EXPECT_EQ(duplicates.load(), 0);
    EXPECT_EQ(seen.size(), static_cast<size_t>(kTasks));
}

TEST(TaskRegistry, RecordIsDroppedWhenLastHandleReleasesTerminalTask) {
    TaskRegistry registry;
    auto id = registry.create(Operation::pathExists("/a"));
    EXPECT_TRUE(registry.retain(id));
    EXPECT_TRUE(registry.complete(id, OperationResult::success(true)));
    EXPECT_EQ(registry.size(), 1u);

    registry.release(id, true);
    EXPECT_EQ(registry.size(), 1u);
    registry.release(id, false);
    EXPECT_EQ(registry.size(), 0u);

    auto r = registry.poll(id);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->isError());
}

TEST(TaskRegistry, AbandonedTaskIsDroppedOnCompletion) {
    TaskRegistry registry;
    auto id = registry.create(Operation::pathExists("/a"));
    registry.release(id, false);
    EXPECT_EQ(registry.size(), 1u);
    ASSERT_TRUE(registry.tryClaimNext().has_value());
    EXPECT_TRUE(registry.complete(id, OperationResult::success(true)));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(TaskRegistry, EvictExpiredOnlyDropsUnobservedOldResults) {
    TaskRegistry registry;
    auto observed = registry.create(Operation::pathExists("/a"));
    auto unobserved = registry.create(Operation::pathExists("/b"));
    auto running = registry.create(Operation::pathExists("/c"));
    registry.complete(observed, OperationResult::success(true));
    registry.complete(unobserved, OperationResult::success(false));
    ASSERT_TRUE(registry.poll(observed).has_value());

    auto later = TaskRegistry::Clock::now() + 10min;
    EXPECT_EQ(registry.evictExpired(later, 5min), 1u);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_TRUE(registry.poll(unobserved)->isError());
    EXPECT_FALSE(registry.poll(running).has_value());
}

TEST(TaskRegistry, CancelAllResolvesEveryOutstandingTask) {
    TaskRegistry registry;
    auto a = registry.create(Operation::pathExists("/a"));
    auto b = registry.create(Operation::pathExists("/b"));
    auto done = registry.create(Operation::pathExists("/c"));
    registry.complete(done, OperationResult::success(true));
    ASSERT_TRUE(registry.tryClaimNext().has_value());  // a is running

    EXPECT_EQ(registry.cancelAll(), 2u);
    EXPECT_EQ(registry.activeCount(), 0u);
    EXPECT_EQ(registry.pendingCount(), 0u);
    EXPECT_TRUE(registry.poll(a)->isCancelled());
    EXPECT_TRUE(registry.poll(b)->isCancelled());
    EXPECT_TRUE(registry.poll(done)->isSuccess());
}

TEST(TaskRegistry, TerminalListenerSeesEveryTerminalWrite) {
    TaskRegistry registry;
    std::vector<TaskId> seen;
    registry.setTerminalListener([&](TaskId id) { seen.push_back(id); });

    auto a = registry.create(Operation::pathExists("/a"));
    auto b = registry.create(Operation::pathExists("/b"));
    registry.complete(a, OperationResult::success(true));
    registry.complete(a, OperationResult::timeout());
    registry.cancel(b);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], a);
    EXPECT_EQ(seen[1], b);
}
