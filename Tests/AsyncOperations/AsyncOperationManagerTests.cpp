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
#include <cstdlib>
#include <filesystem>
#include <thread>
#include <vector>
#include "AsyncOperations/AsyncOperationManager.h"
#include "TestHelpers/ShelfTestHelpers.h"

using namespace Shelf::Core;
using namespace Shelf::Core::Async;
using namespace std::chrono_literals;
using shelf::test_helpers::ControlledBackend;
using shelf::test_helpers::ScopedAsyncEnv;
using shelf::test_helpers::ScopedTempDir;
using shelf::test_helpers::writeFile;
namespace fs = std::filesystem;

TEST(AsyncOperationManager, EveryKindProducesItsResultShape) {
    ScopedTempDir tmp;
    ScopedAsyncEnv env(2);
    auto& mgr = env.manager();
    writeFile(tmp.join("file.txt"), "12345");
    const auto file = tmp.join("file.txt").string();

    EXPECT_NE(mgr.submit(Operation::pathExists(file)).wait().asBool(), nullptr);
    EXPECT_NE(mgr.submit(Operation::getFileInfo(file)).wait().asFileInfo(), nullptr);
    EXPECT_NE(mgr.submit(Operation::readDirectory(tmp.path().string())).wait().asEntries(), nullptr);
    EXPECT_NE(mgr.submit(Operation::getModifiedTime(file)).wait().asTime(), nullptr);

    auto size = mgr.submit(Operation::getFileSize(file)).wait();
    ASSERT_NE(size.asSize(), nullptr);
    EXPECT_EQ(*size.asSize(), 5u);

    EXPECT_TRUE(mgr.submit(Operation::createDirectory(tmp.join("d").string())).wait().isSuccess());
    EXPECT_TRUE(mgr.submit(Operation::copy(file, tmp.join("d/copy.txt").string())).wait().isSuccess());
    EXPECT_TRUE(mgr.submit(Operation::move(tmp.join("d/copy.txt").string(), tmp.join("d/moved.txt").string())).wait().isSuccess());
    EXPECT_TRUE(mgr.submit(Operation::deletePath(tmp.join("d").string())).wait().isSuccess());
    EXPECT_FALSE(fs::exists(tmp.join("d")));

    auto batch = mgr.submit(Operation::batch({Operation::pathExists(file)})).wait();
    ASSERT_NE(batch.asBatch(), nullptr);
    EXPECT_EQ(batch.asBatch()->size(), 1u);
}

TEST(AsyncOperationManager, RepeatedPollsAndWaitAgree) {
    ScopedTempDir tmp;
    ScopedAsyncEnv env(2);
    writeFile(tmp.join("a.txt"), "abc");

    auto handle = env.manager().submit(Operation::getFileSize(tmp.join("a.txt").string()));
    auto waited = handle.wait();
    for (int i = 0; i < 5; ++i) {
        auto polled = handle.poll();
        ASSERT_TRUE(polled.has_value());
        EXPECT_EQ(*polled, waited);
    }
    EXPECT_EQ(handle.wait(), waited);
    EXPECT_FALSE(handle.isRunning());
}

TEST(AsyncOperationManager, CancelBeforeClaimPreventsDelete) {
    ScopedTempDir tmp;
    writeFile(tmp.join("precious.txt"), "keep me");
    auto backend = std::make_shared<ControlledBackend>();
    ScopedAsyncEnv env(1, backend);

    backend->closeGate();
    auto blocker = env.manager().submit(Operation::pathExists(tmp.path().string()));
    ASSERT_TRUE(backend->waitForBlocked(1));

    auto del = env.manager().submit(Operation::deletePath(tmp.join("precious.txt").string()));
    EXPECT_EQ(del.cancel(), CancelOutcome::RemovedPending);
    backend->openGate();

    EXPECT_TRUE(blocker.wait().isSuccess());
    EXPECT_TRUE(del.wait().isCancelled());
    EXPECT_TRUE(fs::exists(tmp.join("precious.txt")));
    EXPECT_EQ(backend->callCount("remove"), 0);
}

TEST(AsyncOperationManager, CancelRunningResolvesBeforePrimitiveReturns) {
    ScopedTempDir tmp;
    auto backend = std::make_shared<ControlledBackend>();
    ScopedAsyncEnv env(1, backend);

    backend->closeGate();
    auto handle = env.manager().submit(Operation::pathExists(tmp.path().string()));
    ASSERT_TRUE(backend->waitForBlocked(1));

    EXPECT_EQ(handle.cancel(), CancelOutcome::CancelledRunning);
    EXPECT_TRUE(handle.wait().isCancelled());
    backend->openGate();

    // The discarded primitive result never replaces Cancelled
    auto follower = env.manager().submit(Operation::pathExists(tmp.path().string()));
    EXPECT_TRUE(follower.wait().isSuccess());
    EXPECT_TRUE(handle.poll()->isCancelled());
}

TEST(AsyncOperationManager, CancelIsIdempotent) {
    ScopedTempDir tmp;
    auto backend = std::make_shared<ControlledBackend>();
    ScopedAsyncEnv env(1, backend);

    backend->closeGate();
    auto blocker = env.manager().submit(Operation::pathExists(tmp.path().string()));
    ASSERT_TRUE(backend->waitForBlocked(1));
    auto pending = env.manager().submit(Operation::pathExists(tmp.path().string()));

    EXPECT_EQ(pending.cancel(), CancelOutcome::RemovedPending);
    EXPECT_EQ(pending.cancel(), CancelOutcome::AlreadyFinished);
    backend->openGate();

    blocker.wait();
    EXPECT_EQ(blocker.cancel(), CancelOutcome::AlreadyFinished);
    EXPECT_TRUE(blocker.poll()->isSuccess());
}

TEST(AsyncOperationManager, TimeoutFiresNearDeadlineWhilePrimitiveIsSlow) {
    ScopedTempDir tmp;
    writeFile(tmp.join("a.txt"), "abc");
    auto backend = std::make_shared<ControlledBackend>();
    backend->setDelay(600ms);
    ScopedAsyncEnv env(1, backend);

    auto start = std::chrono::steady_clock::now();
    auto handle = env.manager().submit(Operation::getFileSize(tmp.join("a.txt").string()), 100ms);
    auto r = handle.wait();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(r.isTimeout());
    EXPECT_GE(elapsed, 90ms);
    EXPECT_LT(elapsed, 500ms);
}

TEST(AsyncOperationManager, PendingTaskTimesOutWithoutRunning) {
    ScopedTempDir tmp;
    auto backend = std::make_shared<ControlledBackend>();
    ScopedAsyncEnv env(1, backend);

    backend->closeGate();
    auto blocker = env.manager().submit(Operation::pathExists(tmp.path().string()));
    ASSERT_TRUE(backend->waitForBlocked(1));

    auto queued = env.manager().submit(Operation::getFileSize(tmp.path().string()), 50ms);
    EXPECT_TRUE(queued.wait().isTimeout());
    backend->openGate();

    EXPECT_TRUE(blocker.wait().isSuccess());
    auto follower = env.manager().submit(Operation::pathExists(tmp.path().string()));
    follower.wait();
    EXPECT_EQ(backend->callCount("fileSize"), 0);
}

TEST(AsyncOperationManager, MaximalTimeoutLeavesTaskUnbounded) {
    ScopedTempDir tmp;
    auto backend = std::make_shared<ControlledBackend>();
    ScopedAsyncEnv env(1, backend);

    backend->closeGate();
    auto blocker = env.manager().submit(Operation::pathExists(tmp.path().string()));
    ASSERT_TRUE(backend->waitForBlocked(1));

    auto queued = env.manager().submit(Operation::getFileSize(tmp.path().string()),
                                       std::chrono::milliseconds::max());
    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(queued.poll().has_value());

    backend->openGate();
    EXPECT_TRUE(blocker.wait().isSuccess());
    EXPECT_FALSE(queued.wait().isTimeout());
}

TEST(AsyncOperationManager, DefaultTimeoutAppliesWhenNoneGiven) {
    ScopedTempDir tmp;
    auto backend = std::make_shared<ControlledBackend>();
    backend->setDelay(400ms);

    AsyncOperationManager::Config cfg;
    cfg.workerCount = 1;
    cfg.defaultTimeout = 50ms;
    AsyncOperationManager mgr(cfg, backend);
    mgr.start();

    EXPECT_TRUE(mgr.submit(Operation::pathExists(tmp.path().string())).wait().isTimeout());
    // An explicit bound overrides the default
    EXPECT_TRUE(mgr.submit(Operation::pathExists(tmp.path().string()), 5s).wait().isSuccess());
    mgr.stop();
}

TEST(AsyncOperationManager, BatchRecordsPartialFailureInOrder) {
    ScopedTempDir tmp;
    ScopedAsyncEnv env(2);
    const auto dir = tmp.join("made").string();

    auto r = env.manager().submit(Operation::batch({
        Operation::createDirectory(dir),
        Operation::deletePath(tmp.join("does-not-exist").string()),
        Operation::pathExists(dir),
    })).wait();

    ASSERT_TRUE(r.isSuccess());
    const auto* items = r.asBatch();
    ASSERT_NE(items, nullptr);
    ASSERT_EQ(items->size(), 3u);
    EXPECT_EQ((*items)[0], OperationResult::success(true));
    EXPECT_TRUE((*items)[1].isError());
    EXPECT_EQ((*items)[1].errorCode(), IO::FileError::FileNotFound);
    EXPECT_EQ((*items)[2], OperationResult::success(true));
}

TEST(AsyncOperationManager, EmptyBatchSucceedsImmediately) {
    ScopedAsyncEnv env(1);
    auto r = env.manager().submit(Operation::batch({})).wait();
    ASSERT_TRUE(r.isSuccess());
    ASSERT_NE(r.asBatch(), nullptr);
    EXPECT_TRUE(r.asBatch()->empty());
}

TEST(AsyncOperationManager, CancelledBatchStopsBetweenItems) {
    ScopedTempDir tmp;
    auto backend = std::make_shared<ControlledBackend>();
    ScopedAsyncEnv env(1, backend);
    const auto p = tmp.path().string();

    backend->closeGate();
    auto batch = env.manager().submit(Operation::batch({
        Operation::pathExists(p), Operation::pathExists(p), Operation::pathExists(p)}));
    ASSERT_TRUE(backend->waitForBlocked(1));
    EXPECT_EQ(batch.cancel(), CancelOutcome::CancelledRunning);
    backend->openGate();

    // One worker: once the follower completes, the batch loop has exited
    env.manager().submit(Operation::getFileSize(p)).wait();
    EXPECT_EQ(backend->callCount("pathExists"), 1);
    EXPECT_TRUE(batch.wait().isCancelled());
}

TEST(AsyncOperationManager, ManyProducersManyChecks) {
    ScopedTempDir tmp;
    for (int i = 0; i < 25; ++i) {
        writeFile(tmp.join("f" + std::to_string(i)), "x");
    }
    ScopedAsyncEnv env(4);

    constexpr int kProducers = 5;
    constexpr int kPerProducer = 10;
    std::atomic<int> correct{0};
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&, p] {
            std::vector<std::pair<TaskHandle, bool>> handles;
            for (int i = 0; i < kPerProducer; ++i) {
                int n = p * kPerProducer + i;  // 0..49, files exist for 0..24
                handles.emplace_back(env.manager().submit(
                    Operation::pathExists(tmp.join("f" + std::to_string(n)).string())), n < 25);
            }
            for (auto& [handle, expected] : handles) {
                auto r = handle.wait();
                if (r.asBool() && *r.asBool() == expected) ++correct;
            }
        });
    }
    for (auto& t : producers) t.join();

    EXPECT_EQ(correct.load(), kProducers * kPerProducer);
    EXPECT_EQ(env.manager().activeTaskCount(), 0u);
}

TEST(AsyncOperationManager, BackendExceptionBecomesErrorAndWorkerSurvives) {
    ScopedTempDir tmp;
    auto backend = std::make_shared<ControlledBackend>();
    backend->throwOn("fileSize");
    ScopedAsyncEnv env(1, backend);

    auto failed = env.manager().submit(Operation::getFileSize(tmp.path().string())).wait();
    ASSERT_TRUE(failed.isError());
    EXPECT_NE(failed.message().find("injected failure"), std::string::npos);

    EXPECT_TRUE(env.manager().submit(Operation::pathExists(tmp.path().string())).wait().isSuccess());
}

TEST(AsyncOperationManager, SubmitBeforeStartQueuesUntilWorkersExist) {
    ScopedTempDir tmp;
    AsyncOperationManager::Config cfg;
    cfg.workerCount = 1;
    AsyncOperationManager mgr(cfg);

    auto handle = mgr.submit(Operation::pathExists(tmp.path().string()));
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(handle.poll().has_value());
    EXPECT_EQ(mgr.activeTaskCount(), 1u);

    mgr.start();
    EXPECT_EQ(handle.wait(), OperationResult::success(true));
    mgr.stop();
}

TEST(AsyncOperationManager, StopCancelsOutstandingAndRejectsSubmit) {
    ScopedTempDir tmp;
    AsyncOperationManager::Config cfg;
    cfg.workerCount = 1;
    AsyncOperationManager mgr(cfg);

    auto a = mgr.submit(Operation::pathExists(tmp.path().string()));
    auto b = mgr.submit(Operation::deletePath(tmp.path().string()));
    mgr.stop();

    EXPECT_TRUE(a.wait().isCancelled());
    EXPECT_TRUE(b.wait().isCancelled());
    EXPECT_TRUE(fs::exists(tmp.path()));
    EXPECT_EQ(mgr.state(), ServiceState::Stopped);
    EXPECT_FALSE(mgr.isAccepting());
    EXPECT_THROW(mgr.submit(Operation::pathExists(tmp.path().string())), std::runtime_error);
    EXPECT_THROW(mgr.start(), std::logic_error);
}

TEST(AsyncOperationManager, CancelAllReportsCount) {
    AsyncOperationManager::Config cfg;
    cfg.workerCount = 1;
    AsyncOperationManager mgr(cfg);
    auto a = mgr.submit(Operation::pathExists("/"));
    auto b = mgr.submit(Operation::pathExists("/"));

    EXPECT_EQ(mgr.activeTaskCount(), 2u);
    EXPECT_EQ(mgr.cancelAll(), 2u);
    EXPECT_EQ(mgr.activeTaskCount(), 0u);
    EXPECT_TRUE(a.poll()->isCancelled());
    EXPECT_TRUE(b.poll()->isCancelled());
}

TEST(AsyncOperationManager, HandlesOutliveManager) {
    ScopedTempDir tmp;
    TaskHandle finished;
    TaskHandle neverRan;
    {
        AsyncOperationManager::Config cfg;
        cfg.workerCount = 1;
        AsyncOperationManager mgr(cfg);
        mgr.start();
        finished = mgr.submit(Operation::pathExists(tmp.path().string()));
        finished.wait();
        mgr.stop();
        AsyncOperationManager idle(cfg);
        neverRan = idle.submit(Operation::pathExists(tmp.path().string()));
    }
    EXPECT_EQ(finished.poll(), OperationResult::success(true));
    EXPECT_TRUE(neverRan.wait().isCancelled());
}

TEST(TaskHandle, CloneSharesResultAndMoveInvalidatesSource) {
    ScopedTempDir tmp;
    ScopedAsyncEnv env(1);
    auto original = env.manager().submit(Operation::pathExists(tmp.path().string()));
    auto copy = original.clone();
    EXPECT_EQ(copy.id(), original.id());

    auto moved = std::move(original);
    EXPECT_FALSE(original.valid());
    EXPECT_THROW(original.wait(), std::logic_error);

    EXPECT_EQ(moved.wait(), copy.wait());
}

TEST(TaskHandle, RecordDroppedWhenLastHandleGoes) {
    ScopedTempDir tmp;
    ScopedAsyncEnv env(1);
    auto handle = env.manager().submit(Operation::pathExists(tmp.path().string()));
    auto copy = handle.clone();
    handle.wait();
    EXPECT_EQ(env.manager().registry()->size(), 1u);

    handle = TaskHandle();
    EXPECT_EQ(env.manager().registry()->size(), 1u);
    copy = TaskHandle();
    EXPECT_EQ(env.manager().registry()->size(), 0u);
}

#if !defined(_WIN32)
TEST(AsyncOperationManagerConfig, FromEnvironmentReadsOverridesAndIgnoresGarbage) {
    ::setenv("SHELF_ASYNC_WORKERS", "3", 1);
    ::setenv("SHELF_ASYNC_DEFAULT_TIMEOUT_MS", "250", 1);
    ::setenv("SHELF_ASYNC_RETENTION_MS", "not-a-number", 1);

    auto cfg = AsyncOperationManager::Config::fromEnvironment();
    EXPECT_EQ(cfg.workerCount, 3u);
    ASSERT_TRUE(cfg.defaultTimeout.has_value());
    EXPECT_EQ(*cfg.defaultTimeout, 250ms);
    EXPECT_EQ(cfg.resultRetention, std::chrono::milliseconds(std::chrono::minutes(5)));

    // Values past the representable range are rejected rather than wrapped
    ::setenv("SHELF_ASYNC_WORKERS", "1000000", 1);
    ::setenv("SHELF_ASYNC_DEFAULT_TIMEOUT_MS", "18446744073709551615", 1);
    ::setenv("SHELF_ASYNC_RETENTION_MS", "9223372036854775807", 1);
    {
        shelf::test_helpers::ScopedLogCapture capture(Shelf::Core::Logging::LogLevel::Warning);
        auto rejected = AsyncOperationManager::Config::fromEnvironment();
        EXPECT_EQ(rejected.workerCount, 0u);
        EXPECT_FALSE(rejected.defaultTimeout.has_value());
        EXPECT_EQ(rejected.resultRetention, std::chrono::milliseconds(std::chrono::minutes(5)));
        EXPECT_EQ(capture.sink().countAtLevel(Shelf::Core::Logging::LogLevel::Warning), 3u);
    }

    ::setenv("SHELF_ASYNC_DEFAULT_TIMEOUT_MS", "9223372036854", 1);
    auto largest = AsyncOperationManager::Config::fromEnvironment();
    ASSERT_TRUE(largest.defaultTimeout.has_value());
    EXPECT_EQ(largest.defaultTimeout->count(), 9223372036854);

    ::unsetenv("SHELF_ASYNC_WORKERS");
    ::unsetenv("SHELF_ASYNC_DEFAULT_TIMEOUT_MS");
    ::unsetenv("SHELF_ASYNC_RETENTION_MS");
}
#endif

TEST(AsyncOperationManagerConfig, ResolvedWorkerCountIsClamped) {
    AsyncOperationManager::Config cfg;
    auto n = cfg.resolvedWorkerCount();
    EXPECT_GE(n, 2u);
    EXPECT_LE(n, 8u);
    cfg.workerCount = 12;
    EXPECT_EQ(cfg.resolvedWorkerCount(), 12u);
}
