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
#include <mutex>
#include <set>
#include <thread>

#include "Concurrency/WorkerPool.h"
#include "Logging/LogLevel.h"
#include "TestHelpers/ShelfTestHelpers.h"

using namespace Shelf::Core::Concurrency;
using namespace std::chrono_literals;

TEST(WorkerPool, RunsBodyOnEveryThreadUntilStopped) {
    WorkerPool pool("PoolTest");
    std::mutex mutex;
    std::set<size_t> seen;
    std::atomic<int> iterations{0};

    pool.start(3, [&](size_t index) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            seen.insert(index);
        }
        iterations.fetch_add(1, std::memory_order_relaxed);
        std::this_thread::sleep_for(1ms);
        return true;
    });
    EXPECT_TRUE(pool.isRunning());
    EXPECT_EQ(pool.threadCount(), 3u);

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (seen.size() == 3) break;
        }
        std::this_thread::sleep_for(1ms);
    }

    pool.requestStop();
    pool.join();
    EXPECT_FALSE(pool.isRunning());
    EXPECT_EQ(pool.threadCount(), 0u);
    EXPECT_EQ(seen, (std::set<size_t>{0, 1, 2}));
    EXPECT_GT(iterations.load(), 0);
}

TEST(WorkerPool, BodyReturningFalseEndsThatThread) {
    WorkerPool pool("PoolExit");
    std::atomic<int> calls{0};
    pool.start(2, [&](size_t) {
        calls.fetch_add(1);
        return false;
    });
    pool.join();
    EXPECT_EQ(calls.load(), 2);
}

TEST(WorkerPool, ThrowingBodyIsLoggedAndThreadKeepsRunning) {
    shelf::test_helpers::ScopedLogCapture capture(Shelf::Core::Logging::LogLevel::Error);
    WorkerPool pool("PoolThrow");
    std::atomic<int> calls{0};
    pool.start(1, [&](size_t) -> bool {
        int n = calls.fetch_add(1);
        if (n == 0) throw std::runtime_error("boom");
        return n < 3;
    });
    pool.join();

    EXPECT_EQ(calls.load(), 4);
    EXPECT_GE(capture.sink().countAtLevel(Shelf::Core::Logging::LogLevel::Error), 1u);
}

TEST(WorkerPool, RejectsInvalidStart) {
    WorkerPool pool;
    EXPECT_THROW(pool.start(0, [](size_t) { return false; }), std::logic_error);
    EXPECT_THROW(pool.start(1, WorkerPool::LoopBody{}), std::logic_error);

    std::atomic<bool> release{false};
    pool.start(1, [&](size_t) {
        std::this_thread::sleep_for(1ms);
        return !release.load();
    });
    EXPECT_THROW(pool.start(1, [](size_t) { return false; }), std::logic_error);
    release = true;
    pool.join();

    // A joined pool can be started again
    std::atomic<int> calls{0};
    pool.start(1, [&](size_t) {
        calls.fetch_add(1);
        return false;
    });
    pool.join();
    EXPECT_EQ(calls.load(), 1);
}
