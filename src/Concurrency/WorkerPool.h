/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

/**
 * @file WorkerPool.h
 * @brief Fixed-size pool of named threads running a caller-supplied loop body
 *
 * The pool does not own a queue. Each thread calls the body repeatedly until
 * the body returns false or stop is requested; the body is expected to block
 * on its own work source (e.g. TaskRegistry::claimNext) and to return once that
 * source is shut down.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Shelf
{
namespace Core
{
namespace Concurrency
{

class WorkerPool
{
public:
    /// Called with the worker index; return false to leave the loop
    using LoopBody = std::function<bool(size_t workerIndex)>;

    explicit WorkerPool(std::string name = "ShelfWorker");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Spawns threadCount threads running body
     * @throws std::logic_error if the pool is already running or threadCount is 0
     */
    void start(size_t threadCount, LoopBody body);

    /// Asks every thread to leave its loop after the current iteration
    void requestStop() noexcept { _stopRequested.store(true, std::memory_order_release); }

    /// Joins every thread. The caller must have unblocked the loop body first.
    void join();

    bool stopRequested() const noexcept { return _stopRequested.load(std::memory_order_acquire); }
    bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }
    size_t threadCount() const;
    const std::string& name() const noexcept { return _name; }

private:
    void run(size_t index);

    std::string _name;
    LoopBody _body;
    std::vector<std::thread> _threads;
    mutable std::mutex _threadsMutex;
    std::atomic<bool> _stopRequested{false};
    std::atomic<bool> _running{false};
};

} // namespace Concurrency
} // namespace Core
} // namespace Shelf
