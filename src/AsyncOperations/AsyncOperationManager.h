/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

/**
 * @file AsyncOperationManager.h
 * @brief Service that runs filesystem operations off the calling thread
 *
 * The manager accepts Operation descriptors, queues them in a TaskRegistry and
 * runs them on a fixed pool of worker threads. Each submission returns a
 * TaskHandle immediately; the caller polls or waits on the handle. Optional
 * per-task timeouts are enforced by a TimeoutSupervisor, counted from the
 * moment of submission.
 *
 * Lifecycle follows ShelfService:
 * - submit() is accepted from construction on; tasks queue until start()
 * - start() spawns the workers and the supervisor
 * - stop() refuses further submissions, resolves every outstanding task as
 *   Cancelled and joins the workers (a primitive already running finishes first)
 *
 * @code
 * AsyncOperationManager manager;
 * manager.start();
 *
 * auto listing = manager.submit(Operation::readDirectory("/home/me/Shelf"));
 * auto sizes = manager.submit(Operation::batch({
 *     Operation::getFileSize("/home/me/a.pdf"),
 *     Operation::getFileSize("/home/me/b.pdf"),
 * }), std::chrono::seconds(5));
 *
 * auto entries = listing.wait();
 * @endcode
 */

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "../Core/ShelfService.h"
#include "../Concurrency/WorkerPool.h"
#include "../FileSystem/IFileSystemBackend.h"
#include "Operation.h"
#include "OperationExecutor.h"
#include "OperationResult.h"
#include "TaskHandle.h"
#include "TaskRegistry.h"
#include "TimeoutSupervisor.h"

namespace Shelf::Core::Async {

class AsyncOperationManager : public ShelfService {
public:
    struct Config {
        size_t workerCount;                                 // 0 selects the hardware default
        std::optional<std::chrono::milliseconds> defaultTimeout; // applied when submit() gets none
        std::chrono::milliseconds resultRetention;          // unobserved results kept this long
        std::string name;                                   // thread names and log category

        Config()
            : workerCount(0)
            , defaultTimeout(std::nullopt)
            , resultRetention(std::chrono::minutes(5))
            , name("ShelfAsync") {}

        /**
         * @brief Defaults overlaid with SHELF_ASYNC_WORKERS, SHELF_ASYNC_DEFAULT_TIMEOUT_MS
         *        and SHELF_ASYNC_RETENTION_MS
         *
         * Malformed or out-of-range values (more than 256 workers, durations that
         * overflow a nanosecond clock) are ignored with a warning.
         */
        static Config fromEnvironment();

        /// workerCount, or hardware_concurrency() clamped to [2, 8] when it is 0
        size_t resolvedWorkerCount() const;
    };

    /// Uses a LocalFileSystemBackend
    AsyncOperationManager();
    explicit AsyncOperationManager(Config config,
                                   std::shared_ptr<IO::IFileSystemBackend> backend = nullptr);
    ~AsyncOperationManager() override;

    AsyncOperationManager(const AsyncOperationManager&) = delete;
    AsyncOperationManager& operator=(const AsyncOperationManager&) = delete;

    // ShelfService interface
    const char* id() const override { return "com.shelf.core.async"; }
    const char* name() const override { return "AsyncOperationManager"; }

    void load() override;
    void start() override;
    void stop() override;
    void unload() override;

    /**
     * @brief Queues an operation; never blocks on I/O
     *
     * @param op Operation to run
     * @param timeout Bound on submit-to-result time; Config::defaultTimeout when empty
     * @return Handle to the new task
     * @throws std::runtime_error after stop()
     */
    TaskHandle submit(Operation op, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Resolves every pending and running task as Cancelled; returns how many changed
    size_t cancelAll();

    /// Tasks not yet terminal (pending plus running)
    size_t activeTaskCount() const;

    bool isAccepting() const noexcept { return !_stopped.load(std::memory_order_acquire); }

    IO::IFileSystemBackend& backend() const noexcept { return *_backend; }
    const Config& config() const noexcept { return _config; }
    const std::shared_ptr<TaskRegistry>& registry() const noexcept { return _registry; }
    TimeoutSupervisor& supervisor() noexcept { return _supervisor; }

private:
    bool workerIteration(size_t workerIndex);

    Config _config;
    std::shared_ptr<IO::IFileSystemBackend> _backend;
    std::shared_ptr<TaskRegistry> _registry;
    OperationExecutor _executor;
    TimeoutSupervisor _supervisor;
    Concurrency::WorkerPool _workers;

    std::mutex _lifecycleMutex;
    std::atomic<bool> _stopped{false};
};

} // namespace Shelf::Core::Async
