/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

/**
 * @file TimeoutSupervisor.h
 * @brief Deadline queue that resolves overdue tasks as Timeout
 *
 * The supervisor keeps one deadline per armed task, ordered by fire time (ties
 * broken by task id), and a single thread that sleeps until the earliest one.
 * Expiry writes Timeout through TaskRegistry::complete(), so a task that
 * already finished, failed or was cancelled keeps its result. A task still
 * sitting in the pending queue is pulled out and never runs.
 *
 * The same thread periodically drops unobserved results older than the
 * retention period (TaskRegistry::evictExpired).
 *
 * processExpired() is public so tests can drive expiry with a synthetic clock
 * without starting the thread.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <unordered_map>
#include <utility>
#include "TaskRegistry.h"

namespace Shelf::Core::Async {

class TimeoutSupervisor {
public:
    using Clock = TaskRegistry::Clock;

    struct Config {
        Clock::duration resultRetention;  ///< Age after which unobserved results are evicted
        Clock::duration sweepInterval;    ///< Upper bound on sleep between retention sweeps

        Config()
            : resultRetention(std::chrono::minutes(5))
            , sweepInterval(std::chrono::seconds(1)) {}
    };

    explicit TimeoutSupervisor(std::shared_ptr<TaskRegistry> registry, Config config = {});
    ~TimeoutSupervisor();

    TimeoutSupervisor(const TimeoutSupervisor&) = delete;
    TimeoutSupervisor& operator=(const TimeoutSupervisor&) = delete;

    /// timeout converted to Clock::duration, saturating at the representable range
    static Clock::duration toClockDuration(std::chrono::milliseconds timeout) noexcept;

    /// start + timeout, clamped to Clock::time_point::max(); non-positive timeouts give start
    static Clock::time_point deadlineAfter(Clock::time_point start, Clock::duration timeout) noexcept;

    /// Schedules (or reschedules) the deadline of a task
    void arm(TaskId id, Clock::time_point deadline);

    /// Removes a task's deadline; no-op if none is armed
    void disarm(TaskId id);

    /**
     * @brief Fires every deadline at or before now
     * @return Number of tasks this call resolved as Timeout
     */
    size_t processExpired(Clock::time_point now);

    /// Runs the retention sweep once
    size_t sweep(Clock::time_point now);

    void start();
    void stop();

    bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }
    size_t armedCount() const;
    std::optional<Clock::time_point> nextDeadline() const;

private:
    void run();

    using Entry = std::pair<Clock::time_point, TaskId>;

    std::shared_ptr<TaskRegistry> _registry;
    Config _config;

    mutable std::mutex _mutex;
    std::condition_variable _wake;
    std::set<Entry> _deadlines;
    std::unordered_map<TaskId, Clock::time_point> _byTask;
    bool _stopRequested = false;

    std::thread _thread;
    std::atomic<bool> _running{false};
};

} // namespace Shelf::Core::Async
