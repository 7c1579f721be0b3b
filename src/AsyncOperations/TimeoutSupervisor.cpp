/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include "TimeoutSupervisor.h"
#include "../Logging/Logger.h"
#include <stdexcept>
#include <vector>

namespace Shelf::Core::Async {

TimeoutSupervisor::TimeoutSupervisor(std::shared_ptr<TaskRegistry> registry, Config config)
    : _registry(std::move(registry))
    , _config(config) {
    if (!_registry) {
        throw std::invalid_argument("TimeoutSupervisor requires a registry");
    }
}

TimeoutSupervisor::~TimeoutSupervisor() {
    stop();
}

TimeoutSupervisor::Clock::duration TimeoutSupervisor::toClockDuration(std::chrono::milliseconds timeout) noexcept {
    constexpr auto maxMs = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::max());
    constexpr auto minMs = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::min());
    if (timeout >= maxMs) return Clock::duration::max();
    if (timeout <= minMs) return Clock::duration::min();
    return std::chrono::duration_cast<Clock::duration>(timeout);
}

TimeoutSupervisor::Clock::time_point TimeoutSupervisor::deadlineAfter(Clock::time_point start,
                                                                      Clock::duration timeout) noexcept {
    if (timeout <= Clock::duration::zero()) {
        return start;
    }
    if (timeout >= Clock::time_point::max() - start) {
        return Clock::time_point::max();
    }
    return start + timeout;
}

void TimeoutSupervisor::arm(TaskId id, Clock::time_point deadline) {
    bool wakeEarlier = false;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto existing = _byTask.find(id);
        if (existing != _byTask.end()) {
            _deadlines.erase({existing->second, id});
        }
        _byTask[id] = deadline;
        _deadlines.insert({deadline, id});
        wakeEarlier = _deadlines.begin()->second == id;
    }
    if (wakeEarlier) {
        _wake.notify_one();
    }
}

void TimeoutSupervisor::disarm(TaskId id) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _byTask.find(id);
    if (it == _byTask.end()) {
        return;
    }
    _deadlines.erase({it->second, id});
    _byTask.erase(it);
}

size_t TimeoutSupervisor::processExpired(Clock::time_point now) {
    std::vector<TaskId> due;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        while (!_deadlines.empty() && _deadlines.begin()->first <= now) {
            TaskId id = _deadlines.begin()->second;
            _deadlines.erase(_deadlines.begin());
            _byTask.erase(id);
            due.push_back(id);
        }
    }

    // Registry calls happen without our lock; its terminal listener calls disarm()
    size_t fired = 0;
    for (TaskId id : due) {
        if (_registry->complete(id, OperationResult::timeout())) {
            ++fired;
            SHELF_LOG_DEBUG_CAT("TimeoutSupervisor", "Task " + std::to_string(id) + " timed out");
        }
    }
    return fired;
}

size_t TimeoutSupervisor::sweep(Clock::time_point now) {
    return _registry->evictExpired(now, _config.resultRetention);
}

void TimeoutSupervisor::start() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_thread.joinable()) {
        return;
    }
    _stopRequested = false;
    _running.store(true, std::memory_order_release);
    _thread = std::thread([this]() { run(); });
}

void TimeoutSupervisor::stop() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _stopRequested = true;
    }
    _wake.notify_all();
    if (_thread.joinable()) {
        _thread.join();
    }
    _running.store(false, std::memory_order_release);
}

size_t TimeoutSupervisor::armedCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _deadlines.size();
}

std::optional<TimeoutSupervisor::Clock::time_point> TimeoutSupervisor::nextDeadline() const {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_deadlines.empty()) return std::nullopt;
    return _deadlines.begin()->first;
}

void TimeoutSupervisor::run() {
    auto nextSweep = Clock::now() + _config.sweepInterval;
    std::unique_lock<std::mutex> lock(_mutex);
    while (!_stopRequested) {
        auto wakeAt = nextSweep;
        if (!_deadlines.empty() && _deadlines.begin()->first < wakeAt) {
            wakeAt = _deadlines.begin()->first;
        }
        _wake.wait_until(lock, wakeAt);
        if (_stopRequested) {
            break;
        }

        lock.unlock();
        auto now = Clock::now();
        processExpired(now);
        if (now >= nextSweep) {
            sweep(now);
            nextSweep = now + _config.sweepInterval;
        }
        lock.lock();
    }
}

} // namespace Shelf::Core::Async
