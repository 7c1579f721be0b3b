/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include "TaskRegistry.h"
#include "../CoreCommon.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <stdexcept>

namespace Shelf::Core::Async {

const char* toString(TaskState state) noexcept {
    switch (state) {
        case TaskState::Pending: return "Pending";
        case TaskState::Running: return "Running";
        case TaskState::Finished: return "Finished";
    }
    return "Unknown";
}

const char* toString(CancelOutcome outcome) noexcept {
    switch (outcome) {
        case CancelOutcome::RemovedPending: return "RemovedPending";
        case CancelOutcome::CancelledRunning: return "CancelledRunning";
        case CancelOutcome::AlreadyFinished: return "AlreadyFinished";
        case CancelOutcome::NotFound: return "NotFound";
    }
    return "Unknown";
}

TaskRegistry::~TaskRegistry() {
    shutdown();
}

OperationResult TaskRegistry::expiredResult(TaskId id) {
    return OperationResult::error("Task " + std::to_string(id) + " is unknown or its result has expired",
                                  IO::FileError::Unknown);
}

TaskRegistry::Record* TaskRegistry::findLocked(TaskId id) const {
    auto it = _records.find(id);
    return it == _records.end() ? nullptr : it->second.get();
}

TaskId TaskRegistry::create(Operation operation, std::optional<Clock::duration> timeout) {
    TaskId id = 0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_shutdown) {
            throw std::runtime_error("TaskRegistry is shut down; no new tasks accepted");
        }
        id = _nextId++;
        auto record = std::make_unique<Record>(std::move(operation));
        record->id = id;
        record->submittedAt = Clock::now();
        record->timeout = timeout;
        record->liveHandles = 1;  // the caller's reference
        _records.emplace(id, std::move(record));
        _pending.push_back(id);
        ++_active;
    }
    _workAvailable.notify_one();
    return id;
}

std::optional<TaskRegistry::Claim> TaskRegistry::popPendingLocked() {
    while (!_pending.empty()) {
        TaskId id = _pending.front();
        _pending.pop_front();
        Record* r = findLocked(id);
        if (r && r->state == TaskState::Pending) {
            SHELF_ASSERT(!r->result, "Pending task already holds a terminal result");
            r->state = TaskState::Running;
            return Claim{id, r->operation};
        }
    }
    return std::nullopt;
}

std::optional<TaskRegistry::Claim> TaskRegistry::claimNext() {
    std::unique_lock<std::mutex> lock(_mutex);
    for (;;) {
        _workAvailable.wait(lock, [this] { return _shutdown || !_pending.empty(); });
        if (_shutdown) {
            return std::nullopt;
        }
        if (auto claim = popPendingLocked()) {
            return claim;
        }
    }
}

std::optional<TaskRegistry::Claim> TaskRegistry::tryClaimNext() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_shutdown) {
        return std::nullopt;
    }
    return popPendingLocked();
}

void TaskRegistry::removeFromQueueLocked(TaskId id) {
    auto it = std::find(_pending.begin(), _pending.end(), id);
    if (it != _pending.end()) {
        _pending.erase(it);
    }
}

bool TaskRegistry::finishLocked(Record& record, OperationResult result) {
    if (record.result) {
        return false;
    }
    if (record.state == TaskState::Pending) {
        removeFromQueueLocked(record.id);
    }
    SHELF_ASSERT(_active > 0, "TaskRegistry finished more tasks than it holds");
    record.result = std::move(result);
    record.state = TaskState::Finished;
    record.finishedAt = Clock::now();
    --_active;
    record.completed.notify_all();
    return true;
}

void TaskRegistry::maybeEvictLocked(TaskId id) {
    auto it = _records.find(id);
    if (it == _records.end()) {
        return;
    }
    const Record& r = *it->second;
    if (r.result && r.liveHandles == 0 && r.waiters == 0) {
        _records.erase(it);
    }
}

void TaskRegistry::notifyTerminal(const std::vector<TaskId>& ids) {
    if (ids.empty()) {
        return;
    }
    // Held across the calls so that clearing the listener waits for callbacks in flight
    std::lock_guard<std::mutex> lock(_listenerMutex);
    if (!_terminalListener) {
        return;
    }
    for (TaskId id : ids) {
        _terminalListener(id);
    }
}

bool TaskRegistry::complete(TaskId id, OperationResult result) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        Record* r = findLocked(id);
        if (!r || !finishLocked(*r, std::move(result))) {
            return false;
        }
        maybeEvictLocked(id);
    }
    notifyTerminal({id});
    return true;
}

CancelOutcome TaskRegistry::cancel(TaskId id) {
    CancelOutcome outcome;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        Record* r = findLocked(id);
        if (!r) {
            return CancelOutcome::NotFound;
        }
        if (r->result) {
            return CancelOutcome::AlreadyFinished;
        }
        r->cancelRequested = true;
        outcome = r->state == TaskState::Pending ? CancelOutcome::RemovedPending : CancelOutcome::CancelledRunning;
        finishLocked(*r, OperationResult::cancelled());
        maybeEvictLocked(id);
    }
    SHELF_LOG_DEBUG_CAT("TaskRegistry", "Task " + std::to_string(id) + " cancelled (" + toString(outcome) + ")");
    notifyTerminal({id});
    return outcome;
}

size_t TaskRegistry::cancelAll() {
    std::vector<TaskId> cancelled;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _pending.clear();
        for (auto& [id, record] : _records) {
            if (record->result) continue;
            record->cancelRequested = true;
            if (finishLocked(*record, OperationResult::cancelled())) {
                cancelled.push_back(id);
            }
        }
        for (TaskId id : cancelled) {
            maybeEvictLocked(id);
        }
    }
    if (!cancelled.empty()) {
        SHELF_LOG_DEBUG_CAT("TaskRegistry", "Cancelled " + std::to_string(cancelled.size()) + " outstanding tasks");
    }
    notifyTerminal(cancelled);
    return cancelled.size();
}

bool TaskRegistry::isCancelled(TaskId id) const {
    std::lock_guard<std::mutex> lock(_mutex);
    Record* r = findLocked(id);
    return r && r->cancelRequested;
}

bool TaskRegistry::isTerminal(TaskId id) const {
    std::lock_guard<std::mutex> lock(_mutex);
    Record* r = findLocked(id);
    return !r || r->result.has_value();
}

std::optional<TaskState> TaskRegistry::state(TaskId id) const {
    std::lock_guard<std::mutex> lock(_mutex);
    Record* r = findLocked(id);
    if (!r) return std::nullopt;
    return r->state;
}

std::optional<TaskRegistry::Clock::time_point> TaskRegistry::submittedAt(TaskId id) const {
    std::lock_guard<std::mutex> lock(_mutex);
    Record* r = findLocked(id);
    if (!r) return std::nullopt;
    return r->submittedAt;
}

std::optional<OperationResult> TaskRegistry::poll(TaskId id) {
    std::lock_guard<std::mutex> lock(_mutex);
    Record* r = findLocked(id);
    if (!r) {
        return expiredResult(id);
    }
    if (!r->result) {
        return std::nullopt;
    }
    r->observed = true;
    return *r->result;
}

OperationResult TaskRegistry::wait(TaskId id) {
    std::unique_lock<std::mutex> lock(_mutex);
    Record* r = findLocked(id);
    if (!r) {
        return expiredResult(id);
    }
    if (!r->result) {
        ++r->waiters;
        r->completed.wait(lock, [r] { return r->result.has_value(); });
        --r->waiters;
    }
    r->observed = true;
    OperationResult out = *r->result;
    maybeEvictLocked(id);
    return out;
}

std::optional<OperationResult> TaskRegistry::waitFor(TaskId id, Clock::duration timeout) {
    std::unique_lock<std::mutex> lock(_mutex);
    Record* r = findLocked(id);
    if (!r) {
        return expiredResult(id);
    }
    if (!r->result) {
        ++r->waiters;
        bool done = r->completed.wait_for(lock, timeout, [r] { return r->result.has_value(); });
        --r->waiters;
        if (!done) {
            return std::nullopt;
        }
    }
    r->observed = true;
    OperationResult out = *r->result;
    maybeEvictLocked(id);
    return out;
}

bool TaskRegistry::retain(TaskId id) {
    std::lock_guard<std::mutex> lock(_mutex);
    Record* r = findLocked(id);
    if (!r) {
        return false;
    }
    ++r->liveHandles;
    return true;
}

void TaskRegistry::release(TaskId id, bool observed) {
    std::lock_guard<std::mutex> lock(_mutex);
    Record* r = findLocked(id);
    if (!r) {
        return;
    }
    if (observed) {
        r->observed = true;
    }
    if (r->liveHandles > 0) {
        --r->liveHandles;
    }
    maybeEvictLocked(id);
}

size_t TaskRegistry::evictExpired(Clock::time_point now, Clock::duration retention) {
    size_t evicted = 0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (auto it = _records.begin(); it != _records.end();) {
            const Record& r = *it->second;
            if (r.result && !r.observed && r.waiters == 0 && now - r.finishedAt >= retention) {
                it = _records.erase(it);
                ++evicted;
            } else {
                ++it;
            }
        }
    }
    if (evicted > 0) {
        SHELF_LOG_DEBUG_CAT("TaskRegistry", "Evicted " + std::to_string(evicted) + " unobserved results past retention");
    }
    return evicted;
}

size_t TaskRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _active;
}

size_t TaskRegistry::pendingCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pending.size();
}

size_t TaskRegistry::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _records.size();
}

void TaskRegistry::shutdown() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _shutdown = true;
    }
    _workAvailable.notify_all();
}

bool TaskRegistry::isShutdown() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _shutdown;
}

void TaskRegistry::setTerminalListener(TerminalListener listener) {
    std::lock_guard<std::mutex> lock(_listenerMutex);
    _terminalListener = std::move(listener);
}

} // namespace Shelf::Core::Async
