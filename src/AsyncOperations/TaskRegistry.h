/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

/**
 * @file TaskRegistry.h
 * @brief Owner of every task record and the pending queue
 *
 * All task state lives behind one mutex. Workers claim from a FIFO pending
 * queue, the supervisor and handles write terminal results, and every writer
 * goes through complete(), which accepts only the first terminal result for a
 * task. Later writers are told they lost and the stored result is untouched.
 *
 * Waiting is per task: each record owns a condition variable that is only
 * notified when that record turns terminal, so a wait on one task is never
 * woken by another task finishing.
 *
 * Record lifetime:
 * - create() hands out one handle reference with the new id (see TaskHandle)
 * - a record is dropped once it is terminal, has no handle references and no
 *   thread is waiting on it
 * - evictExpired() additionally drops terminal records whose result nobody has
 *   observed within the retention period, even if handles are still alive
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include "Operation.h"
#include "OperationResult.h"

namespace Shelf::Core::Async {

using TaskId = uint64_t;

enum class TaskState : uint8_t {
    Pending = 0,
    Running,
    Finished
};

enum class CancelOutcome : uint8_t {
    RemovedPending = 0,  ///< Task left the queue before running; its primitive never runs
    CancelledRunning,    ///< Task resolved Cancelled; the in-flight primitive's result is discarded
    AlreadyFinished,     ///< Task already held a terminal result; nothing changed
    NotFound             ///< Unknown or evicted id
};

const char* toString(TaskState state) noexcept;
const char* toString(CancelOutcome outcome) noexcept;

class TaskRegistry {
public:
    using Clock = std::chrono::steady_clock;

    struct Claim {
        TaskId id;
        Operation operation;
    };

    /// Invoked outside the registry lock after a task turns terminal
    using TerminalListener = std::function<void(TaskId)>;

    TaskRegistry() = default;
    ~TaskRegistry();

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    /**
     * @brief Registers a pending task and appends it to the queue
     *
     * The returned id already carries one handle reference; pass it to a
     * TaskHandle or give it back with release().
     *
     * @throws std::runtime_error after shutdown()
     */
    TaskId create(Operation operation, std::optional<Clock::duration> timeout = std::nullopt);

    /**
     * @brief Blocks until a pending task is available, then marks it Running
     * @return The claimed task, or nullopt once shutdown() was called
     */
    std::optional<Claim> claimNext();

    /// Non-blocking claimNext()
    std::optional<Claim> tryClaimNext();

    /**
     * @brief Writes the terminal result of a task
     *
     * A still-pending task is removed from the queue.
     * @return true if this call stored the result; false if the task was
     *         already terminal (or unknown) and nothing changed
     */
    bool complete(TaskId id, OperationResult result);

    CancelOutcome cancel(TaskId id);

    /// Resolves every non-terminal task as Cancelled; returns how many changed
    size_t cancelAll();

    bool isCancelled(TaskId id) const;
    /// Unknown ids count as terminal
    bool isTerminal(TaskId id) const;
    std::optional<TaskState> state(TaskId id) const;
    std::optional<Clock::time_point> submittedAt(TaskId id) const;

    /**
     * @brief Non-blocking result query
     * @return nullopt while pending or running; an Error result for an
     *         unknown or evicted id
     */
    std::optional<OperationResult> poll(TaskId id);

    /// Blocks the caller until the task is terminal
    OperationResult wait(TaskId id);

    /// As wait(), giving up after timeout
    std::optional<OperationResult> waitFor(TaskId id, Clock::duration timeout);

    /// Adds a handle reference; false if the record no longer exists
    bool retain(TaskId id);

    /// Drops a handle reference; observed marks that the holder saw the result
    void release(TaskId id, bool observed);

    /// Drops terminal records never observed whose result is older than retention
    size_t evictExpired(Clock::time_point now, Clock::duration retention);

    /// Pending plus running tasks
    size_t activeCount() const;
    size_t pendingCount() const;
    /// Records currently held, terminal ones included
    size_t size() const;

    /// Wakes blocked claimers and makes claimNext() return nullopt from now on
    void shutdown();
    bool isShutdown() const;

    void setTerminalListener(TerminalListener listener);

    static OperationResult expiredResult(TaskId id);

private:
    struct Record {
        TaskId id = 0;
        Operation operation;
        Clock::time_point submittedAt;
        std::optional<Clock::duration> timeout;
        TaskState state = TaskState::Pending;
        bool cancelRequested = false;
        std::optional<OperationResult> result;
        Clock::time_point finishedAt;
        uint32_t liveHandles = 0;
        uint32_t waiters = 0;
        bool observed = false;
        std::condition_variable completed;

        explicit Record(Operation op) : operation(std::move(op)) {}
    };

    using RecordMap = std::unordered_map<TaskId, std::unique_ptr<Record>>;

    Record* findLocked(TaskId id) const;
    std::optional<Claim> popPendingLocked();
    bool finishLocked(Record& record, OperationResult result);
    void removeFromQueueLocked(TaskId id);
    void maybeEvictLocked(TaskId id);
    void notifyTerminal(const std::vector<TaskId>& ids);

    mutable std::mutex _mutex;
    std::condition_variable _workAvailable;
    RecordMap _records;
    std::deque<TaskId> _pending;
    TaskId _nextId = 1;
    size_t _active = 0;
    bool _shutdown = false;

    std::mutex _listenerMutex;
    TerminalListener _terminalListener;
};

} // namespace Shelf::Core::Async
