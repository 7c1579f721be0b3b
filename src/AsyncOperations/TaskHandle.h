/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

/**
 * @file TaskHandle.h
 * @brief Caller-side capability for one submitted task
 *
 * A TaskHandle refers to a task by id and keeps the registry alive, not the
 * task itself. Handles are move-only; clone() creates a second, independent
 * reference to the same task. Once a handle has seen the terminal result it
 * keeps a copy, so later poll()/wait() calls return the same value even after
 * the registry has dropped the record.
 *
 * @code
 * auto handle = manager.submit(Operation::getFileSize(path), std::chrono::seconds(2));
 * // ... keep the UI responsive ...
 * if (auto r = handle.poll()) {
 *     if (const auto* bytes = r->asSize()) showSize(*bytes);
 * }
 * @endcode
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include "OperationResult.h"
#include "TaskRegistry.h"

namespace Shelf::Core::Async {

class TaskHandle {
public:
    /// Empty handle; valid() is false
    TaskHandle() = default;

    /// Adopts the handle reference that TaskRegistry::create() returned with id
    TaskHandle(std::shared_ptr<TaskRegistry> registry, TaskId id);

    ~TaskHandle();

    TaskHandle(const TaskHandle&) = delete;
    TaskHandle& operator=(const TaskHandle&) = delete;
    TaskHandle(TaskHandle&& other) noexcept;
    TaskHandle& operator=(TaskHandle&& other) noexcept;

    /// Second handle to the same task, including any cached result
    TaskHandle clone() const;

    /**
     * @brief Blocks the calling thread until the task is terminal
     * @throws std::logic_error on an empty handle
     */
    OperationResult wait();

    /// As wait(), returning nullopt if the task is still running after timeout
    std::optional<OperationResult> waitFor(std::chrono::steady_clock::duration timeout);

    /// Terminal result if available, nullopt while pending or running
    std::optional<OperationResult> poll();

    /**
     * @brief Requests cancellation; safe to call any number of times
     *
     * A pending task is guaranteed not to run. A running task resolves as
     * Cancelled straight away; the primitive already in progress completes in
     * the background and its outcome is discarded.
     */
    CancelOutcome cancel();

    /// True until the task has a terminal result
    bool isRunning() const;

    TaskId id() const noexcept { return _id; }
    bool valid() const noexcept { return _registry != nullptr; }
    explicit operator bool() const noexcept { return valid(); }

private:
    void requireValid(const char* what) const;
    void reset() noexcept;

    std::shared_ptr<TaskRegistry> _registry;
    TaskId _id = 0;
    bool _holdsReference = false;
    std::optional<OperationResult> _cached;
};

} // namespace Shelf::Core::Async
