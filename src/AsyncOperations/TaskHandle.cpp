/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include "TaskHandle.h"
#include <stdexcept>
#include <string>

namespace Shelf::Core::Async {

TaskHandle::TaskHandle(std::shared_ptr<TaskRegistry> registry, TaskId id)
    : _registry(std::move(registry))
    , _id(id)
    , _holdsReference(_registry != nullptr) {
}

TaskHandle::~TaskHandle() {
    reset();
}

TaskHandle::TaskHandle(TaskHandle&& other) noexcept
    : _registry(std::move(other._registry))
    , _id(other._id)
    , _holdsReference(other._holdsReference)
    , _cached(std::move(other._cached)) {
    other._id = 0;
    other._holdsReference = false;
    other._cached.reset();
}

TaskHandle& TaskHandle::operator=(TaskHandle&& other) noexcept {
    if (this != &other) {
        reset();
        _registry = std::move(other._registry);
        _id = other._id;
        _holdsReference = other._holdsReference;
        _cached = std::move(other._cached);
        other._id = 0;
        other._holdsReference = false;
        other._cached.reset();
    }
    return *this;
}

void TaskHandle::reset() noexcept {
    if (_registry && _holdsReference) {
        _registry->release(_id, _cached.has_value());
    }
    _registry.reset();
    _holdsReference = false;
    _cached.reset();
    _id = 0;
}

void TaskHandle::requireValid(const char* what) const {
    if (!_registry) {
        throw std::logic_error(std::string("TaskHandle::") + what + " called on an empty handle");
    }
}

TaskHandle TaskHandle::clone() const {
    requireValid("clone");
    TaskHandle copy;
    copy._registry = _registry;
    copy._id = _id;
    copy._holdsReference = _registry->retain(_id);
    copy._cached = _cached;
    return copy;
}

OperationResult TaskHandle::wait() {
    requireValid("wait");
    if (!_cached) {
        _cached = _registry->wait(_id);
    }
    return *_cached;
}

std::optional<OperationResult> TaskHandle::waitFor(std::chrono::steady_clock::duration timeout) {
    requireValid("waitFor");
    if (!_cached) {
        _cached = _registry->waitFor(_id, timeout);
    }
    return _cached;
}

std::optional<OperationResult> TaskHandle::poll() {
    requireValid("poll");
    if (!_cached) {
        _cached = _registry->poll(_id);
    }
    return _cached;
}

CancelOutcome TaskHandle::cancel() {
    requireValid("cancel");
    if (_cached) {
        return CancelOutcome::AlreadyFinished;
    }
    return _registry->cancel(_id);
}

bool TaskHandle::isRunning() const {
    requireValid("isRunning");
    if (_cached) {
        return false;
    }
    return !_registry->isTerminal(_id);
}

} // namespace Shelf::Core::Async
