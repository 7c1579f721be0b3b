/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include "WorkerPool.h"
#include "../Logging/Logger.h"
#include <exception>
#include <stdexcept>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace Shelf
{
namespace Core
{
namespace Concurrency
{

namespace {
    void setCurrentThreadName(const std::string& name) {
#if defined(__linux__)
        // Linux limits thread names to 15 characters plus the terminator
        std::string truncated = name.substr(0, 15);
        pthread_setname_np(pthread_self(), truncated.c_str());
#elif defined(__APPLE__)
        pthread_setname_np(name.c_str());
#else
        (void)name;
#endif
    }
}

WorkerPool::WorkerPool(std::string name)
    : _name(std::move(name)) {
}

WorkerPool::~WorkerPool() {
    requestStop();
    join();
}

void WorkerPool::start(size_t threadCount, LoopBody body) {
    if (threadCount == 0) {
        throw std::logic_error("WorkerPool requires at least one thread");
    }
    if (!body) {
        throw std::logic_error("WorkerPool requires a loop body");
    }

    std::lock_guard<std::mutex> lock(_threadsMutex);
    if (_running.load(std::memory_order_acquire)) {
        throw std::logic_error("WorkerPool '" + _name + "' is already running");
    }

    _body = std::move(body);
    _stopRequested.store(false, std::memory_order_release);
    _running.store(true, std::memory_order_release);
    _threads.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        _threads.emplace_back([this, i]() { run(i); });
    }
    SHELF_LOG_DEBUG_CAT("WorkerPool", _name + " started " + std::to_string(threadCount) + " threads");
}

void WorkerPool::join() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(_threadsMutex);
        threads.swap(_threads);
    }
    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }
    if (!threads.empty()) {
        SHELF_LOG_DEBUG_CAT("WorkerPool", _name + " joined " + std::to_string(threads.size()) + " threads");
    }
    _running.store(false, std::memory_order_release);
}

size_t WorkerPool::threadCount() const {
    std::lock_guard<std::mutex> lock(_threadsMutex);
    return _threads.size();
}

void WorkerPool::run(size_t index) {
    setCurrentThreadName(_name + "-" + std::to_string(index));
    while (!stopRequested()) {
        bool keepGoing = false;
        try {
            keepGoing = _body(index);
        } catch (const std::exception& e) {
            // The body owns fault handling; anything reaching here is a bug, keep the thread alive
            SHELF_LOG_ERROR_CAT("WorkerPool", _name + "-" + std::to_string(index) + " loop body threw: " + e.what());
            keepGoing = true;
        }
        if (!keepGoing) {
            break;
        }
    }
}

} // namespace Concurrency
} // namespace Core
} // namespace Shelf
