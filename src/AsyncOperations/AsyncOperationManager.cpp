/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include "AsyncOperationManager.h"
#include "../CoreCommon.h"
#include "../FileSystem/LocalFileSystemBackend.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <thread>

namespace Shelf::Core::Async {

namespace {
    std::shared_ptr<IO::IFileSystemBackend> orLocalBackend(std::shared_ptr<IO::IFileSystemBackend> backend) {
        if (backend) return backend;
        return std::make_shared<IO::LocalFileSystemBackend>();
    }

    TimeoutSupervisor::Config supervisorConfig(const AsyncOperationManager::Config& cfg) {
        TimeoutSupervisor::Config sc;
        sc.resultRetention = TimeoutSupervisor::toClockDuration(cfg.resultRetention);
        return sc;
    }

    // Largest worker count accepted from the environment
    constexpr uint64_t kMaxEnvWorkers = 256;
    // Millisecond values above this overflow a nanosecond steady_clock duration
    constexpr uint64_t kMaxEnvMilliseconds = static_cast<uint64_t>(INT64_MAX) / 1'000'000;

    std::optional<uint64_t> readEnvNumber(const char* variable, uint64_t ceiling) {
        auto raw = safeGetEnv(variable);
        if (!raw) return std::nullopt;
        auto parsed = parseUnsigned(*raw);
        if (!parsed || *parsed > ceiling) {
            SHELF_LOG_WARNING_CAT("AsyncOperationManager",
                                  std::string("Ignoring malformed ") + variable + "='" + *raw + "' (expected 0.." +
                                  std::to_string(ceiling) + ")");
            return std::nullopt;
        }
        return parsed;
    }
}

AsyncOperationManager::Config AsyncOperationManager::Config::fromEnvironment() {
    Config cfg;
    if (auto workers = readEnvNumber("SHELF_ASYNC_WORKERS", kMaxEnvWorkers)) {
        cfg.workerCount = static_cast<size_t>(*workers);
    }
    if (auto timeoutMs = readEnvNumber("SHELF_ASYNC_DEFAULT_TIMEOUT_MS", kMaxEnvMilliseconds)) {
        cfg.defaultTimeout = std::chrono::milliseconds(*timeoutMs);
    }
    if (auto retentionMs = readEnvNumber("SHELF_ASYNC_RETENTION_MS", kMaxEnvMilliseconds)) {
        cfg.resultRetention = std::chrono::milliseconds(*retentionMs);
    }
    return cfg;
}

size_t AsyncOperationManager::Config::resolvedWorkerCount() const {
    if (workerCount > 0) {
        return workerCount;
    }
    size_t hw = std::thread::hardware_concurrency();
    return std::clamp<size_t>(hw, 2, 8);
}

AsyncOperationManager::AsyncOperationManager()
    : AsyncOperationManager(Config{}) {
}

AsyncOperationManager::AsyncOperationManager(Config config, std::shared_ptr<IO::IFileSystemBackend> backend)
    : _config(std::move(config))
    , _backend(orLocalBackend(std::move(backend)))
    , _registry(std::make_shared<TaskRegistry>())
    , _executor(_backend)
    , _supervisor(_registry, supervisorConfig(_config))
    , _workers(_config.name) {
    _registry->setTerminalListener([this](TaskId id) { _supervisor.disarm(id); });
}

AsyncOperationManager::~AsyncOperationManager() {
    stop();
}

void AsyncOperationManager::load() {
    if (state() == ServiceState::Registered) {
        setState(ServiceState::Loaded);
    }
}

void AsyncOperationManager::start() {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    if (_stopped.load(std::memory_order_acquire)) {
        throw std::logic_error("AsyncOperationManager cannot be restarted after stop()");
    }
    if (state() == ServiceState::Started) {
        return;
    }

    const size_t workers = _config.resolvedWorkerCount();
    _supervisor.start();
    _workers.start(workers, [this](size_t index) { return workerIteration(index); });
    setState(ServiceState::Started);
    SHELF_LOG_DEBUG_CAT(_config.name, "Started with " + std::to_string(workers) + " workers on " +
                        _backend->getBackendType() + " backend");
}

void AsyncOperationManager::stop() {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    if (_stopped.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    // Handles may outlive us and keep the registry; detach before the supervisor goes away
    _registry->setTerminalListener(nullptr);

    // create() refuses from here on, so cancelAll() sees every task
    _registry->shutdown();
    const size_t cancelled = _registry->cancelAll();
    _workers.requestStop();
    _workers.join();
    _supervisor.stop();

    if (state() != ServiceState::Unloaded) {
        setState(ServiceState::Stopped);
    }
    SHELF_LOG_DEBUG_CAT(_config.name, "Stopped, cancelled " + std::to_string(cancelled) + " outstanding tasks");
}

void AsyncOperationManager::unload() {
    stop();
    setState(ServiceState::Unloaded);
}

TaskHandle AsyncOperationManager::submit(Operation op, std::optional<std::chrono::milliseconds> timeout) {
    if (_stopped.load(std::memory_order_acquire)) {
        throw std::runtime_error("AsyncOperationManager is stopped; submit() rejected");
    }

    const auto effective = timeout ? timeout : _config.defaultTimeout;
    std::optional<TaskRegistry::Clock::duration> bound;
    if (effective) {
        bound = TimeoutSupervisor::toClockDuration(*effective);
    }

    SHELF_LOG_TRACE_CAT(_config.name, "Submitting " + op.describe());
    const TaskId id = _registry->create(std::move(op), bound);
    TaskHandle handle(_registry, id);

    if (bound) {
        if (auto submitted = _registry->submittedAt(id)) {
            _supervisor.arm(id, TimeoutSupervisor::deadlineAfter(*submitted, *bound));
            // The task may have finished before the deadline was armed
            if (_registry->isTerminal(id)) {
                _supervisor.disarm(id);
            }
        }
    }
    return handle;
}

size_t AsyncOperationManager::cancelAll() {
    return _registry->cancelAll();
}

size_t AsyncOperationManager::activeTaskCount() const {
    return _registry->activeCount();
}

bool AsyncOperationManager::workerIteration(size_t workerIndex) {
    auto claim = _registry->claimNext();
    if (!claim) {
        return false;
    }

    const TaskId id = claim->id;
    auto result = _executor.execute(claim->operation, [this, id]() { return _registry->isTerminal(id); });
    if (!_registry->complete(id, std::move(result))) {
        SHELF_LOG_DEBUG_CAT(_config.name, "Worker " + std::to_string(workerIndex) + " discarded result of task " +
                            std::to_string(id) + ", already resolved by cancel or timeout");
    }
    return true;
}

} // namespace Shelf::Core::Async
