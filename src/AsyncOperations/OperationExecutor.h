/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

/**
 * @file OperationExecutor.h
 * @brief Runs an Operation against a filesystem backend on the calling thread
 *
 * Batches run their items in order on the same thread. A failing item is
 * recorded and the next one still runs. Between items the executor consults
 * the stop predicate; once it reports true the remaining items are recorded
 * as Cancelled without being started.
 */

#pragma once

#include <functional>
#include <memory>
#include "Operation.h"
#include "OperationResult.h"
#include "../FileSystem/IFileSystemBackend.h"

namespace Shelf::Core::Async {

class OperationExecutor {
public:
    using StopPredicate = std::function<bool()>;

    explicit OperationExecutor(std::shared_ptr<IO::IFileSystemBackend> backend);

    /**
     * @brief Executes op and returns its result
     *
     * Exceptions thrown by the backend are converted into Error results; this
     * method does not throw.
     */
    OperationResult execute(const Operation& op, const StopPredicate& shouldStop = {}) const;

    IO::IFileSystemBackend& backend() const noexcept { return *_backend; }

private:
    OperationResult executeOne(const Operation& op, const StopPredicate& shouldStop) const;
    OperationResult executeBatch(const Ops::Batch& batch, const StopPredicate& shouldStop) const;

    std::shared_ptr<IO::IFileSystemBackend> _backend;
};

} // namespace Shelf::Core::Async
