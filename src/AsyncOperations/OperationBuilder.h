/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

/**
 * @file OperationBuilder.h
 * @brief Fluent assembly of one operation or a batch
 *
 * @code
 * auto handle = OperationBuilder()
 *     .withTimeout(std::chrono::seconds(10))
 *     .createDirectory("/tmp/shelf/archive")
 *     .movePath("/tmp/shelf/a.pdf", "/tmp/shelf/archive/a.pdf")
 *     .buildBatch(manager);
 * @endcode
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "Operation.h"
#include "TaskHandle.h"

namespace Shelf::Core::Async {

class AsyncOperationManager;

class OperationBuilder {
public:
    OperationBuilder& withTimeout(std::chrono::milliseconds timeout);

    OperationBuilder& checkPathExists(std::string path);
    OperationBuilder& getFileInfo(std::string path);
    OperationBuilder& readDirectory(std::string path);
    OperationBuilder& createDirectory(std::string path);
    OperationBuilder& deletePath(std::string path);
    OperationBuilder& copy(std::string source, std::string destination);
    OperationBuilder& movePath(std::string source, std::string destination);
    OperationBuilder& getFileSize(std::string path);
    OperationBuilder& getModifiedTime(std::string path);
    OperationBuilder& add(Operation op);

    size_t size() const noexcept { return _operations.size(); }
    const std::vector<Operation>& operations() const noexcept { return _operations; }
    const std::optional<std::chrono::milliseconds>& timeout() const noexcept { return _timeout; }

    /**
     * @brief Submits the single queued operation
     * @throws std::logic_error unless exactly one operation was added
     */
    TaskHandle buildSingle(AsyncOperationManager& manager) const;

    /**
     * @brief Submits every queued operation as one Batch
     * @throws std::logic_error if no operation was added
     */
    TaskHandle buildBatch(AsyncOperationManager& manager) const;

private:
    std::vector<Operation> _operations;
    std::optional<std::chrono::milliseconds> _timeout;
};

} // namespace Shelf::Core::Async
