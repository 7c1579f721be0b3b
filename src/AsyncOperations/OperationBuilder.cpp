/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include "OperationBuilder.h"
#include "AsyncOperationManager.h"
#include <stdexcept>

namespace Shelf::Core::Async {

OperationBuilder& OperationBuilder::withTimeout(std::chrono::milliseconds timeout) {
    _timeout = timeout;
    return *this;
}

OperationBuilder& OperationBuilder::checkPathExists(std::string path) {
    return add(Operation::pathExists(std::move(path)));
}

OperationBuilder& OperationBuilder::getFileInfo(std::string path) {
    return add(Operation::getFileInfo(std::move(path)));
}

OperationBuilder& OperationBuilder::readDirectory(std::string path) {
    return add(Operation::readDirectory(std::move(path)));
}

OperationBuilder& OperationBuilder::createDirectory(std::string path) {
    return add(Operation::createDirectory(std::move(path)));
}

OperationBuilder& OperationBuilder::deletePath(std::string path) {
    return add(Operation::deletePath(std::move(path)));
}

OperationBuilder& OperationBuilder::copy(std::string source, std::string destination) {
    return add(Operation::copy(std::move(source), std::move(destination)));
}

OperationBuilder& OperationBuilder::movePath(std::string source, std::string destination) {
    return add(Operation::move(std::move(source), std::move(destination)));
}

OperationBuilder& OperationBuilder::getFileSize(std::string path) {
    return add(Operation::getFileSize(std::move(path)));
}

OperationBuilder& OperationBuilder::getModifiedTime(std::string path) {
    return add(Operation::getModifiedTime(std::move(path)));
}

OperationBuilder& OperationBuilder::add(Operation op) {
    _operations.push_back(std::move(op));
    return *this;
}

TaskHandle OperationBuilder::buildSingle(AsyncOperationManager& manager) const {
    if (_operations.size() != 1) {
        throw std::logic_error("OperationBuilder::buildSingle expects exactly one operation, have " +
                               std::to_string(_operations.size()));
    }
    return manager.submit(_operations.front(), _timeout);
}

TaskHandle OperationBuilder::buildBatch(AsyncOperationManager& manager) const {
    if (_operations.empty()) {
        throw std::logic_error("OperationBuilder::buildBatch called with no operations");
    }
    return manager.submit(Operation::batch(_operations), _timeout);
}

} // namespace Shelf::Core::Async
