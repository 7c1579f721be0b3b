/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include "Operation.h"
#include <type_traits>

namespace Shelf::Core::Async {

const char* kindName(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::PathExists: return "PathExists";
        case OperationKind::GetFileInfo: return "GetFileInfo";
        case OperationKind::ReadDirectory: return "ReadDirectory";
        case OperationKind::CreateDirectory: return "CreateDirectory";
        case OperationKind::Delete: return "Delete";
        case OperationKind::Copy: return "Copy";
        case OperationKind::Move: return "Move";
        case OperationKind::GetFileSize: return "GetFileSize";
        case OperationKind::GetModifiedTime: return "GetModifiedTime";
        case OperationKind::Batch: return "Batch";
    }
    return "Unknown";
}

Operation::Operation(Payload payload)
    : _payload(std::move(payload)) {
}

Operation Operation::pathExists(std::string path) {
    return Operation(Ops::PathExists{std::move(path)});
}

Operation Operation::getFileInfo(std::string path) {
    return Operation(Ops::GetFileInfo{std::move(path)});
}

Operation Operation::readDirectory(std::string path) {
    return Operation(Ops::ReadDirectory{std::move(path)});
}

Operation Operation::createDirectory(std::string path) {
    return Operation(Ops::CreateDirectory{std::move(path)});
}

Operation Operation::deletePath(std::string path) {
    return Operation(Ops::Delete{std::move(path)});
}

Operation Operation::copy(std::string source, std::string destination) {
    return Operation(Ops::Copy{std::move(source), std::move(destination)});
}

Operation Operation::move(std::string source, std::string destination) {
    return Operation(Ops::Move{std::move(source), std::move(destination)});
}

Operation Operation::getFileSize(std::string path) {
    return Operation(Ops::GetFileSize{std::move(path)});
}

Operation Operation::getModifiedTime(std::string path) {
    return Operation(Ops::GetModifiedTime{std::move(path)});
}

Operation Operation::batch(std::vector<Operation> operations) {
    return Operation(Ops::Batch{std::move(operations)});
}

const std::vector<Operation>& Operation::children() const noexcept {
    static const std::vector<Operation> empty;
    if (const auto* b = std::get_if<Ops::Batch>(&_payload)) {
        return b->operations;
    }
    return empty;
}

std::string Operation::describe() const {
    return std::visit([this](const auto& op) -> std::string {
        using T = std::decay_t<decltype(op)>;
        std::string out = kindName(kind());
        if constexpr (std::is_same_v<T, Ops::Batch>) {
            out += "[" + std::to_string(op.operations.size()) + "]";
        } else if constexpr (std::is_same_v<T, Ops::Copy> || std::is_same_v<T, Ops::Move>) {
            out += "(" + op.source + " -> " + op.destination + ")";
        } else {
            out += "(" + op.path + ")";
        }
        return out;
    }, _payload);
}

} // namespace Shelf::Core::Async
