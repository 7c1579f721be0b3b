/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

/**
 * @file Operation.h
 * @brief Immutable description of one asynchronous filesystem request
 *
 * An Operation is a closed tagged value: one alternative per request kind plus
 * Batch, which holds an ordered list of nested operations. Operations own all
 * of their data (paths are copied in) so they can be handed to a worker thread
 * without any reference back to the submitter.
 *
 * @code
 * auto op = Operation::batch({
 *     Operation::createDirectory("/tmp/shelf/a"),
 *     Operation::copy("/tmp/src.txt", "/tmp/shelf/a/src.txt"),
 * });
 * SHELF_LOG_DEBUG(op.describe());
 * @endcode
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace Shelf::Core::Async {

class Operation;

/// Alternative index order of Operation::Payload
enum class OperationKind : uint8_t {
    PathExists = 0,
    GetFileInfo,
    ReadDirectory,
    CreateDirectory,
    Delete,
    Copy,
    Move,
    GetFileSize,
    GetModifiedTime,
    Batch
};

const char* kindName(OperationKind kind) noexcept;

namespace Ops {
    struct PathExists { std::string path; };
    struct GetFileInfo { std::string path; };
    struct ReadDirectory { std::string path; };
    struct CreateDirectory { std::string path; };
    struct Delete { std::string path; };
    struct Copy { std::string source; std::string destination; };
    struct Move { std::string source; std::string destination; };
    struct GetFileSize { std::string path; };
    struct GetModifiedTime { std::string path; };
    struct Batch { std::vector<Operation> operations; };
} // namespace Ops

class Operation {
public:
    using Payload = std::variant<Ops::PathExists,
                                 Ops::GetFileInfo,
                                 Ops::ReadDirectory,
                                 Ops::CreateDirectory,
                                 Ops::Delete,
                                 Ops::Copy,
                                 Ops::Move,
                                 Ops::GetFileSize,
                                 Ops::GetModifiedTime,
                                 Ops::Batch>;

    static Operation pathExists(std::string path);
    static Operation getFileInfo(std::string path);
    static Operation readDirectory(std::string path);
    static Operation createDirectory(std::string path);
    static Operation deletePath(std::string path);
    static Operation copy(std::string source, std::string destination);
    static Operation move(std::string source, std::string destination);
    static Operation getFileSize(std::string path);
    static Operation getModifiedTime(std::string path);
    static Operation batch(std::vector<Operation> operations);

    OperationKind kind() const noexcept { return static_cast<OperationKind>(_payload.index()); }
    bool isBatch() const noexcept { return kind() == OperationKind::Batch; }

    const Payload& payload() const noexcept { return _payload; }

    /// Nested operations of a Batch, empty for every other kind
    const std::vector<Operation>& children() const noexcept;

    /// One-line summary for logs, e.g. "Copy(/a -> /b)" or "Batch[3]"
    std::string describe() const;

private:
    explicit Operation(Payload payload);

    Payload _payload;
};

} // namespace Shelf::Core::Async
