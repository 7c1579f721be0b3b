/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

/**
 * @file OperationResult.h
 * @brief Terminal outcome of an asynchronous operation
 *
 * Exactly one of Success, Error, Timeout or Cancelled. Success carries a value
 * whose shape depends on the operation kind:
 *
 * | Operation                                         | Success value                       |
 * |---------------------------------------------------|-------------------------------------|
 * | PathExists, CreateDirectory, Delete, Copy, Move   | bool                                |
 * | GetFileInfo                                       | IO::FileInfo                        |
 * | ReadDirectory                                     | std::vector<IO::FileInfo>           |
 * | GetFileSize                                       | uint64_t                            |
 * | GetModifiedTime                                   | std::chrono::system_clock::time_point |
 * | Batch                                             | std::vector<OperationResult>        |
 *
 * Timeout and Cancelled are not errors; isError() is false for both.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include "../FileSystem/FileTypes.h"

namespace Shelf::Core::Async {

enum class ResultKind : uint8_t {
    Success = 0,
    Error,
    Timeout,
    Cancelled
};

const char* toString(ResultKind kind) noexcept;

class OperationResult {
public:
    using TimePoint = std::chrono::system_clock::time_point;
    using Value = std::variant<bool,
                               IO::FileInfo,
                               std::vector<IO::FileInfo>,
                               uint64_t,
                               TimePoint,
                               std::vector<OperationResult>>;

    static OperationResult success(Value value);
    static OperationResult error(std::string message, IO::FileError code = IO::FileError::Unknown);
    static OperationResult error(const IO::FileErrorInfo& info);
    static OperationResult timeout();
    static OperationResult cancelled();

    ResultKind kind() const noexcept { return _kind; }
    bool isSuccess() const noexcept { return _kind == ResultKind::Success; }
    bool isError() const noexcept { return _kind == ResultKind::Error; }
    bool isTimeout() const noexcept { return _kind == ResultKind::Timeout; }
    bool isCancelled() const noexcept { return _kind == ResultKind::Cancelled; }

    /**
     * @brief The success value
     * @throws std::logic_error naming the actual outcome when not Success
     */
    const Value& value() const;

    /**
     * @brief The success value as T, or fallback when not Success or shaped differently
     *
     * @code
     * uint64_t bytes = handle.wait().valueOr<uint64_t>(0);
     * @endcode
     */
    template <typename T>
    T valueOr(T fallback) const {
        if (!isSuccess()) return fallback;
        if (const auto* v = std::get_if<T>(&_value)) return *v;
        return fallback;
    }

    // Typed views of a Success value; nullptr when not Success or shaped differently
    const bool* asBool() const noexcept;
    const IO::FileInfo* asFileInfo() const noexcept;
    const std::vector<IO::FileInfo>* asEntries() const noexcept;
    const uint64_t* asSize() const noexcept;
    const TimePoint* asTime() const noexcept;
    const std::vector<OperationResult>* asBatch() const noexcept;

    /// Error message; empty unless Error
    const std::string& message() const noexcept { return _message; }
    /// File error code behind an Error; FileError::None otherwise
    IO::FileError errorCode() const noexcept { return _errorCode; }

    std::string toString() const;

    bool operator==(const OperationResult& other) const;
    bool operator!=(const OperationResult& other) const { return !(*this == other); }

private:
    OperationResult() = default;

    ResultKind _kind = ResultKind::Cancelled;
    Value _value{false};
    std::string _message;
    IO::FileError _errorCode = IO::FileError::None;
};

} // namespace Shelf::Core::Async
