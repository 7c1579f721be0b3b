/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

/**
 * @file FileTypes.h
 * @brief Value types shared by filesystem primitives and async results
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace Shelf::Core::IO {

/**
 * Error taxonomy surfaced by filesystem primitives.
 * Mapping guidelines:
 * - FileNotFound: path does not exist when required (stat/list/delete/copy/move source)
 * - AccessDenied: OS/permission refusal
 * - DiskFull: ENOSPC/EDQUOT or equivalent
 * - InvalidPath: malformed path, name too long, wrong file type for the request
 * - AlreadyExists: creation target exists with an incompatible type
 * - IOError: other local I/O failures
 */
enum class FileError {
    None = 0,
    FileNotFound,
    AccessDenied,
    DiskFull,
    InvalidPath,
    AlreadyExists,
    IOError,
    Unknown
};

const char* toString(FileError error) noexcept;

struct FileErrorInfo {
    FileError code = FileError::None;
    std::string message;
    std::optional<std::error_code> systemError;
    std::string path;

    // "message: system detail (path)" - the form stored in Error results
    std::string describe() const;
};

/**
 * @brief Metadata record for one filesystem entry
 *
 * readonly reflects the calling process' write permission, not the mode bits.
 * created is only populated where the platform reports a birth time.
 */
struct FileInfo {
    std::string path;
    std::string name;                       // final path component
    std::optional<std::string> extension;   // without the leading dot
    uint64_t size = 0;
    bool isDirectory = false;
    bool isRegularFile = false;
    bool isSymlink = false;
    bool readonly = false;
    std::optional<std::chrono::system_clock::time_point> lastModified;
    std::optional<std::chrono::system_clock::time_point> created;

    bool operator==(const FileInfo&) const = default;
};

/**
 * @brief Outcome of a blocking primitive: a value or a failure description
 *
 * Primitives never throw to their caller; they return one of these.
 */
template <typename T>
class IoResult {
public:
    static IoResult success(T value) {
        IoResult r;
        r._value = std::move(value);
        return r;
    }

    static IoResult failure(FileErrorInfo error) {
        IoResult r;
        if (error.code == FileError::None) error.code = FileError::Unknown;
        r._error = std::move(error);
        return r;
    }

    static IoResult failure(FileError code, std::string message, std::string path = {},
                            std::optional<std::error_code> ec = std::nullopt) {
        return failure(FileErrorInfo{code, std::move(message), ec, std::move(path)});
    }

    bool ok() const noexcept { return _value.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    const T& value() const& { return *_value; }
    T&& value() && { return std::move(*_value); }
    const FileErrorInfo& error() const noexcept { return _error; }

private:
    IoResult() = default;

    std::optional<T> _value;
    FileErrorInfo _error;
};

} // namespace Shelf::Core::IO
