/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include "OperationResult.h"

namespace Shelf::Core::Async {

const char* toString(ResultKind kind) noexcept {
    switch (kind) {
        case ResultKind::Success: return "Success";
        case ResultKind::Error: return "Error";
        case ResultKind::Timeout: return "Timeout";
        case ResultKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

OperationResult OperationResult::success(Value value) {
    OperationResult r;
    r._kind = ResultKind::Success;
    r._value = std::move(value);
    return r;
}

OperationResult OperationResult::error(std::string message, IO::FileError code) {
    OperationResult r;
    r._kind = ResultKind::Error;
    r._message = std::move(message);
    r._errorCode = code == IO::FileError::None ? IO::FileError::Unknown : code;
    return r;
}

OperationResult OperationResult::error(const IO::FileErrorInfo& info) {
    return error(info.describe(), info.code);
}

OperationResult OperationResult::timeout() {
    OperationResult r;
    r._kind = ResultKind::Timeout;
    return r;
}

OperationResult OperationResult::cancelled() {
    OperationResult r;
    r._kind = ResultKind::Cancelled;
    return r;
}

const OperationResult::Value& OperationResult::value() const {
    switch (_kind) {
        case ResultKind::Success:
            return _value;
        case ResultKind::Error:
            throw std::logic_error("OperationResult::value() called on Error: " + _message);
        case ResultKind::Timeout:
            throw std::logic_error("OperationResult::value() called on Timeout");
        case ResultKind::Cancelled:
            break;
    }
    throw std::logic_error("OperationResult::value() called on Cancelled");
}

const bool* OperationResult::asBool() const noexcept {
    return isSuccess() ? std::get_if<bool>(&_value) : nullptr;
}

const IO::FileInfo* OperationResult::asFileInfo() const noexcept {
    return isSuccess() ? std::get_if<IO::FileInfo>(&_value) : nullptr;
}

const std::vector<IO::FileInfo>* OperationResult::asEntries() const noexcept {
    return isSuccess() ? std::get_if<std::vector<IO::FileInfo>>(&_value) : nullptr;
}

const uint64_t* OperationResult::asSize() const noexcept {
    return isSuccess() ? std::get_if<uint64_t>(&_value) : nullptr;
}

const OperationResult::TimePoint* OperationResult::asTime() const noexcept {
    return isSuccess() ? std::get_if<TimePoint>(&_value) : nullptr;
}

const std::vector<OperationResult>* OperationResult::asBatch() const noexcept {
    return isSuccess() ? std::get_if<std::vector<OperationResult>>(&_value) : nullptr;
}

std::string OperationResult::toString() const {
    std::string out = Async::toString(_kind);
    if (isError()) {
        out += "(" + _message + ")";
    } else if (const auto* items = asBatch()) {
        out += "[";
        for (size_t i = 0; i < items->size(); ++i) {
            if (i) out += ", ";
            out += (*items)[i].toString();
        }
        out += "]";
    }
    return out;
}

bool OperationResult::operator==(const OperationResult& other) const {
    if (_kind != other._kind) return false;
    switch (_kind) {
        case ResultKind::Success:
            return _value == other._value;
        case ResultKind::Error:
            return _message == other._message && _errorCode == other._errorCode;
        case ResultKind::Timeout:
        case ResultKind::Cancelled:
            break;
    }
    return true;
}

} // namespace Shelf::Core::Async
