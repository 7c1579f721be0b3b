/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include "OperationExecutor.h"
#include "../Logging/Logger.h"
#include <exception>
#include <stdexcept>
#include <type_traits>

namespace Shelf::Core::Async {

namespace {
    template <typename T>
    OperationResult fromIo(IO::IoResult<T>&& r) {
        if (!r) {
            return OperationResult::error(r.error());
        }
        return OperationResult::success(std::move(r).value());
    }

    template <class>
    inline constexpr bool kAlwaysFalse = false;
}

OperationExecutor::OperationExecutor(std::shared_ptr<IO::IFileSystemBackend> backend)
    : _backend(std::move(backend)) {
    if (!_backend) {
        throw std::invalid_argument("OperationExecutor requires a filesystem backend");
    }
}

OperationResult OperationExecutor::execute(const Operation& op, const StopPredicate& shouldStop) const {
    try {
        return executeOne(op, shouldStop);
    } catch (const std::exception& e) {
        SHELF_LOG_ERROR_CAT("OperationExecutor", op.describe() + " threw: " + e.what());
        return OperationResult::error(std::string("Unhandled exception: ") + e.what(), IO::FileError::Unknown);
    } catch (...) {
        SHELF_LOG_ERROR_CAT("OperationExecutor", op.describe() + " threw a non-standard exception");
        return OperationResult::error("Unhandled non-standard exception", IO::FileError::Unknown);
    }
}

OperationResult OperationExecutor::executeOne(const Operation& op, const StopPredicate& shouldStop) const {
    auto& fs = *_backend;
    return std::visit([&](const auto& req) -> OperationResult {
        using T = std::decay_t<decltype(req)>;
        if constexpr (std::is_same_v<T, Ops::PathExists>) {
            return fromIo(fs.pathExists(req.path));
        } else if constexpr (std::is_same_v<T, Ops::GetFileInfo>) {
            return fromIo(fs.getFileInfo(req.path));
        } else if constexpr (std::is_same_v<T, Ops::ReadDirectory>) {
            return fromIo(fs.readDirectory(req.path));
        } else if constexpr (std::is_same_v<T, Ops::CreateDirectory>) {
            return fromIo(fs.createDirectory(req.path));
        } else if constexpr (std::is_same_v<T, Ops::Delete>) {
            return fromIo(fs.remove(req.path));
        } else if constexpr (std::is_same_v<T, Ops::Copy>) {
            return fromIo(fs.copy(req.source, req.destination));
        } else if constexpr (std::is_same_v<T, Ops::Move>) {
            return fromIo(fs.move(req.source, req.destination));
        } else if constexpr (std::is_same_v<T, Ops::GetFileSize>) {
            return fromIo(fs.fileSize(req.path));
        } else if constexpr (std::is_same_v<T, Ops::GetModifiedTime>) {
            return fromIo(fs.modifiedTime(req.path));
        } else if constexpr (std::is_same_v<T, Ops::Batch>) {
            return executeBatch(req, shouldStop);
        } else {
            static_assert(kAlwaysFalse<T>, "OperationExecutor does not handle every Operation alternative");
        }
    }, op.payload());
}

OperationResult OperationExecutor::executeBatch(const Ops::Batch& batch, const StopPredicate& shouldStop) const {
    std::vector<OperationResult> results;
    results.reserve(batch.operations.size());

    bool stopped = false;
    for (const auto& item : batch.operations) {
        if (!stopped && shouldStop && shouldStop()) {
            stopped = true;
            SHELF_LOG_DEBUG_CAT("OperationExecutor", "Batch stopped after " + std::to_string(results.size()) + " of " +
                                std::to_string(batch.operations.size()) + " items");
        }
        if (stopped) {
            results.push_back(OperationResult::cancelled());
            continue;
        }
        // Per-item isolation: a throwing item becomes Error and the batch continues
        results.push_back(execute(item, shouldStop));
    }
    return OperationResult::success(std::move(results));
}

} // namespace Shelf::Core::Async
