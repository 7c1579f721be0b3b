/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include "Convenience.h"
#include "AsyncOperationManager.h"

namespace Shelf::Core::Async {

namespace {
    OperationResult run(AsyncOperationManager& manager, Operation op, OptionalTimeout timeout) {
        return manager.submit(std::move(op), timeout).wait();
    }

    bool succeededTrue(const OperationResult& r) {
        const bool* b = r.asBool();
        return b && *b;
    }

    template <typename T>
    IO::IoResult<T> extract(const OperationResult& r, const T* value) {
        if (!value) {
            return IO::IoResult<T>::failure(toFileError(r));
        }
        return IO::IoResult<T>::success(*value);
    }
}

IO::FileErrorInfo toFileError(const OperationResult& result) {
    IO::FileErrorInfo info;
    switch (result.kind()) {
        case ResultKind::Error:
            info.code = result.errorCode();
            info.message = result.message();
            break;
        case ResultKind::Timeout:
            info.code = IO::FileError::Unknown;
            info.message = "Operation timed out";
            break;
        case ResultKind::Cancelled:
            info.code = IO::FileError::Unknown;
            info.message = "Operation was cancelled";
            break;
        case ResultKind::Success:
            info.code = IO::FileError::Unknown;
            info.message = "Unexpected result shape";
            break;
    }
    return info;
}

bool pathExists(AsyncOperationManager& manager, const std::string& path, OptionalTimeout timeout) {
    return succeededTrue(run(manager, Operation::pathExists(path), timeout));
}

bool isDirectory(AsyncOperationManager& manager, const std::string& path, OptionalTimeout timeout) {
    auto r = run(manager, Operation::getFileInfo(path), timeout);
    const auto* info = r.asFileInfo();
    return info && info->isDirectory;
}

bool isFile(AsyncOperationManager& manager, const std::string& path, OptionalTimeout timeout) {
    auto r = run(manager, Operation::getFileInfo(path), timeout);
    const auto* info = r.asFileInfo();
    return info && info->isRegularFile;
}

IO::IoResult<uint64_t> getFileSize(AsyncOperationManager& manager, const std::string& path, OptionalTimeout timeout) {
    auto r = run(manager, Operation::getFileSize(path), timeout);
    return extract(r, r.asSize());
}

IO::IoResult<std::chrono::system_clock::time_point> getModifiedTime(AsyncOperationManager& manager,
                                                                    const std::string& path,
                                                                    OptionalTimeout timeout) {
    auto r = run(manager, Operation::getModifiedTime(path), timeout);
    return extract(r, r.asTime());
}

IO::IoResult<IO::FileInfo> getFileInfo(AsyncOperationManager& manager, const std::string& path,
                                       OptionalTimeout timeout) {
    auto r = run(manager, Operation::getFileInfo(path), timeout);
    return extract(r, r.asFileInfo());
}

IO::IoResult<std::vector<std::string>> quickReadDir(AsyncOperationManager& manager, const std::string& path,
                                                    OptionalTimeout timeout) {
    auto r = run(manager, Operation::readDirectory(path), timeout);
    const auto* entries = r.asEntries();
    if (!entries) {
        return IO::IoResult<std::vector<std::string>>::failure(toFileError(r));
    }
    std::vector<std::string> names;
    names.reserve(entries->size());
    for (const auto& e : *entries) {
        names.push_back(e.name);
    }
    return IO::IoResult<std::vector<std::string>>::success(std::move(names));
}

bool createDirectory(AsyncOperationManager& manager, const std::string& path, OptionalTimeout timeout) {
    return succeededTrue(run(manager, Operation::createDirectory(path), timeout));
}

bool deletePath(AsyncOperationManager& manager, const std::string& path, OptionalTimeout timeout) {
    return succeededTrue(run(manager, Operation::deletePath(path), timeout));
}

bool copy(AsyncOperationManager& manager, const std::string& source, const std::string& destination,
          OptionalTimeout timeout) {
    return succeededTrue(run(manager, Operation::copy(source, destination), timeout));
}

bool movePath(AsyncOperationManager& manager, const std::string& source, const std::string& destination,
              OptionalTimeout timeout) {
    return succeededTrue(run(manager, Operation::move(source, destination), timeout));
}

} // namespace Shelf::Core::Async
