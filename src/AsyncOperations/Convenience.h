/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

/**
 * @file Convenience.h
 * @brief Submit-and-wait helpers for one-off checks
 *
 * Each helper submits a single operation through the manager and blocks the
 * calling thread until it is terminal. Do not call them from a thread that
 * must stay responsive. Timeout, Cancelled and Error all surface as failures;
 * the bool helpers simply return false.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../FileSystem/FileTypes.h"
#include "OperationResult.h"

namespace Shelf::Core::Async {

class AsyncOperationManager;

using OptionalTimeout = std::optional<std::chrono::milliseconds>;

bool pathExists(AsyncOperationManager& manager, const std::string& path, OptionalTimeout timeout = std::nullopt);
bool isDirectory(AsyncOperationManager& manager, const std::string& path, OptionalTimeout timeout = std::nullopt);
bool isFile(AsyncOperationManager& manager, const std::string& path, OptionalTimeout timeout = std::nullopt);

IO::IoResult<uint64_t> getFileSize(AsyncOperationManager& manager, const std::string& path,
                                   OptionalTimeout timeout = std::nullopt);
IO::IoResult<std::chrono::system_clock::time_point> getModifiedTime(AsyncOperationManager& manager,
                                                                    const std::string& path,
                                                                    OptionalTimeout timeout = std::nullopt);
IO::IoResult<IO::FileInfo> getFileInfo(AsyncOperationManager& manager, const std::string& path,
                                       OptionalTimeout timeout = std::nullopt);

/// Entry names of a directory, in listing order
IO::IoResult<std::vector<std::string>> quickReadDir(AsyncOperationManager& manager, const std::string& path,
                                                    OptionalTimeout timeout = std::nullopt);

bool createDirectory(AsyncOperationManager& manager, const std::string& path, OptionalTimeout timeout = std::nullopt);
bool deletePath(AsyncOperationManager& manager, const std::string& path, OptionalTimeout timeout = std::nullopt);
bool copy(AsyncOperationManager& manager, const std::string& source, const std::string& destination,
          OptionalTimeout timeout = std::nullopt);
bool movePath(AsyncOperationManager& manager, const std::string& source, const std::string& destination,
              OptionalTimeout timeout = std::nullopt);

/// FileErrorInfo describing a non-Success result
IO::FileErrorInfo toFileError(const OperationResult& result);

} // namespace Shelf::Core::Async
