/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#pragma once

/**
 * @file ShelfCore.h
 * @brief Single header that includes all ShelfCore components
 */

// Core common utilities
#include "CoreCommon.h"

// Services
#include "Core/ShelfService.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// Concurrency
#include "Concurrency/WorkerPool.h"

// Filesystem primitives
#include "FileSystem/FileTypes.h"
#include "FileSystem/IFileSystemBackend.h"
#include "FileSystem/LocalFileSystemBackend.h"

// Async operations
#include "AsyncOperations/Operation.h"
#include "AsyncOperations/OperationResult.h"
#include "AsyncOperations/TaskRegistry.h"
#include "AsyncOperations/TaskHandle.h"
#include "AsyncOperations/TimeoutSupervisor.h"
#include "AsyncOperations/OperationExecutor.h"
#include "AsyncOperations/AsyncOperationManager.h"
#include "AsyncOperations/OperationBuilder.h"
#include "AsyncOperations/Convenience.h"
