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
 * @file shelf_types.h
 * @brief Shared types for the ShelfCore C API
 *
 * Hourglass pattern: a stable C ABI over the C++ async operation manager.
 * No C++ exception ever crosses this boundary; every fallible call reports
 * through a ShelfStatus out-parameter.
 */

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Export macro (works for both static and shared builds)
#if defined(_WIN32)
  #if defined(SHELFCORE_SHARED)
    #if defined(SHELFCORE_BUILDING)
      #define SHELF_API __declspec(dllexport)
    #else
      #define SHELF_API __declspec(dllimport)
    #endif
  #else
    #define SHELF_API
  #endif
#else
  #if defined(SHELFCORE_SHARED)
    #define SHELF_API __attribute__((visibility("default")))
  #else
    #define SHELF_API
  #endif
#endif

/* ============================================================================
 * Status and booleans
 * ============================================================================ */

typedef enum ShelfStatus {
    SHELF_OK = 0,
    SHELF_ERR_UNKNOWN = 1,
    SHELF_ERR_INVALID_ARG = 2,
    SHELF_ERR_NOT_FOUND = 3,
    SHELF_ERR_TYPE_MISMATCH = 4,
    SHELF_ERR_NO_MEMORY = 5,
    SHELF_ERR_UNAVAILABLE = 6,    /**< Manager stopped, submission refused */
    SHELF_ERR_INVALID_STATE = 7   /**< Call not valid in the object's current state */
} ShelfStatus;

typedef int32_t ShelfBool; // 0 = false, non-zero = true
#define SHELF_FALSE 0
#define SHELF_TRUE  1

/* ============================================================================
 * Enumerations
 * ============================================================================ */

typedef enum ShelfOperationKind {
    SHELF_OP_PATH_EXISTS = 0,
    SHELF_OP_GET_FILE_INFO = 1,
    SHELF_OP_READ_DIRECTORY = 2,
    SHELF_OP_CREATE_DIRECTORY = 3,
    SHELF_OP_DELETE = 4,
    SHELF_OP_COPY = 5,
    SHELF_OP_MOVE = 6,
    SHELF_OP_GET_FILE_SIZE = 7,
    SHELF_OP_GET_MODIFIED_TIME = 8,
    SHELF_OP_BATCH = 9
} ShelfOperationKind;

typedef enum ShelfResultKind {
    SHELF_RESULT_SUCCESS = 0,
    SHELF_RESULT_ERROR = 1,
    SHELF_RESULT_TIMEOUT = 2,
    SHELF_RESULT_CANCELLED = 3
} ShelfResultKind;

typedef enum ShelfFileError {
    SHELF_FILE_ERROR_NONE = 0,
    SHELF_FILE_ERROR_FILE_NOT_FOUND,
    SHELF_FILE_ERROR_ACCESS_DENIED,
    SHELF_FILE_ERROR_DISK_FULL,
    SHELF_FILE_ERROR_INVALID_PATH,
    SHELF_FILE_ERROR_ALREADY_EXISTS,
    SHELF_FILE_ERROR_IO_ERROR,
    SHELF_FILE_ERROR_UNKNOWN
} ShelfFileError;

typedef enum ShelfCancelOutcome {
    SHELF_CANCEL_REMOVED_PENDING = 0,
    SHELF_CANCEL_CANCELLED_RUNNING = 1,
    SHELF_CANCEL_ALREADY_FINISHED = 2,
    SHELF_CANCEL_NOT_FOUND = 3
} ShelfCancelOutcome;

/* ============================================================================
 * Structures
 * ============================================================================ */

/**
 * @brief Metadata of one filesystem entry
 *
 * String members are borrowed from the owning shelf_Result.
 */
typedef struct ShelfFileInfo {
    const char* path;
    const char* name;
    const char* extension;       /**< Without the dot; NULL when the name has none */
    uint64_t size;
    ShelfBool is_directory;
    ShelfBool is_regular_file;
    ShelfBool is_symlink;
    ShelfBool readonly;
    ShelfBool has_last_modified;
    int64_t last_modified_ms;    /**< Milliseconds since the Unix epoch */
    ShelfBool has_created;
    int64_t created_ms;          /**< Milliseconds since the Unix epoch */
} ShelfFileInfo;

/* ============================================================================
 * Opaque types
 * ============================================================================ */

typedef struct shelf_OperationManager_t* shelf_OperationManager;
typedef struct shelf_Operation_t* shelf_Operation;
typedef struct shelf_TaskHandle_t* shelf_TaskHandle;
typedef struct shelf_Result_t* shelf_Result;

/**
 * @brief Static description of a status code
 * @return Borrowed static string - do NOT free
 */
SHELF_API const char* shelf_status_to_string(ShelfStatus status);

#ifdef __cplusplus
} // extern "C"
#endif
