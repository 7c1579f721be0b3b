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
 * @file shelf_async_operations.h
 * @brief C API for the async filesystem operation manager
 *
 * Typical flow:
 * @code
 * ShelfStatus st = SHELF_OK;
 * shelf_OperationManager mgr = shelf_operation_manager_create(0, -1, &st);
 * shelf_operation_manager_start(mgr, &st);
 *
 * shelf_Operation op = shelf_operation_get_file_size("/tmp/a.pdf", &st);
 * shelf_TaskHandle task = shelf_operation_manager_submit(mgr, op, 2000, &st);
 * shelf_operation_destroy(op);
 *
 * shelf_Result r = shelf_task_handle_wait(task, &st);
 * if (shelf_result_kind(r, &st) == SHELF_RESULT_SUCCESS) {
 *     uint64_t bytes = 0;
 *     shelf_result_get_size(r, &bytes, &st);
 * }
 * shelf_result_destroy(r);
 * shelf_task_handle_destroy(task);
 * shelf_operation_manager_destroy(mgr);
 * @endcode
 */

#include "shelf/shelf_types.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Manager Lifecycle
 * ============================================================================ */

/**
 * @brief Create a manager over the local filesystem
 *
 * @param worker_count Worker threads; 0 selects the hardware default
 * @param default_timeout_ms Timeout for submissions without one; negative for none
 * @param status Error reporting (required)
 * @return Owned manager or NULL on error
 * @ownership Must call shelf_operation_manager_destroy()
 */
SHELF_API shelf_OperationManager shelf_operation_manager_create(
    uint32_t worker_count,
    int64_t default_timeout_ms,
    ShelfStatus* status
);

/**
 * @brief Create a manager configured from SHELF_ASYNC_* environment variables
 */
SHELF_API shelf_OperationManager shelf_operation_manager_create_from_env(ShelfStatus* status);

SHELF_API void shelf_operation_manager_start(shelf_OperationManager manager, ShelfStatus* status);

/**
 * @brief Stop the manager: outstanding tasks resolve as Cancelled
 *
 * Handles remain usable after stop and after destroy.
 */
SHELF_API void shelf_operation_manager_stop(shelf_OperationManager manager, ShelfStatus* status);

/**
 * @brief Stop (if needed) and destroy the manager
 * @param manager Manager to destroy (can be NULL)
 */
SHELF_API void shelf_operation_manager_destroy(shelf_OperationManager manager);

SHELF_API size_t shelf_operation_manager_cancel_all(shelf_OperationManager manager, ShelfStatus* status);

SHELF_API size_t shelf_operation_manager_active_task_count(shelf_OperationManager manager, ShelfStatus* status);

/**
 * @brief Submit an operation
 *
 * The operation is copied; the caller keeps ownership of op.
 *
 * @param timeout_ms Bound on submit-to-result time; negative for the manager default
 * @return Owned task handle or NULL on error (SHELF_ERR_UNAVAILABLE after stop)
 * @ownership Must call shelf_task_handle_destroy()
 */
SHELF_API shelf_TaskHandle shelf_operation_manager_submit(
    shelf_OperationManager manager,
    shelf_Operation op,
    int64_t timeout_ms,
    ShelfStatus* status
);

/* ============================================================================
 * Operations
 * ============================================================================ */

SHELF_API shelf_Operation shelf_operation_path_exists(const char* path, ShelfStatus* status);
SHELF_API shelf_Operation shelf_operation_get_file_info(const char* path, ShelfStatus* status);
SHELF_API shelf_Operation shelf_operation_read_directory(const char* path, ShelfStatus* status);
SHELF_API shelf_Operation shelf_operation_create_directory(const char* path, ShelfStatus* status);
SHELF_API shelf_Operation shelf_operation_delete(const char* path, ShelfStatus* status);
SHELF_API shelf_Operation shelf_operation_copy(const char* src, const char* dst, ShelfStatus* status);
SHELF_API shelf_Operation shelf_operation_move(const char* src, const char* dst, ShelfStatus* status);
SHELF_API shelf_Operation shelf_operation_get_file_size(const char* path, ShelfStatus* status);
SHELF_API shelf_Operation shelf_operation_get_modified_time(const char* path, ShelfStatus* status);

/**
 * @brief Create an empty batch; fill it with shelf_operation_batch_append()
 */
SHELF_API shelf_Operation shelf_operation_batch_create(ShelfStatus* status);

/**
 * @brief Append a copy of item to batch
 * @note SHELF_ERR_TYPE_MISMATCH if batch is not a batch operation
 */
SHELF_API void shelf_operation_batch_append(shelf_Operation batch, shelf_Operation item, ShelfStatus* status);

SHELF_API ShelfOperationKind shelf_operation_kind(shelf_Operation op, ShelfStatus* status);

/**
 * @param op Operation to destroy (can be NULL)
 */
SHELF_API void shelf_operation_destroy(shelf_Operation op);

/* ============================================================================
 * Task Handles
 * ============================================================================ */

/**
 * @brief Block until the task is terminal
 * @return Owned result; must call shelf_result_destroy()
 */
SHELF_API shelf_Result shelf_task_handle_wait(shelf_TaskHandle handle, ShelfStatus* status);

/**
 * @brief Block up to timeout_ms
 * @return Owned result, or NULL with SHELF_OK if the task is still running
 */
SHELF_API shelf_Result shelf_task_handle_wait_for(shelf_TaskHandle handle, int64_t timeout_ms, ShelfStatus* status);

/**
 * @brief Non-blocking check
 * @return Owned result, or NULL with SHELF_OK while pending or running
 */
SHELF_API shelf_Result shelf_task_handle_poll(shelf_TaskHandle handle, ShelfStatus* status);

/**
 * @brief Request cancellation; idempotent
 */
SHELF_API ShelfCancelOutcome shelf_task_handle_cancel(shelf_TaskHandle handle, ShelfStatus* status);

SHELF_API ShelfBool shelf_task_handle_is_running(shelf_TaskHandle handle, ShelfStatus* status);

SHELF_API uint64_t shelf_task_handle_id(shelf_TaskHandle handle, ShelfStatus* status);

/**
 * @brief Second handle to the same task
 * @ownership Must call shelf_task_handle_destroy() on the clone as well
 */
SHELF_API shelf_TaskHandle shelf_task_handle_clone(shelf_TaskHandle handle, ShelfStatus* status);

/**
 * @brief Release the handle; does not cancel the task
 * @param handle Handle to destroy (can be NULL)
 */
SHELF_API void shelf_task_handle_destroy(shelf_TaskHandle handle);

/* ============================================================================
 * Results
 * ============================================================================ */

SHELF_API ShelfResultKind shelf_result_kind(shelf_Result result, ShelfStatus* status);

/**
 * @return Borrowed error message (empty string unless Error), valid until the result is destroyed
 */
SHELF_API const char* shelf_result_message(shelf_Result result, ShelfStatus* status);

SHELF_API ShelfFileError shelf_result_error_code(shelf_Result result, ShelfStatus* status);

/*
 * Typed accessors. Each reports SHELF_ERR_TYPE_MISMATCH when the result is not
 * a Success of the requested shape.
 */
SHELF_API void shelf_result_get_bool(shelf_Result result, ShelfBool* out_value, ShelfStatus* status);
SHELF_API void shelf_result_get_size(shelf_Result result, uint64_t* out_value, ShelfStatus* status);
SHELF_API void shelf_result_get_time_ms(shelf_Result result, int64_t* out_ms, ShelfStatus* status);

/**
 * @return Borrowed file info, valid until the result is destroyed
 */
SHELF_API const ShelfFileInfo* shelf_result_get_file_info(shelf_Result result, ShelfStatus* status);

SHELF_API size_t shelf_result_entry_count(shelf_Result result, ShelfStatus* status);

/**
 * @return Borrowed entry, valid until the result is destroyed
 */
SHELF_API const ShelfFileInfo* shelf_result_entry_at(shelf_Result result, size_t index, ShelfStatus* status);

SHELF_API size_t shelf_result_batch_count(shelf_Result result, ShelfStatus* status);

/**
 * @return Borrowed item result, valid until the parent result is destroyed - do NOT destroy
 */
SHELF_API shelf_Result shelf_result_batch_item(shelf_Result result, size_t index, ShelfStatus* status);

/**
 * @param result Owned result to destroy (can be NULL)
 */
SHELF_API void shelf_result_destroy(shelf_Result result);

#ifdef __cplusplus
} // extern "C"
#endif
