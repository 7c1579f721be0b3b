/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

/**
 * @file shelf_async_operations_c.cpp
 * @brief Implementation of the async operation manager C API
 */

#include "shelf/shelf_async_operations.h"
#include "AsyncOperations/AsyncOperationManager.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Shelf::Core;
using namespace Shelf::Core::Async;

/* ============================================================================
 * Wrappers
 * ============================================================================ */

struct ManagerWrapper {
    std::unique_ptr<AsyncOperationManager> manager;
};

// A batch stays mutable until it is submitted, so items are kept as a list
struct OperationWrapper {
    std::optional<Operation> single;
    std::vector<Operation> batchItems;
    bool isBatch = false;

    Operation build() const {
        return isBatch ? Operation::batch(batchItems) : *single;
    }
};

struct HandleWrapper {
    TaskHandle handle;
    std::mutex mutex;  // TaskHandle caches on poll/wait and is not thread-safe on its own

    explicit HandleWrapper(TaskHandle&& h)
        : handle(std::move(h)) {}
};

// C views of a result are built lazily and live as long as the wrapper
struct ResultWrapper {
    OperationResult result;

    std::mutex mutex;
    bool infoCached = false;
    ShelfFileInfo info{};
    bool entriesCached = false;
    std::vector<ShelfFileInfo> entries;
    bool itemsCached = false;
    std::vector<std::unique_ptr<ResultWrapper>> items;

    explicit ResultWrapper(OperationResult r)
        : result(std::move(r)) {}
};

/* ============================================================================
 * Exception Translation
 * ============================================================================ */

static void translate_exception(ShelfStatus* status) {
    try {
        throw;
    } catch (const std::bad_alloc&) {
        if (status) *status = SHELF_ERR_NO_MEMORY;
    } catch (const std::invalid_argument&) {
        if (status) *status = SHELF_ERR_INVALID_ARG;
    } catch (const std::logic_error&) {
        if (status) *status = SHELF_ERR_INVALID_STATE;
    } catch (const std::runtime_error&) {
        if (status) *status = SHELF_ERR_UNAVAILABLE;
    } catch (...) {
        if (status) *status = SHELF_ERR_UNKNOWN;
    }
}

/* ============================================================================
 * Type Conversions
 * ============================================================================ */

static ShelfFileError to_c_error(IO::FileError e) {
    switch (e) {
        case IO::FileError::None:          return SHELF_FILE_ERROR_NONE;
        case IO::FileError::FileNotFound:  return SHELF_FILE_ERROR_FILE_NOT_FOUND;
        case IO::FileError::AccessDenied:  return SHELF_FILE_ERROR_ACCESS_DENIED;
        case IO::FileError::DiskFull:      return SHELF_FILE_ERROR_DISK_FULL;
        case IO::FileError::InvalidPath:   return SHELF_FILE_ERROR_INVALID_PATH;
        case IO::FileError::AlreadyExists: return SHELF_FILE_ERROR_ALREADY_EXISTS;
        case IO::FileError::IOError:       return SHELF_FILE_ERROR_IO_ERROR;
        case IO::FileError::Unknown:       return SHELF_FILE_ERROR_UNKNOWN;
    }
    return SHELF_FILE_ERROR_UNKNOWN;
}

static ShelfResultKind to_c_kind(ResultKind k) {
    switch (k) {
        case ResultKind::Success:   return SHELF_RESULT_SUCCESS;
        case ResultKind::Error:     return SHELF_RESULT_ERROR;
        case ResultKind::Timeout:   return SHELF_RESULT_TIMEOUT;
        case ResultKind::Cancelled: return SHELF_RESULT_CANCELLED;
    }
    return SHELF_RESULT_ERROR;
}

static ShelfCancelOutcome to_c_outcome(CancelOutcome o) {
    switch (o) {
        case CancelOutcome::RemovedPending:   return SHELF_CANCEL_REMOVED_PENDING;
        case CancelOutcome::CancelledRunning: return SHELF_CANCEL_CANCELLED_RUNNING;
        case CancelOutcome::AlreadyFinished:  return SHELF_CANCEL_ALREADY_FINISHED;
        case CancelOutcome::NotFound:         return SHELF_CANCEL_NOT_FOUND;
    }
    return SHELF_CANCEL_NOT_FOUND;
}

static int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

// Strings point into src, which must outlive dst
static void fill_file_info(ShelfFileInfo& dst, const IO::FileInfo& src) {
    dst.path = src.path.c_str();
    dst.name = src.name.c_str();
    dst.extension = src.extension ? src.extension->c_str() : nullptr;
    dst.size = src.size;
    dst.is_directory = src.isDirectory ? SHELF_TRUE : SHELF_FALSE;
    dst.is_regular_file = src.isRegularFile ? SHELF_TRUE : SHELF_FALSE;
    dst.is_symlink = src.isSymlink ? SHELF_TRUE : SHELF_FALSE;
    dst.readonly = src.readonly ? SHELF_TRUE : SHELF_FALSE;
    dst.has_last_modified = src.lastModified ? SHELF_TRUE : SHELF_FALSE;
    dst.last_modified_ms = src.lastModified ? to_epoch_ms(*src.lastModified) : -1;
    dst.has_created = src.created ? SHELF_TRUE : SHELF_FALSE;
    dst.created_ms = src.created ? to_epoch_ms(*src.created) : -1;
}

static shelf_Result wrap_result(std::optional<OperationResult> r, ShelfStatus* status) {
    if (!r) {
        *status = SHELF_OK;
        return nullptr;
    }
    auto* wrapper = new(std::nothrow) ResultWrapper(std::move(*r));
    if (!wrapper) {
        *status = SHELF_ERR_NO_MEMORY;
        return nullptr;
    }
    *status = SHELF_OK;
    return reinterpret_cast<shelf_Result>(wrapper);
}

static shelf_Operation make_operation(Operation op, ShelfStatus* status) {
    auto* wrapper = new(std::nothrow) OperationWrapper();
    if (!wrapper) {
        *status = SHELF_ERR_NO_MEMORY;
        return nullptr;
    }
    wrapper->single = std::move(op);
    *status = SHELF_OK;
    return reinterpret_cast<shelf_Operation>(wrapper);
}

/* ============================================================================
 * Implementation
 * ============================================================================ */

extern "C" {

const char* shelf_status_to_string(ShelfStatus status) {
    switch (status) {
        case SHELF_OK:                return "OK";
        case SHELF_ERR_UNKNOWN:       return "Unknown error";
        case SHELF_ERR_INVALID_ARG:   return "Invalid argument";
        case SHELF_ERR_NOT_FOUND:     return "Not found";
        case SHELF_ERR_TYPE_MISMATCH: return "Type mismatch";
        case SHELF_ERR_NO_MEMORY:     return "Out of memory";
        case SHELF_ERR_UNAVAILABLE:   return "Unavailable";
        case SHELF_ERR_INVALID_STATE: return "Invalid state";
    }
    return "Unrecognized status";
}

/* ---------------------------------------------------------------------------
 * Manager
 * ------------------------------------------------------------------------- */

static shelf_OperationManager create_manager(AsyncOperationManager::Config cfg, ShelfStatus* status) {
    try {
        auto* wrapper = new(std::nothrow) ManagerWrapper();
        if (!wrapper) {
            *status = SHELF_ERR_NO_MEMORY;
            return nullptr;
        }
        try {
            wrapper->manager = std::make_unique<AsyncOperationManager>(std::move(cfg));
        } catch (...) {
            delete wrapper;
            throw;
        }
        *status = SHELF_OK;
        return reinterpret_cast<shelf_OperationManager>(wrapper);
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

shelf_OperationManager shelf_operation_manager_create(
    uint32_t worker_count,
    int64_t default_timeout_ms,
    ShelfStatus* status
) {
    if (!status) return nullptr;
    AsyncOperationManager::Config cfg;
    cfg.workerCount = worker_count;
    if (default_timeout_ms >= 0) {
        cfg.defaultTimeout = std::chrono::milliseconds(default_timeout_ms);
    }
    return create_manager(std::move(cfg), status);
}

shelf_OperationManager shelf_operation_manager_create_from_env(ShelfStatus* status) {
    if (!status) return nullptr;
    try {
        return create_manager(AsyncOperationManager::Config::fromEnvironment(), status);
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

void shelf_operation_manager_start(shelf_OperationManager manager, ShelfStatus* status) {
    if (!status) return;
    if (!manager) {
        *status = SHELF_ERR_INVALID_ARG;
        return;
    }
    try {
        reinterpret_cast<ManagerWrapper*>(manager)->manager->start();
        *status = SHELF_OK;
    } catch (...) {
        translate_exception(status);
    }
}

void shelf_operation_manager_stop(shelf_OperationManager manager, ShelfStatus* status) {
    if (!status) return;
    if (!manager) {
        *status = SHELF_ERR_INVALID_ARG;
        return;
    }
    try {
        reinterpret_cast<ManagerWrapper*>(manager)->manager->stop();
        *status = SHELF_OK;
    } catch (...) {
        translate_exception(status);
    }
}

void shelf_operation_manager_destroy(shelf_OperationManager manager) {
    if (!manager) return;
    delete reinterpret_cast<ManagerWrapper*>(manager);
}

size_t shelf_operation_manager_cancel_all(shelf_OperationManager manager, ShelfStatus* status) {
    if (!status) return 0;
    if (!manager) {
        *status = SHELF_ERR_INVALID_ARG;
        return 0;
    }
    try {
        size_t n = reinterpret_cast<ManagerWrapper*>(manager)->manager->cancelAll();
        *status = SHELF_OK;
        return n;
    } catch (...) {
        translate_exception(status);
        return 0;
    }
}

size_t shelf_operation_manager_active_task_count(shelf_OperationManager manager, ShelfStatus* status) {
    if (!status) return 0;
    if (!manager) {
        *status = SHELF_ERR_INVALID_ARG;
        return 0;
    }
    try {
        size_t n = reinterpret_cast<ManagerWrapper*>(manager)->manager->activeTaskCount();
        *status = SHELF_OK;
        return n;
    } catch (...) {
        translate_exception(status);
        return 0;
    }
}

shelf_TaskHandle shelf_operation_manager_submit(
    shelf_OperationManager manager,
    shelf_Operation op,
    int64_t timeout_ms,
    ShelfStatus* status
) {
    if (!status) return nullptr;
    if (!manager || !op) {
        *status = SHELF_ERR_INVALID_ARG;
        return nullptr;
    }
    try {
        auto* mgr = reinterpret_cast<ManagerWrapper*>(manager)->manager.get();
        auto* opw = reinterpret_cast<OperationWrapper*>(op);
        std::optional<std::chrono::milliseconds> timeout;
        if (timeout_ms >= 0) {
            timeout = std::chrono::milliseconds(timeout_ms);
        }
        auto* wrapper = new HandleWrapper(mgr->submit(opw->build(), timeout));
        *status = SHELF_OK;
        return reinterpret_cast<shelf_TaskHandle>(wrapper);
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

/* ---------------------------------------------------------------------------
 * Operations
 * ------------------------------------------------------------------------- */

#define SHELF_DEFINE_PATH_OPERATION(cname, factory)                      \
    shelf_Operation cname(const char* path, ShelfStatus* status) {       \
        if (!status) return nullptr;                                     \
        if (!path) {                                                     \
            *status = SHELF_ERR_INVALID_ARG;                             \
            return nullptr;                                              \
        }                                                                \
        try {                                                            \
            return make_operation(Operation::factory(path), status);     \
        } catch (...) {                                                  \
            translate_exception(status);                                 \
            return nullptr;                                              \
        }                                                                \
    }

SHELF_DEFINE_PATH_OPERATION(shelf_operation_path_exists, pathExists)
SHELF_DEFINE_PATH_OPERATION(shelf_operation_get_file_info, getFileInfo)
SHELF_DEFINE_PATH_OPERATION(shelf_operation_read_directory, readDirectory)
SHELF_DEFINE_PATH_OPERATION(shelf_operation_create_directory, createDirectory)
SHELF_DEFINE_PATH_OPERATION(shelf_operation_delete, deletePath)
SHELF_DEFINE_PATH_OPERATION(shelf_operation_get_file_size, getFileSize)
SHELF_DEFINE_PATH_OPERATION(shelf_operation_get_modified_time, getModifiedTime)

#undef SHELF_DEFINE_PATH_OPERATION

shelf_Operation shelf_operation_copy(const char* src, const char* dst, ShelfStatus* status) {
    if (!status) return nullptr;
    if (!src || !dst) {
        *status = SHELF_ERR_INVALID_ARG;
        return nullptr;
    }
    try {
        return make_operation(Operation::copy(src, dst), status);
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

shelf_Operation shelf_operation_move(const char* src, const char* dst, ShelfStatus* status) {
    if (!status) return nullptr;
    if (!src || !dst) {
        *status = SHELF_ERR_INVALID_ARG;
        return nullptr;
    }
    try {
        return make_operation(Operation::move(src, dst), status);
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

shelf_Operation shelf_operation_batch_create(ShelfStatus* status) {
    if (!status) return nullptr;
    auto* wrapper = new(std::nothrow) OperationWrapper();
    if (!wrapper) {
        *status = SHELF_ERR_NO_MEMORY;
        return nullptr;
    }
    wrapper->isBatch = true;
    *status = SHELF_OK;
    return reinterpret_cast<shelf_Operation>(wrapper);
}

void shelf_operation_batch_append(shelf_Operation batch, shelf_Operation item, ShelfStatus* status) {
    if (!status) return;
    if (!batch || !item || batch == item) {
        *status = SHELF_ERR_INVALID_ARG;
        return;
    }
    auto* b = reinterpret_cast<OperationWrapper*>(batch);
    if (!b->isBatch) {
        *status = SHELF_ERR_TYPE_MISMATCH;
        return;
    }
    try {
        b->batchItems.push_back(reinterpret_cast<OperationWrapper*>(item)->build());
        *status = SHELF_OK;
    } catch (...) {
        translate_exception(status);
    }
}

ShelfOperationKind shelf_operation_kind(shelf_Operation op, ShelfStatus* status) {
    if (!status) return SHELF_OP_PATH_EXISTS;
    if (!op) {
        *status = SHELF_ERR_INVALID_ARG;
        return SHELF_OP_PATH_EXISTS;
    }
    auto* w = reinterpret_cast<OperationWrapper*>(op);
    *status = SHELF_OK;
    if (w->isBatch) return SHELF_OP_BATCH;
    return static_cast<ShelfOperationKind>(w->single->kind());
}

void shelf_operation_destroy(shelf_Operation op) {
    if (!op) return;
    delete reinterpret_cast<OperationWrapper*>(op);
}

/* ---------------------------------------------------------------------------
 * Task handles
 * ------------------------------------------------------------------------- */

shelf_Result shelf_task_handle_wait(shelf_TaskHandle handle, ShelfStatus* status) {
    if (!status) return nullptr;
    if (!handle) {
        *status = SHELF_ERR_INVALID_ARG;
        return nullptr;
    }
    try {
        auto* w = reinterpret_cast<HandleWrapper*>(handle);
        std::lock_guard<std::mutex> lock(w->mutex);
        return wrap_result(w->handle.wait(), status);
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

shelf_Result shelf_task_handle_wait_for(shelf_TaskHandle handle, int64_t timeout_ms, ShelfStatus* status) {
    if (!status) return nullptr;
    if (!handle || timeout_ms < 0) {
        *status = SHELF_ERR_INVALID_ARG;
        return nullptr;
    }
    try {
        auto* w = reinterpret_cast<HandleWrapper*>(handle);
        std::lock_guard<std::mutex> lock(w->mutex);
        return wrap_result(w->handle.waitFor(std::chrono::milliseconds(timeout_ms)), status);
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

shelf_Result shelf_task_handle_poll(shelf_TaskHandle handle, ShelfStatus* status) {
    if (!status) return nullptr;
    if (!handle) {
        *status = SHELF_ERR_INVALID_ARG;
        return nullptr;
    }
    try {
        auto* w = reinterpret_cast<HandleWrapper*>(handle);
        std::lock_guard<std::mutex> lock(w->mutex);
        return wrap_result(w->handle.poll(), status);
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

ShelfCancelOutcome shelf_task_handle_cancel(shelf_TaskHandle handle, ShelfStatus* status) {
    if (!status) return SHELF_CANCEL_NOT_FOUND;
    if (!handle) {
        *status = SHELF_ERR_INVALID_ARG;
        return SHELF_CANCEL_NOT_FOUND;
    }
    try {
        auto* w = reinterpret_cast<HandleWrapper*>(handle);
        std::lock_guard<std::mutex> lock(w->mutex);
        auto outcome = w->handle.cancel();
        *status = SHELF_OK;
        return to_c_outcome(outcome);
    } catch (...) {
        translate_exception(status);
        return SHELF_CANCEL_NOT_FOUND;
    }
}

ShelfBool shelf_task_handle_is_running(shelf_TaskHandle handle, ShelfStatus* status) {
    if (!status) return SHELF_FALSE;
    if (!handle) {
        *status = SHELF_ERR_INVALID_ARG;
        return SHELF_FALSE;
    }
    try {
        auto* w = reinterpret_cast<HandleWrapper*>(handle);
        std::lock_guard<std::mutex> lock(w->mutex);
        bool running = w->handle.isRunning();
        *status = SHELF_OK;
        return running ? SHELF_TRUE : SHELF_FALSE;
    } catch (...) {
        translate_exception(status);
        return SHELF_FALSE;
    }
}

uint64_t shelf_task_handle_id(shelf_TaskHandle handle, ShelfStatus* status) {
    if (!status) return 0;
    if (!handle) {
        *status = SHELF_ERR_INVALID_ARG;
        return 0;
    }
    *status = SHELF_OK;
    return reinterpret_cast<HandleWrapper*>(handle)->handle.id();
}

shelf_TaskHandle shelf_task_handle_clone(shelf_TaskHandle handle, ShelfStatus* status) {
    if (!status) return nullptr;
    if (!handle) {
        *status = SHELF_ERR_INVALID_ARG;
        return nullptr;
    }
    try {
        auto* w = reinterpret_cast<HandleWrapper*>(handle);
        std::lock_guard<std::mutex> lock(w->mutex);
        auto* clone = new HandleWrapper(w->handle.clone());
        *status = SHELF_OK;
        return reinterpret_cast<shelf_TaskHandle>(clone);
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

void shelf_task_handle_destroy(shelf_TaskHandle handle) {
    if (!handle) return;
    delete reinterpret_cast<HandleWrapper*>(handle);
}

/* ---------------------------------------------------------------------------
 * Results
 * ------------------------------------------------------------------------- */

ShelfResultKind shelf_result_kind(shelf_Result result, ShelfStatus* status) {
    if (!status) return SHELF_RESULT_ERROR;
    if (!result) {
        *status = SHELF_ERR_INVALID_ARG;
        return SHELF_RESULT_ERROR;
    }
    *status = SHELF_OK;
    return to_c_kind(reinterpret_cast<ResultWrapper*>(result)->result.kind());
}

const char* shelf_result_message(shelf_Result result, ShelfStatus* status) {
    if (!status) return nullptr;
    if (!result) {
        *status = SHELF_ERR_INVALID_ARG;
        return nullptr;
    }
    *status = SHELF_OK;
    return reinterpret_cast<ResultWrapper*>(result)->result.message().c_str();
}

ShelfFileError shelf_result_error_code(shelf_Result result, ShelfStatus* status) {
    if (!status) return SHELF_FILE_ERROR_UNKNOWN;
    if (!result) {
        *status = SHELF_ERR_INVALID_ARG;
        return SHELF_FILE_ERROR_UNKNOWN;
    }
    *status = SHELF_OK;
    return to_c_error(reinterpret_cast<ResultWrapper*>(result)->result.errorCode());
}

void shelf_result_get_bool(shelf_Result result, ShelfBool* out_value, ShelfStatus* status) {
    if (!status) return;
    if (!result || !out_value) {
        *status = SHELF_ERR_INVALID_ARG;
        return;
    }
    const bool* v = reinterpret_cast<ResultWrapper*>(result)->result.asBool();
    if (!v) {
        *status = SHELF_ERR_TYPE_MISMATCH;
        return;
    }
    *out_value = *v ? SHELF_TRUE : SHELF_FALSE;
    *status = SHELF_OK;
}

void shelf_result_get_size(shelf_Result result, uint64_t* out_value, ShelfStatus* status) {
    if (!status) return;
    if (!result || !out_value) {
        *status = SHELF_ERR_INVALID_ARG;
        return;
    }
    const uint64_t* v = reinterpret_cast<ResultWrapper*>(result)->result.asSize();
    if (!v) {
        *status = SHELF_ERR_TYPE_MISMATCH;
        return;
    }
    *out_value = *v;
    *status = SHELF_OK;
}

void shelf_result_get_time_ms(shelf_Result result, int64_t* out_ms, ShelfStatus* status) {
    if (!status) return;
    if (!result || !out_ms) {
        *status = SHELF_ERR_INVALID_ARG;
        return;
    }
    const auto* v = reinterpret_cast<ResultWrapper*>(result)->result.asTime();
    if (!v) {
        *status = SHELF_ERR_TYPE_MISMATCH;
        return;
    }
    *out_ms = to_epoch_ms(*v);
    *status = SHELF_OK;
}

const ShelfFileInfo* shelf_result_get_file_info(shelf_Result result, ShelfStatus* status) {
    if (!status) return nullptr;
    if (!result) {
        *status = SHELF_ERR_INVALID_ARG;
        return nullptr;
    }
    auto* w = reinterpret_cast<ResultWrapper*>(result);
    const auto* info = w->result.asFileInfo();
    if (!info) {
        *status = SHELF_ERR_TYPE_MISMATCH;
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(w->mutex);
    if (!w->infoCached) {
        fill_file_info(w->info, *info);
        w->infoCached = true;
    }
    *status = SHELF_OK;
    return &w->info;
}

static const std::vector<ShelfFileInfo>* cached_entries(ResultWrapper& w, ShelfStatus* status) {
    const auto* entries = w.result.asEntries();
    if (!entries) {
        *status = SHELF_ERR_TYPE_MISMATCH;
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(w.mutex);
    if (!w.entriesCached) {
        w.entries.resize(entries->size());
        for (size_t i = 0; i < entries->size(); ++i) {
            fill_file_info(w.entries[i], (*entries)[i]);
        }
        w.entriesCached = true;
    }
    *status = SHELF_OK;
    return &w.entries;
}

size_t shelf_result_entry_count(shelf_Result result, ShelfStatus* status) {
    if (!status) return 0;
    if (!result) {
        *status = SHELF_ERR_INVALID_ARG;
        return 0;
    }
    try {
        const auto* entries = cached_entries(*reinterpret_cast<ResultWrapper*>(result), status);
        return entries ? entries->size() : 0;
    } catch (...) {
        translate_exception(status);
        return 0;
    }
}

const ShelfFileInfo* shelf_result_entry_at(shelf_Result result, size_t index, ShelfStatus* status) {
    if (!status) return nullptr;
    if (!result) {
        *status = SHELF_ERR_INVALID_ARG;
        return nullptr;
    }
    try {
        const auto* entries = cached_entries(*reinterpret_cast<ResultWrapper*>(result), status);
        if (!entries) return nullptr;
        if (index >= entries->size()) {
            *status = SHELF_ERR_NOT_FOUND;
            return nullptr;
        }
        return &(*entries)[index];
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

static const std::vector<std::unique_ptr<ResultWrapper>>* cached_items(ResultWrapper& w, ShelfStatus* status) {
    const auto* items = w.result.asBatch();
    if (!items) {
        *status = SHELF_ERR_TYPE_MISMATCH;
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(w.mutex);
    if (!w.itemsCached) {
        w.items.reserve(items->size());
        for (const auto& item : *items) {
            w.items.push_back(std::make_unique<ResultWrapper>(item));
        }
        w.itemsCached = true;
    }
    *status = SHELF_OK;
    return &w.items;
}

size_t shelf_result_batch_count(shelf_Result result, ShelfStatus* status) {
    if (!status) return 0;
    if (!result) {
        *status = SHELF_ERR_INVALID_ARG;
        return 0;
    }
    try {
        const auto* items = cached_items(*reinterpret_cast<ResultWrapper*>(result), status);
        return items ? items->size() : 0;
    } catch (...) {
        translate_exception(status);
        return 0;
    }
}

shelf_Result shelf_result_batch_item(shelf_Result result, size_t index, ShelfStatus* status) {
    if (!status) return nullptr;
    if (!result) {
        *status = SHELF_ERR_INVALID_ARG;
        return nullptr;
    }
    try {
        const auto* items = cached_items(*reinterpret_cast<ResultWrapper*>(result), status);
        if (!items) return nullptr;
        if (index >= items->size()) {
            *status = SHELF_ERR_NOT_FOUND;
            return nullptr;
        }
        return reinterpret_cast<shelf_Result>((*items)[index].get());
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

void shelf_result_destroy(shelf_Result result) {
    if (!result) return;
    delete reinterpret_cast<ResultWrapper*>(result);
}

} // extern "C"
