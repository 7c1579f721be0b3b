/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

/**
 * @file IFileSystemBackend.h
 * @brief Blocking filesystem primitives used by the async operation manager
 *
 * Each method maps onto exactly one operation kind. Implementations are called
 * concurrently from several worker threads and must not share mutable state
 * between calls. Failures are returned, never thrown.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "FileTypes.h"

namespace Shelf::Core::IO {

class IFileSystemBackend {
public:
    virtual ~IFileSystemBackend() = default;

    /**
     * @brief Checks existence of a path
     * @return true if the path can be stat'ed, false otherwise. Never fails.
     */
    virtual IoResult<bool> pathExists(const std::string& path) = 0;

    /**
     * @brief Retrieves metadata for a single path
     * @note Fails with FileError::FileNotFound when the path is missing.
     */
    virtual IoResult<FileInfo> getFileInfo(const std::string& path) = 0;

    /**
     * @brief Lists the direct children of a directory
     *
     * Entries whose metadata cannot be read are skipped rather than failing
     * the whole listing.
     */
    virtual IoResult<std::vector<FileInfo>> readDirectory(const std::string& path) = 0;

    /**
     * @brief Creates a directory and all missing parents (like `mkdir -p`)
     * @note Succeeds if the directory already exists.
     */
    virtual IoResult<bool> createDirectory(const std::string& path) = 0;

    /**
     * @brief Deletes a file, symlink or directory tree
     *
     * Regular files and symlinks are unlinked (a symlink's target is left alone),
     * directories are removed recursively.
     * @note Fails with FileError::FileNotFound when nothing exists at path.
     */
    virtual IoResult<bool> remove(const std::string& path) = 0;

    /**
     * @brief Copies a file or directory tree
     *
     * A file source creates dst's parent directories and overwrites dst.
     * A directory source creates dst and copies every child recursively.
     */
    virtual IoResult<bool> copy(const std::string& src, const std::string& dst) = 0;

    /**
     * @brief Moves a file or directory
     *
     * Renames when possible; across filesystems falls back to copy then delete.
     */
    virtual IoResult<bool> move(const std::string& src, const std::string& dst) = 0;

    /**
     * @brief Size in bytes as reported by the entry's metadata
     */
    virtual IoResult<uint64_t> fileSize(const std::string& path) = 0;

    /**
     * @brief Last modification time of the entry
     */
    virtual IoResult<std::chrono::system_clock::time_point> modifiedTime(const std::string& path) = 0;

    virtual std::string getBackendType() const = 0;
};

} // namespace Shelf::Core::IO
