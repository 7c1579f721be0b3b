/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#pragma once
#include "IFileSystemBackend.h"
#include <filesystem>

namespace Shelf::Core::IO {

/**
 * @brief IFileSystemBackend over the local disk via std::filesystem
 *
 * Stateless apart from its immutable Config, so one instance can serve any
 * number of worker threads at once.
 */
class LocalFileSystemBackend : public IFileSystemBackend {
public:
    struct Config {
        bool includeHidden;   // list dot-files (Unix) / hidden files (Windows)
        bool followSymlinks;  // metadata describes the link target
        bool sortByName;      // listings come back in name order

        Config()
            : includeHidden(true)
            , followSymlinks(true)
            , sortByName(true) {}
    };

    explicit LocalFileSystemBackend(Config cfg = {});

    IoResult<bool> pathExists(const std::string& path) override;
    IoResult<FileInfo> getFileInfo(const std::string& path) override;
    IoResult<std::vector<FileInfo>> readDirectory(const std::string& path) override;
    IoResult<bool> createDirectory(const std::string& path) override;
    IoResult<bool> remove(const std::string& path) override;
    IoResult<bool> copy(const std::string& src, const std::string& dst) override;
    IoResult<bool> move(const std::string& src, const std::string& dst) override;
    IoResult<uint64_t> fileSize(const std::string& path) override;
    IoResult<std::chrono::system_clock::time_point> modifiedTime(const std::string& path) override;

    std::string getBackendType() const override { return "Local"; }

    const Config& config() const noexcept { return _cfg; }

private:
    IoResult<FileInfo> buildInfo(const std::filesystem::path& p) const;
    IoResult<bool> copyTree(const std::filesystem::path& src, const std::filesystem::path& dst) const;

    Config _cfg;
};

} // namespace Shelf::Core::IO
