/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include "LocalFileSystemBackend.h"
#include "Logging/Logger.h"
#include <algorithm>
#include <cerrno>

#if defined(_WIN32)
#include <windows.h>
#endif

#if defined(__unix__) || defined(__APPLE__)
#include <fcntl.h>     // AT_FDCWD
#include <unistd.h>    // access()
#include <sys/stat.h>  // stat(), statx()
#endif

namespace fs = std::filesystem;

namespace Shelf::Core::IO {

namespace {
    // Map errno to FileError with platform-specific handling
    FileError mapErrnoToFileError(int err) {
        switch (err) {
            case ENOSPC:
#if defined(__unix__) || defined(__APPLE__)
            case EDQUOT:  // Disk quota exceeded (POSIX)
#endif
                return FileError::DiskFull;
            case EACCES:
            case EPERM:
            case EROFS:
                return FileError::AccessDenied;
            case ENOENT:
                return FileError::FileNotFound;
            case EEXIST:
            case ENOTEMPTY:
                return FileError::AlreadyExists;
            case EINVAL:
            case ENAMETOOLONG:
            case ENOTDIR:
#if defined(__unix__) || defined(__APPLE__)
            case EISDIR:
            case ELOOP:
#endif
                return FileError::InvalidPath;
            default:
                return FileError::IOError;
        }
    }

    FileError mapErrorCode(const std::error_code& ec, FileError fallback = FileError::IOError) {
        if (!ec) return fallback;
        const auto cond = ec.default_error_condition();
        if (cond.category() != std::generic_category()) return FileError::IOError;
        return mapErrnoToFileError(cond.value());
    }

    std::chrono::system_clock::time_point toSystemClock(fs::file_time_type lwt) {
        return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            lwt - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    }

    // Write permission for the current process rather than the mode bits
    bool processCanWrite(const fs::path& p) {
#if defined(__unix__) || defined(__APPLE__)
        return ::access(p.c_str(), W_OK) == 0;
#else
        std::error_code ec;
        auto st = fs::status(p, ec);
        if (ec) return false;
        return (st.permissions() & fs::perms::owner_write) != fs::perms::none;
#endif
    }

    std::optional<std::chrono::system_clock::time_point> birthTime(const fs::path& p) {
#if defined(__linux__) && defined(STATX_BTIME)
        struct statx stx {};
        if (::statx(AT_FDCWD, p.c_str(), 0, STATX_BTIME, &stx) == 0 && (stx.stx_mask & STATX_BTIME)) {
            auto since = std::chrono::seconds(stx.stx_btime.tv_sec) + std::chrono::nanoseconds(stx.stx_btime.tv_nsec);
            return std::chrono::system_clock::time_point(
                std::chrono::duration_cast<std::chrono::system_clock::duration>(since));
        }
        return std::nullopt;
#elif defined(__APPLE__)
        struct stat st {};
        if (::stat(p.c_str(), &st) == 0) {
            auto since = std::chrono::seconds(st.st_birthtimespec.tv_sec) + std::chrono::nanoseconds(st.st_birthtimespec.tv_nsec);
            return std::chrono::system_clock::time_point(
                std::chrono::duration_cast<std::chrono::system_clock::duration>(since));
        }
        return std::nullopt;
#else
        (void)p;
        return std::nullopt;
#endif
    }

    bool isHidden(const fs::path& p) {
#if defined(_WIN32)
        auto attrs = GetFileAttributesW(p.c_str());
        return attrs != INVALID_FILE_ATTRIBUTES && (attrs & FILE_ATTRIBUTE_HIDDEN);
#else
        auto name = p.filename().string();
        return !name.empty() && name[0] == '.';
#endif
    }

    // True when candidate equals root or lies below it
    bool isWithin(const fs::path& candidate, const fs::path& root) {
        std::error_code ec;
        auto c = fs::weakly_canonical(candidate, ec);
        if (ec) c = candidate.lexically_normal();
        auto r = fs::weakly_canonical(root, ec);
        if (ec) r = root.lexically_normal();
        auto ci = c.begin();
        for (const auto& part : r) {
            if (part.empty()) continue;  // trailing separator
            if (ci == c.end() || *ci != part) return false;
            ++ci;
        }
        return true;
    }
}

LocalFileSystemBackend::LocalFileSystemBackend(Config cfg)
    : _cfg(cfg) {
}

IoResult<FileInfo> LocalFileSystemBackend::buildInfo(const fs::path& p) const {
    std::error_code ec;
    auto status = _cfg.followSymlinks ? fs::status(p, ec) : fs::symlink_status(p, ec);
    if (ec || !fs::exists(status)) {
        return IoResult<FileInfo>::failure(mapErrorCode(ec, FileError::FileNotFound),
                                           "Failed to read file metadata", p.string(), ec ? std::optional(ec) : std::nullopt);
    }

    FileInfo info;
    info.path = p.string();
    info.name = p.filename().string();
    if (p.has_extension()) {
        auto ext = p.extension().string();
        info.extension = ext.substr(1);
    }
    info.isDirectory = fs::is_directory(status);
    info.isRegularFile = fs::is_regular_file(status);

    // Determine whether the path itself is a symlink (do not follow)
    std::error_code ssec;
    auto ss = fs::symlink_status(p, ssec);
    info.isSymlink = !ssec && fs::is_symlink(ss);

    if (info.isRegularFile) {
        info.size = fs::file_size(p, ec);
        if (ec) info.size = 0;
    }

    info.readonly = !processCanWrite(p);

    ec.clear();
    auto lwt = fs::last_write_time(p, ec);
    if (!ec) {
        info.lastModified = toSystemClock(lwt);
    }
    info.created = birthTime(p);
    return IoResult<FileInfo>::success(std::move(info));
}

IoResult<bool> LocalFileSystemBackend::pathExists(const std::string& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    return IoResult<bool>::success(!ec && fs::exists(status));
}

IoResult<FileInfo> LocalFileSystemBackend::getFileInfo(const std::string& path) {
    return buildInfo(fs::path(path));
}

IoResult<std::vector<FileInfo>> LocalFileSystemBackend::readDirectory(const std::string& path) {
    using Result = IoResult<std::vector<FileInfo>>;
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return Result::failure(mapErrorCode(ec, FileError::FileNotFound), "Directory not found", path,
                               ec ? std::optional(ec) : std::nullopt);
    }
    if (!fs::is_directory(status)) {
        return Result::failure(FileError::InvalidPath, "Not a directory", path);
    }

    std::vector<FileInfo> entries;
    fs::directory_iterator it(path, ec);
    if (ec) {
        return Result::failure(mapErrorCode(ec), "Cannot open directory", path, ec);
    }
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        const auto& entryPath = it->path();
        if (!_cfg.includeHidden && isHidden(entryPath)) continue;

        auto info = buildInfo(entryPath);
        if (!info) {
            // Dangling symlinks and entries removed mid-listing land here
            SHELF_LOG_WARNING_CAT("LocalFileSystemBackend",
                                  "Skipping entry " + entryPath.string() + ": " + info.error().describe());
            continue;
        }
        entries.push_back(std::move(info).value());
    }
    if (ec) {
        return Result::failure(mapErrorCode(ec), "Cannot iterate directory", path, ec);
    }

    if (_cfg.sortByName) {
        std::sort(entries.begin(), entries.end(), [](const FileInfo& a, const FileInfo& b) {
            return a.name < b.name;
        });
    }
    return Result::success(std::move(entries));
}

IoResult<bool> LocalFileSystemBackend::createDirectory(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return IoResult<bool>::failure(mapErrorCode(ec), "Cannot create directory", path, ec);
    }
    if (!fs::is_directory(path, ec)) {
        return IoResult<bool>::failure(FileError::AlreadyExists, "A non-directory entry already exists", path);
    }
    return IoResult<bool>::success(true);
}

IoResult<bool> LocalFileSystemBackend::remove(const std::string& path) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(status)) {
        return IoResult<bool>::failure(mapErrorCode(ec, FileError::FileNotFound), "Nothing to delete", path,
                                       ec ? std::optional(ec) : std::nullopt);
    }

    if (fs::is_directory(status)) {
        fs::remove_all(path, ec);
    } else {
        fs::remove(path, ec);
    }
    if (ec) {
        return IoResult<bool>::failure(mapErrorCode(ec), "Delete failed", path, ec);
    }
    return IoResult<bool>::success(true);
}

IoResult<bool> LocalFileSystemBackend::copyTree(const fs::path& src, const fs::path& dst) const {
    std::error_code ec;
    auto status = fs::status(src, ec);
    if (ec || !fs::exists(status)) {
        return IoResult<bool>::failure(mapErrorCode(ec, FileError::FileNotFound), "Source not found", src.string(),
                                       ec ? std::optional(ec) : std::nullopt);
    }

    if (fs::is_directory(status)) {
        fs::create_directories(dst, ec);
        if (ec) {
            return IoResult<bool>::failure(mapErrorCode(ec), "Cannot create destination directory", dst.string(), ec);
        }
        fs::directory_iterator it(src, ec);
        if (ec) {
            return IoResult<bool>::failure(mapErrorCode(ec), "Cannot read source directory", src.string(), ec);
        }
        for (const fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) break;
            auto child = copyTree(it->path(), dst / it->path().filename());
            if (!child) return child;
        }
        if (ec) {
            return IoResult<bool>::failure(mapErrorCode(ec), "Cannot read source directory", src.string(), ec);
        }
        return IoResult<bool>::success(true);
    }

    const auto parent = dst.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return IoResult<bool>::failure(mapErrorCode(ec), "Cannot create destination parent directories", dst.string(), ec);
        }
    }
    if (!fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec)) {
        return IoResult<bool>::failure(mapErrorCode(ec), "Copy failed", src.string(), ec);
    }
    return IoResult<bool>::success(true);
}

IoResult<bool> LocalFileSystemBackend::copy(const std::string& src, const std::string& dst) {
    std::error_code ec;
    if (fs::is_directory(src, ec) && isWithin(dst, src)) {
        return IoResult<bool>::failure(FileError::InvalidPath, "Destination lies inside the source directory", dst);
    }
    return copyTree(fs::path(src), fs::path(dst));
}

IoResult<bool> LocalFileSystemBackend::move(const std::string& src, const std::string& dst) {
    std::error_code ec;
    auto status = fs::symlink_status(src, ec);
    if (ec || !fs::exists(status)) {
        return IoResult<bool>::failure(mapErrorCode(ec, FileError::FileNotFound), "Source not found", src,
                                       ec ? std::optional(ec) : std::nullopt);
    }

    // Try rename first (atomic if on same filesystem)
    fs::rename(src, dst, ec);
    if (!ec) {
        return IoResult<bool>::success(true);
    }
    if (ec != std::errc::cross_device_link) {
        return IoResult<bool>::failure(mapErrorCode(ec), "Move failed", src, ec);
    }

    // Cross-filesystem: copy then delete the source
    auto copied = copyTree(fs::path(src), fs::path(dst));
    if (!copied) {
        return copied;
    }
    ec.clear();
    fs::remove_all(src, ec);
    if (ec) {
        return IoResult<bool>::failure(mapErrorCode(ec), "Source deletion failed after copy", src, ec);
    }
    return IoResult<bool>::success(true);
}

IoResult<uint64_t> LocalFileSystemBackend::fileSize(const std::string& path) {
    auto info = buildInfo(fs::path(path));
    if (!info) {
        return IoResult<uint64_t>::failure(info.error());
    }
    return IoResult<uint64_t>::success(info.value().size);
}

IoResult<std::chrono::system_clock::time_point> LocalFileSystemBackend::modifiedTime(const std::string& path) {
    using Result = IoResult<std::chrono::system_clock::time_point>;
    std::error_code ec;
    auto lwt = fs::last_write_time(path, ec);
    if (ec) {
        return Result::failure(mapErrorCode(ec), "Failed to read modification time", path, ec);
    }
    return Result::success(toSystemClock(lwt));
}

} // namespace Shelf::Core::IO
