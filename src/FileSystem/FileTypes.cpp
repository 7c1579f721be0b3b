/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include "FileTypes.h"

namespace Shelf::Core::IO {

const char* toString(FileError error) noexcept {
    switch (error) {
        case FileError::None: return "None";
        case FileError::FileNotFound: return "FileNotFound";
        case FileError::AccessDenied: return "AccessDenied";
        case FileError::DiskFull: return "DiskFull";
        case FileError::InvalidPath: return "InvalidPath";
        case FileError::AlreadyExists: return "AlreadyExists";
        case FileError::IOError: return "IOError";
        case FileError::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::string FileErrorInfo::describe() const {
    std::string out = message.empty() ? std::string(toString(code)) : message;
    if (systemError && *systemError) {
        out += ": ";
        out += systemError->message();
    }
    if (!path.empty()) {
        out += " (";
        out += path;
        out += ")";
    }
    return out;
}

} // namespace Shelf::Core::IO
