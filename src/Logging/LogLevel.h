/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

/**
 * @file LogLevel.h
 * @brief Severity levels shared by the C++ logger and the C shim
 *
 * Values are kept in sync with ShelfLogLevelC in CLogger.h.
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace Shelf {
namespace Core {
namespace Logging {

    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Fatal = 5
    };

    /**
     * @brief Fixed-width display name for a level
     * @param level Level to name
     * @return Upper-case name padded to five characters ("INFO ", "WARN ", ...)
     */
    constexpr std::string_view toString(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Trace:   return "TRACE";
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO ";
            case LogLevel::Warning: return "WARN ";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::Fatal:   return "FATAL";
        }
        return "?????";
    }

} // namespace Logging
} // namespace Core
} // namespace Shelf
