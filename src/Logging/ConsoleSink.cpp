/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include "ConsoleSink.h"
#include <ctime>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Shelf {
namespace Core {
namespace Logging {

    namespace {
        const char* colorFor(LogLevel level) {
            switch (level) {
                case LogLevel::Trace:   return "\033[90m";
                case LogLevel::Debug:   return "\033[36m";
                case LogLevel::Info:    return "\033[0m";
                case LogLevel::Warning: return "\033[33m";
                case LogLevel::Error:   return "\033[31m";
                case LogLevel::Fatal:   return "\033[1;31m";
            }
            return "\033[0m";
        }
        constexpr const char* kReset = "\033[0m";
    }

    ConsoleSink::ConsoleSink(bool useColor, bool showLocation)
        : _useColor(useColor)
        , _showLocation(showLocation) {
    }

    std::string ConsoleSink::formatEntry(const LogEntry& entry, bool showLocation) {
        auto secs = std::chrono::system_clock::to_time_t(entry.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            entry.timestamp.time_since_epoch()).count() % 1000;

        std::tm tm{};
#if defined(_WIN32)
        localtime_s(&tm, &secs);
#else
        localtime_r(&secs, &tm);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms
            << " [" << toString(entry.level) << "]";
        if (!entry.category.empty()) {
            oss << " [" << entry.category << "]";
        }
        oss << ' ' << entry.message;
        if (showLocation && entry.location.file_name() && *entry.location.file_name()) {
            oss << " (" << entry.location.file_name() << ':' << entry.location.line() << ')';
        }
        return oss.str();
    }

    void ConsoleSink::write(const LogEntry& entry) {
        if (!shouldLog(entry.level)) return;

        const std::string line = formatEntry(entry, _showLocation);
        std::lock_guard<std::mutex> lock(_mutex);
        std::ostream& out = entry.level >= LogLevel::Error ? std::cerr : std::cout;
        if (_useColor) {
            out << colorFor(entry.level) << line << kReset << '\n';
        } else {
            out << line << '\n';
        }
    }

    void ConsoleSink::flush() {
        std::lock_guard<std::mutex> lock(_mutex);
        std::cout.flush();
        std::cerr.flush();
    }

} // namespace Logging
} // namespace Core
} // namespace Shelf
