/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

/**
 * @file Logger.h
 * @brief Thread-safe logger with pluggable sinks
 *
 * The global logger starts with a single ConsoleSink at Info level. Use the
 * SHELF_LOG_* macros rather than calling log() directly so that call sites
 * pick up their source location and a sensible default category.
 *
 * @code
 * Logger::global().setMinLevel(LogLevel::Debug);
 * SHELF_LOG_INFO_CAT("Async", "Manager started with " + std::to_string(n) + " workers");
 * @endcode
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <source_location>
#include <string>
#include <vector>
#include "ILogSink.h"
#include "LogLevel.h"

namespace Shelf {
namespace Core {
namespace Logging {

    class Logger {
    public:
        explicit Logger(std::string name = "Shelf");
        ~Logger();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        /**
         * @brief Process-wide logger used by the SHELF_LOG_* macros
         */
        static Logger& global();

        void addSink(std::shared_ptr<ILogSink> sink);
        void removeSink(const std::shared_ptr<ILogSink>& sink);
        void clearSinks();
        size_t sinkCount() const;

        void setMinLevel(LogLevel level) { _minLevel.store(level, std::memory_order_relaxed); }
        LogLevel getMinLevel() const { return _minLevel.load(std::memory_order_relaxed); }
        bool isEnabled(LogLevel level) const { return level >= getMinLevel(); }

        void log(LogLevel level,
                 const std::string& category,
                 const std::string& message,
                 const std::source_location& location = std::source_location::current());

        void flush();

        const std::string& name() const { return _name; }

    private:
        std::string _name;
        std::atomic<LogLevel> _minLevel{LogLevel::Info};
        mutable std::mutex _sinksMutex;
        std::vector<std::shared_ptr<ILogSink>> _sinks;
    };

} // namespace Logging
} // namespace Core
} // namespace Shelf

// Category defaults to the calling function's name
#define SHELF_LOG_TRACE(msg) ::Shelf::Core::Logging::Logger::global().log(::Shelf::Core::Logging::LogLevel::Trace, __func__, (msg))
#define SHELF_LOG_DEBUG(msg) ::Shelf::Core::Logging::Logger::global().log(::Shelf::Core::Logging::LogLevel::Debug, __func__, (msg))
#define SHELF_LOG_INFO(msg) ::Shelf::Core::Logging::Logger::global().log(::Shelf::Core::Logging::LogLevel::Info, __func__, (msg))
#define SHELF_LOG_WARNING(msg) ::Shelf::Core::Logging::Logger::global().log(::Shelf::Core::Logging::LogLevel::Warning, __func__, (msg))
#define SHELF_LOG_ERROR(msg) ::Shelf::Core::Logging::Logger::global().log(::Shelf::Core::Logging::LogLevel::Error, __func__, (msg))
#define SHELF_LOG_FATAL(msg) ::Shelf::Core::Logging::Logger::global().log(::Shelf::Core::Logging::LogLevel::Fatal, __func__, (msg))

#define SHELF_LOG_TRACE_CAT(cat, msg) ::Shelf::Core::Logging::Logger::global().log(::Shelf::Core::Logging::LogLevel::Trace, (cat), (msg))
#define SHELF_LOG_DEBUG_CAT(cat, msg) ::Shelf::Core::Logging::Logger::global().log(::Shelf::Core::Logging::LogLevel::Debug, (cat), (msg))
#define SHELF_LOG_INFO_CAT(cat, msg) ::Shelf::Core::Logging::Logger::global().log(::Shelf::Core::Logging::LogLevel::Info, (cat), (msg))
#define SHELF_LOG_WARNING_CAT(cat, msg) ::Shelf::Core::Logging::Logger::global().log(::Shelf::Core::Logging::LogLevel::Warning, (cat), (msg))
#define SHELF_LOG_ERROR_CAT(cat, msg) ::Shelf::Core::Logging::Logger::global().log(::Shelf::Core::Logging::LogLevel::Error, (cat), (msg))
#define SHELF_LOG_FATAL_CAT(cat, msg) ::Shelf::Core::Logging::Logger::global().log(::Shelf::Core::Logging::LogLevel::Fatal, (cat), (msg))
