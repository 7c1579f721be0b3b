/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include "Logger.h"
#include "ConsoleSink.h"
#include <algorithm>

namespace Shelf {
namespace Core {
namespace Logging {

    Logger::Logger(std::string name)
        : _name(std::move(name)) {
    }

    Logger::~Logger() {
        flush();
    }

    Logger& Logger::global() {
        // Leaked on purpose: worker threads may still log during static destruction
        static Logger* instance = [] {
            auto* logger = new Logger("Global");
            logger->addSink(std::make_shared<ConsoleSink>());
            return logger;
        }();
        return *instance;
    }

    void Logger::addSink(std::shared_ptr<ILogSink> sink) {
        if (!sink) return;
        std::lock_guard<std::mutex> lock(_sinksMutex);
        _sinks.push_back(std::move(sink));
    }

    void Logger::removeSink(const std::shared_ptr<ILogSink>& sink) {
        std::lock_guard<std::mutex> lock(_sinksMutex);
        _sinks.erase(std::remove(_sinks.begin(), _sinks.end(), sink), _sinks.end());
    }

    void Logger::clearSinks() {
        std::lock_guard<std::mutex> lock(_sinksMutex);
        _sinks.clear();
    }

    size_t Logger::sinkCount() const {
        std::lock_guard<std::mutex> lock(_sinksMutex);
        return _sinks.size();
    }

    void Logger::log(LogLevel level,
                     const std::string& category,
                     const std::string& message,
                     const std::source_location& location) {
        if (!isEnabled(level)) return;

        LogEntry entry(level, category, message, location);
        std::lock_guard<std::mutex> lock(_sinksMutex);
        for (auto& sink : _sinks) {
            if (sink->shouldLog(level)) {
                sink->write(entry);
            }
        }
        if (level >= LogLevel::Error) {
            for (auto& sink : _sinks) {
                sink->flush();
            }
        }
    }

    void Logger::flush() {
        std::lock_guard<std::mutex> lock(_sinksMutex);
        for (auto& sink : _sinks) {
            sink->flush();
        }
    }

} // namespace Logging
} // namespace Core
} // namespace Shelf
