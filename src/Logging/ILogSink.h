/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#pragma once

#include "LogEntry.h"

namespace Shelf {
namespace Core {
namespace Logging {

    /**
     * @brief Destination for log entries
     *
     * Sinks are called from whichever thread produced the entry. Logger
     * serializes calls into a given sink, so implementations only need to
     * protect state they share with other objects.
     */
    class ILogSink {
    public:
        virtual ~ILogSink() = default;

        virtual void write(const LogEntry& entry) = 0;
        virtual void flush() = 0;

        // Sinks may filter more strictly than the logger
        virtual bool shouldLog(LogLevel level) const { return level >= _minLevel; }
        void setMinLevel(LogLevel level) { _minLevel = level; }
        LogLevel getMinLevel() const { return _minLevel; }

    protected:
        LogLevel _minLevel = LogLevel::Trace;
    };

} // namespace Logging
} // namespace Core
} // namespace Shelf
