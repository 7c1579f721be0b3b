/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#pragma once

#include <mutex>
#include <string>
#include "ILogSink.h"

namespace Shelf {
namespace Core {
namespace Logging {

    /**
     * @brief Writes formatted entries to stdout, Error and Fatal to stderr
     *
     * Line format: `2025-01-01 12:00:00.123 [INFO ] [Category] message`.
     * With showLocation enabled the source file and line are appended.
     */
    class ConsoleSink : public ILogSink {
    public:
        explicit ConsoleSink(bool useColor = true, bool showLocation = false);

        void write(const LogEntry& entry) override;
        void flush() override;

        void setUseColor(bool useColor) { _useColor = useColor; }
        void setShowLocation(bool showLocation) { _showLocation = showLocation; }

        static std::string formatEntry(const LogEntry& entry, bool showLocation);

    private:
        std::mutex _mutex;
        bool _useColor;
        bool _showLocation;
    };

} // namespace Logging
} // namespace Core
} // namespace Shelf
