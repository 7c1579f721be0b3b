/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#pragma once

#include "CoreCommon.h"
#include <atomic>
#include <string>
#include <vector>

namespace Shelf {
    namespace Core {

        /**
         * @brief Lifecycle states for a ShelfService instance.
         */
        enum class ServiceState {
            Registered,
            Loaded,
            Started,
            Stopped,
            Unloaded
        };

        /**
         * @brief Base interface for long-lived subsystems within Shelf.
         *
         * Services encapsulate optional subsystems (e.g., async file operations)
         * and participate in the application lifecycle via load/start/stop/unload callbacks.
         *
         * Implementations should be lightweight to construct; heavy initialization should
         * happen in load()/start(). All lifecycle methods are expected to be called from
         * the thread that owns the service.
         */
        class ShelfService {
        public:
            virtual ~ShelfService() = default;

            // Identity (metadata only; not used for lookups)
            virtual const char* id() const = 0;    // stable unique id, e.g. "com.shelf.core.async"
            virtual const char* name() const = 0;  // human readable

            // Optional semantic version for compatibility checks
            virtual const char* version() const { return "0.1.0"; }

            // String-based dependencies, informational only
            virtual std::vector<std::string> dependsOn() const { return {}; }

            // Lifecycle hooks
            virtual void load() {}
            virtual void start() {}
            virtual void stop() {}
            virtual void unload() {}

            // Observability
            ServiceState state() const noexcept { return _state.load(std::memory_order_acquire); }

        protected:
            void setState(ServiceState s) noexcept { _state.store(s, std::memory_order_release); }

        private:
            std::atomic<ServiceState> _state{ServiceState::Registered};
        };

    } // namespace Core
} // namespace Shelf
