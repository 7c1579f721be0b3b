/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#pragma once

/**
 * @file CoreCommon.h
 * @brief Core common utilities and debugging macros for ShelfCore
 *
 * This header provides essential debugging utilities and common macros
 * used throughout the ShelfCore library: SHELF_ASSERT for internal invariants
 * (active only when ShelfDebug is defined) and the environment helpers used
 * by config loaders.
 */

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <cstdlib>

#ifdef ShelfDebug
#undef NDEBUG
#include <cassert>
#define SHELF_ASSERT(condition, message) assert((condition) && (message))
#else
#define SHELF_ASSERT(condition, message) ((void)0)
#endif

namespace Shelf {
namespace Core {
    // Cross-platform safe environment variable getter that avoids returning raw pointers
    // and copies into std::string. Returns std::nullopt if the variable is not set.
    inline std::optional<std::string> safeGetEnv(const char* name) {
        if (!name) return std::nullopt;
#if defined(_WIN32)
        // Use secure getenv_s to query size first
        size_t required = 0;
        errno_t err = getenv_s(&required, nullptr, 0, name);
        if (err != 0 || required == 0) return std::nullopt;
        // required includes the null terminator
        std::string value;
        value.resize(required);
        size_t read = 0;
        err = getenv_s(&read, value.data(), value.size(), name);
        if (err != 0 || read == 0) return std::nullopt;
        // Trim trailing null if present
        if (!value.empty() && value.back() == '\0') value.pop_back();
        return value;
#else
        const char* v = std::getenv(name);
        if (!v) return std::nullopt;
        return std::string(v);
#endif
    }

    // Parses a non-negative decimal integer. Rejects empty strings, signs and trailing garbage.
    inline std::optional<uint64_t> parseUnsigned(const std::string& text) {
        if (text.empty()) return std::nullopt;
        uint64_t value = 0;
        const char* first = text.data();
        const char* last = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last) return std::nullopt;
        return value;
    }
} // namespace Core
}
