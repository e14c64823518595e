/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once

/**
 * @file CoreCommon.h
 * @brief Core common utilities and debugging macros for Ferry
 *
 * Debug assertions, build configuration flags and the environment helpers
 * used by the Config::fromEnvironment() factories.
 */

#include <cassert>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>

#ifdef FerryDebug
#define FERRY_DEBUG_BLOCK(code) do { code } while(0)
#undef NDEBUG
#define FERRY_ASSERT(condition, message) assert(condition)
#else
#define FERRY_DEBUG_BLOCK(code) ((void)0)
#define FERRY_ASSERT(condition, message) ((void)0)
#endif

namespace Ferry {
namespace Core {
    // Cross-platform safe environment variable getter that avoids returning raw pointers
    // and copies into std::string. Returns std::nullopt if the variable is not set.
    inline std::optional<std::string> safeGetEnv(const char* name) {
        if (!name) return std::nullopt;
#if defined(_WIN32)
        size_t required = 0;
        errno_t err = getenv_s(&required, nullptr, 0, name);
        if (err != 0 || required == 0) return std::nullopt;
        std::string value;
        value.resize(required);
        size_t read = 0;
        err = getenv_s(&read, value.data(), value.size(), name);
        if (err != 0 || read == 0) return std::nullopt;
        if (!value.empty() && value.back() == '\0') value.pop_back();
        return value;
#else
        const char* v = std::getenv(name);
        if (!v) return std::nullopt;
        return std::string(v);
#endif
    }

    // Parses an unsigned environment value; malformed or absent values yield std::nullopt
    inline std::optional<size_t> safeGetEnvSize(const char* name) {
        auto raw = safeGetEnv(name);
        if (!raw || raw->empty()) return std::nullopt;
        size_t value = 0;
        const char* first = raw->data();
        const char* last = raw->data() + raw->size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last) return std::nullopt;
        return value;
    }
} // namespace Core
}
