/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once
#include <string>
#include <string_view>
#include <vector>

/**
 * Provider path helpers.
 *
 * Provider paths are absolute, '/'-separated and independent of the host OS:
 * "/" is the provider root, "/photos/2024" a nested directory. normalize() is
 * the single place that turns user input into that form; ".." never climbs
 * above the root.
 */
namespace Ferry::Core::Storage::StoragePath {

std::string normalize(std::string_view path);
std::string join(std::string_view directory, std::string_view name);
std::string parent(std::string_view path);
std::string filename(std::string_view path);
std::vector<std::string> segments(std::string_view path);

inline bool isRoot(std::string_view path) { return path.empty() || path == "/"; }

/// True when path equals ancestor or lies below it. Both must be normalized.
bool isWithin(std::string_view path, std::string_view ancestor);

/// Path of `path` relative to `base` without a leading slash ("" when equal).
std::string relativeTo(std::string_view path, std::string_view base);

/// A single path segment usable as an entry name.
bool isValidName(std::string_view name);

} // namespace Ferry::Core::Storage::StoragePath
