/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "StoragePath.h"

namespace Ferry::Core::Storage::StoragePath {

std::vector<std::string> segments(std::string_view path) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string_view::npos) next = path.size();
        std::string_view part = path.substr(pos, next - pos);
        if (part.empty() || part == ".") {
            // skip
        } else if (part == "..") {
            if (!out.empty()) out.pop_back();
        } else {
            out.emplace_back(part);
        }
        pos = next + 1;
    }
    return out;
}

std::string normalize(std::string_view path) {
    auto parts = segments(path);
    if (parts.empty()) return "/";
    std::string out;
    for (const auto& part : parts) {
        out += '/';
        out += part;
    }
    return out;
}

std::string join(std::string_view directory, std::string_view name) {
    std::string combined(directory);
    combined += '/';
    combined += name;
    return normalize(combined);
}

std::string parent(std::string_view path) {
    auto parts = segments(path);
    if (parts.empty()) return "/";
    parts.pop_back();
    std::string out;
    for (const auto& part : parts) {
        out += '/';
        out += part;
    }
    return out.empty() ? std::string("/") : out;
}

std::string filename(std::string_view path) {
    auto parts = segments(path);
    return parts.empty() ? std::string() : parts.back();
}

bool isWithin(std::string_view path, std::string_view ancestor) {
    if (isRoot(ancestor)) return true;
    if (path.size() < ancestor.size()) return false;
    if (path.substr(0, ancestor.size()) != ancestor) return false;
    return path.size() == ancestor.size() || path[ancestor.size()] == '/';
}

std::string relativeTo(std::string_view path, std::string_view base) {
    if (!isWithin(path, base)) return std::string(path);
    std::string_view rest = isRoot(base) ? path : path.substr(base.size());
    while (!rest.empty() && rest.front() == '/') rest.remove_prefix(1);
    return std::string(rest);
}

bool isValidName(std::string_view name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string_view::npos && name.find('\0') == std::string_view::npos;
}

} // namespace Ferry::Core::Storage::StoragePath
