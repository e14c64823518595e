/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "Pane.h"
#include "../Storage/StoragePath.h"
#include "../Logging/Logger.h"
#include <stdexcept>

namespace Ferry::Core::Panes {

using namespace Storage;

Pane::Pane(std::shared_ptr<IStorageProvider> provider, std::string path)
    : _provider(std::move(provider))
    , _path(StoragePath::normalize(path)) {
    if (!_provider) {
        throw std::invalid_argument("Pane requires a provider");
    }
}

const Entry* Pane::entryUnderCursor() const {
    if (_entries.empty()) return nullptr;
    return &_entries[_cursor];
}

const Entry* Pane::findEntry(const std::string& path) const {
    for (const auto& entry : _entries) {
        if (entry.path == path) return &entry;
    }
    return nullptr;
}

std::string Pane::title() const {
    return _provider->resourceName() + "@" + _provider->providerType() + ":" + _path;
}

void Pane::applyListing(std::string path, std::vector<Entry> entries) {
    _path = std::move(path);
    _entries = std::move(entries);
    _error.reset();
    _stale = false;

    for (auto it = _marks.begin(); it != _marks.end();) {
        if (!findEntry(it->first)) {
            it = _marks.erase(it);
        } else {
            ++it;
        }
    }
    if (_entries.empty()) {
        _cursor = 0;
    } else if (_cursor >= _entries.size()) {
        _cursor = _entries.size() - 1;
    }
}

StorageStatus Pane::refresh() {
    auto listing = _provider->list(_path);
    if (!listing) {
        _error = listing.error();
        FERRY_LOG_WARNING_CAT("Pane", "Refresh of " + title() + " failed: " + listing.error().describe());
        return StorageStatus(listing.error());
    }
    applyListing(_path, std::move(listing).value());
    return StorageStatus::success();
}

StorageStatus Pane::changeDirectory(const std::string& path) {
    auto target = StoragePath::normalize(path);
    auto listing = _provider->list(target);
    if (!listing) {
        _error = listing.error();
        FERRY_LOG_WARNING_CAT("Pane", "Cannot open " + target + ": " + listing.error().describe());
        return StorageStatus(listing.error());
    }
    _cursor = 0;
    applyListing(std::move(target), std::move(listing).value());
    return StorageStatus::success();
}

void Pane::moveCursor(long delta) {
    if (_entries.empty()) return;
    long size = static_cast<long>(_entries.size());
    long next = (static_cast<long>(_cursor) + delta % size + size) % size;
    _cursor = static_cast<size_t>(next);
}

bool Pane::setCursor(size_t index) {
    if (index >= _entries.size()) return false;
    _cursor = index;
    return true;
}

bool Pane::setCursorToPath(const std::string& path) {
    for (size_t i = 0; i < _entries.size(); ++i) {
        if (_entries[i].path == path) {
            _cursor = i;
            return true;
        }
    }
    return false;
}

std::optional<Mark> Pane::markFor(const std::string& path) const {
    auto it = _marks.find(path);
    if (it == _marks.end()) return std::nullopt;
    return it->second;
}

bool Pane::toggleMark(const std::string& path, OperationKind kind) {
    if (!findEntry(path)) return false;
    auto it = _marks.find(path);
    if (it != _marks.end() && it->second.kind == kind) {
        _marks.erase(it);
    } else {
        _marks[path] = Mark{kind, std::nullopt};
    }
    return true;
}

void Pane::setMarkFailure(const std::string& path, StorageErrorInfo failure) {
    auto it = _marks.find(path);
    if (it != _marks.end()) it->second.failure = std::move(failure);
}

std::vector<Transfer::MarkRequest> Pane::markRequests() const {
    std::vector<Transfer::MarkRequest> requests;
    for (const auto& entry : _entries) {
        auto it = _marks.find(entry.path);
        if (it != _marks.end()) requests.push_back(Transfer::MarkRequest{entry, it->second.kind});
    }
    return requests;
}

} // namespace Ferry::Core::Panes
