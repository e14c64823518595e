/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "DirectoryWatcher.h"
#include "../Logging/Logger.h"
#include <efsw/efsw.hpp>

namespace Ferry::Core::Panes {

/**
 * @brief efsw listener that forwards every action to its DirectoryWatcher
 */
class DirectoryWatchListener : public efsw::FileWatchListener
{
public:
    explicit DirectoryWatchListener(DirectoryWatcher* owner) : _owner(owner) {}

    void handleFileAction(efsw::WatchID watchId, const std::string& dir, const std::string& filename,
                          efsw::Action action, std::string oldFilename) override {
        (void)oldFilename;
        switch (action) {
            case efsw::Actions::Add:
            case efsw::Actions::Delete:
            case efsw::Actions::Modified:
            case efsw::Actions::Moved:
                break;
            default:
                return;
        }
        FERRY_LOG_TRACE_CAT("DirectoryWatcher", "Change in " + dir + ": " + filename);
        _owner->onEvent(static_cast<long>(watchId));
    }

private:
    DirectoryWatcher* _owner;
};

DirectoryWatcher::DirectoryWatcher()
    : _listener(std::make_unique<DirectoryWatchListener>(this)) {
}

DirectoryWatcher::~DirectoryWatcher() {
    // Destroying the watcher joins the efsw thread before the listener goes away
    _watcher.reset();
    _listener.reset();
}

void DirectoryWatcher::ensureWatcherInitialized() {
    if (_watcher) {
        return;
    }
    _watcher = std::make_unique<efsw::FileWatcher>();
    _watcher->watch();
}

bool DirectoryWatcher::watch(const std::string& key, const std::filesystem::path& directory) {
    unwatch(key);
    ensureWatcherInitialized();

    {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_pendingWatches;
    }
    // efsw may lock its internal mutex here and can deliver events before it returns
    efsw::WatchID id = _watcher->addWatch(directory.string(), _listener.get(), false);

    std::lock_guard<std::mutex> lock(_mutex);
    --_pendingWatches;
    if (id < 0) {
        if (_pendingWatches == 0) _earlyEvents.clear();
        FERRY_LOG_WARNING_CAT("DirectoryWatcher",
            "Cannot watch " + directory.string() + ": " + efsw::Errors::Log::getLastErrorLog());
        return false;
    }

    _keysByWatchId[static_cast<long>(id)] = key;
    _watchIdsByKey[key] = static_cast<long>(id);
    _changed.erase(key);
    if (_earlyEvents.erase(static_cast<long>(id)) != 0) _changed.insert(key);
    if (_pendingWatches == 0) _earlyEvents.clear();
    FERRY_LOG_DEBUG_CAT("DirectoryWatcher", "Watching " + directory.string() + " for " + key);
    return true;
}

void DirectoryWatcher::unwatch(const std::string& key) {
    long id = -1;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _watchIdsByKey.find(key);
        if (it == _watchIdsByKey.end()) return;
        id = it->second;
        _watchIdsByKey.erase(it);
        _keysByWatchId.erase(id);
        _changed.erase(key);
    }
    if (_watcher) _watcher->removeWatch(static_cast<efsw::WatchID>(id));
}

void DirectoryWatcher::onEvent(long watchId) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _keysByWatchId.find(watchId);
    if (it == _keysByWatchId.end()) {
        // Either removed, or addWatch() has not returned the id yet
        if (_pendingWatches > 0) _earlyEvents.insert(watchId);
        return;
    }
    _changed.insert(it->second);
}

void DirectoryWatcher::notifyChanged(const std::string& key) {
    std::lock_guard<std::mutex> lock(_mutex);
    _changed.insert(key);
}

bool DirectoryWatcher::consumeChanged(const std::string& key) {
    std::lock_guard<std::mutex> lock(_mutex);
    return _changed.erase(key) != 0;
}

bool DirectoryWatcher::isWatching(const std::string& key) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _watchIdsByKey.count(key) != 0;
}

size_t DirectoryWatcher::watchCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _watchIdsByKey.size();
}

} // namespace Ferry::Core::Panes
