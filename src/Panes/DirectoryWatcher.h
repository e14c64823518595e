/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

/**
 * @file DirectoryWatcher.h
 * @brief Flags watched directories as changed when the host filesystem reports activity
 *
 * DirectoryWatcher owns an efsw::FileWatcher and keeps at most one
 * non-recursive watch per key (a pane side, typically). Events arrive on the
 * efsw thread and only set a flag; the control thread collects flags with
 * consumeChanged() and decides when to re-list.
 */
#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

// Forward declare efsw types
namespace efsw {
    class FileWatcher;
    class FileWatchListener;
}

namespace Ferry::Core::Panes {

class DirectoryWatcher {
public:
    DirectoryWatcher();
    ~DirectoryWatcher();

    DirectoryWatcher(const DirectoryWatcher&) = delete;
    DirectoryWatcher& operator=(const DirectoryWatcher&) = delete;

    /**
     * @brief Watches @p directory under @p key, replacing any previous watch for that key
     * @return false if efsw could not watch the directory
     */
    bool watch(const std::string& key, const std::filesystem::path& directory);
    void unwatch(const std::string& key);

    /// True once per burst of events since the last call for @p key
    bool consumeChanged(const std::string& key);

    /// Sets the change flag as an efsw event would
    void notifyChanged(const std::string& key);

    bool isWatching(const std::string& key) const;
    size_t watchCount() const;

private:
    friend class DirectoryWatchListener;

    void onEvent(long watchId);
    void ensureWatcherInitialized();

    std::unique_ptr<efsw::FileWatcher> _watcher;          ///< Lazily created on first watch()
    std::unique_ptr<efsw::FileWatchListener> _listener;

    // Guards the maps below only; never held while calling into efsw
    mutable std::mutex _mutex;
    std::map<long, std::string> _keysByWatchId;
    std::map<std::string, long> _watchIdsByKey;
    std::set<std::string> _changed;
    size_t _pendingWatches = 0;            ///< addWatch() calls in flight
    std::set<long> _earlyEvents;           ///< Unmapped ids seen while a watch was pending
};

} // namespace Ferry::Core::Panes
