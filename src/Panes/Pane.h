/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "../Storage/IStorageProvider.h"
#include "../Transfer/TransferTypes.h"

namespace Ferry::Core::Panes {

using Storage::Entry;
using Storage::StorageErrorInfo;
using Transfer::OperationKind;

struct Mark {
    OperationKind kind = OperationKind::Copy;
    std::optional<StorageErrorInfo> failure;   ///< Set when a commit left this mark unresolved
};

/**
 * @brief One side of the dual-pane browser
 *
 * A pane is a view onto one directory of one provider: the latest listing,
 * a cursor into it and the user's marks. Marks are keyed by entry path and
 * always reference entries of the latest successful listing.
 */
class Pane {
public:
    Pane(std::shared_ptr<Storage::IStorageProvider> provider, std::string path);

    const Storage::ProviderId& providerId() const noexcept { return _provider->id(); }
    Storage::IStorageProvider& provider() const noexcept { return *_provider; }
    const std::shared_ptr<Storage::IStorageProvider>& providerPtr() const noexcept { return _provider; }

    const std::string& currentPath() const noexcept { return _path; }
    const std::vector<Entry>& entries() const noexcept { return _entries; }
    const Entry* entryUnderCursor() const;
    const Entry* findEntry(const std::string& path) const;

    /// "resource@provider:path"
    std::string title() const;

    /**
     * @brief Re-lists the current directory
     *
     * On failure the previous entries stay visible and error() is set. On
     * success entries are replaced, marks for vanished entries are dropped and
     * the cursor is clamped.
     */
    Storage::StorageStatus refresh();

    /**
     * @brief Lists @p path and makes it current
     * @return Listing status; on failure nothing but error() changes
     */
    Storage::StorageStatus changeDirectory(const std::string& path);

    // Cursor
    size_t cursorIndex() const noexcept { return _cursor; }
    void moveCursor(long delta);            ///< Wraps at both ends
    bool setCursor(size_t index);
    bool setCursorToPath(const std::string& path);

    // Marks
    const std::map<std::string, Mark>& marks() const noexcept { return _marks; }
    std::optional<Mark> markFor(const std::string& path) const;
    bool hasMarks() const noexcept { return !_marks.empty(); }

    /**
     * @brief Toggles or replaces the mark on a listed entry
     * @return false if @p path is not in the current listing
     */
    bool toggleMark(const std::string& path, OperationKind kind);
    void clearMark(const std::string& path) { _marks.erase(path); }
    void clearMarks() { _marks.clear(); }
    void setMarkFailure(const std::string& path, StorageErrorInfo failure);

    /// Marks in listing order, ready for the planner
    std::vector<Transfer::MarkRequest> markRequests() const;

    // Listing error, external change and in-flight state
    const std::optional<StorageErrorInfo>& error() const noexcept { return _error; }
    bool isStale() const noexcept { return _stale; }
    void markStale() noexcept { _stale = true; }
    bool isProcessing(const std::string& path) const { return _processing.count(path) != 0; }
    void setProcessing(std::set<std::string> paths) { _processing = std::move(paths); }
    void clearProcessing() { _processing.clear(); }

private:
    void applyListing(std::string path, std::vector<Entry> entries);

    std::shared_ptr<Storage::IStorageProvider> _provider;
    std::string _path;
    std::vector<Entry> _entries;
    size_t _cursor = 0;
    std::map<std::string, Mark> _marks;
    std::optional<StorageErrorInfo> _error;
    bool _stale = false;
    std::set<std::string> _processing;
};

} // namespace Ferry::Core::Panes
