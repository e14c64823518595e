/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "ObjectStoreProvider.h"
#include "StoragePath.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace Ferry::Core::Storage {

ObjectStoreProvider::ObjectStoreProvider(std::shared_ptr<IObjectStoreClient> client)
    : ObjectStoreProvider(std::move(client), Config{}) {
}

ObjectStoreProvider::ObjectStoreProvider(std::shared_ptr<IObjectStoreClient> client, Config config)
    : _client(std::move(client))
    , _config(std::move(config)) {
    if (!_client) {
        throw std::invalid_argument("ObjectStoreProvider requires a client");
    }
}

std::string ObjectStoreProvider::keyFor(const std::string& path) {
    auto normalized = StoragePath::normalize(path);
    return normalized.substr(1);
}

std::string ObjectStoreProvider::directoryPrefix(const std::string& path) {
    auto key = keyFor(path);
    return key.empty() ? key : key + "/";
}

ProviderCapabilities ObjectStoreProvider::capabilities() const {
    ProviderCapabilities caps;
    caps.supportsNativeMove = false;
    caps.isRemote = _client->isRemote();
    caps.maxConcurrency = _config.maxConcurrency;
    return caps;
}

Entry ObjectStoreProvider::makeFileEntry(const std::string& path, const ObjectInfo& info) const {
    Entry entry;
    entry.path = path;
    entry.name = StoragePath::filename(path);
    entry.kind = EntryKind::File;
    entry.size = info.size;
    entry.providerId = _id;
    entry.lastModified = info.lastModified;
    return entry;
}

Entry ObjectStoreProvider::makeDirectoryEntry(const std::string& path) const {
    Entry entry;
    entry.path = path;
    entry.name = StoragePath::isRoot(path) ? std::string("/") : StoragePath::filename(path);
    entry.kind = EntryKind::Directory;
    entry.providerId = _id;
    return entry;
}

StorageResult<std::vector<Entry>> ObjectStoreProvider::list(const std::string& path) {
    auto logical = StoragePath::normalize(path);
    auto prefix = directoryPrefix(logical);

    auto listing = _client->listObjects(prefix, '/');
    if (!listing) return StorageResult<std::vector<Entry>>(listing.error());
    auto& result = listing.value();

    bool hasMarker = false;
    std::set<std::string> directoryNames;
    for (const auto& common : result.commonPrefixes) {
        // "a/b/" under prefix "a/" yields "b"
        auto name = common.substr(prefix.size(), common.size() - prefix.size() - 1);
        if (name.empty()) continue;  // "a//" style keys do not form entries
        directoryNames.insert(name);
    }

    std::vector<Entry> entries;
    for (const auto& object : result.objects) {
        if (object.key == prefix) {
            hasMarker = true;
            continue;
        }
        auto name = object.key.substr(prefix.size());
        if (directoryNames.count(name) != 0) {
            FERRY_LOG_WARNING_CAT("ObjectStoreProvider",
                "Key '" + object.key + "' is shadowed by a directory of the same name");
            continue;
        }
        entries.push_back(makeFileEntry(StoragePath::join(logical, name), object));
    }
    for (const auto& name : directoryNames) {
        entries.push_back(makeDirectoryEntry(StoragePath::join(logical, name)));
    }
    // Bucket listings are lexicographic across files and prefixes
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) { return a.name < b.name; });

    if (entries.empty() && !hasMarker && !StoragePath::isRoot(logical)) {
        auto head = _client->headObject(keyFor(logical));
        if (head) {
            return StorageResult<std::vector<Entry>>::failure(StorageError::InvalidPath, "Not a directory", logical);
        }
        if (head.code() != StorageError::NotFound) {
            return StorageResult<std::vector<Entry>>(head.error());
        }
        return StorageResult<std::vector<Entry>>::failure(StorageError::NotFound, "Directory not found", logical);
    }
    return entries;
}

StorageResult<Entry> ObjectStoreProvider::stat(const std::string& path) {
    auto logical = StoragePath::normalize(path);
    if (StoragePath::isRoot(logical)) return makeDirectoryEntry(logical);

    auto head = _client->headObject(keyFor(logical));
    if (head) return makeFileEntry(logical, head.value());
    if (head.code() != StorageError::NotFound) return StorageResult<Entry>(head.error());

    // Marker or any deeper key makes it a directory
    auto children = _client->listObjects(directoryPrefix(logical), '/');
    if (!children) return StorageResult<Entry>(children.error());
    if (!children.value().objects.empty() || !children.value().commonPrefixes.empty()) {
        return makeDirectoryEntry(logical);
    }
    return StorageResult<Entry>::failure(StorageError::NotFound, "No such entry", logical);
}

StorageResult<std::unique_ptr<ByteSource>> ObjectStoreProvider::openRead(const std::string& path) {
    auto logical = StoragePath::normalize(path);
    if (StoragePath::isRoot(logical)) {
        return StorageResult<std::unique_ptr<ByteSource>>::failure(StorageError::InvalidPath,
                                                                   "Cannot read a directory", logical);
    }
    auto source = _client->getObject(keyFor(logical));
    if (!source && source.code() == StorageError::NotFound) {
        auto entry = stat(logical);
        if (entry && entry.value().isDirectory()) {
            return StorageResult<std::unique_ptr<ByteSource>>::failure(StorageError::InvalidPath,
                                                                       "Cannot read a directory", logical);
        }
        return StorageResult<std::unique_ptr<ByteSource>>::failure(StorageError::NotFound, "No such file", logical);
    }
    return source;
}

StorageResult<Entry> ObjectStoreProvider::write(const std::string& path,
                                                ByteSource& source,
                                                const Concurrency::CancellationToken& cancel,
                                                const WriteOptions& options) {
    auto logical = StoragePath::normalize(path);
    if (StoragePath::isRoot(logical)) {
        return StorageResult<Entry>::failure(StorageError::InvalidPath, "Cannot write to the bucket root", logical);
    }

    auto parent = stat(StoragePath::parent(logical));
    if (!parent) {
        if (parent.code() == StorageError::NotFound) {
            return StorageResult<Entry>::failure(StorageError::NotFound, "Parent directory does not exist", logical);
        }
        return StorageResult<Entry>(parent.error());
    }
    if (!parent.value().isDirectory()) {
        return StorageResult<Entry>::failure(StorageError::NotFound, "Parent is not a directory", logical);
    }

    auto existing = stat(logical);
    if (existing) {
        return StorageResult<Entry>::failure(StorageError::AlreadyExists, "Destination already exists", logical);
    }
    if (existing.code() != StorageError::NotFound) return StorageResult<Entry>(existing.error());

    auto upload = _client->createUpload(keyFor(logical), true);
    if (!upload) return StorageResult<Entry>(upload.error());
    auto& handle = *upload.value();

    uint64_t written = 0;
    auto status = pumpChunks(source, cancel, options.chunkSize,
        [&handle](std::span<const std::byte> chunk) { return handle.appendPart(chunk); },
        written, options.progressCallback);
    if (!status) {
        handle.abort();
        return StorageResult<Entry>(status.error());
    }

    auto committed = handle.commit();
    if (!committed) return StorageResult<Entry>(committed.error());
    return makeFileEntry(logical, committed.value());
}

StorageStatus ObjectStoreProvider::createDirectory(const std::string& path) {
    auto logical = StoragePath::normalize(path);
    if (StoragePath::isRoot(logical)) return StorageStatus::success();

    auto existing = stat(logical);
    if (existing) {
        if (existing.value().isDirectory()) return StorageStatus::success();
        return StorageStatus::failure(StorageError::AlreadyExists, "A file occupies the directory path", logical);
    }
    if (existing.code() != StorageError::NotFound) return StorageStatus(existing.error());

    auto parent = stat(StoragePath::parent(logical));
    if (!parent || !parent.value().isDirectory()) {
        if (parent.ok() || parent.code() == StorageError::NotFound) {
            return StorageStatus::failure(StorageError::NotFound, "Parent directory does not exist", logical);
        }
        return StorageStatus(parent.error());
    }

    // Unconditional marker put keeps the operation idempotent under races
    auto upload = _client->createUpload(directoryPrefix(logical), false);
    if (!upload) return StorageStatus(upload.error());
    auto committed = upload.value()->commit();
    if (!committed) return StorageStatus(committed.error());
    return StorageStatus::success();
}

StorageStatus ObjectStoreProvider::remove(const std::string& path) {
    auto logical = StoragePath::normalize(path);
    if (StoragePath::isRoot(logical)) {
        return StorageStatus::failure(StorageError::PermissionDenied, "Refusing to remove the bucket root", logical);
    }

    auto entry = stat(logical);
    if (!entry) return StorageStatus(entry.error());

    if (entry.value().isFile()) {
        auto kept = keepParentDirectory(logical);
        if (!kept) return kept;
        return _client->deleteObject(keyFor(logical));
    }

    auto prefix = directoryPrefix(logical);
    auto contents = _client->listObjects(prefix, std::nullopt);
    if (!contents) return StorageStatus(contents.error());
    for (const auto& object : contents.value().objects) {
        if (object.key != prefix) {
            return StorageStatus::failure(StorageError::NotEmpty, "Directory is not empty", logical);
        }
    }
    auto kept = keepParentDirectory(logical);
    if (!kept) return kept;
    return _client->deleteObject(prefix);
}

StorageStatus ObjectStoreProvider::keepParentDirectory(const std::string& path) {
    // Removing the last key below an implicit directory would make the directory vanish
    auto parent = StoragePath::parent(path);
    if (StoragePath::isRoot(parent)) return StorageStatus::success();

    auto marker = directoryPrefix(parent);
    auto head = _client->headObject(marker);
    if (head) return StorageStatus::success();
    if (head.code() != StorageError::NotFound) return StorageStatus(head.error());

    auto upload = _client->createUpload(marker, false);
    if (!upload) return StorageStatus(upload.error());
    auto committed = upload.value()->commit();
    if (!committed) return StorageStatus(committed.error());
    return StorageStatus::success();
}

} // namespace Ferry::Core::Storage
