/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "MemoryObjectStoreClient.h"

namespace Ferry::Core::Storage {

class MemoryObjectStoreClient::Upload : public IObjectUpload {
public:
    Upload(MemoryObjectStoreClient& owner, std::string key, bool ifNoneMatch)
        : _owner(owner), _key(std::move(key)), _ifNoneMatch(ifNoneMatch) {}

    ~Upload() override { abort(); }

    StorageStatus appendPart(std::span<const std::byte> data) override {
        if (_finished) {
            return StorageStatus::failure(StorageError::InvalidPath, "Upload already finished", _key);
        }
        _parts.insert(_parts.end(), data.begin(), data.end());
        return StorageStatus::success();
    }

    StorageResult<ObjectInfo> commit() override {
        if (_finished) {
            return StorageResult<ObjectInfo>::failure(StorageError::InvalidPath, "Upload already finished", _key);
        }
        _finished = true;
        return _owner.commitUpload(_key, std::move(_parts), _ifNoneMatch);
    }

    void abort() noexcept override {
        _finished = true;
        _parts.clear();
    }

    const std::string& key() const override { return _key; }

private:
    MemoryObjectStoreClient& _owner;
    std::string _key;
    bool _ifNoneMatch;
    bool _finished = false;
    std::vector<std::byte> _parts;
};

MemoryObjectStoreClient::MemoryObjectStoreClient(std::string bucket)
    : _bucket(std::move(bucket)) {
}

StorageResult<ObjectListing> MemoryObjectStoreClient::listObjects(const std::string& prefix,
                                                                  std::optional<char> delimiter) {
    std::vector<ObjectInfo> matched;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (auto it = _objects.lower_bound(prefix); it != _objects.end(); ++it) {
            if (it->first.compare(0, prefix.size(), prefix) != 0) break;
            matched.push_back(ObjectInfo{it->first, it->second.data->size(), it->second.lastModified});
        }
    }
    return groupByDelimiter(std::move(matched), prefix, delimiter);
}

StorageResult<ObjectInfo> MemoryObjectStoreClient::headObject(const std::string& key) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _objects.find(key);
    if (it == _objects.end()) {
        return StorageResult<ObjectInfo>::failure(StorageError::NotFound, "No such key", key);
    }
    return ObjectInfo{key, it->second.data->size(), it->second.lastModified};
}

StorageResult<std::unique_ptr<ByteSource>> MemoryObjectStoreClient::getObject(const std::string& key) {
    std::shared_ptr<const std::vector<std::byte>> data;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _objects.find(key);
        if (it == _objects.end()) {
            return StorageResult<std::unique_ptr<ByteSource>>::failure(StorageError::NotFound, "No such key", key);
        }
        data = it->second.data;
    }
    std::unique_ptr<ByteSource> source = std::make_unique<MemoryByteSource>(std::move(data), key);
    return source;
}

StorageResult<std::unique_ptr<IObjectUpload>> MemoryObjectStoreClient::createUpload(const std::string& key,
                                                                                    bool ifNoneMatch) {
    std::unique_ptr<IObjectUpload> upload = std::make_unique<Upload>(*this, key, ifNoneMatch);
    return upload;
}

StorageResult<ObjectInfo> MemoryObjectStoreClient::commitUpload(const std::string& key,
                                                                std::vector<std::byte> data,
                                                                bool ifNoneMatch) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (ifNoneMatch && _objects.count(key) != 0) {
        return StorageResult<ObjectInfo>::failure(StorageError::AlreadyExists, "Key already exists", key);
    }
    StoredObject stored{std::make_shared<const std::vector<std::byte>>(std::move(data)),
                        std::chrono::system_clock::now()};
    ObjectInfo info{key, stored.data->size(), stored.lastModified};
    _objects[key] = std::move(stored);
    return info;
}

StorageStatus MemoryObjectStoreClient::deleteObject(const std::string& key) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_objects.erase(key) == 0) {
        return StorageStatus::failure(StorageError::NotFound, "No such key", key);
    }
    return StorageStatus::success();
}

void MemoryObjectStoreClient::putObject(const std::string& key, std::string_view body) {
    std::lock_guard<std::mutex> lock(_mutex);
    _objects[key] = StoredObject{makeBytes(body), std::chrono::system_clock::now()};
}

size_t MemoryObjectStoreClient::objectCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _objects.size();
}

} // namespace Ferry::Core::Storage
