/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

/**
 * @file IObjectStoreClient.h
 * @brief Flat key/value bucket interface beneath ObjectStoreProvider
 *
 * Clients speak in keys, never in paths. Directory semantics (marker keys,
 * implicit prefixes) live in ObjectStoreProvider so every client only has to
 * implement the handful of primitives an S3-compatible service offers.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "StorageTypes.h"
#include "ByteStream.h"

namespace Ferry::Core::Storage {

struct ObjectInfo {
    std::string key;
    uint64_t size = 0;
    std::optional<std::chrono::system_clock::time_point> lastModified;
};

/**
 * @brief Result of a prefix listing
 *
 * With a delimiter, keys containing the delimiter after the prefix are rolled
 * up into commonPrefixes (each ending in the delimiter). Both vectors are in
 * lexicographic key order.
 */
struct ObjectListing {
    std::vector<ObjectInfo> objects;
    std::vector<std::string> commonPrefixes;
};

/**
 * @brief In-progress multipart upload
 *
 * Parts are invisible to readers until commit(). Destroying an upload that was
 * neither committed nor aborted aborts it.
 */
class IObjectUpload {
public:
    virtual ~IObjectUpload() = default;

    virtual StorageStatus appendPart(std::span<const std::byte> data) = 0;

    /// Publishes the object; AlreadyExists if the upload is conditional and the key is taken
    virtual StorageResult<ObjectInfo> commit() = 0;

    virtual void abort() noexcept = 0;

    virtual const std::string& key() const = 0;
};

class IObjectStoreClient {
public:
    virtual ~IObjectStoreClient() = default;

    virtual StorageResult<ObjectListing> listObjects(const std::string& prefix,
                                                     std::optional<char> delimiter) = 0;

    /// NotFound if the key is absent
    virtual StorageResult<ObjectInfo> headObject(const std::string& key) = 0;

    virtual StorageResult<std::unique_ptr<ByteSource>> getObject(const std::string& key) = 0;

    /**
     * @brief Starts a multipart upload
     * @param ifNoneMatch Conditional create: commit fails with AlreadyExists if the key exists
     */
    virtual StorageResult<std::unique_ptr<IObjectUpload>> createUpload(const std::string& key,
                                                                       bool ifNoneMatch) = 0;

    /// Deleting an absent key is NotFound
    virtual StorageStatus deleteObject(const std::string& key) = 0;

    virtual std::string bucket() const = 0;
    virtual bool isRemote() const { return false; }
};

/**
 * @brief Rolls sorted objects up into an ObjectListing
 *
 * Shared by clients that can enumerate their keys cheaply. @p objects must be
 * sorted by key and already filtered to @p prefix.
 */
ObjectListing groupByDelimiter(std::vector<ObjectInfo> objects,
                               const std::string& prefix,
                               std::optional<char> delimiter);

/// S3 bucket naming rules: 3-63 chars of [a-z0-9.-], alphanumeric at both ends
bool isValidBucketName(const std::string& name);

} // namespace Ferry::Core::Storage
