/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "ProviderFactory.h"
#include "LocalFileSystemProvider.h"
#include "LocalBucketClient.h"
#include "MemoryObjectStoreClient.h"
#include "ObjectStoreProvider.h"
#include "S3ObjectStoreClient.h"
#include "../Logging/Logger.h"
#include <charconv>
#include <cstdint>
#include <filesystem>

namespace Ferry::Core::Storage {

namespace {
    std::string requireBucketName(const std::string& tag, const ProviderOptions& options) {
        auto bucket = ProviderFactory::requireOption(tag, options, "bucket");
        if (!isValidBucketName(bucket)) {
            throw ConfigurationError(tag + ": invalid bucket name '" + bucket + "'");
        }
        return bucket;
    }

    bool parseFlag(const std::string& tag, const ProviderOptions& options, const char* key, bool fallback) {
        auto it = options.find(key);
        if (it == options.end()) return fallback;
        if (it->second == "true" || it->second == "1") return true;
        if (it->second == "false" || it->second == "0") return false;
        throw ConfigurationError(tag + ": option '" + std::string(key) + "' must be true or false, got '" +
                                 it->second + "'");
    }

    uint64_t parsePartSize(const std::string& tag, const ProviderOptions& options) {
        auto it = options.find("part_size_mib");
        if (it == options.end()) return S3ObjectStoreClient::MinPartSize;
        const auto& text = it->second;
        uint64_t mib = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), mib);
        if (ec != std::errc() || ptr != text.data() + text.size() || mib == 0 || mib > 5 * 1024) {
            throw ConfigurationError(tag + ": option 'part_size_mib' must be a number from 5 to 5120: '" + text + "'");
        }
        return mib * 1024 * 1024;
    }
}

ProviderFactory::ProviderFactory() {
    registerBackend("local", [](const ProviderOptions& options) -> std::shared_ptr<IStorageProvider> {
        requireKnownKeys("local", options, {"root", "max_concurrency"});
        LocalFileSystemProvider::Config config;
        auto it = options.find("root");
        if (it != options.end()) {
            if (it->second.empty()) throw ConfigurationError("local: option 'root' must not be empty");
            config.root = it->second;
        }
        config.maxConcurrency = parseConcurrency("local", options);
        return std::make_shared<LocalFileSystemProvider>(std::move(config));
    });

    registerBackend("bucket", [](const ProviderOptions& options) -> std::shared_ptr<IStorageProvider> {
        if (options.count("region") != 0) {
            throw ConfigurationError("bucket: option 'region' does not apply to a local bucket; use the s3 backend");
        }
        requireKnownKeys("bucket", options, {"bucket", "root", "max_concurrency"});
        auto bucket = requireBucketName("bucket", options);
        std::filesystem::path root = requireOption("bucket", options, "root");
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            throw ConfigurationError("bucket: root is not an existing directory: " + root.string());
        }
        ObjectStoreProvider::Config config;
        config.providerType = "bucket";
        config.maxConcurrency = parseConcurrency("bucket", options);
        return std::make_shared<ObjectStoreProvider>(std::make_shared<LocalBucketClient>(root, bucket), config);
    });

    registerBackend("s3", [](const ProviderOptions& options) -> std::shared_ptr<IStorageProvider> {
        requireKnownKeys("s3", options, {"bucket", "region", "endpoint", "access_key_id", "secret_access_key",
                                         "use_https", "verify_tls", "path_style", "part_size_mib",
                                         "max_concurrency"});
        S3ObjectStoreClient::Config s3;
        s3.bucket = requireBucketName("s3", options);
        if (auto it = options.find("region"); it != options.end()) {
            if (it->second.empty()) throw ConfigurationError("s3: option 'region' must not be empty when given");
            s3.region = it->second;
        }
        if (auto it = options.find("endpoint"); it != options.end()) {
            if (it->second.empty()) throw ConfigurationError("s3: option 'endpoint' must not be empty when given");
            s3.endpoint = it->second;
        }
        auto accessKey = options.find("access_key_id");
        auto secretKey = options.find("secret_access_key");
        if ((accessKey == options.end()) != (secretKey == options.end())) {
            throw ConfigurationError("s3: options 'access_key_id' and 'secret_access_key' must be given together");
        }
        if (accessKey != options.end()) {
            s3.accessKeyId = requireOption("s3", options, "access_key_id");
            s3.secretAccessKey = requireOption("s3", options, "secret_access_key");
        }
        s3.useHttps = parseFlag("s3", options, "use_https", true);
        s3.verifyTls = parseFlag("s3", options, "verify_tls", true);
        s3.virtualAddressing = !parseFlag("s3", options, "path_style", false);
        s3.partSize = parsePartSize("s3", options);

        ObjectStoreProvider::Config config;
        config.providerType = "s3";
        config.maxConcurrency = parseConcurrency("s3", options);
        return std::make_shared<ObjectStoreProvider>(std::make_shared<S3ObjectStoreClient>(std::move(s3)), config);
    });

    registerBackend("memory", [](const ProviderOptions& options) -> std::shared_ptr<IStorageProvider> {
        requireKnownKeys("memory", options, {"bucket", "max_concurrency"});
        auto bucket = requireBucketName("memory", options);
        ObjectStoreProvider::Config config;
        config.providerType = "memory";
        config.maxConcurrency = parseConcurrency("memory", options);
        return std::make_shared<ObjectStoreProvider>(std::make_shared<MemoryObjectStoreClient>(bucket), config);
    });
}

void ProviderFactory::registerBackend(const std::string& tag, Creator creator) {
    std::lock_guard<std::mutex> lock(_mutex);
    _creators[tag] = std::move(creator);
}

bool ProviderFactory::hasBackend(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _creators.count(tag) != 0;
}

std::vector<std::string> ProviderFactory::tags() const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<std::string> out;
    out.reserve(_creators.size());
    for (const auto& [tag, creator] : _creators) out.push_back(tag);
    return out;
}

std::shared_ptr<IStorageProvider> ProviderFactory::create(const std::string& tag,
                                                          const ProviderOptions& options) const {
    Creator creator;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _creators.find(tag);
        if (it == _creators.end()) {
            throw ConfigurationError("unknown provider type '" + tag + "'");
        }
        creator = it->second;
    }

    auto provider = creator(options);
    if (!provider) {
        throw ConfigurationError(tag + ": backend returned no provider");
    }
    FERRY_LOG_INFO_CAT("ProviderFactory", "Created " + tag + " provider for " + provider->resourceName());
    return provider;
}

void ProviderFactory::requireKnownKeys(const std::string& tag, const ProviderOptions& options,
                                       std::initializer_list<const char*> allowed) {
    for (const auto& [key, value] : options) {
        bool known = false;
        for (const char* name : allowed) {
            if (key == name) {
                known = true;
                break;
            }
        }
        if (!known) throw ConfigurationError(tag + ": unknown option '" + key + "'");
    }
}

std::string ProviderFactory::requireOption(const std::string& tag, const ProviderOptions& options, const char* key) {
    auto it = options.find(key);
    if (it == options.end() || it->second.empty()) {
        throw ConfigurationError(tag + ": missing required option '" + std::string(key) + "'");
    }
    return it->second;
}

size_t ProviderFactory::parseConcurrency(const std::string& tag, const ProviderOptions& options) {
    auto it = options.find("max_concurrency");
    if (it == options.end()) return 0;
    const auto& text = it->second;
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw ConfigurationError(tag + ": option 'max_concurrency' is not a number: '" + text + "'");
    }
    return value;
}

} // namespace Ferry::Core::Storage
