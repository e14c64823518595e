/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "IStorageProvider.h"

namespace Ferry::Core::Storage {

using ProviderOptions = std::map<std::string, std::string>;

/**
 * @brief Builds providers from a backend tag and an option map
 *
 * Built-in tags:
 * - "local":  root (existing directory, default "/"), max_concurrency
 * - "bucket": bucket, root (both required), max_concurrency
 * - "s3":     bucket (required), region (default us-east-1), endpoint,
 *             access_key_id and secret_access_key (together or not at all),
 *             use_https, verify_tls, path_style, part_size_mib (5-5120), max_concurrency
 * - "memory": bucket (required), max_concurrency
 *
 * Unknown tags, unknown option keys, and missing or malformed values throw
 * ConfigurationError so a bad configuration fails before any pane is shown.
 *
 * @code
 * ProviderFactory factory;
 * auto left = factory.create("local", {{"root", "/home/user"}});
 * auto right = factory.create("bucket", {{"bucket", "backup"}, {"root", "/srv/buckets"}});
 * @endcode
 */
class ProviderFactory {
public:
    using Creator = std::function<std::shared_ptr<IStorageProvider>(const ProviderOptions&)>;

    ProviderFactory();

    /// Registers or replaces a backend tag
    void registerBackend(const std::string& tag, Creator creator);
    bool hasBackend(const std::string& tag) const;
    std::vector<std::string> tags() const;

    /// @throws ConfigurationError
    std::shared_ptr<IStorageProvider> create(const std::string& tag, const ProviderOptions& options) const;

    // Option helpers for custom creators
    static void requireKnownKeys(const std::string& tag, const ProviderOptions& options,
                                 std::initializer_list<const char*> allowed);
    static std::string requireOption(const std::string& tag, const ProviderOptions& options, const char* key);
    static size_t parseConcurrency(const std::string& tag, const ProviderOptions& options);

private:
    mutable std::mutex _mutex;
    std::map<std::string, Creator> _creators;
};

} // namespace Ferry::Core::Storage
