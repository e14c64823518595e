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
#include <shared_mutex>
#include <string>
#include <vector>
#include "IStorageProvider.h"
#include "ProviderFactory.h"

namespace Ferry::Core::Storage {

/**
 * @brief Maps provider ids to live providers
 *
 * Panes and transfer tasks hold ids, never provider pointers; everything is
 * resolved here. Ids are stamped onto the provider when it is added.
 */
class ProviderRegistry {
public:
    ProviderRegistry() = default;
    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    /**
     * @brief Registers a provider
     * @param id Explicit id; when absent "<type>-<n>" is generated
     * @return The id now owning the provider
     * @throws std::invalid_argument for a null provider or a duplicate id
     */
    ProviderId add(std::shared_ptr<IStorageProvider> provider, std::optional<ProviderId> id = std::nullopt);

    /// Factory shortcut; ConfigurationError propagates
    ProviderId create(const ProviderFactory& factory, const std::string& tag, const ProviderOptions& options,
                      std::optional<ProviderId> id = std::nullopt);

    std::shared_ptr<IStorageProvider> find(const ProviderId& id) const;

    /// Resolves an id that must exist; a miss is logged Fatal and thrown as std::logic_error
    std::shared_ptr<IStorageProvider> require(const ProviderId& id) const;

    bool contains(const ProviderId& id) const;
    bool remove(const ProviderId& id);
    std::vector<ProviderId> ids() const;
    size_t size() const;

private:
    mutable std::shared_mutex _mutex;
    std::map<ProviderId, std::shared_ptr<IStorageProvider>> _providers;
    size_t _nextSerial = 1;
};

} // namespace Ferry::Core::Storage
