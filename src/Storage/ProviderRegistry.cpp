/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "ProviderRegistry.h"
#include "../Logging/Logger.h"
#include <mutex>
#include <stdexcept>

namespace Ferry::Core::Storage {

ProviderId ProviderRegistry::add(std::shared_ptr<IStorageProvider> provider, std::optional<ProviderId> id) {
    if (!provider) {
        throw std::invalid_argument("ProviderRegistry::add: null provider");
    }

    std::unique_lock<std::shared_mutex> lock(_mutex);
    ProviderId assigned;
    if (id) {
        if (id->empty()) throw std::invalid_argument("ProviderRegistry::add: empty provider id");
        if (_providers.count(*id) != 0) {
            throw std::invalid_argument("ProviderRegistry::add: duplicate provider id '" + *id + "'");
        }
        assigned = *id;
    } else {
        do {
            assigned = provider->providerType() + "-" + std::to_string(_nextSerial++);
        } while (_providers.count(assigned) != 0);
    }

    provider->setId(assigned);
    _providers.emplace(assigned, std::move(provider));
    FERRY_LOG_DEBUG_CAT("ProviderRegistry", "Registered provider " + assigned);
    return assigned;
}

ProviderId ProviderRegistry::create(const ProviderFactory& factory, const std::string& tag,
                                    const ProviderOptions& options, std::optional<ProviderId> id) {
    return add(factory.create(tag, options), std::move(id));
}

std::shared_ptr<IStorageProvider> ProviderRegistry::find(const ProviderId& id) const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    auto it = _providers.find(id);
    return it == _providers.end() ? nullptr : it->second;
}

std::shared_ptr<IStorageProvider> ProviderRegistry::require(const ProviderId& id) const {
    auto provider = find(id);
    if (!provider) {
        std::string message = "Unregistered provider id '" + id + "'";
        FERRY_LOG_FATAL_CAT("ProviderRegistry", message);
        throw std::logic_error(message);
    }
    return provider;
}

bool ProviderRegistry::contains(const ProviderId& id) const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _providers.count(id) != 0;
}

bool ProviderRegistry::remove(const ProviderId& id) {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    return _providers.erase(id) != 0;
}

std::vector<ProviderId> ProviderRegistry::ids() const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    std::vector<ProviderId> out;
    out.reserve(_providers.size());
    for (const auto& [id, provider] : _providers) out.push_back(id);
    return out;
}

size_t ProviderRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _providers.size();
}

} // namespace Ferry::Core::Storage
