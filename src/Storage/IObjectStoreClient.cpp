/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "IObjectStoreClient.h"

namespace Ferry::Core::Storage {

ObjectListing groupByDelimiter(std::vector<ObjectInfo> objects,
                               const std::string& prefix,
                               std::optional<char> delimiter) {
    ObjectListing listing;
    for (auto& object : objects) {
        if (delimiter) {
            auto cut = object.key.find(*delimiter, prefix.size());
            if (cut != std::string::npos) {
                auto common = object.key.substr(0, cut + 1);
                // Input is sorted, so duplicates are adjacent
                if (listing.commonPrefixes.empty() || listing.commonPrefixes.back() != common) {
                    listing.commonPrefixes.push_back(std::move(common));
                }
                continue;
            }
        }
        listing.objects.push_back(std::move(object));
    }
    return listing;
}

bool isValidBucketName(const std::string& name) {
    if (name.size() < 3 || name.size() > 63) return false;
    auto alnum = [](char c) { return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'); };
    if (!alnum(name.front()) || !alnum(name.back())) return false;
    for (char c : name) {
        if (!alnum(c) && c != '.' && c != '-') return false;
    }
    return name.find("..") == std::string::npos;
}

} // namespace Ferry::Core::Storage
