/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once
#include <string>
#include <vector>
#include "TransferTypes.h"
#include "../Storage/ProviderRegistry.h"

namespace Ferry::Core::Transfer {

struct PlanRequest {
    ProviderId sourceProviderId;
    std::vector<MarkRequest> marks;          ///< In the source pane's listing order
    ProviderId destinationProviderId;
    std::string destinationRoot;             ///< Inactive pane's current path
};

/**
 * @brief Turns marks into an ordered, dependency-annotated plan
 *
 * Marked directories are enumerated depth-first with an explicit worklist so
 * deep trees cannot exhaust the stack. Ordering guarantees:
 * - a CreateDir precedes, and is a dependency of, every task for its children
 * - Deletes are post-order: each directory Delete follows and depends on all
 *   of its children's Deletes
 * - for copy+delete moves each source Delete depends on the copy of the same entry
 *
 * Same-provider moves on providers with native move collapse into a single
 * NativeMove task per mark. Destinations are never checked here; conflicts show
 * up when the task runs.
 */
class TransferPlanner {
public:
    explicit TransferPlanner(Storage::ProviderRegistry& registry);

    /// @throws std::logic_error if a provider id is not registered
    TransferPlan plan(const PlanRequest& request) const;

private:
    struct Node {
        Entry entry;
        std::string relativePath;          ///< Relative to the mark's parent directory
        std::vector<size_t> children;
    };

    /// Subtree of @p root with every parent before its children; siblings keep listing order
    Storage::StorageResult<std::vector<Node>> enumerate(Storage::IStorageProvider& provider,
                                                        const Entry& root) const;

    static std::vector<size_t> postOrder(const std::vector<Node>& nodes);

    Storage::ProviderRegistry& _registry;
};

} // namespace Ferry::Core::Transfer
