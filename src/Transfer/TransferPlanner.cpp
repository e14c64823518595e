/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "TransferPlanner.h"
#include "../Storage/StoragePath.h"
#include "../Logging/Logger.h"
#include <utility>

namespace Ferry::Core::Transfer {

using namespace Storage;

namespace {
    TaskId appendTask(TransferPlan& plan, TransferTask task) {
        task.id = plan.tasks.size();
        plan.tasks.push_back(std::move(task));
        return plan.tasks.back().id;
    }
}

TransferPlanner::TransferPlanner(ProviderRegistry& registry)
    : _registry(registry) {
}

StorageResult<std::vector<TransferPlanner::Node>> TransferPlanner::enumerate(IStorageProvider& provider,
                                                                             const Entry& root) const {
    std::vector<Node> nodes;
    nodes.push_back(Node{root, root.name, {}});
    if (!root.isDirectory()) return nodes;

    // Explicit worklist; popping from the back gives depth-first order
    std::vector<size_t> worklist{0};
    while (!worklist.empty()) {
        size_t index = worklist.back();
        worklist.pop_back();

        auto listing = provider.list(nodes[index].entry.path);
        if (!listing) return StorageResult<std::vector<Node>>(listing.error());

        std::vector<size_t> directories;
        for (auto& child : listing.value()) {
            Node node;
            node.relativePath = nodes[index].relativePath + "/" + child.name;
            node.entry = std::move(child);
            nodes.push_back(std::move(node));
            size_t childIndex = nodes.size() - 1;
            nodes[index].children.push_back(childIndex);
            if (nodes[childIndex].entry.isDirectory()) directories.push_back(childIndex);
        }
        // Reverse so the first listed directory is expanded first
        for (auto it = directories.rbegin(); it != directories.rend(); ++it) {
            worklist.push_back(*it);
        }
    }
    return nodes;
}

std::vector<size_t> TransferPlanner::postOrder(const std::vector<Node>& nodes) {
    std::vector<size_t> order;
    if (nodes.empty()) return order;
    order.reserve(nodes.size());

    std::vector<std::pair<size_t, size_t>> stack{{0, 0}};
    while (!stack.empty()) {
        auto& [index, next] = stack.back();
        if (next < nodes[index].children.size()) {
            size_t child = nodes[index].children[next++];
            stack.emplace_back(child, 0);
        } else {
            order.push_back(index);
            stack.pop_back();
        }
    }
    return order;
}

TransferPlan TransferPlanner::plan(const PlanRequest& request) const {
    TransferPlan plan;

    auto source = _registry.require(request.sourceProviderId);
    bool deleteOnly = true;
    for (const auto& mark : request.marks) {
        if (mark.kind != OperationKind::Delete) deleteOnly = false;
    }
    std::shared_ptr<IStorageProvider> destination;
    if (!deleteOnly) destination = _registry.require(request.destinationProviderId);

    const bool sameProvider = request.sourceProviderId == request.destinationProviderId;
    const bool nativeMove = sameProvider && source->capabilities().supportsNativeMove;
    const auto destinationRoot = StoragePath::normalize(request.destinationRoot);

    for (const auto& mark : request.marks) {
        const auto& markPath = mark.entry.path;

        if (mark.kind != OperationKind::Delete && sameProvider && mark.entry.isDirectory() &&
            StoragePath::isWithin(destinationRoot, markPath)) {
            plan.planningFailures.push_back(PlanningFailure{markPath,
                StorageErrorInfo{StorageError::InvalidPath, "Destination lies inside the source directory",
                                 markPath, std::nullopt}});
            continue;
        }

        if (mark.kind == OperationKind::Move && nativeMove) {
            TransferTask task;
            task.kind = TaskKind::NativeMove;
            task.sourceProviderId = request.sourceProviderId;
            task.sourcePath = markPath;
            task.destinationProviderId = request.destinationProviderId;
            task.destinationPath = StoragePath::join(destinationRoot, mark.entry.name);
            task.markPath = markPath;
            appendTask(plan, std::move(task));
            continue;
        }

        auto tree = enumerate(*source, mark.entry);
        if (!tree) {
            FERRY_LOG_WARNING_CAT("TransferPlanner",
                "Cannot enumerate " + markPath + ": " + tree.error().describe());
            plan.planningFailures.push_back(PlanningFailure{markPath, tree.error()});
            continue;
        }
        const auto& nodes = tree.value();
        std::vector<std::optional<TaskId>> copyTask(nodes.size());

        if (mark.kind != OperationKind::Delete) {
            // Parents before children: every CreateDir exists before its children are emitted
            std::vector<std::optional<size_t>> parentOf(nodes.size());
            for (size_t i = 0; i < nodes.size(); ++i) {
                for (size_t child : nodes[i].children) parentOf[child] = i;
            }
            for (size_t i = 0; i < nodes.size(); ++i) {
                TransferTask task;
                task.kind = nodes[i].entry.isDirectory() ? TaskKind::CreateDir : TaskKind::CopyBytes;
                task.sourceProviderId = request.sourceProviderId;
                task.sourcePath = nodes[i].entry.path;
                task.destinationProviderId = request.destinationProviderId;
                task.destinationPath = StoragePath::join(destinationRoot, nodes[i].relativePath);
                task.markPath = markPath;
                if (parentOf[i]) task.dependsOn.push_back(*copyTask[*parentOf[i]]);
                copyTask[i] = appendTask(plan, std::move(task));
            }
        }

        if (mark.kind == OperationKind::Copy) continue;

        std::vector<std::optional<TaskId>> deleteTask(nodes.size());
        for (size_t index : postOrder(nodes)) {
            TransferTask task;
            task.kind = TaskKind::Delete;
            task.sourceProviderId = request.sourceProviderId;
            task.sourcePath = nodes[index].entry.path;
            task.markPath = markPath;
            if (copyTask[index]) task.dependsOn.push_back(*copyTask[index]);
            for (size_t child : nodes[index].children) task.dependsOn.push_back(*deleteTask[child]);
            deleteTask[index] = appendTask(plan, std::move(task));
        }
    }

    FERRY_LOG_DEBUG_CAT("TransferPlanner",
        "Planned " + std::to_string(plan.tasks.size()) + " tasks from " + std::to_string(request.marks.size()) +
        " marks (" + std::to_string(plan.planningFailures.size()) + " planning failures)");
    return plan;
}

} // namespace Ferry::Core::Transfer
