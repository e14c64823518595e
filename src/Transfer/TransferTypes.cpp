/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "TransferTypes.h"

namespace Ferry::Core::Transfer {

std::string_view operationKindToString(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::Move:   return "Move";
        case OperationKind::Copy:   return "Copy";
        case OperationKind::Delete: return "Delete";
    }
    return "Unknown";
}

std::string_view taskKindToString(TaskKind kind) noexcept {
    switch (kind) {
        case TaskKind::CreateDir:  return "CreateDir";
        case TaskKind::CopyBytes:  return "CopyBytes";
        case TaskKind::Delete:     return "Delete";
        case TaskKind::NativeMove: return "NativeMove";
    }
    return "Unknown";
}

std::string_view taskStatusToString(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending: return "Pending";
        case TaskStatus::Running: return "Running";
        case TaskStatus::Done:    return "Done";
        case TaskStatus::Failed:  return "Failed";
    }
    return "Unknown";
}

std::vector<const TransferTask*> TransferPlan::tasksForMark(const std::string& markPath) const {
    std::vector<const TransferTask*> out;
    for (const auto& task : tasks) {
        if (task.markPath == markPath) out.push_back(&task);
    }
    return out;
}

TransferSummary::TransferSummary(size_t done, size_t failed, bool cancelled,
                                 std::vector<TaskFailure> failures,
                                 std::map<std::string, MarkOutcome> markOutcomes,
                                 std::vector<PlanningFailure> planningFailures)
    : _done(done)
    , _failed(failed)
    , _cancelled(cancelled)
    , _failures(std::move(failures))
    , _markOutcomes(std::move(markOutcomes))
    , _planningFailures(std::move(planningFailures)) {
}

std::optional<MarkOutcome> TransferSummary::outcomeFor(const std::string& markPath) const {
    auto it = _markOutcomes.find(markPath);
    if (it == _markOutcomes.end()) return std::nullopt;
    return it->second;
}

StorageError TransferSummary::status() const noexcept {
    if (_failed > 0 || !_planningFailures.empty()) return StorageError::PartialTransfer;
    return StorageError::None;
}

std::string TransferSummary::describe() const {
    std::string out = std::to_string(_done) + " done, " + std::to_string(_failed) + " failed";
    if (!_planningFailures.empty()) {
        out += ", " + std::to_string(_planningFailures.size()) + " not planned";
    }
    if (_cancelled) out += " (cancelled)";
    return out;
}

} // namespace Ferry::Core::Transfer
