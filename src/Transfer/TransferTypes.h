/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

/**
 * @file TransferTypes.h
 * @brief Plans, tasks, outcomes and progress events shared by planner and executor
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "../Storage/StorageTypes.h"

namespace Ferry::Core::Transfer {

using Storage::Entry;
using Storage::ProviderId;
using Storage::StorageError;
using Storage::StorageErrorInfo;

enum class OperationKind { Move, Copy, Delete };

enum class TaskKind { CreateDir, CopyBytes, Delete, NativeMove };

enum class TaskStatus { Pending, Running, Done, Failed };

std::string_view operationKindToString(OperationKind kind) noexcept;
std::string_view taskKindToString(TaskKind kind) noexcept;
std::string_view taskStatusToString(TaskStatus status) noexcept;

using TaskId = size_t;

/**
 * @brief One unit of work in a plan
 *
 * The id equals the task's position in TransferPlan::tasks. dependsOn only ever
 * names earlier tasks.
 */
struct TransferTask {
    TaskId id = 0;
    TaskKind kind = TaskKind::CopyBytes;
    ProviderId sourceProviderId;
    std::string sourcePath;
    std::optional<ProviderId> destinationProviderId;   ///< Absent for Delete
    std::optional<std::string> destinationPath;        ///< Absent for Delete
    TaskStatus status = TaskStatus::Pending;
    std::optional<StorageErrorInfo> failure;
    std::vector<TaskId> dependsOn;
    std::string markPath;                              ///< Entry path of the originating mark
    size_t attempts = 0;
};

/// User intent handed to the planner: one marked entry of the active pane
struct MarkRequest {
    Entry entry;
    OperationKind kind = OperationKind::Copy;
};

/// A mark whose subtree could not be enumerated; it produced no tasks
struct PlanningFailure {
    std::string markPath;
    StorageErrorInfo error;
};

struct TransferPlan {
    std::vector<TransferTask> tasks;
    std::vector<PlanningFailure> planningFailures;

    bool empty() const noexcept { return tasks.empty() && planningFailures.empty(); }
    size_t size() const noexcept { return tasks.size(); }

    /// Tasks originating from one mark, in plan order
    std::vector<const TransferTask*> tasksForMark(const std::string& markPath) const;
};

struct TaskFailure {
    TaskId taskId = 0;
    TaskKind kind = TaskKind::CopyBytes;
    std::string sourcePath;
    std::optional<std::string> destinationPath;
    std::string markPath;
    StorageErrorInfo error;
};

struct MarkOutcome {
    bool done = false;
    std::optional<StorageErrorInfo> reason;   ///< First failure among the mark's tasks
};

/**
 * @brief Immutable result of executing one plan
 */
class TransferSummary {
public:
    TransferSummary() = default;
    TransferSummary(size_t done, size_t failed, bool cancelled,
                    std::vector<TaskFailure> failures,
                    std::map<std::string, MarkOutcome> markOutcomes,
                    std::vector<PlanningFailure> planningFailures);

    size_t doneCount() const noexcept { return _done; }
    size_t failedCount() const noexcept { return _failed; }
    size_t totalCount() const noexcept { return _done + _failed; }
    bool cancelled() const noexcept { return _cancelled; }

    const std::vector<TaskFailure>& failures() const noexcept { return _failures; }
    const std::map<std::string, MarkOutcome>& markOutcomes() const noexcept { return _markOutcomes; }
    const std::vector<PlanningFailure>& planningFailures() const noexcept { return _planningFailures; }

    std::optional<MarkOutcome> outcomeFor(const std::string& markPath) const;

    /// None when everything succeeded, PartialTransfer when anything failed
    StorageError status() const noexcept;
    bool succeeded() const noexcept { return status() == StorageError::None; }

    std::string describe() const;

private:
    size_t _done = 0;
    size_t _failed = 0;
    bool _cancelled = false;
    std::vector<TaskFailure> _failures;
    std::map<std::string, MarkOutcome> _markOutcomes;
    std::vector<PlanningFailure> _planningFailures;
};

/// Progress record delivered to the observer on the caller's thread
struct TransferEvent {
    TaskId taskId = 0;
    TaskKind kind = TaskKind::CopyBytes;
    TaskStatus status = TaskStatus::Pending;
    std::optional<StorageErrorInfo> error;
    size_t attempt = 0;
    uint64_t bytesTransferred = 0;
};

} // namespace Ferry::Core::Transfer
