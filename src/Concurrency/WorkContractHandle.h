/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

/**
 * @file WorkContractHandle.h
 * @brief Value handle for scheduling and managing work contracts
 *
 * A WorkContractHandle is stamped with (owner + index + generation) by
 * WorkContractGroup. The group is the source of truth; a handle whose generation
 * no longer matches its slot is simply invalid, which prevents use-after-free
 * when slots are recycled.
 */

#pragma once

#include <cstdint>
#include <string>

namespace Ferry
{
namespace Core
{
namespace Concurrency
{

class WorkContractGroup;

/**
 * @brief States that a work contract can be in during its lifecycle
 */
enum class ContractState : uint32_t
{
    Free = 0,       ///< Contract slot is available for allocation
    Allocated = 1,  ///< Contract has been allocated but not scheduled
    Scheduled = 2,  ///< Contract is scheduled and ready for execution
    Executing = 3   ///< Contract is currently being executed
};

/**
 * @brief Result of schedule/unschedule operations
 */
enum class ScheduleResult
{
    Scheduled,         ///< Contract is now scheduled (successful schedule operation)
    AlreadyScheduled,  ///< Contract was already scheduled (schedule operation failed)
    NotScheduled,      ///< Contract is not scheduled (successful unschedule operation)
    Executing,         ///< Cannot modify - currently executing
    Invalid            ///< Invalid handle provided
};

/**
 * @class WorkContractHandle
 * @brief Stamped identity of one contract slot
 *
 * Copying a handle copies only its identity. After the contract starts executing
 * or is released, valid() becomes false.
 *
 * @code
 * WorkContractGroup group(64, "Uploads");
 * auto h = group.createContract([]{ doWork(); });
 * if (h.schedule() == ScheduleResult::Scheduled) { // queued }
 * @endcode
 */
class WorkContractHandle
{
public:
    WorkContractHandle() = default;

    ScheduleResult schedule();
    ScheduleResult unschedule();
    bool valid() const;
    void release();
    bool isScheduled() const;
    bool isExecuting() const;

    WorkContractGroup* owner() const noexcept { return _owner; }
    uint32_t index() const noexcept { return _index; }
    uint32_t generation() const noexcept { return _generation; }

    std::string toString() const;

private:
    friend class WorkContractGroup;

    WorkContractHandle(WorkContractGroup* owner, uint32_t index, uint32_t generation)
        : _owner(owner), _index(index), _generation(generation) {}

    WorkContractGroup* _owner = nullptr;
    uint32_t _index = 0;
    uint32_t _generation = 0;
};

}  // namespace Concurrency
}  // namespace Core
}  // namespace Ferry
