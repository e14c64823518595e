/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

/**
 * @file WorkContractGroup.h
 * @brief Fixed-capacity pool of schedulable work contracts
 *
 * A WorkContractGroup owns a fixed number of contract slots. Work is created into a
 * slot, scheduled, and then executed either by a WorkService worker thread (when the
 * group has been added to a running service) or by the caller through
 * executeAllBackgroundWork(). Capacity is a hard bound: createContract() returns an
 * invalid handle when every slot is occupied.
 *
 * @code
 * WorkService service(WorkService::Config{});
 * WorkContractGroup group(64, "Transfers");
 * service.start();
 * service.addWorkContractGroup(&group);
 *
 * group.createContract([]{ copyOneFile(); }).schedule();
 * group.wait();
 * @endcode
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "WorkContractHandle.h"

namespace Ferry {
namespace Core {
namespace Concurrency {

    class IConcurrencyProvider;

    class WorkContractGroup {
    public:
        /**
         * @param capacity Maximum number of live (allocated, scheduled or executing) contracts
         * @param name Diagnostic name used in logs
         */
        explicit WorkContractGroup(size_t capacity, std::string name = "WorkContractGroup");
        ~WorkContractGroup();

        WorkContractGroup(const WorkContractGroup&) = delete;
        WorkContractGroup& operator=(const WorkContractGroup&) = delete;

        /**
         * @brief Allocates a slot for @p work
         * @return Valid handle, or an invalid one if the group is full or stopping
         */
        WorkContractHandle createContract(std::function<void()> work);

        ScheduleResult scheduleContract(const WorkContractHandle& handle);
        ScheduleResult unscheduleContract(const WorkContractHandle& handle);
        void releaseContract(const WorkContractHandle& handle);
        bool isValidHandle(const WorkContractHandle& handle) const;
        ContractState getContractState(const WorkContractHandle& handle) const;

        /**
         * @brief Executes one ready contract on the calling thread
         * @return true if a contract was executed
         */
        bool executeNext();

        /**
         * @brief Drains the ready queue on the calling thread
         * @return Number of contracts executed
         */
        size_t executeAllBackgroundWork();

        /**
         * @brief Blocks until no contract is scheduled or executing
         */
        void wait();

        /**
         * @brief Stops accepting new contracts; already scheduled work still runs
         */
        void stop();
        void resume();
        bool isStopping() const noexcept { return _stopping.load(std::memory_order_acquire); }

        void setConcurrencyProvider(IConcurrencyProvider* provider);
        IConcurrencyProvider* concurrencyProvider() const;

        size_t capacity() const noexcept { return _capacity; }
        size_t activeCount() const noexcept { return _activeCount.load(std::memory_order_acquire); }
        size_t scheduledCount() const noexcept { return _scheduledCount.load(std::memory_order_acquire); }
        size_t executingCount() const noexcept { return _executingCount.load(std::memory_order_acquire); }
        bool hasReadyWork() const noexcept { return scheduledCount() > 0; }
        const std::string& name() const noexcept { return _name; }

    private:
        struct ContractSlot {
            std::function<void()> work;
            ContractState state = ContractState::Free;
            uint32_t generation = 1;
        };

        bool matches(const WorkContractHandle& handle) const;
        void freeSlotLocked(uint32_t index);
        void notifyWaitersIfIdle();

        const size_t _capacity;
        std::string _name;

        mutable std::mutex _slotMutex;
        std::vector<ContractSlot> _contracts;
        std::vector<uint32_t> _freeList;
        std::deque<uint32_t> _readyQueue;

        std::atomic<size_t> _activeCount{0};
        std::atomic<size_t> _scheduledCount{0};
        std::atomic<size_t> _executingCount{0};
        std::atomic<bool> _stopping{false};

        std::mutex _waitMutex;
        std::condition_variable _waitCondition;

        mutable std::shared_mutex _concurrencyProviderMutex;
        IConcurrencyProvider* _concurrencyProvider = nullptr;
    };

} // namespace Concurrency
} // namespace Core
} // namespace Ferry
