/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "WorkContractGroup.h"

#include <exception>

#include "../CoreCommon.h"
#include "../Logging/Logger.h"
#include "IConcurrencyProvider.h"

namespace Ferry {
namespace Core {
namespace Concurrency {

    WorkContractGroup::WorkContractGroup(size_t capacity, std::string name)
        : _capacity(capacity == 0 ? 1 : capacity)
        , _name(std::move(name))
        , _contracts(_capacity) {
        // Free list is a stack; push in reverse so slot 0 is handed out first
        _freeList.reserve(_capacity);
        for (size_t i = _capacity; i > 0; --i) {
            _freeList.push_back(static_cast<uint32_t>(i - 1));
        }
    }

    WorkContractGroup::~WorkContractGroup() {
        // Stop accepting new work, drop anything still queued, then wait for running contracts
        stop();
        {
            std::lock_guard<std::mutex> lock(_slotMutex);
            for (uint32_t index : _readyQueue) {
                _contracts[index].state = ContractState::Allocated;
                _scheduledCount.fetch_sub(1, std::memory_order_acq_rel);
            }
            _readyQueue.clear();
        }
        wait();

        {
            std::lock_guard<std::mutex> lock(_slotMutex);
            for (uint32_t i = 0; i < _capacity; ++i) {
                if (_contracts[i].state != ContractState::Free) {
                    freeSlotLocked(i);
                }
            }
        }

        FERRY_DEBUG_BLOCK(
            FERRY_ASSERT(_activeCount.load() == 0, "WorkContractGroup destroyed with active contracts");
        );

        // Read provider without holding the lock to avoid lock-order inversion with the service
        IConcurrencyProvider* provider = nullptr;
        {
            std::unique_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
            provider = _concurrencyProvider;
            _concurrencyProvider = nullptr;
        }
        if (provider) {
            provider->notifyGroupDestroyed(this);
        }
    }

    WorkContractHandle WorkContractGroup::createContract(std::function<void()> work) {
        if (isStopping() || !work) {
            return WorkContractHandle();
        }

        std::lock_guard<std::mutex> lock(_slotMutex);
        if (_freeList.empty()) {
            return WorkContractHandle();  // No free slots available
        }
        uint32_t index = _freeList.back();
        _freeList.pop_back();

        auto& slot = _contracts[index];
        slot.work = std::move(work);
        slot.state = ContractState::Allocated;
        _activeCount.fetch_add(1, std::memory_order_acq_rel);
        return WorkContractHandle(this, index, slot.generation);
    }

    bool WorkContractGroup::matches(const WorkContractHandle& handle) const {
        return handle._owner == this && handle._index < _capacity &&
               _contracts[handle._index].generation == handle._generation;
    }

    ScheduleResult WorkContractGroup::scheduleContract(const WorkContractHandle& handle) {
        {
            std::lock_guard<std::mutex> lock(_slotMutex);
            if (!matches(handle)) return ScheduleResult::Invalid;

            auto& slot = _contracts[handle._index];
            switch (slot.state) {
                case ContractState::Scheduled: return ScheduleResult::AlreadyScheduled;
                case ContractState::Executing: return ScheduleResult::Executing;
                case ContractState::Free: return ScheduleResult::Invalid;
                case ContractState::Allocated: break;
            }
            slot.state = ContractState::Scheduled;
            _readyQueue.push_back(handle._index);
            _scheduledCount.fetch_add(1, std::memory_order_acq_rel);
        }

        std::shared_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
        if (_concurrencyProvider) {
            _concurrencyProvider->notifyWorkAvailable(this);
        }
        return ScheduleResult::Scheduled;
    }

    ScheduleResult WorkContractGroup::unscheduleContract(const WorkContractHandle& handle) {
        ScheduleResult result;
        {
            std::lock_guard<std::mutex> lock(_slotMutex);
            if (!matches(handle)) return ScheduleResult::Invalid;

            auto& slot = _contracts[handle._index];
            if (slot.state == ContractState::Executing) return ScheduleResult::Executing;
            if (slot.state != ContractState::Scheduled) return ScheduleResult::NotScheduled;

            for (auto it = _readyQueue.begin(); it != _readyQueue.end(); ++it) {
                if (*it == handle._index) {
                    _readyQueue.erase(it);
                    break;
                }
            }
            slot.state = ContractState::Allocated;
            _scheduledCount.fetch_sub(1, std::memory_order_acq_rel);
            result = ScheduleResult::NotScheduled;
        }
        notifyWaitersIfIdle();
        return result;
    }

    void WorkContractGroup::releaseContract(const WorkContractHandle& handle) {
        {
            std::lock_guard<std::mutex> lock(_slotMutex);
            if (!matches(handle)) return;

            auto& slot = _contracts[handle._index];
            if (slot.state == ContractState::Executing || slot.state == ContractState::Free) {
                return;  // Executing contracts free themselves when they finish
            }
            if (slot.state == ContractState::Scheduled) {
                for (auto it = _readyQueue.begin(); it != _readyQueue.end(); ++it) {
                    if (*it == handle._index) {
                        _readyQueue.erase(it);
                        break;
                    }
                }
                _scheduledCount.fetch_sub(1, std::memory_order_acq_rel);
            }
            freeSlotLocked(handle._index);
        }
        notifyWaitersIfIdle();
    }

    bool WorkContractGroup::isValidHandle(const WorkContractHandle& handle) const {
        std::lock_guard<std::mutex> lock(_slotMutex);
        if (!matches(handle)) return false;
        auto st = _contracts[handle._index].state;
        return st == ContractState::Allocated || st == ContractState::Scheduled;
    }

    ContractState WorkContractGroup::getContractState(const WorkContractHandle& handle) const {
        std::lock_guard<std::mutex> lock(_slotMutex);
        if (!matches(handle)) return ContractState::Free;
        return _contracts[handle._index].state;
    }

    void WorkContractGroup::freeSlotLocked(uint32_t index) {
        auto& slot = _contracts[index];
        slot.work = nullptr;
        slot.state = ContractState::Free;
        ++slot.generation;
        _freeList.push_back(index);
        _activeCount.fetch_sub(1, std::memory_order_acq_rel);
    }

    bool WorkContractGroup::executeNext() {
        uint32_t index;
        std::function<void()> work;
        {
            std::lock_guard<std::mutex> lock(_slotMutex);
            if (_readyQueue.empty()) return false;
            index = _readyQueue.front();
            _readyQueue.pop_front();

            auto& slot = _contracts[index];
            slot.state = ContractState::Executing;
            work = std::move(slot.work);
            slot.work = nullptr;
            // Count as executing before leaving the scheduled set so wait() never sees a gap
            _executingCount.fetch_add(1, std::memory_order_acq_rel);
            _scheduledCount.fetch_sub(1, std::memory_order_acq_rel);
        }

        try {
            work();
        } catch (const std::exception& e) {
            FERRY_LOG_ERROR_CAT("WorkContractGroup",
                                _name + ": contract #" + std::to_string(index) + " threw: " + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(_slotMutex);
            freeSlotLocked(index);
            _executingCount.fetch_sub(1, std::memory_order_acq_rel);
        }
        notifyWaitersIfIdle();
        return true;
    }

    size_t WorkContractGroup::executeAllBackgroundWork() {
        size_t executed = 0;
        while (executeNext()) {
            ++executed;
        }
        return executed;
    }

    void WorkContractGroup::wait() {
        std::unique_lock<std::mutex> lock(_waitMutex);
        _waitCondition.wait(lock, [this] {
            return _scheduledCount.load(std::memory_order_acquire) == 0 &&
                   _executingCount.load(std::memory_order_acquire) == 0;
        });
    }

    void WorkContractGroup::notifyWaitersIfIdle() {
        if (_scheduledCount.load(std::memory_order_acquire) == 0 &&
            _executingCount.load(std::memory_order_acquire) == 0) {
            std::lock_guard<std::mutex> lock(_waitMutex);
            _waitCondition.notify_all();
        }
    }

    void WorkContractGroup::stop() {
        _stopping.store(true, std::memory_order_release);
    }

    void WorkContractGroup::resume() {
        _stopping.store(false, std::memory_order_release);
    }

    void WorkContractGroup::setConcurrencyProvider(IConcurrencyProvider* provider) {
        std::unique_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
        _concurrencyProvider = provider;
    }

    IConcurrencyProvider* WorkContractGroup::concurrencyProvider() const {
        std::shared_lock<std::shared_mutex> lock(_concurrencyProviderMutex);
        return _concurrencyProvider;
    }

} // namespace Concurrency
} // namespace Core
} // namespace Ferry
