/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "WorkService.h"

#include <algorithm>

#include "../Logging/Logger.h"
#include "WorkContractGroup.h"

namespace Ferry {
namespace Core {
namespace Concurrency {

    WorkService::WorkService(Config config)
        : _config(std::move(config)) {
        if (_config.threadCount == 0) {
            _config.threadCount = std::max(1u, std::thread::hardware_concurrency());
        }
    }

    WorkService::~WorkService() {
        stop();

        std::unique_lock<std::shared_mutex> lock(_groupsMutex);
        for (auto* group : _groups) {
            group->setConcurrencyProvider(nullptr);
        }
        _groups.clear();
    }

    void WorkService::start() {
        bool expected = false;
        if (!_running.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return;
        }
        _threads.reserve(_config.threadCount);
        for (size_t i = 0; i < _config.threadCount; ++i) {
            _threads.emplace_back([this, i] { workerLoop(i); });
        }
        FERRY_LOG_DEBUG_CAT("WorkService", _config.name + " started with " +
                            std::to_string(_config.threadCount) + " threads");
    }

    void WorkService::stop() {
        bool expected = true;
        if (!_running.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(_wakeMutex);
            ++_wakeSequence;
        }
        _wakeCondition.notify_all();
        for (auto& t : _threads) {
            if (t.joinable()) t.join();
        }
        _threads.clear();
        FERRY_LOG_DEBUG_CAT("WorkService", _config.name + " stopped");
    }

    WorkService::GroupOperationStatus WorkService::addWorkContractGroup(WorkContractGroup* group) {
        if (!group) return GroupOperationStatus::NotFound;
        {
            std::unique_lock<std::shared_mutex> lock(_groupsMutex);
            if (std::find(_groups.begin(), _groups.end(), group) != _groups.end()) {
                return GroupOperationStatus::Exists;
            }
            if (_groups.size() >= _config.maxGroups) {
                return GroupOperationStatus::OutOfSpace;
            }
            _groups.push_back(group);
        }
        group->setConcurrencyProvider(this);
        // The group may already hold scheduled work
        notifyWorkAvailable(group);
        return GroupOperationStatus::Added;
    }

    WorkService::GroupOperationStatus WorkService::removeWorkContractGroup(WorkContractGroup* group) {
        {
            std::unique_lock<std::shared_mutex> lock(_groupsMutex);
            auto it = std::find(_groups.begin(), _groups.end(), group);
            if (it == _groups.end()) {
                return GroupOperationStatus::NotFound;
            }
            _groups.erase(it);
        }
        group->setConcurrencyProvider(nullptr);
        return GroupOperationStatus::Removed;
    }

    size_t WorkService::getWorkContractGroupCount() const {
        std::shared_lock<std::shared_mutex> lock(_groupsMutex);
        return _groups.size();
    }

    void WorkService::notifyWorkAvailable(WorkContractGroup*) {
        {
            std::lock_guard<std::mutex> lock(_wakeMutex);
            ++_wakeSequence;
        }
        _wakeCondition.notify_one();
    }

    void WorkService::notifyGroupDestroyed(WorkContractGroup* group) {
        std::unique_lock<std::shared_mutex> lock(_groupsMutex);
        _groups.erase(std::remove(_groups.begin(), _groups.end(), group), _groups.end());
    }

    bool WorkService::tryExecuteOne(size_t& cursor) {
        // Holding the shared lock keeps every registered group alive for the duration of the call
        std::shared_lock<std::shared_mutex> lock(_groupsMutex);
        const size_t count = _groups.size();
        for (size_t n = 0; n < count; ++n) {
            auto* group = _groups[(cursor + n) % count];
            if (group->executeNext()) {
                cursor = (cursor + n + 1) % count;
                return true;
            }
        }
        return false;
    }

    void WorkService::workerLoop(size_t threadIndex) {
        size_t cursor = threadIndex;
        while (_running.load(std::memory_order_acquire)) {
            uint64_t observed;
            {
                std::lock_guard<std::mutex> lock(_wakeMutex);
                observed = _wakeSequence;
            }
            if (tryExecuteOne(cursor)) {
                continue;
            }
            std::unique_lock<std::mutex> lock(_wakeMutex);
            _wakeCondition.wait(lock, [this, observed] {
                return _wakeSequence != observed || !_running.load(std::memory_order_acquire);
            });
        }
    }

} // namespace Concurrency
} // namespace Core
} // namespace Ferry
