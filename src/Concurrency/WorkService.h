/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

/**
 * @file WorkService.h
 * @brief Fixed-size worker thread pool that executes WorkContractGroups
 *
 * The service owns its threads; groups are registered with addWorkContractGroup()
 * and serviced round-robin. Threads sleep when no registered group has ready work
 * and are woken through IConcurrencyProvider::notifyWorkAvailable().
 *
 * A group must be removed (or destroyed) before the service is destroyed. Do not call
 * removeWorkContractGroup() from inside a contract: removal waits for in-flight
 * contracts to leave the group.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include "IConcurrencyProvider.h"

namespace Ferry {
namespace Core {
namespace Concurrency {

    class WorkContractGroup;

    class WorkService : public IConcurrencyProvider {
    public:
        struct Config {
            size_t threadCount = 0;     ///< 0 = std::thread::hardware_concurrency()
            size_t maxGroups = 64;      ///< Upper bound on registered groups
            std::string name = "WorkService";
        };

        enum class GroupOperationStatus {
            Added,
            Removed,
            Exists,
            NotFound,
            OutOfSpace
        };

        explicit WorkService(Config config);
        ~WorkService() override;

        WorkService(const WorkService&) = delete;
        WorkService& operator=(const WorkService&) = delete;

        void start();
        void stop();
        bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

        GroupOperationStatus addWorkContractGroup(WorkContractGroup* group);
        GroupOperationStatus removeWorkContractGroup(WorkContractGroup* group);
        size_t getWorkContractGroupCount() const;

        size_t getThreadCount() const noexcept { return _config.threadCount; }

        // IConcurrencyProvider
        void notifyWorkAvailable(WorkContractGroup* group) override;
        void notifyGroupDestroyed(WorkContractGroup* group) override;

    private:
        void workerLoop(size_t threadIndex);
        bool tryExecuteOne(size_t& cursor);

        Config _config;
        std::vector<std::thread> _threads;
        std::atomic<bool> _running{false};

        mutable std::shared_mutex _groupsMutex;
        std::vector<WorkContractGroup*> _groups;

        std::mutex _wakeMutex;
        std::condition_variable _wakeCondition;
        uint64_t _wakeSequence = 0;
    };

} // namespace Concurrency
} // namespace Core
} // namespace Ferry
