/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

/**
 * @file TransferExecutor.h
 * @brief Runs a TransferPlan on a bounded worker pool
 *
 * Each execute() call gets its own WorkContractGroup on the executor's
 * WorkService. Workers receive a copy of one task's inputs, run it with
 * retries, and report back through a CompletionChannel. The calling thread is
 * the single aggregator: it owns the plan, dispatches tasks whose dependencies
 * are Done, cascades failures to dependents, and delivers TransferEvents to
 * the observer.
 *
 * @code
 * TransferExecutor executor(registry, TransferExecutor::Config::fromEnvironment());
 * Concurrency::CancellationSource cancel;
 * auto summary = executor.execute(std::move(plan), cancel.token(),
 *     [](const TransferEvent& e) { renderProgress(e); });
 * if (!summary.succeeded()) showErrors(summary.failures());
 * @endcode
 */
#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "TransferTypes.h"
#include "../Concurrency/CancellationToken.h"
#include "../Concurrency/WorkService.h"
#include "../Storage/ProviderRegistry.h"

namespace Ferry::Core::Transfer {

class TransferExecutor {
public:
    struct Config {
        size_t threadCount = 4;                                 ///< Worker threads in the pool
        size_t maxRetries = 3;                                  ///< Extra attempts after a ProviderUnavailable
        std::chrono::milliseconds initialBackoff{50};           ///< Wait before the first retry
        double backoffMultiplier = 2.0;
        size_t chunkSize = 256 * 1024;                          ///< Streaming chunk size for CopyBytes
        size_t perProviderLimit = 0;                            ///< Max concurrent tasks touching one provider (0 = unlimited)

        /// Defaults overridden by FERRY_TRANSFER_THREADS and FERRY_TRANSFER_RETRIES
        static Config fromEnvironment();
    };

    using Observer = std::function<void(const TransferEvent&)>;

    explicit TransferExecutor(Storage::ProviderRegistry& registry);
    TransferExecutor(Storage::ProviderRegistry& registry, Config config);
    ~TransferExecutor();

    TransferExecutor(const TransferExecutor&) = delete;
    TransferExecutor& operator=(const TransferExecutor&) = delete;

    /**
     * @brief Executes a plan to completion on the calling thread's behalf
     * @param plan Consumed; tasks are owned by the aggregator until the summary is built
     * @param cancel Checked before each attempt and between stream chunks
     * @param observer Invoked on the calling thread for every task state change
     * @return Summary with per-task failures and per-mark outcomes
     * @throws std::logic_error if the plan references an unregistered provider or a later task
     */
    TransferSummary execute(TransferPlan plan,
                            const Concurrency::CancellationToken& cancel = {},
                            const Observer& observer = {});

    const Config& config() const noexcept { return _config; }

private:
    struct TaskInput {
        TaskId id = 0;
        TaskKind kind = TaskKind::CopyBytes;
        std::shared_ptr<Storage::IStorageProvider> source;
        std::string sourcePath;
        std::shared_ptr<Storage::IStorageProvider> destination;
        std::string destinationPath;
    };

    struct WorkerMessage {
        enum class Type { Started, Finished };
        Type type = Type::Started;
        TaskId id = 0;
        size_t attempt = 0;
        std::optional<Storage::StorageErrorInfo> error;
        uint64_t bytes = 0;
    };

    // Mutable per-task state carried across attempts by the worker
    struct AttemptState {
        bool copied = false;
        uint64_t bytes = 0;
        // Directory fallback progress, kept across retries
        std::set<std::string> copiedTargets;
        std::vector<std::string> removals;   ///< Source paths, children before parents
        size_t removed = 0;
    };

    template<class Channel>
    void runTask(const TaskInput& input, const Concurrency::CancellationToken& cancel, Channel& channel) const;

    Storage::StorageStatus runOnce(const TaskInput& input, const Concurrency::CancellationToken& cancel,
                                   AttemptState& state) const;
    /// Copies a directory tree then removes the source, for NativeMove on a backend that refused it
    Storage::StorageStatus moveTreeByCopy(const TaskInput& input, const Concurrency::CancellationToken& cancel,
                                          AttemptState& state) const;
    Storage::StorageStatus copyBytes(Storage::IStorageProvider& source, const std::string& sourcePath,
                                     Storage::IStorageProvider& destination, const std::string& destinationPath,
                                     const Concurrency::CancellationToken& cancel, uint64_t& bytes) const;

    size_t providerLimit(const Storage::IStorageProvider& provider) const;

    Storage::ProviderRegistry& _registry;
    Config _config;
    Concurrency::WorkService _service;
};

} // namespace Ferry::Core::Transfer
