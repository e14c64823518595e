/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "TransferExecutor.h"
#include "../Concurrency/CompletionChannel.h"
#include "../Concurrency/WorkContractGroup.h"
#include "../CoreCommon.h"
#include "../Logging/Logger.h"
#include "../Storage/StoragePath.h"
#include <algorithm>
#include <cmath>
#include <deque>
#include <map>
#include <set>
#include <stdexcept>

namespace Ferry::Core::Transfer {

using namespace Storage;

namespace {
    constexpr const char* kCategory = "TransferExecutor";

    Concurrency::WorkService::Config serviceConfig(const TransferExecutor::Config& config) {
        Concurrency::WorkService::Config sc;
        sc.threadCount = std::max<size_t>(config.threadCount, 1);
        sc.name = "TransferWorkers";
        return sc;
    }

    [[noreturn]] void invariantViolation(const std::string& message) {
        FERRY_LOG_FATAL_CAT(kCategory, message);
        throw std::logic_error(message);
    }

    StorageErrorInfo cancelledError(const std::string& path) {
        return StorageErrorInfo{StorageError::Cancelled, "Transfer cancelled", path, std::nullopt};
    }
}

TransferExecutor::Config TransferExecutor::Config::fromEnvironment() {
    Config config;
    if (auto threads = safeGetEnvSize("FERRY_TRANSFER_THREADS")) {
        if (*threads > 0) config.threadCount = *threads;
    } else if (safeGetEnv("FERRY_TRANSFER_THREADS")) {
        FERRY_LOG_WARNING_CAT(kCategory, "Ignoring malformed FERRY_TRANSFER_THREADS");
    }
    if (auto retries = safeGetEnvSize("FERRY_TRANSFER_RETRIES")) {
        config.maxRetries = *retries;
    } else if (safeGetEnv("FERRY_TRANSFER_RETRIES")) {
        FERRY_LOG_WARNING_CAT(kCategory, "Ignoring malformed FERRY_TRANSFER_RETRIES");
    }
    return config;
}

TransferExecutor::TransferExecutor(ProviderRegistry& registry)
    : TransferExecutor(registry, Config{}) {
}

TransferExecutor::TransferExecutor(ProviderRegistry& registry, Config config)
    : _registry(registry)
    , _config(std::move(config))
    , _service(serviceConfig(_config)) {
    _service.start();
}

TransferExecutor::~TransferExecutor() {
    _service.stop();
}

size_t TransferExecutor::providerLimit(const IStorageProvider& provider) const {
    size_t own = provider.capabilities().maxConcurrency;
    size_t configured = _config.perProviderLimit;
    if (own == 0) return configured;
    if (configured == 0) return own;
    return std::min(own, configured);
}

StorageStatus TransferExecutor::copyBytes(IStorageProvider& source, const std::string& sourcePath,
                                          IStorageProvider& destination, const std::string& destinationPath,
                                          const Concurrency::CancellationToken& cancel, uint64_t& bytes) const {
    auto reader = source.openRead(sourcePath);
    if (!reader) return StorageStatus(reader.error());

    WriteOptions options;
    options.chunkSize = _config.chunkSize;
    options.progressCallback = [&bytes](uint64_t written) { bytes = written; };
    auto written = destination.write(destinationPath, *reader.value(), cancel, options);
    if (!written) return StorageStatus(written.error());
    return StorageStatus::success();
}

StorageStatus TransferExecutor::runOnce(const TaskInput& input, const Concurrency::CancellationToken& cancel,
                                        AttemptState& state) const {
    switch (input.kind) {
        case TaskKind::CreateDir:
            return input.destination->createDirectory(input.destinationPath);

        case TaskKind::CopyBytes:
            return copyBytes(*input.source, input.sourcePath, *input.destination, input.destinationPath,
                             cancel, state.bytes);

        case TaskKind::Delete:
            return input.source->remove(input.sourcePath);

        case TaskKind::NativeMove: {
            // A retried tree fallback resumes where it stopped
            if (!state.copiedTargets.empty()) return moveTreeByCopy(input, cancel, state);
            if (!state.copied) {
                auto moved = input.source->nativeMove(input.sourcePath, input.destinationPath);
                if (moved) return StorageStatus::success();
                if (moved.code() != StorageError::Unsupported) return StorageStatus(moved.error());

                // Backend refused at runtime (e.g. across mount points): copy then delete
                auto entry = input.source->stat(input.sourcePath);
                if (!entry) return StorageStatus(entry.error());
                if (entry.value().isDirectory()) return moveTreeByCopy(input, cancel, state);

                FERRY_LOG_DEBUG_CAT(kCategory, "Native move unsupported, copying " + input.sourcePath);
                auto copied = copyBytes(*input.source, input.sourcePath, *input.destination,
                                        input.destinationPath, cancel, state.bytes);
                if (!copied) return copied;
                state.copied = true;
            }
            if (cancel.isCancelled()) {
                return StorageStatus(cancelledError(input.sourcePath));
            }
            return input.source->remove(input.sourcePath);
        }
    }
    return StorageStatus::failure(StorageError::Unsupported, "Unknown task kind", input.sourcePath);
}

StorageStatus TransferExecutor::moveTreeByCopy(const TaskInput& input, const Concurrency::CancellationToken& cancel,
                                               AttemptState& state) const {
    if (!state.copied) {
        if (state.copiedTargets.empty()) {
            FERRY_LOG_DEBUG_CAT(kCategory, "Native move unsupported, copying tree " + input.sourcePath);
            auto existing = input.destination->stat(input.destinationPath);
            if (existing) {
                return StorageStatus::failure(StorageError::AlreadyExists, "Destination already exists",
                                              input.destinationPath);
            }
            if (existing.code() != StorageError::NotFound) return StorageStatus(existing.error());
        }

        // Parents before children; directories are removed in reverse discovery order
        std::vector<std::string> files;
        std::vector<std::string> directories;
        std::vector<std::pair<std::string, std::string>> worklist{{input.sourcePath, input.destinationPath}};
        while (!worklist.empty()) {
            auto [from, to] = std::move(worklist.back());
            worklist.pop_back();
            if (cancel.isCancelled()) return StorageStatus(cancelledError(from));

            if (!state.copiedTargets.count(to)) {
                auto created = input.destination->createDirectory(to);
                if (!created) return created;
                state.copiedTargets.insert(to);
            }
            directories.push_back(from);

            auto listing = input.source->list(from);
            if (!listing) return StorageStatus(listing.error());
            for (const auto& child : listing.value()) {
                auto target = StoragePath::join(to, child.name);
                if (child.isDirectory()) {
                    worklist.emplace_back(child.path, std::move(target));
                    continue;
                }
                files.push_back(child.path);
                if (state.copiedTargets.count(target)) continue;

                uint64_t fileBytes = 0;
                auto copied = copyBytes(*input.source, child.path, *input.destination, target, cancel, fileBytes);
                if (!copied) return copied;
                state.bytes += fileBytes;
                state.copiedTargets.insert(std::move(target));
            }
        }

        state.removals = std::move(files);
        state.removals.insert(state.removals.end(), directories.rbegin(), directories.rend());
        state.removed = 0;
        state.copied = true;
    }

    for (; state.removed < state.removals.size(); ++state.removed) {
        if (cancel.isCancelled()) return StorageStatus(cancelledError(input.sourcePath));
        auto removed = input.source->remove(state.removals[state.removed]);
        if (!removed) return removed;
    }
    return StorageStatus::success();
}

template<class Channel>
void TransferExecutor::runTask(const TaskInput& input, const Concurrency::CancellationToken& cancel,
                               Channel& channel) const {
    WorkerMessage finished;
    finished.type = WorkerMessage::Type::Finished;
    finished.id = input.id;

    AttemptState state;
    auto backoff = std::chrono::duration<double, std::milli>(_config.initialBackoff);
    const size_t maxAttempts = _config.maxRetries + 1;

    for (size_t attempt = 1; attempt <= maxAttempts; ++attempt) {
        finished.attempt = attempt;
        if (cancel.isCancelled()) {
            finished.error = cancelledError(input.sourcePath);
            break;
        }

        WorkerMessage started;
        started.type = WorkerMessage::Type::Started;
        started.id = input.id;
        started.attempt = attempt;
        channel.push(std::move(started));

        StorageStatus status = StorageStatus::success();
        try {
            status = runOnce(input, cancel, state);
        } catch (const std::exception& e) {
            status = StorageStatus::failure(StorageError::IOError,
                                            std::string("Unexpected exception: ") + e.what(), input.sourcePath);
        }

        if (status) {
            finished.error.reset();
            break;
        }
        finished.error = status.error();
        if (!isTransient(status.code()) || attempt == maxAttempts) break;

        FERRY_LOG_INFO_CAT(kCategory,
            "Task " + std::to_string(input.id) + " attempt " + std::to_string(attempt) + " failed (" +
            status.error().describe() + "), retrying in " +
            std::to_string(static_cast<long long>(backoff.count())) + "ms");
        if (cancel.waitFor(std::chrono::duration_cast<std::chrono::milliseconds>(backoff))) {
            finished.error = cancelledError(input.sourcePath);
            break;
        }
        backoff *= _config.backoffMultiplier;
    }

    finished.bytes = state.bytes;
    channel.push(std::move(finished));
}

TransferSummary TransferExecutor::execute(TransferPlan plan,
                                          const Concurrency::CancellationToken& cancel,
                                          const Observer& observer) {
    auto& tasks = plan.tasks;
    const size_t count = tasks.size();

    // Resolve every provider and validate the graph before anything runs
    std::map<ProviderId, std::shared_ptr<IStorageProvider>> providers;
    auto resolve = [&](const ProviderId& id) {
        auto it = providers.find(id);
        if (it == providers.end()) it = providers.emplace(id, _registry.require(id)).first;
        return it->second;
    };
    std::vector<size_t> unmet(count, 0);
    std::vector<std::vector<TaskId>> dependents(count);
    for (size_t i = 0; i < count; ++i) {
        auto& task = tasks[i];
        if (task.id != i) invariantViolation("Task id " + std::to_string(task.id) + " at position " + std::to_string(i));
        resolve(task.sourceProviderId);
        if (task.kind != TaskKind::Delete) {
            if (!task.destinationProviderId || !task.destinationPath) {
                invariantViolation("Task " + std::to_string(i) + " has no destination");
            }
            resolve(*task.destinationProviderId);
        }
        for (TaskId dep : task.dependsOn) {
            if (dep >= i) invariantViolation("Task " + std::to_string(i) + " depends on later task " + std::to_string(dep));
            dependents[dep].push_back(i);
            ++unmet[i];
        }
        task.status = TaskStatus::Pending;
        task.attempts = 0;
        task.failure.reset();
    }

    size_t done = 0;
    size_t failed = 0;
    size_t terminal = 0;
    std::vector<TaskFailure> failures;
    std::map<std::string, MarkOutcome> outcomes;

    auto emit = [&](const TransferTask& task, uint64_t bytes) {
        if (!observer) return;
        TransferEvent event;
        event.taskId = task.id;
        event.kind = task.kind;
        event.status = task.status;
        event.error = task.failure;
        event.attempt = task.attempts;
        event.bytesTransferred = bytes;
        observer(event);
    };

    auto fail = [&](TransferTask& task, StorageErrorInfo error) {
        task.status = TaskStatus::Failed;
        task.failure = error;
        ++failed;
        ++terminal;
        failures.push_back(TaskFailure{task.id, task.kind, task.sourcePath, task.destinationPath, task.markPath, error});
        auto& outcome = outcomes[task.markPath];
        if (!outcome.reason) outcome.reason = std::move(error);
        emit(task, 0);
    };

    // Every transitive dependent that has not started inherits the failure
    auto cascade = [&](TaskId root) {
        std::deque<TaskId> queue(dependents[root].begin(), dependents[root].end());
        while (!queue.empty()) {
            TaskId id = queue.front();
            queue.pop_front();
            auto& task = tasks[id];
            if (task.status != TaskStatus::Pending) continue;
            fail(task, StorageErrorInfo{StorageError::DependencyFailed,
                                        "Prerequisite task " + std::to_string(root) + " failed",
                                        task.sourcePath, std::nullopt});
            queue.insert(queue.end(), dependents[id].begin(), dependents[id].end());
        }
    };

    std::set<TaskId> ready;
    for (size_t i = 0; i < count; ++i) {
        if (unmet[i] == 0) ready.insert(i);
    }

    Concurrency::CompletionChannel<WorkerMessage> channel;
    Concurrency::WorkContractGroup group(std::max<size_t>(count, 1), "TransferPlan");
    if (count > 0) {
        auto added = _service.addWorkContractGroup(&group);
        if (added != Concurrency::WorkService::GroupOperationStatus::Added) {
            invariantViolation("Worker service refused the transfer group");
        }
    }

    std::map<ProviderId, size_t> inFlight;
    std::vector<bool> dispatched(count, false);
    size_t running = 0;

    auto providersOf = [&](const TransferTask& task) {
        std::vector<ProviderId> ids{task.sourceProviderId};
        if (task.destinationProviderId && *task.destinationProviderId != task.sourceProviderId) {
            ids.push_back(*task.destinationProviderId);
        }
        return ids;
    };

    FERRY_LOG_INFO_CAT(kCategory, "Executing plan of " + std::to_string(count) + " tasks");

    while (terminal < count) {
        if (cancel.isCancelled()) {
            for (auto& task : tasks) {
                if (task.status == TaskStatus::Pending && !dispatched[task.id]) {
                    fail(task, cancelledError(task.sourcePath));
                }
            }
            ready.clear();
        }

        for (auto it = ready.begin(); it != ready.end();) {
            auto& task = tasks[*it];
            if (task.status != TaskStatus::Pending) {
                it = ready.erase(it);
                continue;
            }
            auto ids = providersOf(task);
            bool admitted = std::all_of(ids.begin(), ids.end(), [&](const ProviderId& id) {
                size_t limit = providerLimit(*providers[id]);
                return limit == 0 || inFlight[id] < limit;
            });
            if (!admitted) {
                ++it;
                continue;
            }

            TaskInput input;
            input.id = task.id;
            input.kind = task.kind;
            input.source = providers[task.sourceProviderId];
            input.sourcePath = task.sourcePath;
            if (task.destinationProviderId) {
                input.destination = providers[*task.destinationProviderId];
                input.destinationPath = *task.destinationPath;
            }

            auto handle = group.createContract([this, input, cancel, &channel]() {
                runTask(input, cancel, channel);
            });
            if (!handle.valid() || handle.schedule() != Concurrency::ScheduleResult::Scheduled) {
                invariantViolation("Transfer group rejected task " + std::to_string(task.id));
            }

            for (const auto& id : ids) ++inFlight[id];
            dispatched[task.id] = true;
            ++running;
            it = ready.erase(it);
        }

        if (terminal >= count) break;
        if (running == 0) {
            invariantViolation("Transfer scheduler stalled with " + std::to_string(count - terminal) + " tasks left");
        }

        auto message = channel.pop();
        auto& task = tasks[message.id];
        task.attempts = message.attempt;

        if (message.type == WorkerMessage::Type::Started) {
            task.status = TaskStatus::Running;
            emit(task, 0);
            continue;
        }

        --running;
        for (const auto& id : providersOf(task)) --inFlight[id];

        if (!message.error) {
            task.status = TaskStatus::Done;
            ++done;
            ++terminal;
            emit(task, message.bytes);
            for (TaskId dependent : dependents[task.id]) {
                if (--unmet[dependent] == 0 && tasks[dependent].status == TaskStatus::Pending) {
                    ready.insert(dependent);
                }
            }
        } else {
            FERRY_LOG_WARNING_CAT(kCategory,
                std::string(taskKindToString(task.kind)) + " " + task.sourcePath + " failed: " +
                message.error->describe());
            fail(task, *message.error);
            cascade(task.id);
        }
    }

    if (count > 0) {
        group.wait();
        _service.removeWorkContractGroup(&group);
    }

    for (const auto& task : tasks) {
        auto& outcome = outcomes[task.markPath];
        outcome.done = !outcome.reason.has_value();
    }
    for (const auto& failure : plan.planningFailures) {
        outcomes[failure.markPath] = MarkOutcome{false, failure.error};
    }

    TransferSummary summary(done, failed, cancel.isCancelled(), std::move(failures), std::move(outcomes),
                            std::move(plan.planningFailures));
    FERRY_LOG_INFO_CAT(kCategory, "Plan finished: " + summary.describe());
    return summary;
}

} // namespace Ferry::Core::Transfer
