/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "DualPaneSession.h"
#include "DirectoryWatcher.h"
#include "../Storage/LocalFileSystemProvider.h"
#include "../Storage/StoragePath.h"
#include "../Logging/Logger.h"

namespace Ferry::Core::Panes {

using namespace Storage;
using namespace Transfer;

namespace {
    constexpr const char* kCategory = "DualPaneSession";

    // Restores Browsing and clears in-flight flags even if planning throws
    class ExecutingScope {
    public:
        ExecutingScope(SessionState& state, Pane& pane) : _state(state), _pane(pane) {
            _state = SessionState::Executing;
        }
        ~ExecutingScope() {
            _pane.clearProcessing();
            _state = SessionState::Browsing;
        }

    private:
        SessionState& _state;
        Pane& _pane;
    };

    // Publishes a fresh cancellation source for one commit and withdraws it on every exit path
    class CommitCancelScope {
    public:
        CommitCancelScope(std::mutex& mutex, std::optional<Concurrency::CancellationSource>& slot)
            : _mutex(mutex), _slot(slot) {
            std::lock_guard<std::mutex> lock(_mutex);
            _slot.emplace();
            _token = _slot->token();
        }
        ~CommitCancelScope() {
            std::lock_guard<std::mutex> lock(_mutex);
            _slot.reset();
        }

        const Concurrency::CancellationToken& token() const noexcept { return _token; }

    private:
        std::mutex& _mutex;
        std::optional<Concurrency::CancellationSource>& _slot;
        Concurrency::CancellationToken _token;
    };
}

std::string_view sessionStateToString(SessionState state) noexcept {
    switch (state) {
        case SessionState::Browsing:  return "Browsing";
        case SessionState::Executing: return "Executing";
        case SessionState::Exited:    return "Exited";
    }
    return "Unknown";
}

DualPaneSession::DualPaneSession(ProviderRegistry& registry, PaneSpec left, PaneSpec right)
    : DualPaneSession(registry, std::move(left), std::move(right), TransferExecutor::Config{}) {
}

DualPaneSession::DualPaneSession(ProviderRegistry& registry, PaneSpec left, PaneSpec right,
                                 TransferExecutor::Config executorConfig)
    : _registry(registry)
    , _left(registry.require(left.providerId), left.path)
    , _right(registry.require(right.providerId), right.path)
    , _planner(registry)
    , _executor(std::make_unique<TransferExecutor>(registry, std::move(executorConfig))) {
    refreshPane(PaneSide::Left);
    refreshPane(PaneSide::Right);
}

DualPaneSession::~DualPaneSession() = default;

void DualPaneSession::pushError(std::string component, StorageErrorInfo error) {
    _errors.push_back(SessionError{std::move(component), std::move(error)});
}

void DualPaneSession::refreshPane(PaneSide side) {
    auto status = pane(side).refresh();
    if (!status) pushError(componentName(side), status.error());
}

void DualPaneSession::navigate(PaneSide side, const std::string& path) {
    auto status = pane(side).changeDirectory(path);
    if (!status) {
        pushError(componentName(side), status.error());
        return;
    }
    rewatch(side);
}

void DualPaneSession::rewatch(PaneSide side) {
    if (!_watcher) return;
    auto key = componentName(side);
    auto& target = pane(side);
    auto* local = dynamic_cast<LocalFileSystemProvider*>(&target.provider());
    if (!local) {
        _watcher->unwatch(key);
        return;
    }
    if (!_watcher->watch(key, local->toNative(target.currentPath()))) {
        FERRY_LOG_DEBUG_CAT(kCategory, "External changes to " + target.title() + " will not be noticed");
    }
}

void DualPaneSession::attachWatcher(std::shared_ptr<DirectoryWatcher> watcher) {
    _watcher = std::move(watcher);
    rewatch(PaneSide::Left);
    rewatch(PaneSide::Right);
}

size_t DualPaneSession::pollExternalChanges() {
    if (_state != SessionState::Browsing) return 0;
    size_t refreshed = 0;
    for (auto side : {PaneSide::Left, PaneSide::Right}) {
        if (_watcher && _watcher->consumeChanged(componentName(side))) {
            pane(side).markStale();
        }
        if (pane(side).isStale()) {
            refreshPane(side);
            ++refreshed;
        }
    }
    return refreshed;
}

void DualPaneSession::cancelCommit() {
    std::lock_guard<std::mutex> lock(_cancelMutex);
    if (_commitCancel) _commitCancel->cancel();
}

bool DualPaneSession::commitInProgress() const {
    std::lock_guard<std::mutex> lock(_cancelMutex);
    return _commitCancel.has_value();
}

PaneView DualPaneSession::view(PaneSide side) const {
    const auto& source = pane(side);
    PaneView out;
    out.title = source.title();
    out.cursorIndex = source.cursorIndex();
    out.active = side == _active;
    out.stale = source.isStale();
    if (source.error()) out.error = source.error()->describe();

    out.entries.reserve(source.entries().size());
    for (size_t i = 0; i < source.entries().size(); ++i) {
        const auto& entry = source.entries()[i];
        PaneEntryView item;
        item.entry = entry;
        item.underCursor = i == source.cursorIndex();
        item.processing = source.isProcessing(entry.path);
        if (auto mark = source.markFor(entry.path)) {
            item.mark = mark->kind;
            if (mark->failure) item.failureReason = mark->failure->describe();
        }
        out.entries.push_back(std::move(item));
    }
    return out;
}

ActionResult DualPaneSession::dispatch(const Action& action) {
    if (_state == SessionState::Exited) {
        return ActionResult::rejected("Session has exited");
    }
    if (_state == SessionState::Executing) {
        return ActionResult::rejected("A transfer is executing");
    }
    return std::visit([this](const auto& concrete) { return handle(concrete); }, action);
}

ActionResult DualPaneSession::handle(const Actions::MoveCursor& action) {
    activePane().moveCursor(action.delta);
    return ActionResult::ok();
}

ActionResult DualPaneSession::handle(const Actions::SetCursor& action) {
    if (!activePane().setCursor(action.index)) {
        return ActionResult::rejected("Cursor index " + std::to_string(action.index) + " is out of range");
    }
    return ActionResult::ok();
}

ActionResult DualPaneSession::handle(const Actions::EnterDirectory&) {
    const Entry* entry = activePane().entryUnderCursor();
    if (!entry) return ActionResult::rejected("Pane is empty");
    if (!entry->isDirectory()) return ActionResult::rejected(entry->name + " is not a directory");
    std::string target = entry->path;
    navigate(_active, target);
    return ActionResult::ok();
}

ActionResult DualPaneSession::handle(const Actions::GoUp&) {
    auto& current = activePane();
    if (StoragePath::isRoot(current.currentPath())) return ActionResult::rejected("Already at the root");
    std::string from = current.currentPath();
    navigate(_active, StoragePath::parent(from));
    // Land on the directory we came from
    current.setCursorToPath(from);
    return ActionResult::ok();
}

ActionResult DualPaneSession::handle(const Actions::SwitchPane&) {
    _active = other(_active);
    return ActionResult::ok();
}

ActionResult DualPaneSession::handle(const Actions::Refresh&) {
    refreshPane(_active);
    return ActionResult::ok();
}

ActionResult DualPaneSession::handle(const Actions::Mark& action) {
    auto& current = activePane();
    std::string path;
    if (action.path) {
        path = StoragePath::normalize(*action.path);
    } else {
        const Entry* entry = current.entryUnderCursor();
        if (!entry) return ActionResult::rejected("Pane is empty");
        path = entry->path;
    }
    if (!current.toggleMark(path, action.kind)) {
        return ActionResult::rejected(path + " is not in the current listing");
    }
    return ActionResult::ok();
}

ActionResult DualPaneSession::handle(const Actions::Commit&) {
    auto& source = activePane();
    auto& destination = inactivePane();
    if (!source.hasMarks()) return ActionResult::rejected("Nothing is marked");

    std::set<std::string> processing;
    for (const auto& [path, mark] : source.marks()) processing.insert(path);

    PlanRequest request;
    request.sourceProviderId = source.providerId();
    request.marks = source.markRequests();
    request.destinationProviderId = destination.providerId();
    request.destinationRoot = destination.currentPath();

    FERRY_LOG_INFO_CAT(kCategory, "Committing " + std::to_string(request.marks.size()) + " marks from " +
                                  source.title() + " to " + destination.title());
    {
        ExecutingScope executing(_state, source);
        source.setProcessing(std::move(processing));

        std::optional<TransferSummary> summary;
        {
            CommitCancelScope cancellation(_cancelMutex, _commitCancel);
            auto plan = _planner.plan(request);
            summary = _executor->execute(std::move(plan), cancellation.token(), _observer);
        }

        for (const auto& [markPath, outcome] : summary->markOutcomes()) {
            if (outcome.done) {
                source.clearMark(markPath);
            } else if (outcome.reason) {
                source.setMarkFailure(markPath, *outcome.reason);
                pushError("transfer", *outcome.reason);
            }
        }
        _lastSummary = std::move(*summary);
    }

    refreshPane(PaneSide::Left);
    refreshPane(PaneSide::Right);
    return ActionResult::ok();
}

ActionResult DualPaneSession::handle(const Actions::Exit&) {
    _state = SessionState::Exited;
    if (_watcher) {
        _watcher->unwatch(componentName(PaneSide::Left));
        _watcher->unwatch(componentName(PaneSide::Right));
    }
    return ActionResult::ok();
}

ActionResult DualPaneSession::handle(const Actions::AcknowledgeErrors&) {
    _errors.clear();
    return ActionResult::ok();
}

} // namespace Ferry::Core::Panes
