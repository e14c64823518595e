/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

/**
 * @file DualPaneSession.h
 * @brief Pane/mark state machine driving the transfer engine
 *
 * The session holds two panes, exactly one active, and moves between three
 * states: Browsing, Executing and Exited. dispatch() is the only mutation
 * path. Actions that are invalid for the current state are rejected with a
 * reason and never throw.
 *
 * @code
 * DualPaneSession session(registry, {"local-1", "/home/user"}, {"bucket-1", "/"});
 * session.dispatch(Actions::Mark{OperationKind::Copy, "/home/user/a.txt"});
 * auto result = session.dispatch(Actions::Commit{});
 * auto left = session.view(PaneSide::Left);
 * @endcode
 */
#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "Pane.h"
#include "../Concurrency/CancellationToken.h"
#include "../Storage/ProviderRegistry.h"
#include "../Transfer/TransferExecutor.h"
#include "../Transfer/TransferPlanner.h"

namespace Ferry::Core::Panes {

class DirectoryWatcher;

enum class SessionState { Browsing, Executing, Exited };
enum class PaneSide { Left, Right };

std::string_view sessionStateToString(SessionState state) noexcept;

namespace Actions {
    struct MoveCursor { long delta = 1; };
    struct SetCursor { size_t index = 0; };
    struct EnterDirectory {};
    struct GoUp {};
    struct SwitchPane {};
    struct Refresh {};
    struct Mark {
        OperationKind kind = OperationKind::Copy;
        std::optional<std::string> path;   ///< Defaults to the entry under the cursor
    };
    struct Commit {};
    struct Exit {};
    struct AcknowledgeErrors {};
}

using Action = std::variant<Actions::MoveCursor, Actions::SetCursor, Actions::EnterDirectory, Actions::GoUp,
                            Actions::SwitchPane, Actions::Refresh, Actions::Mark, Actions::Commit,
                            Actions::Exit, Actions::AcknowledgeErrors>;

struct ActionResult {
    bool accepted = true;
    std::string reason;

    static ActionResult ok() { return {}; }
    static ActionResult rejected(std::string why) { return ActionResult{false, std::move(why)}; }
};

/// One entry of the error stack shown to the user until acknowledged
struct SessionError {
    std::string component;     ///< "left pane", "right pane" or "transfer"
    StorageErrorInfo error;
};

struct PaneEntryView {
    Entry entry;
    std::optional<OperationKind> mark;
    std::optional<std::string> failureReason;
    bool processing = false;
    bool underCursor = false;
};

/// Rendering snapshot of one pane
struct PaneView {
    std::string title;
    std::vector<PaneEntryView> entries;
    size_t cursorIndex = 0;
    bool active = false;
    bool stale = false;
    std::optional<std::string> error;
};

struct PaneSpec {
    Storage::ProviderId providerId;
    std::string path = "/";
};

class DualPaneSession {
public:
    /// @throws std::logic_error if either provider id is not registered
    DualPaneSession(Storage::ProviderRegistry& registry, PaneSpec left, PaneSpec right);
    DualPaneSession(Storage::ProviderRegistry& registry, PaneSpec left, PaneSpec right,
                    Transfer::TransferExecutor::Config executorConfig);
    ~DualPaneSession();

    DualPaneSession(const DualPaneSession&) = delete;
    DualPaneSession& operator=(const DualPaneSession&) = delete;

    ActionResult dispatch(const Action& action);

    SessionState state() const noexcept { return _state; }
    PaneSide activeSide() const noexcept { return _active; }
    Pane& pane(PaneSide side) noexcept { return side == PaneSide::Left ? _left : _right; }
    const Pane& pane(PaneSide side) const noexcept { return side == PaneSide::Left ? _left : _right; }
    Pane& activePane() noexcept { return pane(_active); }
    Pane& inactivePane() noexcept { return pane(other(_active)); }

    PaneView view(PaneSide side) const;

    const std::vector<SessionError>& errors() const noexcept { return _errors; }
    const std::optional<Transfer::TransferSummary>& lastSummary() const noexcept { return _lastSummary; }

    /// Receives TransferEvents on the thread that dispatched Commit
    void setTransferObserver(Transfer::TransferExecutor::Observer observer) { _observer = std::move(observer); }

    /// Thread-safe; aborts the commit currently executing, if any
    void cancelCommit();

    /// Thread-safe; true between planning and the end of execution of a Commit
    bool commitInProgress() const;

    /**
     * @brief Watches local panes for external changes
     *
     * Panes backed by LocalFileSystemProvider are (re)watched whenever their
     * directory changes. Other providers are never watched.
     */
    void attachWatcher(std::shared_ptr<DirectoryWatcher> watcher);

    /**
     * @brief Re-lists panes flagged stale by the watcher
     * @return Number of panes refreshed; always 0 outside Browsing
     */
    size_t pollExternalChanges();

private:
    static PaneSide other(PaneSide side) noexcept { return side == PaneSide::Left ? PaneSide::Right : PaneSide::Left; }
    static std::string componentName(PaneSide side) { return side == PaneSide::Left ? "left pane" : "right pane"; }

    ActionResult handle(const Actions::MoveCursor& action);
    ActionResult handle(const Actions::SetCursor& action);
    ActionResult handle(const Actions::EnterDirectory& action);
    ActionResult handle(const Actions::GoUp& action);
    ActionResult handle(const Actions::SwitchPane& action);
    ActionResult handle(const Actions::Refresh& action);
    ActionResult handle(const Actions::Mark& action);
    ActionResult handle(const Actions::Commit& action);
    ActionResult handle(const Actions::Exit& action);
    ActionResult handle(const Actions::AcknowledgeErrors& action);

    void refreshPane(PaneSide side);
    void navigate(PaneSide side, const std::string& path);
    void rewatch(PaneSide side);
    void pushError(std::string component, StorageErrorInfo error);

    Storage::ProviderRegistry& _registry;
    Pane _left;
    Pane _right;
    PaneSide _active = PaneSide::Left;
    SessionState _state = SessionState::Browsing;
    std::vector<SessionError> _errors;
    std::optional<Transfer::TransferSummary> _lastSummary;

    Transfer::TransferPlanner _planner;
    std::unique_ptr<Transfer::TransferExecutor> _executor;
    Transfer::TransferExecutor::Observer _observer;

    mutable std::mutex _cancelMutex;
    std::optional<Concurrency::CancellationSource> _commitCancel;

    std::shared_ptr<DirectoryWatcher> _watcher;
};

} // namespace Ferry::Core::Panes
