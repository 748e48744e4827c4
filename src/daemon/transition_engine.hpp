#pragma once

#include "platform/action_executor.hpp"
#include "platform/window_registry.hpp"
#include "state_store.hpp"
#include "types.hpp"

#include <string>
#include <vector>

enum class StageToggle { Staged, Unstaged };

// Every user-facing operation on the sticky/staged sets. Each one validates
// against the registry, then runs inside a single StateStore transaction,
// including the compositor call, so its effect is all-or-nothing to readers.
class TransitionEngine {
public:
    TransitionEngine(StateStore& store, WindowRegistry& registry, ActionExecutor& executor,
                     std::string stage_workspace, bool verbose = false);

    TransitionEngine(const TransitionEngine&) = delete;
    TransitionEngine& operator=(const TransitionEngine&) = delete;

    Result<bool> add(WindowId id);
    Result<bool> remove(WindowId id);
    // true when the focused window was added, false when it was removed.
    Result<bool> toggle_active();

    Result<void> stage(WindowId id);
    Result<void> unstage(WindowId id, WorkspaceId target);
    Result<void> stage_active();
    Result<void> unstage_active(WorkspaceId target);
    // Unstages the focused window to the active workspace if it is staged,
    // stages it otherwise.
    Result<StageToggle> toggle_stage_active();

    Result<size_t> stage_all();
    Result<size_t> unstage_all(WorkspaceId target);

    Result<std::vector<WindowId>> list_sticky();
    std::vector<WindowId> list_staged();

    bool is_staged(WindowId id);

    // Prunes vanished windows from the sticky set and moves the rest to
    // `target`. Returns the number of windows moved.
    Result<size_t> sync_to_workspace(WorkspaceId target);

    Result<WorkspaceId> active_workspace();

    const std::string& stage_workspace() const { return stage_workspace_; }

private:
    Result<WindowSet> live_windows();
    Result<void> require_exists(WindowId id, const char* missing_message);
    Result<WindowId> focused_window();

    Result<void> stage_locked(StateStore::Transaction& txn, WindowId id, const char* not_sticky_message);
    Result<void> unstage_locked(StateStore::Transaction& txn, WindowId id, WorkspaceId target,
                                const char* not_staged_message);

    void log(const std::string& msg);
    void log_error(const std::string& msg);

    StateStore& store_;
    WindowRegistry& registry_;
    ActionExecutor& executor_;
    std::string stage_workspace_;
    bool verbose_;
};
