#include "transition_engine.hpp"

#include <format>
#include <print>

namespace {

enum class Membership { Sticky, Staged };

void insert(StateStore::Transaction& txn, Membership set, WindowId id) {
    if (set == Membership::Sticky) txn.add_sticky(id);
    else txn.add_staged(id);
}

void erase(StateStore::Transaction& txn, Membership set, WindowId id) {
    if (set == Membership::Sticky) txn.remove_sticky(id);
    else txn.remove_staged(id);
}

// Compensating move between the two sets: take id out of `from`, run the
// compositor action, then commit it to `to` or put it back into `from`.
template <typename Action>
Result<void> relocate(StateStore::Transaction& txn, WindowId id,
                      Membership from, Membership to, Action&& action) {
    erase(txn, from, id);
    auto res = action();
    if (!res) {
        insert(txn, from, id);
        return make_error(ErrorKind::RemoteActionFailure, res.error());
    }
    insert(txn, to, id);
    return {};
}

} // namespace

TransitionEngine::TransitionEngine(StateStore& store, WindowRegistry& registry,
                                   ActionExecutor& executor, std::string stage_workspace,
                                   bool verbose)
    : store_(store), registry_(registry), executor_(executor),
      stage_workspace_(std::move(stage_workspace)), verbose_(verbose) {}

Result<bool> TransitionEngine::add(WindowId id) {
    if (auto ok = require_exists(id, "Window not found in Niri"); !ok) {
        return std::unexpected(ok.error());
    }

    auto txn = store_.begin();
    if (txn.is_staged(id)) {
        return make_error(ErrorKind::InvalidState, "Window is staged, unstage it first");
    }
    return txn.add_sticky(id);
}

Result<bool> TransitionEngine::remove(WindowId id) {
    if (auto ok = require_exists(id, "Window not found in Niri"); !ok) {
        return std::unexpected(ok.error());
    }

    auto txn = store_.begin();
    return txn.remove_sticky(id);
}

Result<bool> TransitionEngine::toggle_active() {
    auto id = focused_window();
    if (!id) return std::unexpected(id.error());
    if (auto ok = require_exists(*id, "Active window not found in Niri"); !ok) {
        return std::unexpected(ok.error());
    }

    auto txn = store_.begin();
    if (txn.remove_sticky(*id)) {
        log(std::format("Window {} is no longer sticky", *id));
        return false;
    }
    if (txn.is_staged(*id)) {
        return make_error(ErrorKind::InvalidState, "Active window is staged, unstage it first");
    }
    txn.add_sticky(*id);
    log(std::format("Window {} is now sticky", *id));
    return true;
}

Result<void> TransitionEngine::stage(WindowId id) {
    if (auto ok = require_exists(id, "Window not found in Niri"); !ok) {
        return ok;
    }

    auto txn = store_.begin();
    return stage_locked(txn, id, "Window is not sticky, cannot stage");
}

Result<void> TransitionEngine::unstage(WindowId id, WorkspaceId target) {
    if (auto ok = require_exists(id, "Window not found in Niri"); !ok) {
        return ok;
    }

    auto txn = store_.begin();
    return unstage_locked(txn, id, target, "Window is not staged");
}

Result<void> TransitionEngine::stage_active() {
    auto id = focused_window();
    if (!id) return std::unexpected(id.error());
    if (auto ok = require_exists(*id, "Active window not found in Niri"); !ok) {
        return ok;
    }

    auto txn = store_.begin();
    return stage_locked(txn, *id, "Window is not sticky, cannot stage");
}

Result<void> TransitionEngine::unstage_active(WorkspaceId target) {
    auto id = focused_window();
    if (!id) return std::unexpected(id.error());
    if (auto ok = require_exists(*id, "Active window not found in Niri"); !ok) {
        return ok;
    }

    auto txn = store_.begin();
    return unstage_locked(txn, *id, target, "Active window is not staged");
}

Result<StageToggle> TransitionEngine::toggle_stage_active() {
    auto id = focused_window();
    if (!id) return std::unexpected(id.error());
    if (auto ok = require_exists(*id, "Active window not found in Niri"); !ok) {
        return std::unexpected(ok.error());
    }

    // Membership is read once; the transaction keeps it stable until the
    // chosen branch has committed.
    auto txn = store_.begin();
    if (txn.is_staged(*id)) {
        auto target = active_workspace();
        if (!target) return std::unexpected(target.error());

        auto res = unstage_locked(txn, *id, *target, "Active window is not staged");
        if (!res) return std::unexpected(res.error());
        return StageToggle::Unstaged;
    }

    auto res = stage_locked(txn, *id, "Window is not sticky, cannot stage");
    if (!res) return std::unexpected(res.error());
    return StageToggle::Staged;
}

Result<size_t> TransitionEngine::stage_all() {
    auto txn = store_.begin();
    auto sticky = txn.sticky();
    if (sticky.empty()) return 0;

    auto live = live_windows();
    if (!live) return std::unexpected(live.error());

    WorkspaceRef dest = WorkspaceName{stage_workspace_};
    std::vector<WindowId> moved;
    for (auto id : sticky) {
        if (!live->contains(id)) continue;

        auto res = executor_.move_window(id, dest);
        if (res) {
            moved.push_back(id);
        } else {
            log_error(std::format("Failed to move window {} to stage: {}", id, res.error()));
        }
    }

    return txn.commit_staged(moved);
}

Result<size_t> TransitionEngine::unstage_all(WorkspaceId target) {
    auto txn = store_.begin();
    auto staged = txn.staged();
    if (staged.empty()) return 0;

    auto live = live_windows();
    if (!live) return std::unexpected(live.error());

    WorkspaceRef dest = target;
    std::vector<WindowId> moved;
    for (auto id : staged) {
        if (!live->contains(id)) continue;

        auto res = executor_.move_window(id, dest);
        if (res) {
            moved.push_back(id);
        } else {
            log_error(std::format("Failed to move window {} to workspace {}: {}",
                                  id, target, res.error()));
        }
    }

    return txn.commit_unstaged(moved);
}

Result<std::vector<WindowId>> TransitionEngine::list_sticky() {
    auto live = live_windows();
    if (!live) return std::unexpected(live.error());

    auto ids = store_.sticky();
    std::erase_if(ids, [&](WindowId id) { return !live->contains(id); });
    return ids;
}

std::vector<WindowId> TransitionEngine::list_staged() {
    return store_.staged();
}

bool TransitionEngine::is_staged(WindowId id) {
    return store_.begin().is_staged(id);
}

Result<size_t> TransitionEngine::sync_to_workspace(WorkspaceId target) {
    auto txn = store_.begin();

    auto live = live_windows();
    if (!live) return std::unexpected(live.error());

    size_t pruned = txn.prune_sticky(*live);
    auto sticky = txn.sticky();
    if (pruned > 0) {
        log(std::format("Pruned {} closed windows, sticky windows: {}",
                        pruned, format_window_ids(sticky)));
    }

    WorkspaceRef dest = target;
    size_t moved = 0;
    for (auto id : sticky) {
        auto res = executor_.move_window(id, dest);
        if (res) {
            moved++;
        } else {
            log_error(std::format("Failed to move window {} to workspace {}: {}",
                                  id, target, res.error()));
        }
    }
    return moved;
}

Result<WorkspaceId> TransitionEngine::active_workspace() {
    auto ws = registry_.active_workspace_id();
    if (!ws) {
        log(std::format("Active workspace lookup failed: {}", ws.error()));
        return make_error(ErrorKind::ActiveWindowUnavailable, "Failed to get active workspace ID");
    }
    return *ws;
}

Result<WindowSet> TransitionEngine::live_windows() {
    auto ids = registry_.window_ids();
    if (!ids) {
        return make_error(ErrorKind::RegistryError, "Failed to get windows list: " + ids.error());
    }
    return std::move(*ids);
}

Result<void> TransitionEngine::require_exists(WindowId id, const char* missing_message) {
    auto live = live_windows();
    if (!live) return std::unexpected(live.error());
    if (!live->contains(id)) {
        return make_error(ErrorKind::NotFound, missing_message);
    }
    return {};
}

Result<WindowId> TransitionEngine::focused_window() {
    auto id = registry_.focused_window_id();
    if (!id) {
        log(std::format("Focused window lookup failed: {}", id.error()));
        return make_error(ErrorKind::ActiveWindowUnavailable, "Failed to get active window");
    }
    return *id;
}

Result<void> TransitionEngine::stage_locked(StateStore::Transaction& txn, WindowId id,
                                            const char* not_sticky_message) {
    if (!txn.is_sticky(id)) {
        return make_error(ErrorKind::InvalidState, not_sticky_message);
    }

    WorkspaceRef dest = WorkspaceName{stage_workspace_};
    auto res = relocate(txn, id, Membership::Sticky, Membership::Staged,
                        [&] { return executor_.move_window(id, dest); });
    if (!res) {
        log_error(std::format("Failed to stage window {}: {}", id, res.error().message));
        return res;
    }
    log(std::format("Staged window {}", id));
    return {};
}

Result<void> TransitionEngine::unstage_locked(StateStore::Transaction& txn, WindowId id,
                                              WorkspaceId target, const char* not_staged_message) {
    if (!txn.is_staged(id)) {
        return make_error(ErrorKind::InvalidState, not_staged_message);
    }

    WorkspaceRef dest = target;
    auto res = relocate(txn, id, Membership::Staged, Membership::Sticky,
                        [&] { return executor_.move_window(id, dest); });
    if (!res) {
        log_error(std::format("Failed to unstage window {}: {}", id, res.error().message));
        return res;
    }
    log(std::format("Unstaged window {} to workspace {}", id, target));
    return {};
}

void TransitionEngine::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[nsticky] {}", msg);
    }
}

void TransitionEngine::log_error(const std::string& msg) {
    std::println(stderr, "[nsticky] {}", msg);
}
