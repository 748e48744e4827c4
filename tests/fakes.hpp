#pragma once

#include "platform/action_executor.hpp"
#include "platform/event_source.hpp"
#include "platform/window_registry.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

class FakeRegistry : public WindowRegistry {
public:
    std::expected<WindowSet, std::string> window_ids() override {
        std::lock_guard lock(mutex_);
        queries++;
        if (fail_windows) return std::unexpected("registry down");
        return windows;
    }

    std::expected<WindowId, std::string> focused_window_id() override {
        std::lock_guard lock(mutex_);
        if (!focused) return std::unexpected("no focused window");
        return *focused;
    }

    std::expected<WorkspaceId, std::string> active_workspace_id() override {
        std::lock_guard lock(mutex_);
        if (!active_workspace) return std::unexpected("no active workspace");
        return *active_workspace;
    }

    WindowSet windows;
    std::optional<WindowId> focused;
    std::optional<WorkspaceId> active_workspace = 1;
    bool fail_windows = false;
    int queries = 0;

private:
    std::mutex mutex_;
};

struct MoveCall {
    WindowId id;
    WorkspaceRef dest;
};

class FakeExecutor : public ActionExecutor {
public:
    std::expected<void, std::string> move_window(WindowId id, const WorkspaceRef& dest) override {
        std::lock_guard lock(mutex_);
        calls_.push_back({id, dest});
        if (fail_all || failing.contains(id)) return std::unexpected("move refused");
        return {};
    }

    std::vector<MoveCall> moves() {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    std::set<WindowId> failing;
    bool fail_all = false;

private:
    std::mutex mutex_;
    std::vector<MoveCall> calls_;
};

// Replays queued statuses, then reports Closed.
class ScriptedEventSource : public EventSource {
public:
    bool subscribe() override { return true; }

    ReadStatus read_event(WorkspaceActivated& event, std::chrono::milliseconds) override {
        std::lock_guard lock(mutex_);
        if (script.empty()) return ReadStatus::Closed;
        auto [status, id] = script.front();
        script.pop_front();
        if (status == ReadStatus::Event) event.id = id;
        return status;
    }

    void push_event(WorkspaceId id) { script.emplace_back(ReadStatus::Event, id); }
    void push(ReadStatus status) { script.emplace_back(status, 0); }

private:
    std::mutex mutex_;
    std::deque<std::pair<ReadStatus, WorkspaceId>> script;
};

inline bool is_workspace(const WorkspaceRef& ref, WorkspaceId id) {
    auto* ws = std::get_if<WorkspaceId>(&ref);
    return ws && *ws == id;
}

inline bool is_named(const WorkspaceRef& ref, const std::string& name) {
    auto* ws = std::get_if<WorkspaceName>(&ref);
    return ws && ws->name == name;
}
