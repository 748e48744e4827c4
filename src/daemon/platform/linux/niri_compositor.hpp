#pragma once

#include "platform/action_executor.hpp"
#include "platform/window_registry.hpp"

#include <chrono>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Registry queries and window moves against a running niri, one short-lived
// IPC connection per call.
class NiriCompositor : public WindowRegistry, public ActionExecutor {
public:
    NiriCompositor(std::string socket_path, std::chrono::milliseconds timeout, bool verbose = false);

    std::expected<WindowSet, std::string> window_ids() override;
    std::expected<WindowId, std::string> focused_window_id() override;
    std::expected<WorkspaceId, std::string> active_workspace_id() override;
    std::expected<void, std::string> move_window(WindowId id, const WorkspaceRef& dest) override;

    const std::string& socket_path() const { return socket_path_; }

private:
    std::expected<nlohmann::json, std::string> request(const nlohmann::json& req);
    void log(const std::string& msg);

    std::string socket_path_;
    std::chrono::milliseconds timeout_;
    bool verbose_;
};
