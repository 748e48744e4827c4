#pragma once

#include "types.hpp"

#include <expected>
#include <string>

// Authoritative view of the compositor's windows and focus.
class WindowRegistry {
public:
    virtual ~WindowRegistry() = default;
    virtual std::expected<WindowSet, std::string> window_ids() = 0;
    virtual std::expected<WindowId, std::string> focused_window_id() = 0;
    virtual std::expected<WorkspaceId, std::string> active_workspace_id() = 0;
};
