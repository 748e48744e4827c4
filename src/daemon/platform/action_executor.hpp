#pragma once

#include "types.hpp"

#include <expected>
#include <string>

class ActionExecutor {
public:
    virtual ~ActionExecutor() = default;
    virtual std::expected<void, std::string> move_window(WindowId id, const WorkspaceRef& dest) = 0;
};
