#include "types.hpp"

#include <format>

std::string describe(const WorkspaceRef& ref) {
    if (auto* id = std::get_if<WorkspaceId>(&ref)) {
        return std::format("workspace {}", *id);
    }
    return std::format("workspace \"{}\"", std::get<WorkspaceName>(ref).name);
}

std::string format_window_ids(std::span<const WindowId> ids) {
    std::string out = "[";
    for (size_t i = 0; i < ids.size(); i++) {
        if (i > 0) out += ", ";
        out += std::to_string(ids[i]);
    }
    out += "]";
    return out;
}
