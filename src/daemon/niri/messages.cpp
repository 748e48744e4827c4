#include "niri/messages.hpp"

using json = nlohmann::json;

namespace niri {

json windows_request() { return "Windows"; }
json focused_window_request() { return "FocusedWindow"; }
json workspaces_request() { return "Workspaces"; }
json event_stream_request() { return "EventStream"; }

json move_window_request(WindowId id, const WorkspaceRef& dest) {
    json reference;
    if (auto* ws = std::get_if<WorkspaceId>(&dest)) {
        reference = {{"Id", *ws}};
    } else {
        reference = {{"Name", std::get<WorkspaceName>(dest).name}};
    }

    return {
        {"Action", {
            {"MoveWindowToWorkspace", {
                {"window_id", id},
                {"reference", reference},
                {"focus", false},
            }},
        }},
    };
}

std::expected<json, std::string> parse_reply(std::string_view line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("malformed reply: ") + e.what());
    }

    if (!j.is_object()) {
        return std::unexpected("malformed reply: not an object");
    }
    if (auto err = j.find("Err"); err != j.end()) {
        return std::unexpected(err->is_string() ? err->get<std::string>() : err->dump());
    }
    if (auto ok = j.find("Ok"); ok != j.end()) {
        return *ok;
    }
    return std::unexpected("malformed reply: neither Ok nor Err");
}

std::expected<WindowSet, std::string> decode_windows(const json& ok) {
    if (!ok.is_object() || !ok.contains("Windows") || !ok["Windows"].is_array()) {
        return std::unexpected("unexpected reply to Windows");
    }

    WindowSet ids;
    for (auto& window : ok["Windows"]) {
        auto id = window.find("id");
        if (id != window.end() && id->is_number_unsigned()) {
            ids.insert(id->get<WindowId>());
        }
    }
    return ids;
}

std::expected<WindowId, std::string> decode_focused_window(const json& ok) {
    if (!ok.is_object() || !ok.contains("FocusedWindow")) {
        return std::unexpected("unexpected reply to FocusedWindow");
    }

    auto& window = ok["FocusedWindow"];
    if (window.is_null()) {
        return std::unexpected("no focused window");
    }
    auto id = window.find("id");
    if (id == window.end() || !id->is_number_unsigned()) {
        return std::unexpected("focused window id not found");
    }
    return id->get<WindowId>();
}

namespace {

// niri's boolean fields; anything that is not a JSON bool counts as false.
bool flag(const json& ws, const char* key) {
    auto it = ws.find(key);
    return it != ws.end() && it->is_boolean() && it->get<bool>();
}

} // namespace

std::expected<WorkspaceId, std::string> decode_active_workspace(const json& ok) {
    if (!ok.is_object() || !ok.contains("Workspaces") || !ok["Workspaces"].is_array()) {
        return std::unexpected("unexpected reply to Workspaces");
    }

    // With several outputs each has an active workspace; the focused one wins.
    const json* active = nullptr;
    for (auto& ws : ok["Workspaces"]) {
        if (!ws.is_object()) continue;
        auto id = ws.find("id");
        if (id == ws.end() || !id->is_number_unsigned()) continue;
        if (flag(ws, "is_focused")) return id->get<WorkspaceId>();
        if (!active && flag(ws, "is_active")) active = &ws;
    }

    if (active) return (*active)["id"].get<WorkspaceId>();
    return std::unexpected("active workspace not found");
}

ReadStatus decode_event(std::string_view line, WorkspaceActivated& event) {
    auto j = json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return ReadStatus::Ignored;

    auto activated = j.find("WorkspaceActivated");
    if (activated == j.end() || !activated->is_object()) return ReadStatus::Ignored;

    auto id = activated->find("id");
    if (id == activated->end() || !id->is_number_unsigned()) return ReadStatus::Ignored;

    event.id = id->get<WorkspaceId>();
    return ReadStatus::Event;
}

} // namespace niri
