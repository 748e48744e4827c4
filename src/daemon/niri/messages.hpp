#pragma once

#include "platform/event_source.hpp"
#include "types.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

// Encoding and decoding of niri's JSON IPC. Every request is one JSON value
// on one line; every reply is {"Ok": ...} or {"Err": "..."} on one line.
namespace niri {

nlohmann::json windows_request();
nlohmann::json focused_window_request();
nlohmann::json workspaces_request();
nlohmann::json event_stream_request();
nlohmann::json move_window_request(WindowId id, const WorkspaceRef& dest);

// Unwraps {"Ok": {...}} or turns {"Err": msg} into an error.
std::expected<nlohmann::json, std::string> parse_reply(std::string_view line);

std::expected<WindowSet, std::string> decode_windows(const nlohmann::json& ok);
std::expected<WindowId, std::string> decode_focused_window(const nlohmann::json& ok);
std::expected<WorkspaceId, std::string> decode_active_workspace(const nlohmann::json& ok);

// Returns Event for {"WorkspaceActivated":{"id":N,...}}, Ignored for any
// other well-formed or malformed line.
ReadStatus decode_event(std::string_view line, WorkspaceActivated& event);

} // namespace niri
