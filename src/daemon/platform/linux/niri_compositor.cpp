#include "platform/linux/niri_compositor.hpp"

#include "niri/messages.hpp"
#include "platform/linux/niri_ipc.hpp"

#include <format>
#include <print>

NiriCompositor::NiriCompositor(std::string socket_path, std::chrono::milliseconds timeout,
                               bool verbose)
    : socket_path_(std::move(socket_path)), timeout_(timeout), verbose_(verbose) {}

std::expected<WindowSet, std::string> NiriCompositor::window_ids() {
    auto ok = request(niri::windows_request());
    if (!ok) return std::unexpected(ok.error());
    return niri::decode_windows(*ok);
}

std::expected<WindowId, std::string> NiriCompositor::focused_window_id() {
    auto ok = request(niri::focused_window_request());
    if (!ok) return std::unexpected(ok.error());
    return niri::decode_focused_window(*ok);
}

std::expected<WorkspaceId, std::string> NiriCompositor::active_workspace_id() {
    auto ok = request(niri::workspaces_request());
    if (!ok) return std::unexpected(ok.error());
    return niri::decode_active_workspace(*ok);
}

std::expected<void, std::string> NiriCompositor::move_window(WindowId id, const WorkspaceRef& dest) {
    auto ok = request(niri::move_window_request(id, dest));
    if (!ok) return std::unexpected(ok.error());
    log(std::format("Moved window {} to {}", id, describe(dest)));
    return {};
}

std::expected<nlohmann::json, std::string> NiriCompositor::request(const nlohmann::json& req) {
    auto line = NiriIpc::round_trip(socket_path_, req, timeout_);
    if (!line) return std::unexpected(line.error());
    return niri::parse_reply(*line);
}

void NiriCompositor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[nsticky] {}", msg);
    }
}
