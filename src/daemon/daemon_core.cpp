#include "daemon_core.hpp"

#include <format>
#include <print>

using protocol::Response;

namespace {

Response failure(const Error& err) {
    return Response::error(err.message);
}

} // namespace

DaemonCore::DaemonCore(TransitionEngine& engine, bool verbose)
    : engine_(engine), verbose_(verbose) {}

std::string DaemonCore::handle_command(std::string_view line) {
    auto request = protocol::parse_request(line);
    if (!request) {
        log(std::format("Rejected request \"{}\": {}", line, request.error().message));
        return protocol::format_response(failure(request.error()));
    }

    auto response = dispatch(*request);
    if (response.kind == Response::Kind::Error) {
        log(std::format("Request \"{}\" failed: {}", line, response.text));
    }
    return protocol::format_response(response);
}

Response DaemonCore::dispatch(const protocol::Request& request) {
    struct Visitor {
        DaemonCore& core;
        Response operator()(const protocol::Add& r) { return core.handle_add(r); }
        Response operator()(const protocol::Remove& r) { return core.handle_remove(r); }
        Response operator()(const protocol::List&) { return core.handle_list(); }
        Response operator()(const protocol::ToggleActive&) { return core.handle_toggle_active(); }
        Response operator()(const protocol::Stage& r) { return core.handle_stage(r); }
        Response operator()(const protocol::Unstage& r) { return core.handle_unstage(r); }
    };
    return std::visit(Visitor{*this}, request);
}

Response DaemonCore::handle_add(const protocol::Add& req) {
    auto added = engine_.add(req.window_id);
    if (!added) return failure(added.error());
    return Response::success(*added ? "Added" : "Already in sticky list");
}

Response DaemonCore::handle_remove(const protocol::Remove& req) {
    auto removed = engine_.remove(req.window_id);
    if (!removed) return failure(removed.error());
    return Response::success(*removed ? "Removed" : "Not in sticky list");
}

Response DaemonCore::handle_list() {
    auto ids = engine_.list_sticky();
    if (!ids) return failure(ids.error());
    return Response::data(format_window_ids(*ids));
}

Response DaemonCore::handle_toggle_active() {
    auto added = engine_.toggle_active();
    if (!added) return failure(added.error());
    return Response::success(*added ? "Added active window to sticky"
                                    : "Removed active window from sticky");
}

Response DaemonCore::handle_stage(const protocol::Stage& req) {
    if (req.all) {
        auto count = engine_.stage_all();
        if (!count) return failure(count.error());
        return Response::success(std::format("Staged {} windows", *count));
    }

    if (req.list) {
        return Response::data(format_window_ids(engine_.list_staged()));
    }

    if (req.active) {
        auto toggled = engine_.toggle_stage_active();
        if (!toggled) return failure(toggled.error());
        return Response::success(*toggled == StageToggle::Staged ? "Staged active window"
                                                                  : "Unstaged active window");
    }

    if (req.window_id) {
        auto res = engine_.stage(*req.window_id);
        if (!res) return failure(res.error());
        return Response::success("Staged window");
    }

    return Response::error("Invalid stage command");
}

Response DaemonCore::handle_unstage(const protocol::Unstage& req) {
    auto target = engine_.active_workspace();
    if (!target) return failure(target.error());

    if (req.all) {
        auto count = engine_.unstage_all(*target);
        if (!count) return failure(count.error());
        return Response::success(std::format("Unstaged {} windows", *count));
    }

    if (req.active) {
        auto res = engine_.unstage_active(*target);
        if (!res) return failure(res.error());
        return Response::success("Unstaged active window");
    }

    if (req.window_id) {
        auto res = engine_.unstage(*req.window_id, *target);
        if (!res) return failure(res.error());
        return Response::success("Unstaged window");
    }

    return Response::error("Invalid unstage command");
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[nsticky] {}", msg);
    }
}
