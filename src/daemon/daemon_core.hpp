#pragma once

#include "protocol.hpp"
#include "transition_engine.hpp"

#include <string>
#include <string_view>

// Turns one boundary protocol line into one response line.
class DaemonCore {
public:
    explicit DaemonCore(TransitionEngine& engine, bool verbose = false);

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    std::string handle_command(std::string_view line);

    protocol::Response dispatch(const protocol::Request& request);

private:
    protocol::Response handle_add(const protocol::Add& req);
    protocol::Response handle_remove(const protocol::Remove& req);
    protocol::Response handle_list();
    protocol::Response handle_toggle_active();
    protocol::Response handle_stage(const protocol::Stage& req);
    protocol::Response handle_unstage(const protocol::Unstage& req);

    void log(const std::string& msg);

    TransitionEngine& engine_;
    bool verbose_;
};
