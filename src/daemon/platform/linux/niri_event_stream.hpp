#pragma once

#include "platform/event_source.hpp"
#include "platform/linux/niri_ipc.hpp"

#include <chrono>
#include <string>

// niri's event stream: a dedicated connection that, after the "EventStream"
// request is acknowledged, carries one JSON event per line forever.
class NiriEventStream : public EventSource {
public:
    NiriEventStream(std::string socket_path, std::chrono::milliseconds timeout);

    bool subscribe() override;
    ReadStatus read_event(WorkspaceActivated& event, std::chrono::milliseconds timeout) override;

private:
    NiriIpc conn_;
    std::chrono::milliseconds timeout_;
};
