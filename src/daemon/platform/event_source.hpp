#pragma once

#include "types.hpp"

#include <chrono>

struct WorkspaceActivated {
    WorkspaceId id = 0;
};

enum class ReadStatus { Event, Ignored, Timeout, Closed };

class EventSource {
public:
    virtual ~EventSource() = default;
    virtual bool subscribe() = 0;
    // Waits up to `timeout` for the next line of the feed. `event` is only
    // filled when Event is returned.
    virtual ReadStatus read_event(WorkspaceActivated& event, std::chrono::milliseconds timeout) = 0;
};
