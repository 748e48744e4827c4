#include "platform/linux/niri_event_stream.hpp"

#include "niri/messages.hpp"

#include <print>

NiriEventStream::NiriEventStream(std::string socket_path, std::chrono::milliseconds timeout)
    : conn_(std::move(socket_path), timeout), timeout_(timeout) {}

bool NiriEventStream::subscribe() {
    if (!conn_.connect()) {
        std::println(stderr, "niri: cannot connect event stream");
        return false;
    }
    if (!conn_.send_request(niri::event_stream_request())) {
        std::println(stderr, "niri: failed to request event stream");
        conn_.close();
        return false;
    }

    std::string line;
    bool timed_out = false;
    if (!conn_.read_line(line, timeout_, timed_out)) {
        std::println(stderr, "niri: no reply to event stream request");
        conn_.close();
        return false;
    }

    auto ok = niri::parse_reply(line);
    if (!ok) {
        std::println(stderr, "niri: event stream refused: {}", ok.error());
        conn_.close();
        return false;
    }
    return true;
}

ReadStatus NiriEventStream::read_event(WorkspaceActivated& event, std::chrono::milliseconds timeout) {
    std::string line;
    bool timed_out = false;
    if (!conn_.read_line(line, timeout, timed_out)) {
        return timed_out ? ReadStatus::Timeout : ReadStatus::Closed;
    }
    return niri::decode_event(line, event);
}
