#include "event_synchronizer.hpp"

#include <format>
#include <print>

EventSynchronizer::EventSynchronizer(EventSource& source, TransitionEngine& engine,
                                     StreamLostCallback on_lost, bool verbose)
    : source_(source), engine_(engine), on_lost_(std::move(on_lost)), verbose_(verbose) {}

EventSynchronizer::~EventSynchronizer() {
    stop();
}

void EventSynchronizer::start() {
    worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void EventSynchronizer::stop() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
}

void EventSynchronizer::on_workspace_activated(const WorkspaceActivated& event) {
    state_.store(SyncState::Syncing, std::memory_order_release);
    log(std::format("Workspace switched to: {}", event.id));

    auto moved = engine_.sync_to_workspace(event.id);
    if (!moved) {
        std::println(stderr, "[nsticky] Failed to handle workspace activation: {}",
                     moved.error().message);
    } else if (*moved > 0) {
        log(std::format("Moved {} sticky windows to workspace {}", *moved, event.id));
    }

    state_.store(SyncState::Idle, std::memory_order_release);
}

void EventSynchronizer::run(std::stop_token stop) {
    while (!stop.stop_requested()) {
        WorkspaceActivated event;
        switch (source_.read_event(event, POLL_INTERVAL)) {
            case ReadStatus::Event:
                on_workspace_activated(event);
                break;
            case ReadStatus::Ignored:
            case ReadStatus::Timeout:
                break;
            case ReadStatus::Closed:
                std::println(stderr, "[nsticky] Event stream closed");
                if (on_lost_) on_lost_();
                return;
        }
    }
}

void EventSynchronizer::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[nsticky] {}", msg);
    }
}
