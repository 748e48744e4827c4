#pragma once

#include "platform/event_source.hpp"
#include "transition_engine.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

enum class SyncState { Idle, Syncing };

// Follows the compositor's workspace activations and drags every sticky
// window along. Runs on its own thread until stopped or the feed is lost.
class EventSynchronizer {
public:
    using StreamLostCallback = std::function<void()>;

    EventSynchronizer(EventSource& source, TransitionEngine& engine,
                      StreamLostCallback on_lost, bool verbose = false);
    ~EventSynchronizer();

    EventSynchronizer(const EventSynchronizer&) = delete;
    EventSynchronizer& operator=(const EventSynchronizer&) = delete;

    void start();
    void stop();

    // Handles one activation. Exposed for the read loop and for tests.
    void on_workspace_activated(const WorkspaceActivated& event);

    SyncState state() const { return state_.load(std::memory_order_acquire); }

private:
    static constexpr std::chrono::milliseconds POLL_INTERVAL{250};

    void run(std::stop_token stop);
    void log(const std::string& msg);

    EventSource& source_;
    TransitionEngine& engine_;
    StreamLostCallback on_lost_;
    bool verbose_;

    std::atomic<SyncState> state_{SyncState::Idle};
    std::jthread worker_;
};
