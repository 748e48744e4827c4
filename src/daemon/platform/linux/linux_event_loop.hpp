#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "event_synchronizer.hpp"
#include "platform/linux/niri_compositor.hpp"
#include "platform/linux/niri_event_stream.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "state_store.hpp"
#include "transition_engine.hpp"

#include <atomic>
#include <list>
#include <memory>
#include <thread>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    // Returns the process exit code.
    int run();
    void request_stop();

private:
    // A request being served on its own thread; the thread owns client_fd.
    struct RequestWorker {
        std::shared_ptr<std::atomic<bool>> done;
        std::jthread thread;
    };

    void serve(int client_fd, std::string line);
    void reap_workers(bool wait_all);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before the core)
    NiriCompositor compositor_;
    NiriEventStream event_stream_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    StateStore store_;
    TransitionEngine engine_;
    DaemonCore core_;
    EventSynchronizer synchronizer_;

    std::list<RequestWorker> workers_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int stream_lost_fd_ = -1;

    std::atomic<bool> running_{false};
    int exit_code_ = 0;
};
