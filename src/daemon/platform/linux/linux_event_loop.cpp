#include "platform/linux/linux_event_loop.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      compositor_(config_.niri_socket(), config_.niri.timeout(), verbose_),
      event_stream_(config_.niri_socket(), config_.niri.timeout()),
      engine_(store_, compositor_, compositor_, config_.stage.workspace, verbose_),
      core_(engine_, verbose_),
      synchronizer_(event_stream_, engine_,
                    // StreamLostCallback
                    [this]() {
                        uint64_t val = 1;
                        if (::write(stream_lost_fd_, &val, sizeof(val)) < 0) {
                            std::println(stderr, "[nsticky] eventfd write failed: {}",
                                         std::strerror(errno));
                        }
                    },
                    verbose_) {}

LinuxEventLoop::~LinuxEventLoop() {
    synchronizer_.stop();
    reap_workers(true);
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (stream_lost_fd_ >= 0) ::close(stream_lost_fd_);
}

bool LinuxEventLoop::init() {
    if (compositor_.socket_path().empty()) {
        std::println(stderr, "niri: $NIRI_SOCKET not set and no niri.socket configured");
        return false;
    }

    // IPC socket
    auto ipc_path = config_.ipc_socket();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Event stream loss notification
    stream_lost_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (stream_lost_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(stream_lost_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    // Workspace event stream (required; without it nothing is sticky)
    if (!event_stream_.subscribe()) {
        std::println(stderr, "niri: event stream unavailable at {}", compositor_.socket_path());
        return false;
    }
    synchronizer_.start();
    log("Subscribed to niri event stream");

    running_.store(true, std::memory_order_release);
    return true;
}

int LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    log("nsticky daemon started.");

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            exit_code_ = 1;
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal, shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == stream_lost_fd_) {
                uint64_t val;
                if (::read(stream_lost_fd_, &val, sizeof(val)) > 0) {
                    std::println(stderr, "[nsticky] Lost niri event stream, exiting");
                }
                exit_code_ = 1;
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            // Client fd
            std::string line;
            if (ipc_server_.read_request(fd, line)) {
                // One request per connection: the worker answers and closes.
                epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
                ipc_server_.release_client(fd);
                serve(fd, std::move(line));
            } else if (ipc_server_.client_gone(fd)) {
                epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
                ipc_server_.close_client(fd);
            }
        }

        reap_workers(false);
    }

    // Clean shutdown
    synchronizer_.stop();
    reap_workers(true);
    ipc_server_.stop();
    return exit_code_;
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::serve(int client_fd, std::string line) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    workers_.push_back(RequestWorker{
        .done = done,
        .thread = std::jthread([this, client_fd, line = std::move(line), done] {
            auto response = core_.handle_command(line);
            if (!ipc_server_.send_response(client_fd, response)) {
                std::println(stderr, "[nsticky] Failed to send response: {}", std::strerror(errno));
            }
            ::close(client_fd);
            done->store(true, std::memory_order_release);
        }),
    });
}

void LinuxEventLoop::reap_workers(bool wait_all) {
    std::erase_if(workers_, [wait_all](RequestWorker& w) {
        if (!wait_all && !w.done->load(std::memory_order_acquire)) return false;
        if (w.thread.joinable()) w.thread.join();
        return true;
    });
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[nsticky] {}", msg);
    }
}
