#include "platform/linux/niri_ipc.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <format>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

NiriIpc::NiriIpc(std::string socket_path, std::chrono::milliseconds timeout)
    : socket_path_(std::move(socket_path)), timeout_(timeout) {}

int NiriIpc::poll_timeout(std::chrono::steady_clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return static_cast<int>(std::clamp<int64_t>(remaining.count(), 0, MAX_POLL_MS));
}

NiriIpc::~NiriIpc() {
    close();
}

bool NiriIpc::connect() {
    close();

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path_.empty() || socket_path_.size() >= sizeof(addr.sun_path)) {
        return false;
    }
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    // Non-blocking so a compositor that stops accepting cannot hang us.
    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    auto deadline = std::chrono::steady_clock::now() + timeout_;
    while (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (errno == EINTR) continue;

        int remaining = poll_timeout(deadline);
        if (errno == EAGAIN) {
            // Listen backlog is full; AF_UNIX offers nothing to wait on.
            if (remaining == 0) {
                close();
                return false;
            }
            ::poll(nullptr, 0, std::min(remaining, CONNECT_RETRY_MS));
            continue;
        }

        if (errno != EINPROGRESS) {
            close();
            return false;
        }

        pollfd pfd{.fd = fd_, .events = POLLOUT, .revents = 0};
        int err = 0;
        socklen_t len = sizeof(err);
        if (::poll(&pfd, 1, remaining) <= 0 ||
            ::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) < 0 || err != 0) {
            close();
            return false;
        }
        break;
    }
    return true;
}

void NiriIpc::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    buf_.clear();
}

bool NiriIpc::send_request(const nlohmann::json& request) {
    if (fd_ < 0) return false;

    std::string msg = request.dump() + "\n";
    auto deadline = std::chrono::steady_clock::now() + timeout_;
    size_t sent_total = 0;
    while (sent_total < msg.size()) {
        pollfd pfd{.fd = fd_, .events = POLLOUT, .revents = 0};
        if (::poll(&pfd, 1, poll_timeout(deadline)) <= 0) return false;

        ssize_t n = ::send(fd_, msg.data() + sent_total, msg.size() - sent_total, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return false;
        }
        sent_total += static_cast<size_t>(n);
    }
    return true;
}

bool NiriIpc::read_line(std::string& line, std::chrono::milliseconds timeout, bool& timed_out) {
    timed_out = false;
    if (fd_ < 0) return false;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto pos = buf_.find('\n');
        if (pos != std::string::npos) {
            line = buf_.substr(0, pos);
            buf_.erase(0, pos + 1);
            return true;
        }

        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, poll_timeout(deadline));
        if (ret < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (ret == 0) {
            timed_out = true;
            return false;
        }

        char tmp[4096];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
        if (n <= 0) return false;
        buf_.append(tmp, static_cast<size_t>(n));
    }
}

std::expected<std::string, std::string>
NiriIpc::round_trip(const std::string& socket_path, const nlohmann::json& request,
                    std::chrono::milliseconds timeout) {
    NiriIpc conn(socket_path, timeout);
    if (!conn.connect()) {
        return std::unexpected(std::format("cannot connect to niri at {}", socket_path));
    }
    if (!conn.send_request(request)) {
        return std::unexpected("failed to send request to niri");
    }

    std::string line;
    bool timed_out = false;
    if (!conn.read_line(line, timeout, timed_out)) {
        if (timed_out) {
            return std::unexpected(std::format("niri did not reply within {}ms", timeout.count()));
        }
        return std::unexpected("niri closed the connection");
    }
    return line;
}
