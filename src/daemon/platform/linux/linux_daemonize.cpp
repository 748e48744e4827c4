#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <print>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

namespace {

// Hands `what` plus errno to the waiting launcher, then gives up.
[[noreturn]] void fail(int report_fd, const char* what) {
    auto msg = std::format("{}: {}", what, std::strerror(errno));
    (void)::write(report_fd, msg.data(), msg.size());
    _exit(1);
}

// Launcher side: everything the detached process writes is an error; EOF
// with nothing written means it is up.
[[noreturn]] void await_detached(pid_t child, int report_fd) {
    std::string report;
    char buf[256];
    while (true) {
        ssize_t n = ::read(report_fd, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        report.append(buf, static_cast<size_t>(n));
    }
    ::close(report_fd);
    while (::waitpid(child, nullptr, 0) < 0 && errno == EINTR) {}

    if (!report.empty()) {
        std::println(stderr, "[nsticky] daemonize failed: {}", report);
        _exit(1);
    }
    _exit(0);
}

} // namespace

std::expected<void, std::string> daemonize() {
    int report[2];
    if (::pipe2(report, O_CLOEXEC) < 0) {
        return std::unexpected(std::format("pipe2() failed: {}", std::strerror(errno)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(report[0]);
        ::close(report[1]);
        return std::unexpected(std::format("fork() failed: {}", std::strerror(err)));
    }
    if (pid > 0) {
        ::close(report[1]);
        await_detached(pid, report[0]);
    }

    ::close(report[0]);
    if (::setsid() < 0) fail(report[1], "setsid()");

    // Not a session leader any more, so no controlling terminal can come back.
    pid = ::fork();
    if (pid < 0) fail(report[1], "second fork()");
    if (pid > 0) _exit(0);

    int null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd < 0) fail(report[1], "open(/dev/null)");
    for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
        if (::dup2(null_fd, fd) < 0) fail(report[1], "dup2(/dev/null)");
    }
    if (null_fd > STDERR_FILENO) ::close(null_fd);

    ::close(report[1]);
    return {};
}

} // namespace platform
