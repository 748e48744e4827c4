#include <catch2/catch_test_macros.hpp>

#include "platform/linux/niri_compositor.hpp"
#include "platform/linux/niri_event_stream.hpp"

#include <atomic>
#include <chrono>
#include <cstring>
#include <functional>
#include <mutex>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

// Accepts connections on a unix socket and answers each request line with
// whatever the handler returns. An empty answer means "stay silent".
class FakeNiri {
public:
    using Handler = std::function<std::vector<std::string>(const std::string&)>;

    FakeNiri(std::string path, Handler handler)
        : path_(std::move(path)), handler_(std::move(handler)) {
        ::unlink(path_.c_str());
        fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path_.c_str(), sizeof(addr.sun_path) - 1);
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(fd_, 8);

        thread_ = std::jthread([this](std::stop_token stop) { serve(stop); });
    }

    ~FakeNiri() {
        thread_.request_stop();
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        thread_.join();
        for (int c : clients_) ::close(c);
        ::unlink(path_.c_str());
    }

    std::vector<std::string> requests() {
        std::lock_guard lock(mutex_);
        return requests_;
    }

private:
    void serve(std::stop_token stop) {
        while (!stop.stop_requested()) {
            int c = ::accept(fd_, nullptr, nullptr);
            if (c < 0) return;
            clients_.push_back(c);

            std::string buf;
            char tmp[1024];
            while (buf.find('\n') == std::string::npos) {
                ssize_t n = ::recv(c, tmp, sizeof(tmp), 0);
                if (n <= 0) break;
                buf.append(tmp, static_cast<size_t>(n));
            }
            auto line = buf.substr(0, buf.find('\n'));
            {
                std::lock_guard lock(mutex_);
                requests_.push_back(line);
            }
            for (auto& reply : handler_(line)) {
                auto msg = reply + "\n";
                ::send(c, msg.data(), msg.size(), MSG_NOSIGNAL);
            }
        }
    }

    std::string path_;
    Handler handler_;
    int fd_ = -1;
    std::vector<int> clients_;
    std::mutex mutex_;
    std::vector<std::string> requests_;
    std::jthread thread_;
};

std::string tmp_niri_path() {
    return "/tmp/nsticky_test_niri_" + std::to_string(getpid()) + ".sock";
}

} // namespace

TEST_CASE("NiriCompositor", "[niri]") {
    auto path = tmp_niri_path();
    std::chrono::milliseconds timeout{200};

    SECTION("QueriesDecodeReplies") {
        FakeNiri niri(path, [](const std::string& req) -> std::vector<std::string> {
            if (req == R"("Windows")") return {R"({"Ok":{"Windows":[{"id":1},{"id":2}]}})"};
            if (req == R"("FocusedWindow")") return {R"({"Ok":{"FocusedWindow":{"id":2}}})"};
            if (req == R"("Workspaces")") return {R"({"Ok":{"Workspaces":[{"id":3,"is_active":true,"is_focused":true}]}})"};
            return {R"({"Err":"unexpected"})"};
        });
        NiriCompositor compositor(path, timeout);

        auto ids = compositor.window_ids();
        REQUIRE(ids.has_value());
        REQUIRE(*ids == WindowSet{1, 2});
        REQUIRE(*compositor.focused_window_id() == 2);
        REQUIRE(*compositor.active_workspace_id() == 3);
    }

    SECTION("MoveSendsActionAndHonoursErr") {
        FakeNiri niri(path, [](const std::string& req) -> std::vector<std::string> {
            if (req.find(R"("window_id":9)") != std::string::npos) return {R"({"Err":"no such window"})"};
            return {R"({"Ok":"Handled"})"};
        });
        NiriCompositor compositor(path, timeout);

        REQUIRE(compositor.move_window(4, WorkspaceName{"stage"}).has_value());
        auto failed = compositor.move_window(9, WorkspaceRef{WorkspaceId{2}});
        REQUIRE_FALSE(failed.has_value());
        REQUIRE(failed.error() == "no such window");

        auto reqs = niri.requests();
        REQUIRE(reqs.size() == 2);
        REQUIRE(reqs[0].find(R"("Name":"stage")") != std::string::npos);
    }

    SECTION("SilentCompositorTimesOut") {
        FakeNiri niri(path, [](const std::string&) -> std::vector<std::string> { return {}; });
        NiriCompositor compositor(path, std::chrono::milliseconds{50});

        auto start = std::chrono::steady_clock::now();
        auto res = compositor.move_window(1, WorkspaceRef{WorkspaceId{1}});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));
    }

    SECTION("StalledListenerTimesOutOnConnect") {
        // Bound but never accepting, with the backlog already full.
        ::unlink(path.c_str());
        int listener = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        REQUIRE(::bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(::listen(listener, 0) == 0);

        std::vector<int> queued;
        for (int i = 0; i < 64; ++i) {
            int c = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
            queued.push_back(c);
            if (::connect(c, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) break;
        }

        NiriCompositor compositor(path, std::chrono::milliseconds{100});
        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(compositor.window_ids().has_value());
        REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));

        for (int c : queued) ::close(c);
        ::close(listener);
        ::unlink(path.c_str());
    }

    SECTION("MissingSocketFails") {
        NiriCompositor compositor("/tmp/nsticky_test_no_such_niri.sock", timeout);
        REQUIRE_FALSE(compositor.window_ids().has_value());
    }

    SECTION("EventStreamYieldsActivations") {
        FakeNiri niri(path, [](const std::string& req) -> std::vector<std::string> {
            if (req != R"("EventStream")") return {R"({"Err":"unexpected"})"};
            return {
                R"({"Ok":"Handled"})",
                R"({"WorkspacesChanged":{"workspaces":[]}})",
                R"({"WorkspaceActivated":{"id":6,"focused":true}})",
            };
        });
        NiriEventStream stream(path, timeout);
        REQUIRE(stream.subscribe());

        WorkspaceActivated event;
        REQUIRE(stream.read_event(event, timeout) == ReadStatus::Ignored);
        REQUIRE(stream.read_event(event, timeout) == ReadStatus::Event);
        REQUIRE(event.id == 6);
        REQUIRE(stream.read_event(event, std::chrono::milliseconds{20}) == ReadStatus::Timeout);
    }
}
