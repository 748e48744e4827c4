#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// A connection to niri's IPC socket. Reads and writes are line based and
// bounded by the configured timeout.
class NiriIpc {
public:
    NiriIpc(std::string socket_path, std::chrono::milliseconds timeout);
    ~NiriIpc();

    NiriIpc(const NiriIpc&) = delete;
    NiriIpc& operator=(const NiriIpc&) = delete;

    bool connect();
    void close();

    bool send_request(const nlohmann::json& request);

    // Returns false on error or EOF; `timed_out` tells a quiet socket apart
    // from a dead one.
    bool read_line(std::string& line, std::chrono::milliseconds timeout, bool& timed_out);

    // Connect, send one request, read one reply. Used for queries and actions,
    // each on a fresh connection.
    static std::expected<std::string, std::string>
        round_trip(const std::string& socket_path, const nlohmann::json& request,
                   std::chrono::milliseconds timeout);

private:
    static constexpr int CONNECT_RETRY_MS = 10;
    static constexpr int64_t MAX_POLL_MS = 600000;

    // Milliseconds left until `deadline`, in the range poll() accepts.
    static int poll_timeout(std::chrono::steady_clock::time_point deadline);

    std::string socket_path_;
    std::chrono::milliseconds timeout_;
    int fd_ = -1;
    std::string buf_;
};
