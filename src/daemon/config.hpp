#pragma once

#include <chrono>
#include <cstdint>
#include <string>

struct Config {
    struct Niri {
        static constexpr uint32_t MIN_TIMEOUT_MS = 1;
        static constexpr uint32_t MAX_TIMEOUT_MS = 600000;

        std::string socket;          // empty: $NIRI_SOCKET
        uint32_t timeout_ms = 2000;  // bound on every query and move

        std::chrono::milliseconds timeout() const { return std::chrono::milliseconds{timeout_ms}; }
    } niri;

    struct Ipc {
        std::string socket;  // empty: platform::ipc_endpoint()
    } ipc;

    struct Stage {
        std::string workspace = "stage";
    } stage;

    // Fill in the empty socket paths from the environment.
    std::string niri_socket() const;
    std::string ipc_socket() const;

    static Config load(const std::string& path);
    static Config load_default();
};
