#pragma once

#include "platform/ipc_client.hpp"

class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient();
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const std::string& line) override;
    // Reads up to the first newline, which is stripped.
    bool recv(std::string& line, int timeout_ms = 30000) override;
    void close() override;

private:
    int fd_ = -1;
};
