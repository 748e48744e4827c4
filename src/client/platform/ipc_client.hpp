#pragma once

#include <string>

class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const std::string& line) = 0;
    virtual bool recv(std::string& line, int timeout_ms = 30000) = 0;
    virtual void close() = 0;
};
