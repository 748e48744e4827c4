#pragma once

#include <string>

class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    virtual bool read_request(int client_fd, std::string& line) = 0;
    virtual bool send_response(int client_fd, const std::string& line) = 0;
    virtual void close_client(int client_fd) = 0;
    // Stops tracking the client without closing it; ownership of the fd
    // passes to the caller.
    virtual void release_client(int client_fd) = 0;
};
