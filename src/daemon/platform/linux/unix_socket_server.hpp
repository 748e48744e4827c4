#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <vector>

class UnixSocketServer : public IpcServer {
public:
    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    bool read_request(int client_fd, std::string& line) override;
    bool send_response(int client_fd, const std::string& line) override;
    void close_client(int client_fd) override;
    void release_client(int client_fd) override;

    // Set after read_request returns false: the client hung up or errored,
    // as opposed to having sent only part of a line so far.
    bool client_gone(int client_fd) const;

private:
    static constexpr size_t MAX_REQUEST_BYTES = 4096;

    int server_fd_ = -1;
    std::string socket_path_;

    struct ClientBuffer {
        int fd;
        std::string buf;
        bool gone = false;
    };
    std::vector<ClientBuffer> clients_;

    ClientBuffer* find_client(int fd);
};
