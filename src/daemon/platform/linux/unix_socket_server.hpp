#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <vector>

// Listens on a filesystem Unix socket. Accepted connections are blocking and
// served one at a time by the event loop, so each one gets send and receive
// timeouts and a stalled client cannot hold up the loop.
class UnixSocketServer : public IpcServer {
public:
    static constexpr int CLIENT_TIMEOUT_MS = 1000;

    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& socket_path) override;
    void stop() override;
    int listen_fd() const override { return listen_fd_; }
    int accept_client() override;
    std::expected<nlohmann::json, std::string> read_request(int client_fd) override;
    bool send_result(int client_fd, const CommandResult& result) override;
    void close_client(int client_fd) override;

private:
    static constexpr size_t MAX_REQUEST_BYTES = 1 << 20;

    int listen_fd_ = -1;
    std::string socket_path_;
    std::vector<int> clients_;
};
