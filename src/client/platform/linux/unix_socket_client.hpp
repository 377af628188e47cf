#pragma once

#include "platform/ipc_client.hpp"

#include <string>

class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient() = default;
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& socket_path) override;
    bool send_command(const Command& command) override;
    std::expected<CommandResult, std::string> read_result(int timeout_ms = 30000) override;
    void close() override;

private:
    int fd_ = -1;
};
