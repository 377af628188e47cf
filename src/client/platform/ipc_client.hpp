#pragma once

#include "protocol.hpp"

#include <expected>
#include <string>

// Connection to niriusd, good for a single command.
class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;

    // Writes the command and half-closes, which tells the daemon the request
    // is complete.
    virtual bool send_command(const Command& command) = 0;

    // Waits until the daemon closes its side. The outer error means no
    // result arrived; a failed command is an error inside the result.
    virtual std::expected<CommandResult, std::string> read_result(int timeout_ms = 30000) = 0;

    virtual void close() = 0;
};
