#pragma once

#include "protocol.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// niriusd's listening endpoint. One command per connection: the client writes
// its command and half-closes, the daemon answers with exactly one result and
// half-closes its side.
class IpcServer {
public:
    virtual ~IpcServer() = default;

    // Replaces a stale endpoint left behind by a previous run.
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;

    // Readable while a connection is pending.
    virtual int listen_fd() const = 0;

    // -1 when nothing is pending.
    virtual int accept_client() = 0;

    // Reads until the client half-closes. Fails on I/O errors, oversized
    // requests and bytes that are not JSON.
    virtual std::expected<nlohmann::json, std::string> read_request(int client_fd) = 0;

    virtual bool send_result(int client_fd, const CommandResult& result) = 0;
    virtual void close_client(int client_fd) = 0;
};
