#pragma once

#include "platform/compositor.hpp"
#include "platform/event_feed.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// niri IPC: newline-delimited JSON over the Unix socket in $NIRI_SOCKET.
// Each request opens its own connection; replies are {"Ok": ...} or {"Err": "..."}.
class NiriIpc : public Compositor {
public:
    explicit NiriIpc(std::string socket_path);

    NiriIpc(const NiriIpc&) = delete;
    NiriIpc& operator=(const NiriIpc&) = delete;

    std::expected<std::vector<Window>, std::string> windows() override;
    std::expected<std::vector<Workspace>, std::string> workspaces() override;
    std::expected<std::optional<Window>, std::string> focused_window() override;
    std::expected<void, std::string> perform(const Action& action) override;

    // Send one request and return the payload of an "Ok" reply.
    std::expected<nlohmann::json, std::string> request(const nlohmann::json& req);

private:
    std::string socket_path_;
};

class NiriEventFeed : public EventFeed {
public:
    explicit NiriEventFeed(std::string socket_path);
    ~NiriEventFeed() override;

    NiriEventFeed(const NiriEventFeed&) = delete;
    NiriEventFeed& operator=(const NiriEventFeed&) = delete;

    bool subscribe() override;
    ReadStatus read_event(Event& event, std::string& error) override;
    void interrupt() override;

private:
    std::string socket_path_;
    int fd_ = -1;
    std::string buf_;
};

// "received unexpected reply: <json>"
std::string unexpected_reply(const nlohmann::json& reply);
