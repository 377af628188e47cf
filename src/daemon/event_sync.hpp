#pragma once

#include "niri/types.hpp"
#include "platform/compositor.hpp"
#include "platform/event_feed.hpp"
#include "state_store.hpp"

#include <expected>
#include <string>

// Applies niri's event stream to the state store.
class EventSync {
public:
    EventSync(StateStore& store, Compositor& compositor, bool verbose = false);

    EventSync(const EventSync&) = delete;
    EventSync& operator=(const EventSync&) = delete;

    // Fill the store from one-shot queries, before the stream catches up.
    bool prime();

    // Returns a summary of what changed.
    std::expected<std::string, std::string> handle_event(const Event& event);

    // Read and apply events until the feed ends (compositor gone or interrupted).
    void run(EventFeed& feed);

private:
    std::expected<std::string, std::string> on(const event::WindowsChanged& ev);
    std::expected<std::string, std::string> on(const event::WindowOpenedOrChanged& ev);
    std::expected<std::string, std::string> on(const event::WindowClosed& ev);
    std::expected<std::string, std::string> on(const event::WindowFocusChanged& ev);
    std::expected<std::string, std::string> on(const event::WorkspacesChanged& ev);
    std::expected<std::string, std::string> on(const event::WorkspaceActivated& ev);
    std::expected<std::string, std::string> on(const event::Other& ev);

    void log(const std::string& msg);

    StateStore& store_;
    Compositor& compositor_;
    bool verbose_;
};
