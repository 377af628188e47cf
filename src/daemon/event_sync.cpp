#include "event_sync.hpp"

#include <format>
#include <print>

EventSync::EventSync(StateStore& store, Compositor& compositor, bool verbose)
    : store_(store), compositor_(compositor), verbose_(verbose) {}

bool EventSync::prime() {
    auto workspaces = compositor_.workspaces();
    if (!workspaces) {
        std::println(stderr, "sync: could not list workspaces: {}", workspaces.error());
        return false;
    }
    auto windows = compositor_.windows();
    if (!windows) {
        std::println(stderr, "sync: could not list windows: {}", windows.error());
        return false;
    }
    auto focused = compositor_.focused_window();
    if (!focused) {
        std::println(stderr, "sync: could not query focused window: {}", focused.error());
        return false;
    }

    store_.replace_workspaces(std::move(*workspaces));
    store_.replace_windows(std::move(*windows));
    store_.set_focus(*focused ? std::optional<uint64_t>((*focused)->id) : std::nullopt);

    log(std::format("Primed state with {} windows", store_.windows().size()));
    return true;
}

std::expected<std::string, std::string> EventSync::handle_event(const Event& event) {
    return std::visit([this](const auto& ev) { return on(ev); }, event);
}

void EventSync::run(EventFeed& feed) {
    while (true) {
        Event event;
        std::string error;
        switch (feed.read_event(event, error)) {
            case EventFeed::ReadStatus::Eof:
                log("Event stream closed");
                return;
            case EventFeed::ReadStatus::Error:
                std::println(stderr, "sync: could not read event: {}", error);
                continue;
            case EventFeed::ReadStatus::Ok:
                break;
        }

        auto result = handle_event(event);
        if (result) {
            if (!result->empty()) log(*result);
        } else {
            std::println(stderr, "sync: error handling event: {}", result.error());
        }
    }
}

std::expected<std::string, std::string> EventSync::on(const event::WindowsChanged& ev) {
    store_.replace_windows(ev.windows);
    return std::format("Window list replaced ({} windows)", ev.windows.size());
}

std::expected<std::string, std::string> EventSync::on(const event::WindowOpenedOrChanged& ev) {
    store_.upsert_window(ev.window);
    return std::format("Window {} opened or changed", ev.window.id);
}

std::expected<std::string, std::string> EventSync::on(const event::WindowClosed& ev) {
    auto remaining = store_.remove_window(ev.id);
    return std::format("Window {} closed, {} left", ev.id, remaining);
}

std::expected<std::string, std::string> EventSync::on(const event::WindowFocusChanged& ev) {
    store_.set_focus(ev.id);
    if (!ev.id) return std::string("Focus cleared");
    return std::format("Window {} focused", *ev.id);
}

std::expected<std::string, std::string> EventSync::on(const event::WorkspacesChanged& ev) {
    store_.replace_workspaces(ev.workspaces);
    return std::format("Workspace list replaced ({} workspaces)", ev.workspaces.size());
}

// Follow-mode windows go wherever focus goes. A failed move is reported but
// does not stop the remaining ones.
std::expected<std::string, std::string> EventSync::on(const event::WorkspaceActivated& ev) {
    if (!ev.focused) return std::string{};

    store_.focus_workspace(ev.id);

    int moved = 0;
    std::string errors;
    for (uint64_t id : store_.follow_mode_ids()) {
        auto res = compositor_.perform(action::MoveWindowToWorkspace{id, ev.id, true});
        if (!res) {
            if (!errors.empty()) errors += "; ";
            errors += std::format("window {}: {}", id, res.error());
            continue;
        }
        moved++;
    }

    if (!errors.empty()) {
        return std::unexpected(std::format("moved {} follow-mode windows, failed: {}", moved, errors));
    }
    return std::format("Workspace {} focused, moved {} follow-mode windows", ev.id, moved);
}

std::expected<std::string, std::string> EventSync::on(const event::Other& /*ev*/) {
    return std::string{};
}
