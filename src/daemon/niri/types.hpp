#pragma once

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct Window {
    uint64_t id = 0;
    std::optional<std::string> app_id;       // Wayland app_id (e.g. "kitty")
    std::optional<std::string> title;
    std::optional<uint64_t> workspace_id;    // unset while not on a workspace
    bool is_focused = false;
    bool is_floating = false;

    bool operator==(const Window&) const = default;
};

struct Workspace {
    uint64_t id = 0;
    uint32_t idx = 0;                        // position on its output, 1-based
    std::optional<std::string> name;
    std::optional<std::string> output;
    bool is_active = false;
    bool is_focused = false;

    bool operator==(const Workspace&) const = default;
};

// Throw nlohmann::json::exception on malformed input.
Window window_from_json(const nlohmann::json& j);
Workspace workspace_from_json(const nlohmann::json& j);

namespace action {

struct FocusWindow {
    uint64_t id;
};

struct Spawn {
    std::vector<std::string> command;
};

struct MoveWindowToWorkspace {
    uint64_t window_id;
    uint64_t workspace_id;
    bool focus;
};

struct ToggleWindowFloating {
    uint64_t id;
};

} // namespace action

using Action = std::variant<action::FocusWindow,
                            action::Spawn,
                            action::MoveWindowToWorkspace,
                            action::ToggleWindowFloating>;

// {"Action": {...}} request for niri.
nlohmann::json action_request(const Action& action);

namespace event {

// Full window list, sent once after subscribing and whenever niri resyncs.
struct WindowsChanged {
    std::vector<Window> windows;
};

struct WindowOpenedOrChanged {
    Window window;
};

struct WindowClosed {
    uint64_t id;
};

struct WindowFocusChanged {
    std::optional<uint64_t> id;
};

struct WorkspacesChanged {
    std::vector<Workspace> workspaces;
};

struct WorkspaceActivated {
    uint64_t id;
    bool focused;
};

// Any event kind nirius does not track (keyboard layouts, overview, ...).
struct Other {
    std::string kind;
};

} // namespace event

using Event = std::variant<event::WindowsChanged,
                           event::WindowOpenedOrChanged,
                           event::WindowClosed,
                           event::WindowFocusChanged,
                           event::WorkspacesChanged,
                           event::WorkspaceActivated,
                           event::Other>;

std::expected<Event, std::string> parse_event(const nlohmann::json& j);
