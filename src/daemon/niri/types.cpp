#include "niri/types.hpp"

#include <format>

using json = nlohmann::json;

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template <typename T>
std::optional<T> optional_field(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<T>();
}

} // namespace

Window window_from_json(const json& j) {
    Window w;
    w.id = j.at("id").get<uint64_t>();
    w.app_id = optional_field<std::string>(j, "app_id");
    w.title = optional_field<std::string>(j, "title");
    w.workspace_id = optional_field<uint64_t>(j, "workspace_id");
    w.is_focused = j.value("is_focused", false);
    w.is_floating = j.value("is_floating", false);
    return w;
}

Workspace workspace_from_json(const json& j) {
    Workspace ws;
    ws.id = j.at("id").get<uint64_t>();
    ws.idx = j.at("idx").get<uint32_t>();
    ws.name = optional_field<std::string>(j, "name");
    ws.output = optional_field<std::string>(j, "output");
    ws.is_active = j.value("is_active", false);
    ws.is_focused = j.value("is_focused", false);
    return ws;
}

json action_request(const Action& action) {
    json body = std::visit(overloaded{
        [](const action::FocusWindow& a) -> json {
            return {{"FocusWindow", {{"id", a.id}}}};
        },
        [](const action::Spawn& a) -> json {
            return {{"Spawn", {{"command", a.command}}}};
        },
        [](const action::MoveWindowToWorkspace& a) -> json {
            return {{"MoveWindowToWorkspace", {
                {"window_id", a.window_id},
                {"reference", {{"Id", a.workspace_id}}},
                {"focus", a.focus},
            }}};
        },
        [](const action::ToggleWindowFloating& a) -> json {
            return {{"ToggleWindowFloating", {{"id", a.id}}}};
        },
    }, action);
    return {{"Action", body}};
}

std::expected<Event, std::string> parse_event(const json& j) {
    if (!j.is_object() || j.size() != 1) {
        return std::unexpected("malformed event: " + j.dump());
    }

    const auto& kind = j.begin().key();
    const auto& body = j.begin().value();

    try {
        if (kind == "WindowsChanged") {
            event::WindowsChanged ev;
            for (auto& w : body.at("windows")) ev.windows.push_back(window_from_json(w));
            return ev;
        }
        if (kind == "WindowOpenedOrChanged") {
            return event::WindowOpenedOrChanged{window_from_json(body.at("window"))};
        }
        if (kind == "WindowClosed") {
            return event::WindowClosed{body.at("id").get<uint64_t>()};
        }
        if (kind == "WindowFocusChanged") {
            return event::WindowFocusChanged{optional_field<uint64_t>(body, "id")};
        }
        if (kind == "WorkspacesChanged") {
            event::WorkspacesChanged ev;
            for (auto& ws : body.at("workspaces")) ev.workspaces.push_back(workspace_from_json(ws));
            return ev;
        }
        if (kind == "WorkspaceActivated") {
            return event::WorkspaceActivated{body.at("id").get<uint64_t>(),
                                             body.value("focused", false)};
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::format("malformed {} event: {}", kind, e.what()));
    }

    return event::Other{kind};
}
