#pragma once

#include "platform/compositor.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Records every action and answers queries from plain member data.
class MockCompositor : public Compositor {
public:
    std::vector<Window> window_list;
    std::vector<Workspace> workspace_list;
    std::optional<Window> focused;

    std::vector<Action> actions;
    std::string fail_with;                     // non-empty: every action fails
    std::optional<uint64_t> fail_for_window;   // only actions on this window fail

    std::expected<std::vector<Window>, std::string> windows() override { return window_list; }
    std::expected<std::vector<Workspace>, std::string> workspaces() override { return workspace_list; }
    std::expected<std::optional<Window>, std::string> focused_window() override { return focused; }

    std::expected<void, std::string> perform(const Action& action) override {
        actions.push_back(action);
        if (!fail_with.empty()) return std::unexpected(fail_with);
        if (fail_for_window) {
            auto* move = std::get_if<action::MoveWindowToWorkspace>(&action);
            if (move && move->window_id == *fail_for_window) {
                return std::unexpected("window " + std::to_string(move->window_id) + " is gone");
            }
        }
        return {};
    }

    template <typename T>
    std::vector<T> performed() const {
        std::vector<T> result;
        for (auto& a : actions) {
            if (auto* t = std::get_if<T>(&a)) result.push_back(*t);
        }
        return result;
    }
};

inline Window make_window(uint64_t id, std::optional<std::string> app_id,
                          std::optional<uint64_t> workspace_id = 1) {
    Window w;
    w.id = id;
    w.app_id = std::move(app_id);
    w.title = "window " + std::to_string(id);
    w.workspace_id = workspace_id;
    return w;
}

inline Workspace make_workspace(uint64_t id, uint32_t idx, std::string output,
                                bool focused = false) {
    Workspace ws;
    ws.id = id;
    ws.idx = idx;
    ws.output = std::move(output);
    ws.is_active = focused;
    ws.is_focused = focused;
    return ws;
}
