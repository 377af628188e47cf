#include "command_engine.hpp"

#include "window_matcher.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <tuple>

namespace {

bool contains(const std::vector<uint64_t>& ids, uint64_t id) {
    return std::ranges::find(ids, id) != ids.end();
}

} // namespace

CommandEngine::CommandEngine(StateStore& store, Compositor& compositor,
                             std::string default_mark, bool verbose)
    : store_(store), compositor_(compositor),
      default_mark_(std::move(default_mark)), verbose_(verbose) {}

CommandResult CommandEngine::execute(const Command& command) {
    if (store_.observe_command(command)) {
        log("Command changed, cycle memory cleared");
    }
    log("Executing " + command_name(command));
    return std::visit([this](const auto& c) { return handle(c); }, command);
}

CommandResult CommandEngine::handle(const cmd::Nop& /*c*/) {
    return std::string{};
}

// Candidates are ordered by: focused window last, then not yet visited
// before visited, then ascending id. Once every candidate has been visited
// the cycle starts over.
CommandResult CommandEngine::handle(const cmd::Focus& c) {
    return focus_matching(c.match);
}

CommandResult CommandEngine::handle(const cmd::FocusOrSpawn& c) {
    auto result = focus_matching(c.match);
    if (!result && result.error() == NO_MATCHING_WINDOW) {
        log("No matching window, spawning");
        return spawn(c.command);
    }
    return result;
}

CommandResult CommandEngine::handle(const cmd::MoveToCurrentWorkspace& c) {
    return move_matching(c.match, c.focus);
}

CommandResult CommandEngine::handle(const cmd::MoveToCurrentWorkspaceOrSpawn& c) {
    auto result = move_matching(c.match, c.focus);
    if (!result && result.error() == NO_MATCHING_WINDOW) {
        log("No matching window, spawning");
        return spawn(c.command);
    }
    return result;
}

CommandResult CommandEngine::handle(const cmd::ToggleFollowMode& /*c*/) {
    auto focused = store_.focused_window();
    if (!focused) return std::unexpected("No focused window");

    bool enabled = store_.toggle_follow_mode(focused->id);
    return std::format("{} follow-mode for window {}", enabled ? "Enabled" : "Disabled", focused->id);
}

CommandResult CommandEngine::handle(const cmd::ToggleMark& c) {
    auto focused = store_.focused_window();
    if (!focused) return std::unexpected("No focused window");

    auto name = mark_name(c.mark);
    if (store_.toggle_mark(name, focused->id)) {
        return std::format("Marked window {} with {}", focused->id, name);
    }
    return std::format("Unmarked window {} from {}", focused->id, name);
}

// Same cycling discipline as Focus, in mark order. The focused window always
// counts as visited.
CommandResult CommandEngine::handle(const cmd::FocusMarked& c) {
    auto name = mark_name(c.mark);
    auto ids = store_.prune_mark(name);
    if (!ids) return std::unexpected("Unknown mark " + name);

    auto visited = store_.visited_ids();
    auto focused = store_.focused_window();
    if (focused && !contains(visited, focused->id)) visited.push_back(focused->id);

    auto unvisited = [&visited](uint64_t id) { return !contains(visited, id); };
    if (std::ranges::none_of(*ids, unvisited)) {
        log("All windows marked " + name + " visited, starting a new cycle");
        store_.clear_visits();
        visited.clear();
        if (focused) visited.push_back(focused->id);
    }

    auto it = std::ranges::find_if(*ids, unvisited);
    if (it == ids->end()) return std::unexpected("No marked window");

    store_.remember_visit(*it);
    return focus_window(*it);
}

CommandResult CommandEngine::handle(const cmd::ListMarked& c) {
    std::vector<std::string> lines;

    if (c.all) {
        for (auto& name : store_.mark_names()) {
            auto ids = store_.prune_mark(name);
            if (!ids || ids->empty()) continue;
            lines.push_back(name + ":");
            for (uint64_t id : *ids) {
                if (auto w = store_.window(id)) lines.push_back("  " + describe_window(*w));
            }
        }
    } else {
        auto name = mark_name(c.mark);
        auto ids = store_.prune_mark(name);
        if (!ids) return std::unexpected("Unknown mark " + name);
        for (uint64_t id : *ids) {
            if (auto w = store_.window(id)) lines.push_back(describe_window(*w));
        }
    }

    std::string out;
    for (auto& line : lines) {
        if (!out.empty()) out += '\n';
        out += line;
    }
    return out;
}

CommandResult CommandEngine::handle(const cmd::ScratchpadToggle& /*c*/) {
    auto focused = store_.focused_window();
    if (!focused) return std::unexpected("No focused window");

    if (store_.in_scratchpad(focused->id)) {
        store_.toggle_scratchpad(focused->id);
        return std::format("Window {} removed from scratchpad", focused->id);
    }

    auto parking = scratchpad_workspace();
    if (!parking) return std::unexpected(parking.error());

    store_.toggle_scratchpad(focused->id);
    auto moved = move_to_scratchpad(store_.scratchpad_ids(), *parking);
    if (!moved) {
        // Not parked, so it must not count as a scratchpad window.
        if (store_.in_scratchpad(focused->id)) store_.toggle_scratchpad(focused->id);
        return std::unexpected(moved.error());
    }
    return std::format("Window {} moved to scratchpad", focused->id);
}

CommandResult CommandEngine::handle(const cmd::ScratchpadShow& /*c*/) {
    auto ids = store_.scratchpad_ids();
    if (ids.empty()) return std::unexpected("Scratchpad is empty");

    auto focused = store_.focused_window();
    if (focused && contains(ids, focused->id)) {
        auto parking = scratchpad_workspace();
        if (!parking) return std::unexpected(parking.error());
        auto moved = move_to_scratchpad({focused->id}, *parking);
        if (!moved) return std::unexpected(moved.error());
        return std::format("Window {} moved to scratchpad", focused->id);
    }

    auto ws = store_.focused_workspace();
    if (!ws) return std::unexpected("No focused workspace");

    uint64_t id = ids.front();
    auto moved = compositor_.perform(action::MoveWindowToWorkspace{id, ws->id, false});
    if (!moved) return std::unexpected(moved.error());

    auto focus = focus_window(id);
    if (!focus) return focus;
    return std::format("Showing window {} from scratchpad", id);
}

CommandResult CommandEngine::focus_matching(const MatchOptions& match) {
    auto matcher = WindowMatcher::compile(match);
    if (!matcher) return std::unexpected(matcher.error());

    std::vector<Window> candidates;
    for (auto& w : store_.windows()) {
        if (matcher->matches(w)) candidates.push_back(std::move(w));
    }
    if (candidates.empty()) return std::unexpected(NO_MATCHING_WINDOW);

    auto visited = store_.visited_ids();
    bool all_visited = std::ranges::all_of(candidates, [&visited](const Window& w) {
        return contains(visited, w.id);
    });
    if (all_visited) {
        log("All matching windows visited, starting a new cycle");
        store_.clear_visits();
        visited.clear();
    }

    auto rank = [&visited](const Window& w) {
        return std::tuple(w.is_focused, contains(visited, w.id), w.id);
    };
    auto chosen = std::ranges::min(candidates, {}, rank);

    store_.remember_visit(chosen.id);
    return focus_window(chosen.id);
}

CommandResult CommandEngine::move_matching(const MatchOptions& match, bool focus) {
    auto ws = store_.focused_workspace();
    if (!ws) return std::unexpected("No focused workspace");

    auto matcher = WindowMatcher::compile(match);
    if (!matcher) return std::unexpected(matcher.error());

    std::optional<Window> chosen;
    for (auto& w : store_.windows()) {
        if (w.workspace_id == ws->id || !matcher->matches(w)) continue;
        if (!chosen || w.id < chosen->id) chosen = w;
    }
    if (!chosen) return std::unexpected(NO_MATCHING_WINDOW);

    auto moved = compositor_.perform(action::MoveWindowToWorkspace{chosen->id, ws->id, false});
    if (!moved) return std::unexpected(moved.error());

    if (focus) {
        auto focused = focus_window(chosen->id);
        if (!focused) return focused;
    }
    return std::format("Moved window with id {} to workspace {}", chosen->id, ws->id);
}

CommandResult CommandEngine::focus_window(uint64_t id) {
    auto res = compositor_.perform(action::FocusWindow{id});
    if (!res) return std::unexpected(res.error());
    return std::format("Focused window with id {}", id);
}

CommandResult CommandEngine::spawn(const std::vector<std::string>& command) {
    if (command.empty()) return std::unexpected("No command to spawn");

    auto res = compositor_.perform(action::Spawn{command});
    if (!res) return std::unexpected(res.error());
    return std::string("Spawned successfully");
}

std::expected<uint64_t, std::string> CommandEngine::scratchpad_workspace() const {
    auto ws = store_.focused_workspace();
    if (!ws) return std::unexpected("No focused workspace");
    if (!ws->output) return std::unexpected("Focused workspace is not on an output");

    auto bottom = store_.find_bottom_workspace(*ws->output);
    if (!bottom) return std::unexpected(bottom.error());
    return bottom->id;
}

std::expected<void, std::string> CommandEngine::move_to_scratchpad(const std::vector<uint64_t>& ids,
                                                                   uint64_t workspace_id) {
    for (uint64_t id : ids) {
        auto w = store_.window(id);
        if (!w) continue;

        if (!w->is_floating) {
            auto floated = compositor_.perform(action::ToggleWindowFloating{id});
            if (!floated) return floated;
        }
        auto moved = compositor_.perform(action::MoveWindowToWorkspace{id, workspace_id, false});
        if (!moved) return moved;
        log(std::format("Window {} parked on workspace {}", id, workspace_id));
    }
    return {};
}

std::string CommandEngine::mark_name(const std::optional<std::string>& mark) const {
    return mark.value_or(default_mark_);
}

std::string CommandEngine::describe_window(const Window& window) const {
    std::string workspace = "none";
    if (window.workspace_id) {
        auto ws = store_.workspace(*window.workspace_id);
        if (ws) {
            workspace = ws->name ? *ws->name : std::to_string(ws->idx);
            if (ws->output) workspace += " on " + *ws->output;
        } else {
            workspace = std::to_string(*window.workspace_id);
        }
    }

    return std::format("{}  app-id: {}  title: {}  workspace: {}", window.id,
                       window.app_id.value_or("-"), window.title.value_or("-"), workspace);
}

void CommandEngine::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[nirius] {}", msg);
    }
}
