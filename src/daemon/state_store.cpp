#include "state_store.hpp"

#include <algorithm>
#include <mutex>

namespace {

// Append `id` if absent, otherwise remove it keeping the order of the rest.
// Returns true if `id` is present afterwards.
bool toggle_id(std::vector<uint64_t>& ids, uint64_t id) {
    auto it = std::ranges::find(ids, id);
    if (it != ids.end()) {
        ids.erase(it);
        return false;
    }
    ids.push_back(id);
    return true;
}

bool contains(const std::vector<uint64_t>& ids, uint64_t id) {
    return std::ranges::find(ids, id) != ids.end();
}

} // namespace

void StateStore::upsert_window(Window window) {
    std::unique_lock lock(mutex_);

    if (window.is_focused) {
        for (auto& w : windows_) w.is_focused = false;
    }

    auto it = std::ranges::find_if(windows_, [&](const Window& w) { return w.id == window.id; });
    if (it != windows_.end()) {
        *it = std::move(window);
    } else {
        windows_.push_back(std::move(window));
    }
}

size_t StateStore::remove_window(uint64_t id) {
    std::unique_lock lock(mutex_);
    std::erase_if(windows_, [id](const Window& w) { return w.id == id; });
    purge_id(id);
    return windows_.size();
}

void StateStore::replace_windows(std::vector<Window> windows) {
    std::unique_lock lock(mutex_);

    std::vector<uint64_t> stale;
    for (auto& w : windows_) {
        bool kept = std::ranges::any_of(windows, [&](const Window& n) { return n.id == w.id; });
        if (!kept) stale.push_back(w.id);
    }

    windows_ = std::move(windows);
    for (uint64_t id : stale) purge_id(id);
}

void StateStore::set_focus(std::optional<uint64_t> id) {
    std::unique_lock lock(mutex_);

    for (auto& w : windows_) w.is_focused = false;
    if (!id) return;

    auto it = std::ranges::find_if(windows_, [&](const Window& w) { return w.id == *id; });
    if (it == windows_.end()) return;

    it->is_focused = true;
    std::rotate(it, it + 1, windows_.end());
}

std::vector<Window> StateStore::windows() const {
    std::shared_lock lock(mutex_);
    return windows_;
}

std::optional<Window> StateStore::window(uint64_t id) const {
    std::shared_lock lock(mutex_);
    auto it = std::ranges::find_if(windows_, [id](const Window& w) { return w.id == id; });
    if (it == windows_.end()) return std::nullopt;
    return *it;
}

std::optional<Window> StateStore::focused_window() const {
    std::shared_lock lock(mutex_);
    auto it = std::ranges::find_if(windows_, [](const Window& w) { return w.is_focused; });
    if (it == windows_.end()) return std::nullopt;
    return *it;
}

void StateStore::replace_workspaces(std::vector<Workspace> workspaces) {
    std::unique_lock lock(mutex_);
    workspaces_ = std::move(workspaces);
}

void StateStore::focus_workspace(uint64_t id) {
    std::unique_lock lock(mutex_);

    auto target = std::ranges::find_if(workspaces_, [id](const Workspace& ws) { return ws.id == id; });
    if (target == workspaces_.end()) return;

    auto output = target->output;
    for (auto& ws : workspaces_) {
        ws.is_focused = ws.id == id;
        if (ws.output == output) ws.is_active = ws.id == id;
    }
}

std::vector<Workspace> StateStore::workspaces() const {
    std::shared_lock lock(mutex_);
    return workspaces_;
}

std::optional<Workspace> StateStore::workspace(uint64_t id) const {
    std::shared_lock lock(mutex_);
    auto it = std::ranges::find_if(workspaces_, [id](const Workspace& ws) { return ws.id == id; });
    if (it == workspaces_.end()) return std::nullopt;
    return *it;
}

std::optional<Workspace> StateStore::focused_workspace() const {
    std::shared_lock lock(mutex_);
    auto it = std::ranges::find_if(workspaces_, [](const Workspace& ws) { return ws.is_focused; });
    if (it == workspaces_.end()) return std::nullopt;
    return *it;
}

std::expected<Workspace, std::string> StateStore::find_bottom_workspace(const std::string& output) const {
    std::shared_lock lock(mutex_);

    const Workspace* bottom = nullptr;
    for (auto& ws : workspaces_) {
        if (ws.output != output) continue;
        if (!bottom || ws.idx > bottom->idx) bottom = &ws;
    }
    if (!bottom) return std::unexpected("No workspaces on output " + output);
    return *bottom;
}

bool StateStore::toggle_follow_mode(uint64_t id) {
    std::unique_lock lock(mutex_);
    if (!contains(follow_mode_, id) && !has_window(id)) return false;
    return toggle_id(follow_mode_, id);
}

std::vector<uint64_t> StateStore::follow_mode_ids() const {
    std::shared_lock lock(mutex_);
    return follow_mode_;
}

bool StateStore::toggle_mark(const std::string& mark, uint64_t id) {
    std::unique_lock lock(mutex_);

    auto& ids = marks_[mark];
    bool marked = (contains(ids, id) || has_window(id)) ? toggle_id(ids, id) : false;
    if (ids.empty()) marks_.erase(mark);
    return marked;
}

std::optional<std::vector<uint64_t>> StateStore::prune_mark(const std::string& mark) {
    std::unique_lock lock(mutex_);

    auto it = marks_.find(mark);
    if (it == marks_.end()) return std::nullopt;

    std::erase_if(it->second, [this](uint64_t id) { return !has_window(id); });
    auto ids = it->second;
    if (ids.empty()) marks_.erase(it);
    return ids;
}

std::vector<std::string> StateStore::mark_names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    for (auto& [name, ids] : marks_) names.push_back(name);
    return names;
}

bool StateStore::toggle_scratchpad(uint64_t id) {
    std::unique_lock lock(mutex_);
    if (!contains(scratchpad_, id) && !has_window(id)) return false;
    return toggle_id(scratchpad_, id);
}

std::vector<uint64_t> StateStore::scratchpad_ids() const {
    std::shared_lock lock(mutex_);
    return scratchpad_;
}

bool StateStore::in_scratchpad(uint64_t id) const {
    std::shared_lock lock(mutex_);
    return contains(scratchpad_, id);
}

std::vector<uint64_t> StateStore::visited_ids() const {
    std::shared_lock lock(mutex_);
    return visited_;
}

void StateStore::remember_visit(uint64_t id) {
    std::unique_lock lock(mutex_);
    if (!contains(visited_, id) && has_window(id)) visited_.push_back(id);
}

void StateStore::clear_visits() {
    std::unique_lock lock(mutex_);
    visited_.clear();
}

bool StateStore::observe_command(const Command& command) {
    std::unique_lock lock(mutex_);

    bool changed = !last_command_ || *last_command_ != command;
    if (changed) visited_.clear();
    last_command_ = command;
    return changed;
}

// Caller holds the exclusive lock.
void StateStore::purge_id(uint64_t id) {
    std::erase(follow_mode_, id);
    std::erase(scratchpad_, id);
    std::erase(visited_, id);
    for (auto it = marks_.begin(); it != marks_.end();) {
        std::erase(it->second, id);
        if (it->second.empty()) {
            it = marks_.erase(it);
        } else {
            ++it;
        }
    }
}

bool StateStore::has_window(uint64_t id) const {
    return std::ranges::any_of(windows_, [id](const Window& w) { return w.id == id; });
}
