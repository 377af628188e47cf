#pragma once

#include "niri/types.hpp"
#include "protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

// Mirror of niri's windows and workspaces plus the daemon's own bookkeeping
// (marks, follow-mode, scratchpad, cycle memory). Every method takes the lock
// once: queries share it, mutations hold it exclusively. Queries return
// copies so callers never hold references into the store.
class StateStore {
public:
    StateStore() = default;

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    // --- windows ---

    // Replace in place, or append as the newest window. A focused window
    // takes the focus from all others.
    void upsert_window(Window window);
    // Drop the window and every reference to its id. Returns the number of
    // windows left.
    size_t remove_window(uint64_t id);
    // Wholesale replacement; references to ids not in `windows` are purged.
    void replace_windows(std::vector<Window> windows);
    // Focus `id` (or nothing) and move it to the most recently focused end.
    void set_focus(std::optional<uint64_t> id);

    std::vector<Window> windows() const;
    std::optional<Window> window(uint64_t id) const;
    std::optional<Window> focused_window() const;

    // --- workspaces ---

    void replace_workspaces(std::vector<Workspace> workspaces);
    void focus_workspace(uint64_t id);

    std::vector<Workspace> workspaces() const;
    std::optional<Workspace> workspace(uint64_t id) const;
    std::optional<Workspace> focused_workspace() const;
    // Workspace with the highest index on `output`, the always empty one.
    std::expected<Workspace, std::string> find_bottom_workspace(const std::string& output) const;

    // --- follow-mode ---

    // Returns true if the window is enrolled afterwards.
    bool toggle_follow_mode(uint64_t id);
    std::vector<uint64_t> follow_mode_ids() const;

    // --- marks ---

    // Returns true if the window carries the mark afterwards. A mark left
    // without windows is removed.
    bool toggle_mark(const std::string& mark, uint64_t id);
    // Drop ids of vanished windows from `mark` and return the remaining ones
    // (oldest first), or nullopt for an unknown mark.
    std::optional<std::vector<uint64_t>> prune_mark(const std::string& mark);
    std::vector<std::string> mark_names() const;

    // --- scratchpad ---

    // Returns true if the window is in the scratchpad afterwards.
    bool toggle_scratchpad(uint64_t id);
    std::vector<uint64_t> scratchpad_ids() const;
    bool in_scratchpad(uint64_t id) const;

    // --- cycle memory ---

    std::vector<uint64_t> visited_ids() const;
    void remember_visit(uint64_t id);
    void clear_visits();
    // Record `command` as the latest one; cycle memory is cleared when it
    // differs from its predecessor. Returns true if memory was cleared.
    bool observe_command(const Command& command);

private:
    void purge_id(uint64_t id);
    bool has_window(uint64_t id) const;

    mutable std::shared_mutex mutex_;

    std::vector<Window> windows_;           // least recently focused first
    std::vector<Workspace> workspaces_;
    std::map<std::string, std::vector<uint64_t>> marks_;
    std::vector<uint64_t> follow_mode_;
    std::vector<uint64_t> scratchpad_;
    std::vector<uint64_t> visited_;
    std::optional<Command> last_command_;
};
