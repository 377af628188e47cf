#pragma once

#include "platform/compositor.hpp"
#include "protocol.hpp"
#include "state_store.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

// Executes client commands against the state store and the compositor.
// Compositor requests are only issued while no store lock is held.
class CommandEngine {
public:
    // Domain error the *OrSpawn commands fall back on.
    static constexpr const char* NO_MATCHING_WINDOW = "No matching window";

    CommandEngine(StateStore& store, Compositor& compositor,
                  std::string default_mark, bool verbose = false);

    CommandEngine(const CommandEngine&) = delete;
    CommandEngine& operator=(const CommandEngine&) = delete;

    // Clears cycle memory if `command` differs from the previous one, then
    // runs it.
    CommandResult execute(const Command& command);

private:
    CommandResult handle(const cmd::Nop& c);
    CommandResult handle(const cmd::Focus& c);
    CommandResult handle(const cmd::FocusOrSpawn& c);
    CommandResult handle(const cmd::MoveToCurrentWorkspace& c);
    CommandResult handle(const cmd::MoveToCurrentWorkspaceOrSpawn& c);
    CommandResult handle(const cmd::ToggleFollowMode& c);
    CommandResult handle(const cmd::ToggleMark& c);
    CommandResult handle(const cmd::FocusMarked& c);
    CommandResult handle(const cmd::ListMarked& c);
    CommandResult handle(const cmd::ScratchpadToggle& c);
    CommandResult handle(const cmd::ScratchpadShow& c);

    // Cycle through matching windows, see handle(cmd::Focus).
    CommandResult focus_matching(const MatchOptions& match);
    // Lowest-id matching window not yet on the focused workspace.
    CommandResult move_matching(const MatchOptions& match, bool focus);

    CommandResult focus_window(uint64_t id);
    CommandResult spawn(const std::vector<std::string>& command);
    // Bottom workspace of the focused output, where scratchpad windows are parked.
    std::expected<uint64_t, std::string> scratchpad_workspace() const;
    // Float each window and park it on the given workspace.
    std::expected<void, std::string> move_to_scratchpad(const std::vector<uint64_t>& ids,
                                                        uint64_t workspace_id);

    std::string mark_name(const std::optional<std::string>& mark) const;
    std::string describe_window(const Window& window) const;

    void log(const std::string& msg);

    StateStore& store_;
    Compositor& compositor_;
    std::string default_mark_;
    bool verbose_;
};
