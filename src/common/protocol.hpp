#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Window filters shared by the focus and move commands. Each present filter
// is a regular expression searched in the corresponding window property.
struct MatchOptions {
    std::optional<std::string> app_id;
    std::optional<std::string> title;

    bool operator==(const MatchOptions&) const = default;
};

namespace cmd {

struct Nop {
    bool operator==(const Nop&) const = default;
};

struct Focus {
    MatchOptions match;
    bool operator==(const Focus&) const = default;
};

struct FocusOrSpawn {
    MatchOptions match;
    std::vector<std::string> command;
    bool operator==(const FocusOrSpawn&) const = default;
};

struct MoveToCurrentWorkspace {
    MatchOptions match;
    bool focus = false;
    bool operator==(const MoveToCurrentWorkspace&) const = default;
};

struct MoveToCurrentWorkspaceOrSpawn {
    MatchOptions match;
    bool focus = false;
    std::vector<std::string> command;
    bool operator==(const MoveToCurrentWorkspaceOrSpawn&) const = default;
};

struct ToggleFollowMode {
    bool operator==(const ToggleFollowMode&) const = default;
};

struct ToggleMark {
    std::optional<std::string> mark;
    bool operator==(const ToggleMark&) const = default;
};

struct FocusMarked {
    std::optional<std::string> mark;
    bool operator==(const FocusMarked&) const = default;
};

struct ListMarked {
    std::optional<std::string> mark;
    bool all = false;
    bool operator==(const ListMarked&) const = default;
};

struct ScratchpadToggle {
    bool operator==(const ScratchpadToggle&) const = default;
};

struct ScratchpadShow {
    bool operator==(const ScratchpadShow&) const = default;
};

} // namespace cmd

using Command = std::variant<cmd::Nop,
                             cmd::Focus,
                             cmd::FocusOrSpawn,
                             cmd::MoveToCurrentWorkspace,
                             cmd::MoveToCurrentWorkspaceOrSpawn,
                             cmd::ToggleFollowMode,
                             cmd::ToggleMark,
                             cmd::FocusMarked,
                             cmd::ListMarked,
                             cmd::ScratchpadToggle,
                             cmd::ScratchpadShow>;

// Success message or error message of one executed command.
using CommandResult = std::expected<std::string, std::string>;

// Externally tagged encoding: unit commands are bare strings ("Nop"),
// the others a single-key object ({"Focus": {"app_id": "kitty"}}).
nlohmann::json command_to_json(const Command& command);
std::expected<Command, std::string> command_from_json(const nlohmann::json& j);

// {"Ok": "..."} or {"Err": "..."}
nlohmann::json result_to_json(const CommandResult& result);
std::expected<CommandResult, std::string> result_from_json(const nlohmann::json& j);

// Name used in the wire encoding, e.g. "FocusOrSpawn".
std::string command_name(const Command& command);
