#include "protocol.hpp"

#include <format>

using json = nlohmann::json;

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

json optional_to_json(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> optional_string(const json& body, const char* key) {
    if (!body.contains(key) || body[key].is_null()) return std::nullopt;
    return body[key].get<std::string>();
}

json match_to_json(const MatchOptions& match) {
    return {{"app_id", optional_to_json(match.app_id)},
            {"title", optional_to_json(match.title)}};
}

MatchOptions match_from_json(const json& body) {
    return {.app_id = optional_string(body, "app_id"),
            .title = optional_string(body, "title")};
}

std::vector<std::string> command_line(const json& body) {
    if (!body.contains("command")) return {};
    return body["command"].get<std::vector<std::string>>();
}

} // namespace

json command_to_json(const Command& command) {
    return std::visit(overloaded{
        [](const cmd::Nop&) -> json { return "Nop"; },
        [](const cmd::Focus& c) -> json {
            return {{"Focus", match_to_json(c.match)}};
        },
        [](const cmd::FocusOrSpawn& c) -> json {
            auto body = match_to_json(c.match);
            body["command"] = c.command;
            return {{"FocusOrSpawn", body}};
        },
        [](const cmd::MoveToCurrentWorkspace& c) -> json {
            auto body = match_to_json(c.match);
            body["focus"] = c.focus;
            return {{"MoveToCurrentWorkspace", body}};
        },
        [](const cmd::MoveToCurrentWorkspaceOrSpawn& c) -> json {
            auto body = match_to_json(c.match);
            body["focus"] = c.focus;
            body["command"] = c.command;
            return {{"MoveToCurrentWorkspaceOrSpawn", body}};
        },
        [](const cmd::ToggleFollowMode&) -> json { return "ToggleFollowMode"; },
        [](const cmd::ToggleMark& c) -> json {
            return {{"ToggleMark", {{"mark", optional_to_json(c.mark)}}}};
        },
        [](const cmd::FocusMarked& c) -> json {
            return {{"FocusMarked", {{"mark", optional_to_json(c.mark)}}}};
        },
        [](const cmd::ListMarked& c) -> json {
            return {{"ListMarked", {{"mark", optional_to_json(c.mark)}, {"all", c.all}}}};
        },
        [](const cmd::ScratchpadToggle&) -> json { return "ScratchpadToggle"; },
        [](const cmd::ScratchpadShow&) -> json { return "ScratchpadShow"; },
    }, command);
}

std::expected<Command, std::string> command_from_json(const json& j) {
    std::string name;
    json body = json::object();

    if (j.is_string()) {
        name = j.get<std::string>();
    } else if (j.is_object() && j.size() == 1) {
        name = j.begin().key();
        if (!j.begin().value().is_null()) body = j.begin().value();
    } else {
        return std::unexpected("malformed command: " + j.dump());
    }

    if (!body.is_object()) {
        return std::unexpected(std::format("malformed arguments for {}: {}", name, body.dump()));
    }

    try {
        if (name == "Nop") return cmd::Nop{};
        if (name == "Focus") return cmd::Focus{match_from_json(body)};
        if (name == "FocusOrSpawn") {
            return cmd::FocusOrSpawn{match_from_json(body), command_line(body)};
        }
        if (name == "MoveToCurrentWorkspace") {
            return cmd::MoveToCurrentWorkspace{match_from_json(body), body.value("focus", false)};
        }
        if (name == "MoveToCurrentWorkspaceOrSpawn") {
            return cmd::MoveToCurrentWorkspaceOrSpawn{
                match_from_json(body), body.value("focus", false), command_line(body)};
        }
        if (name == "ToggleFollowMode") return cmd::ToggleFollowMode{};
        if (name == "ToggleMark") return cmd::ToggleMark{optional_string(body, "mark")};
        if (name == "FocusMarked") return cmd::FocusMarked{optional_string(body, "mark")};
        if (name == "ListMarked") {
            return cmd::ListMarked{optional_string(body, "mark"), body.value("all", false)};
        }
        if (name == "ScratchpadToggle") return cmd::ScratchpadToggle{};
        if (name == "ScratchpadShow") return cmd::ScratchpadShow{};
    } catch (const json::exception& e) {
        return std::unexpected(std::format("malformed arguments for {}: {}", name, e.what()));
    }

    return std::unexpected("unknown command " + name);
}

json result_to_json(const CommandResult& result) {
    if (result) return {{"Ok", *result}};
    return {{"Err", result.error()}};
}

std::expected<CommandResult, std::string> result_from_json(const json& j) {
    if (j.is_object() && j.size() == 1) {
        auto& value = j.begin().value();
        if (value.is_string()) {
            if (j.contains("Ok")) return CommandResult{value.get<std::string>()};
            if (j.contains("Err")) return CommandResult{std::unexpected(value.get<std::string>())};
        }
    }
    return std::unexpected("malformed result: " + j.dump());
}

std::string command_name(const Command& command) {
    auto j = command_to_json(command);
    if (j.is_string()) return j.get<std::string>();
    return j.begin().key();
}
