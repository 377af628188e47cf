#include <catch2/catch_test_macros.hpp>

#include "command_line.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace {

Command parse_ok(const std::vector<std::string>& args) {
    auto command = parse_command_line(args);
    REQUIRE(command.has_value());
    return *command;
}

std::string parse_err(const std::vector<std::string>& args) {
    auto command = parse_command_line(args);
    REQUIRE_FALSE(command.has_value());
    return command.error();
}

} // namespace

TEST_CASE("Client command line", "[client]") {

    SECTION("UnitCommands") {
        REQUIRE(parse_ok({"nop"}) == Command{cmd::Nop{}});
        REQUIRE(parse_ok({"toggle-follow-mode"}) == Command{cmd::ToggleFollowMode{}});
        REQUIRE(parse_ok({"scratchpad-toggle"}) == Command{cmd::ScratchpadToggle{}});
        REQUIRE(parse_ok({"scratchpad-show"}) == Command{cmd::ScratchpadShow{}});
    }

    SECTION("FocusFilters") {
        auto command = parse_ok({"focus", "--app-id", "^kitty$", "-t", "vim"});
        auto& focus = std::get<cmd::Focus>(command);
        REQUIRE(focus.match.app_id == "^kitty$");
        REQUIRE(focus.match.title == "vim");
    }

    SECTION("FocusOrSpawnKeepsCommandFlags") {
        auto command = parse_ok({"focus-or-spawn", "-a", "firefox", "firefox", "-P", "work"});
        auto& spawn = std::get<cmd::FocusOrSpawn>(command);
        REQUIRE(spawn.match.app_id == "firefox");
        REQUIRE(spawn.command == std::vector<std::string>{"firefox", "-P", "work"});
    }

    SECTION("DoubleDashEndsOptions") {
        auto command = parse_ok({"move-to-current-workspace-or-spawn", "-f", "-t", "mail", "--", "-weird", "arg"});
        auto& move = std::get<cmd::MoveToCurrentWorkspaceOrSpawn>(command);
        REQUIRE(move.focus);
        REQUIRE(move.match.title == "mail");
        REQUIRE(move.command == std::vector<std::string>{"-weird", "arg"});
    }

    SECTION("MoveToCurrentWorkspace") {
        auto command = parse_ok({"move-to-current-workspace", "-a", "pavucontrol", "--focus"});
        REQUIRE(command == Command{cmd::MoveToCurrentWorkspace{{.app_id = "pavucontrol"}, true}});
    }

    SECTION("Marks") {
        REQUIRE(parse_ok({"toggle-mark"}) == Command{cmd::ToggleMark{}});
        REQUIRE(parse_ok({"toggle-mark", "work"}) == Command{cmd::ToggleMark{"work"}});
        REQUIRE(parse_ok({"focus-marked", "work"}) == Command{cmd::FocusMarked{"work"}});
        REQUIRE(parse_ok({"list-marked", "--all"}) == Command{cmd::ListMarked{std::nullopt, true}});
        REQUIRE(parse_ok({"list-marked", "work"}) == Command{cmd::ListMarked{"work", false}});
    }

    SECTION("Errors") {
        REQUIRE(parse_err({}) == "No command given");
        REQUIRE(parse_err({"teleport"}) == "Unknown command: teleport");
        REQUIRE(parse_err({"focus", "--bogus"}) == "Unknown option: --bogus");
        REQUIRE(parse_err({"focus", "-a"}) == "Missing value for -a");
        REQUIRE(parse_err({"focus-or-spawn", "-a", "x"}) == "focus-or-spawn: missing command to spawn");
        REQUIRE(parse_err({"nop", "extra"}) == "nop: unexpected argument extra");
        REQUIRE(parse_err({"toggle-mark", "a", "b"}) == "toggle-mark: unexpected argument b");
    }
}

TEST_CASE("Client socket path", "[client]") {
    auto config_path = std::filesystem::temp_directory_path() /
                       ("nirius_test_client_config_" + std::to_string(getpid()) + ".json");

    SECTION("ConfiguredSocketWins") {
        std::ofstream(config_path) << R"({ "socket_path": "/tmp/nirius-custom.sock" })";
        REQUIRE(daemon_socket_path(config_path.string()) == "/tmp/nirius-custom.sock");
    }

    SECTION("FallsBackToDerivedPath") {
        std::ofstream(config_path) << R"({ "verbose": true })";
        REQUIRE(daemon_socket_path(config_path.string()) == platform::ipc_endpoint());
    }

    std::filesystem::remove(config_path);
}
