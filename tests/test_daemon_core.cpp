#include <catch2/catch_test_macros.hpp>

#include "daemon_core.hpp"
#include "mock_compositor.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

TEST_CASE("Daemon request handling", "[daemon]") {
    MockCompositor niri;
    Config config;
    config.default_mark = "main";
    DaemonCore core(config, false, niri);

    core.store().replace_workspaces({make_workspace(1, 1, "DP-1", true)});
    core.store().replace_windows({make_window(1, "kitty"), make_window(2, "firefox")});
    core.store().set_focus(2);

    SECTION("FocusRequest") {
        auto result = core.handle_request(json::parse(R"({"Focus":{"app_id":"kitty","title":null}})"));
        REQUIRE(result == CommandResult{"Focused window with id 1"});
        REQUIRE(niri.performed<action::FocusWindow>().size() == 1);
    }

    SECTION("CommandErrorIsErrReply") {
        auto result = core.handle_request(json::parse(R"({"Focus":{"app_id":"emacs"}})"));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == "No matching window");
    }

    SECTION("InvalidCommandIsErrReply") {
        auto result = core.handle_request(json("SelfDestruct"));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == "unknown command SelfDestruct");
        REQUIRE(niri.actions.empty());
    }

    SECTION("ConfiguredDefaultMark") {
        auto result = core.handle_request(json::parse(R"({"ToggleMark":{"mark":null}})"));
        REQUIRE(result == CommandResult{"Marked window 2 with main"});
        REQUIRE(core.store().mark_names() == std::vector<std::string>{"main"});
    }

    SECTION("NopIsEmptyOk") {
        REQUIRE(core.handle_request(json("Nop")) == CommandResult{""});
    }

    SECTION("EventsReachTheSameStore") {
        core.event_sync().handle_event(event::WindowClosed{1});
        auto result = core.handle_request(json::parse(R"({"Focus":{"app_id":"kitty"}})"));
        REQUIRE_FALSE(result.has_value());
    }
}
