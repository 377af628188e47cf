#include <catch2/catch_test_macros.hpp>

#include "mock_compositor.hpp"
#include "state_store.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

namespace {

std::vector<uint64_t> window_ids(const StateStore& store) {
    std::vector<uint64_t> ids;
    for (auto& w : store.windows()) ids.push_back(w.id);
    return ids;
}

} // namespace

TEST_CASE("State store windows", "[state]") {
    StateStore store;
    store.upsert_window(make_window(1, "kitty"));
    store.upsert_window(make_window(2, "firefox"));
    store.upsert_window(make_window(3, "emacs"));

    SECTION("UpsertAppendsNewWindows") {
        REQUIRE(window_ids(store) == std::vector<uint64_t>{1, 2, 3});
    }

    SECTION("UpsertReplacesInPlace") {
        auto changed = make_window(2, "firefox");
        changed.title = "New Tab";
        store.upsert_window(changed);

        REQUIRE(window_ids(store) == std::vector<uint64_t>{1, 2, 3});
        REQUIRE(store.window(2)->title == "New Tab");
    }

    SECTION("FocusedUpsertTakesFocus") {
        store.set_focus(1);
        auto w = make_window(3, "emacs");
        w.is_focused = true;
        store.upsert_window(w);

        REQUIRE(store.focused_window()->id == 3);
        REQUIRE_FALSE(store.window(1)->is_focused);
    }

    SECTION("SetFocusMovesWindowToNewestEnd") {
        store.set_focus(1);
        REQUIRE(store.focused_window()->id == 1);
        REQUIRE(window_ids(store) == std::vector<uint64_t>{2, 3, 1});

        store.set_focus(2);
        REQUIRE(window_ids(store) == std::vector<uint64_t>{3, 1, 2});
        auto focused_count = std::ranges::count_if(store.windows(), [](const Window& w) { return w.is_focused; });
        REQUIRE(focused_count == 1);
    }

    SECTION("SetFocusNoneOrUnknownClearsFocus") {
        store.set_focus(1);
        store.set_focus(std::nullopt);
        REQUIRE_FALSE(store.focused_window().has_value());

        store.set_focus(1);
        store.set_focus(42);
        REQUIRE_FALSE(store.focused_window().has_value());
    }

    SECTION("RemoveWindowReturnsRemainingCount") {
        REQUIRE(store.remove_window(2) == 2);
        REQUIRE_FALSE(store.window(2).has_value());
        REQUIRE(store.remove_window(2) == 2);
    }

    SECTION("RemoveWindowPurgesAllReferences") {
        store.toggle_follow_mode(2);
        store.toggle_mark("m", 2);
        store.toggle_mark("m", 3);
        store.toggle_mark("solo", 2);
        store.toggle_scratchpad(2);
        store.remember_visit(2);

        store.remove_window(2);

        REQUIRE(store.follow_mode_ids().empty());
        REQUIRE(store.scratchpad_ids().empty());
        REQUIRE(store.visited_ids().empty());
        REQUIRE(store.prune_mark("m") == std::vector<uint64_t>{3});
        REQUIRE_FALSE(store.prune_mark("solo").has_value());
    }

    SECTION("ReplaceWindowsPurgesVanishedIds") {
        store.toggle_follow_mode(1);
        store.toggle_scratchpad(3);

        store.replace_windows({make_window(3, "emacs"), make_window(4, "foot")});

        REQUIRE(window_ids(store) == std::vector<uint64_t>{3, 4});
        REQUIRE(store.follow_mode_ids().empty());
        REQUIRE(store.scratchpad_ids() == std::vector<uint64_t>{3});
    }
}

TEST_CASE("State store workspaces", "[state]") {
    StateStore store;
    store.replace_workspaces({
        make_workspace(10, 1, "DP-1", true),
        make_workspace(11, 2, "DP-1"),
        make_workspace(12, 3, "DP-1"),
        make_workspace(20, 1, "HDMI-A-1"),
        make_workspace(21, 2, "HDMI-A-1"),
    });

    SECTION("FindBottomWorkspace") {
        REQUIRE(store.find_bottom_workspace("DP-1")->id == 12);
        REQUIRE(store.find_bottom_workspace("HDMI-A-1")->id == 21);
    }

    SECTION("FindBottomWorkspaceUnknownOutput") {
        auto bottom = store.find_bottom_workspace("eDP-1");
        REQUIRE_FALSE(bottom.has_value());
        REQUIRE(bottom.error() == "No workspaces on output eDP-1");
    }

    SECTION("FocusWorkspace") {
        store.focus_workspace(20);
        REQUIRE(store.focused_workspace()->id == 20);
        REQUIRE(store.workspace(20)->is_active);
        REQUIRE_FALSE(store.workspace(10)->is_focused);
        // Other outputs keep their active workspace
        REQUIRE(store.workspace(10)->is_active);

        store.focus_workspace(11);
        REQUIRE(store.focused_workspace()->id == 11);
        REQUIRE_FALSE(store.workspace(10)->is_active);
    }

    SECTION("ReplaceWorkspaces") {
        store.replace_workspaces({make_workspace(30, 1, "DP-1", true)});
        REQUIRE(store.workspaces().size() == 1);
        REQUIRE(store.focused_workspace()->id == 30);
    }
}

TEST_CASE("State store bookkeeping", "[state]") {
    StateStore store;
    for (uint64_t id = 1; id <= 3; id++) store.upsert_window(make_window(id, "kitty"));

    SECTION("ToggleFollowModeKeepsOrder") {
        REQUIRE(store.toggle_follow_mode(1));
        REQUIRE(store.toggle_follow_mode(2));
        REQUIRE(store.toggle_follow_mode(3));
        REQUIRE_FALSE(store.toggle_follow_mode(2));
        REQUIRE(store.follow_mode_ids() == std::vector<uint64_t>{1, 3});
    }

    SECTION("ToggleMarkTwiceLeavesNoMark") {
        REQUIRE(store.toggle_mark("m", 1));
        REQUIRE(store.mark_names() == std::vector<std::string>{"m"});
        REQUIRE_FALSE(store.toggle_mark("m", 1));
        REQUIRE(store.mark_names().empty());
    }

    SECTION("UnknownWindowsAreNotEnrolled") {
        REQUIRE_FALSE(store.toggle_follow_mode(99));
        REQUIRE_FALSE(store.toggle_mark("m", 99));
        REQUIRE_FALSE(store.toggle_scratchpad(99));
        store.remember_visit(99);

        REQUIRE(store.follow_mode_ids().empty());
        REQUIRE(store.mark_names().empty());
        REQUIRE(store.scratchpad_ids().empty());
        REQUIRE(store.visited_ids().empty());
    }

    SECTION("ScratchpadMembership") {
        REQUIRE(store.toggle_scratchpad(2));
        REQUIRE(store.in_scratchpad(2));
        REQUIRE_FALSE(store.toggle_scratchpad(2));
        REQUIRE_FALSE(store.in_scratchpad(2));
    }

    SECTION("VisitsAreRememberedOnce") {
        store.remember_visit(2);
        store.remember_visit(1);
        store.remember_visit(2);
        REQUIRE(store.visited_ids() == std::vector<uint64_t>{2, 1});
        store.clear_visits();
        REQUIRE(store.visited_ids().empty());
    }

    SECTION("ObserveCommandClearsVisitsOnChange") {
        Command focus_kitty = cmd::Focus{{.app_id = "kitty"}};
        Command focus_foot = cmd::Focus{{.app_id = "foot"}};

        REQUIRE(store.observe_command(focus_kitty));
        store.remember_visit(1);

        REQUIRE_FALSE(store.observe_command(focus_kitty));
        REQUIRE(store.visited_ids() == std::vector<uint64_t>{1});

        REQUIRE(store.observe_command(focus_foot));
        REQUIRE(store.visited_ids().empty());
    }
}

TEST_CASE("State store concurrent access", "[state]") {
    StateStore store;
    std::atomic<bool> done{false};

    std::thread writer([&] {
        for (uint64_t i = 1; i <= 500; i++) {
            auto w = make_window(i, "kitty");
            w.is_focused = true;
            store.upsert_window(w);
            store.toggle_mark("m", i);
            if (i % 2 == 0) store.remove_window(i - 1);
        }
        done = true;
    });

    bool single_focus = true;
    while (!done) {
        auto windows = store.windows();
        auto focused = std::ranges::count_if(windows, [](const Window& w) { return w.is_focused; });
        if (focused > 1) single_focus = false;
    }
    writer.join();

    REQUIRE(single_focus);
    REQUIRE(store.windows().size() == 250);
    REQUIRE(store.prune_mark("m")->size() == 250);
}
