#include "command_line.hpp"

#include "config.hpp"

#include <print>

namespace {

struct Args {
    MatchOptions match;
    bool focus = false;
    bool all = false;
    std::vector<std::string> positional;
};

std::expected<Args, std::string> parse_options(const std::vector<std::string>& args) {
    Args parsed;
    for (size_t i = 1; i < args.size(); i++) {
        const auto& arg = args[i];
        // Everything from the first positional word on is the command line
        if (!parsed.positional.empty()) {
            parsed.positional.push_back(arg);
            continue;
        }
        if (arg == "--") {
            parsed.positional.insert(parsed.positional.end(), args.begin() + i + 1, args.end());
            break;
        }
        if (arg == "--app-id" || arg == "-a" || arg == "--title" || arg == "-t") {
            if (i + 1 >= args.size()) return std::unexpected("Missing value for " + arg);
            auto& target = (arg == "--app-id" || arg == "-a") ? parsed.match.app_id : parsed.match.title;
            target = args[++i];
        } else if (arg == "--focus" || arg == "-f") {
            parsed.focus = true;
        } else if (arg == "--all") {
            parsed.all = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return std::unexpected("Unknown option: " + arg);
        } else {
            parsed.positional.push_back(arg);
        }
    }
    return parsed;
}

std::optional<std::string> single_mark(const std::vector<std::string>& positional) {
    if (positional.empty()) return std::nullopt;
    return positional.front();
}

} // namespace

std::expected<Command, std::string> parse_command_line(const std::vector<std::string>& args) {
    if (args.empty()) return std::unexpected("No command given");

    auto parsed = parse_options(args);
    if (!parsed) return std::unexpected(parsed.error());

    const auto& name = args.front();
    auto& a = *parsed;

    auto no_positional = [&](Command command) -> std::expected<Command, std::string> {
        if (!a.positional.empty()) {
            return std::unexpected(name + ": unexpected argument " + a.positional.front());
        }
        return command;
    };
    auto at_most_one = [&](Command command) -> std::expected<Command, std::string> {
        if (a.positional.size() > 1) {
            return std::unexpected(name + ": unexpected argument " + a.positional[1]);
        }
        return command;
    };

    if (name == "nop") return no_positional(cmd::Nop{});
    if (name == "focus") return no_positional(cmd::Focus{a.match});
    if (name == "focus-or-spawn") {
        if (a.positional.empty()) return std::unexpected(name + ": missing command to spawn");
        return cmd::FocusOrSpawn{a.match, a.positional};
    }
    if (name == "move-to-current-workspace") {
        return no_positional(cmd::MoveToCurrentWorkspace{a.match, a.focus});
    }
    if (name == "move-to-current-workspace-or-spawn") {
        if (a.positional.empty()) return std::unexpected(name + ": missing command to spawn");
        return cmd::MoveToCurrentWorkspaceOrSpawn{a.match, a.focus, a.positional};
    }
    if (name == "toggle-follow-mode") return no_positional(cmd::ToggleFollowMode{});
    if (name == "toggle-mark") return at_most_one(cmd::ToggleMark{single_mark(a.positional)});
    if (name == "focus-marked") return at_most_one(cmd::FocusMarked{single_mark(a.positional)});
    if (name == "list-marked") {
        return at_most_one(cmd::ListMarked{single_mark(a.positional), a.all});
    }
    if (name == "scratchpad-toggle") return no_positional(cmd::ScratchpadToggle{});
    if (name == "scratchpad-show") return no_positional(cmd::ScratchpadShow{});

    return std::unexpected("Unknown command: " + name);
}

std::string daemon_socket_path(const std::string& config_path) {
    auto config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    return config.daemon_socket();
}

void print_usage(const char* prog) {
    std::println(stderr, "Usage: {} [-c CONFIG] <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  focus [-a RX] [-t RX]                            Cycle focus through matching windows");
    std::println(stderr, "  focus-or-spawn [-a RX] [-t RX] [--] CMD...       Focus a match or spawn CMD");
    std::println(stderr, "  move-to-current-workspace [-a RX] [-t RX] [-f]   Pull a matching window here");
    std::println(stderr, "  move-to-current-workspace-or-spawn [...] CMD...  Pull a match here or spawn CMD");
    std::println(stderr, "  toggle-follow-mode                               Focused window follows workspace focus");
    std::println(stderr, "  toggle-mark [MARK]                               Mark or unmark the focused window");
    std::println(stderr, "  focus-marked [MARK]                              Cycle focus through marked windows");
    std::println(stderr, "  list-marked [MARK] [--all]                       List marked windows");
    std::println(stderr, "  scratchpad-toggle                                Move the focused window to the scratchpad or back");
    std::println(stderr, "  scratchpad-show                                  Show or hide a scratchpad window");
    std::println(stderr, "  nop                                              Do nothing (resets focus cycling)");
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH Read the daemon socket from PATH (before the command)");
    std::println(stderr, "  -a, --app-id RX   Match window app-ids against RX");
    std::println(stderr, "  -t, --title RX    Match window titles against RX");
    std::println(stderr, "  -f, --focus       Focus the window after moving it");
    std::println(stderr, "      --all         List every mark");
}
