#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <expected>
#include <print>
#include <string>

namespace {

struct Options {
    bool foreground = false;
    bool verbose = false;
    bool help = false;
    std::string config_path;
};

std::expected<Options, std::string> parse_options(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            opts.foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) return std::unexpected("Missing value for " + arg);
            opts.config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else {
            return std::unexpected("Unknown option: " + arg);
        }
    }
    return opts;
}

void print_usage() {
    std::println("Usage: niriusd [options]");
    std::println("Keeps track of niri's windows and serves commands from nirius.");
    std::println("Options:");
    std::println("  -f, --foreground    Stay attached to the terminal");
    std::println("  -v, --verbose       Log every event and command to stderr");
    std::println("  -c, --config PATH   Read PATH instead of the default config.json");
    std::println("  -h, --help          Show this help");
}

} // namespace

int main(int argc, char* argv[]) {
    auto opts = parse_options(argc, argv);
    if (!opts) {
        std::println(stderr, "niriusd: {}", opts.error());
        print_usage();
        return 1;
    }
    if (opts->help) {
        print_usage();
        return 0;
    }

    Config config = opts->config_path.empty() ? Config::load_default()
                                              : Config::load(opts->config_path);

    if (!opts->foreground) {
        platform::daemonize();
    }

    LinuxEventLoop loop(std::move(config), opts->verbose);
    if (!loop.init()) {
        std::println(stderr, "niriusd: could not start, is niri running?");
        return 1;
    }

    loop.run();
    return 0;
}
