#pragma once

#include <string>

struct Config {
    bool verbose = false;

    // Overrides for the derived socket paths; empty means derive from the
    // environment.
    std::string socket_path;
    std::string niri_socket;

    // Mark used when a mark command names none.
    std::string default_mark = "__default__";

    // socket_path if set, otherwise the path derived from the environment.
    // niriusd listens here and nirius connects here.
    std::string daemon_socket() const;

    static Config load(const std::string& path);
    static Config load_default();
};
