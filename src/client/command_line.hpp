#pragma once

#include "protocol.hpp"

#include <expected>
#include <string>
#include <vector>

// Build a command from the client's arguments (without the program name),
// e.g. {"focus-or-spawn", "-a", "^firefox$", "firefox"}.
std::expected<Command, std::string> parse_command_line(const std::vector<std::string>& args);

// Socket niriusd listens on, from the config file at config_path (the
// default config.json when empty). Must agree with the daemon's choice.
std::string daemon_socket_path(const std::string& config_path);

void print_usage(const char* prog);
