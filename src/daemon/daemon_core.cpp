#include "daemon_core.hpp"

#include <print>

DaemonCore::DaemonCore(const Config& config, bool verbose, Compositor& compositor)
    : verbose_(verbose),
      engine_(store_, compositor, config.default_mark, verbose),
      event_sync_(store_, compositor, verbose) {}

CommandResult DaemonCore::handle_request(const nlohmann::json& request) {
    auto command = command_from_json(request);
    if (!command) {
        std::println(stderr, "Rejected command: {}", command.error());
        return std::unexpected(command.error());
    }

    log("Received command: " + request.dump());
    auto result = engine_.execute(*command);
    log(result ? "Command succeeded: " + *result : "Command failed: " + result.error());
    return result;
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[nirius] {}", msg);
    }
}
