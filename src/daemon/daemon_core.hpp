#pragma once

#include "command_engine.hpp"
#include "config.hpp"
#include "event_sync.hpp"
#include "platform/compositor.hpp"
#include "state_store.hpp"

#include <nlohmann/json.hpp>
#include <string>

// Portable part of the daemon: owns the state store and wires the command
// engine and the event synchronizer to it.
class DaemonCore {
public:
    DaemonCore(const Config& config, bool verbose, Compositor& compositor);

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Decode a client request and run it. A request that is not a known
    // command fails like any other command.
    CommandResult handle_request(const nlohmann::json& request);

    StateStore& store() { return store_; }
    EventSync& event_sync() { return event_sync_; }

private:
    void log(const std::string& msg);

    bool verbose_;
    StateStore store_;
    CommandEngine engine_;
    EventSync event_sync_;
};
