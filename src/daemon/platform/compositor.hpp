#pragma once

#include "niri/types.hpp"

#include <expected>
#include <optional>
#include <string>
#include <vector>

// One-shot requests to the compositor. Every call is a single round trip;
// errors carry the compositor's message or the transport failure.
class Compositor {
public:
    virtual ~Compositor() = default;
    virtual std::expected<std::vector<Window>, std::string> windows() = 0;
    virtual std::expected<std::vector<Workspace>, std::string> workspaces() = 0;
    virtual std::expected<std::optional<Window>, std::string> focused_window() = 0;
    virtual std::expected<void, std::string> perform(const Action& action) = 0;
};
