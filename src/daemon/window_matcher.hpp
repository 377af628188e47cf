#pragma once

#include "niri/types.hpp"
#include "protocol.hpp"

#include <expected>
#include <optional>
#include <regex>
#include <string>

// Compiled form of MatchOptions. A window matches if every present filter is
// found (regex search) in the corresponding property; a filter against an
// absent property never matches. No filters match every window.
class WindowMatcher {
public:
    // Fails with "Invalid filter <regex>: <reason>".
    static std::expected<WindowMatcher, std::string> compile(const MatchOptions& match);

    bool matches(const Window& window) const;

private:
    WindowMatcher() = default;

    std::optional<std::regex> app_id_;
    std::optional<std::regex> title_;
};
