#include "window_matcher.hpp"

#include <format>

namespace {

bool filter_matches(const std::optional<std::regex>& filter,
                    const std::optional<std::string>& value) {
    if (!filter) return true;
    if (!value) return false;
    return std::regex_search(*value, *filter);
}

} // namespace

std::expected<WindowMatcher, std::string> WindowMatcher::compile(const MatchOptions& match) {
    WindowMatcher matcher;
    const std::optional<std::string>* current = nullptr;
    try {
        current = &match.app_id;
        if (match.app_id) matcher.app_id_.emplace(*match.app_id);
        current = &match.title;
        if (match.title) matcher.title_.emplace(*match.title);
    } catch (const std::regex_error& e) {
        return std::unexpected(std::format("Invalid filter {}: {}", **current, e.what()));
    }
    return matcher;
}

bool WindowMatcher::matches(const Window& window) const {
    return filter_matches(app_id_, window.app_id) && filter_matches(title_, window.title);
}
