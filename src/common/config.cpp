#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Absent keys leave the default in place.
template <typename T>
void read_key(const json& j, const char* key, T& target) {
    if (j.contains(key)) target = j.at(key).get<T>();
}

} // namespace

std::string Config::daemon_socket() const {
    return socket_path.empty() ? platform::ipc_endpoint() : socket_path;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return Config{};
    }

    Config cfg;
    try {
        auto j = json::parse(f);
        if (!j.is_object()) {
            std::println(stderr, "config: {} is not a JSON object, using defaults", path);
            return Config{};
        }

        read_key(j, "verbose", cfg.verbose);
        read_key(j, "socket_path", cfg.socket_path);
        read_key(j, "niri_socket", cfg.niri_socket);

        std::string mark;
        read_key(j, "default_mark", mark);
        if (!mark.empty()) cfg.default_mark = std::move(mark);
    } catch (const json::exception& e) {
        std::println(stderr, "config: {}: {}, using defaults", path, e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto path = fs::path(dir) / "config.json";
    if (!fs::exists(path)) return Config{};
    return load(path.string());
}
