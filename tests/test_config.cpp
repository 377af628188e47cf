#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "platform/platform_paths.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "nirius_test_config_XXXXXX";
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        std::ofstream(path) << content;
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE_FALSE(cfg.verbose);
        REQUIRE(cfg.socket_path.empty());
        REQUIRE(cfg.niri_socket.empty());
        REQUIRE(cfg.default_mark == "__default__");
    }

    SECTION("DaemonSocketPrefersOverride") {
        Config cfg;
        REQUIRE(cfg.daemon_socket() == platform::ipc_endpoint());
        cfg.socket_path = "/tmp/nirius-custom.sock";
        REQUIRE(cfg.daemon_socket() == "/tmp/nirius-custom.sock");
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "verbose": true,
            "socket_path": "/run/user/1000/nirius.sock",
            "niri_socket": "/run/user/1000/niri.sock",
            "default_mark": "main"
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.verbose);
        REQUIRE(cfg.socket_path == "/run/user/1000/nirius.sock");
        REQUIRE(cfg.niri_socket == "/run/user/1000/niri.sock");
        REQUIRE(cfg.default_mark == "main");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "default_mark": "work" })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.default_mark == "work");
        // Other fields retain defaults
        REQUIRE_FALSE(cfg.verbose);
        REQUIRE(cfg.socket_path.empty());
    }

    SECTION("EmptyDefaultMarkIsIgnored") {
        TmpFile f(R"({ "default_mark": "" })");
        REQUIRE(Config::load(f.path).default_mark == "__default__");
    }

    SECTION("WrongTypeFallsBackToDefaults") {
        TmpFile f(R"({ "verbose": true, "socket_path": 12 })");

        auto cfg = Config::load(f.path);
        REQUIRE_FALSE(cfg.verbose);
        REQUIRE(cfg.socket_path.empty());
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.default_mark == "__default__");
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/nirius_test_nonexistent_config_file.json");
        REQUIRE_FALSE(cfg.verbose);
        REQUIRE(cfg.default_mark == "__default__");
    }
}
