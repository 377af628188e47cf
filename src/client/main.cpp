#include "command_line.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "protocol.hpp"

#include <print>
#include <string>
#include <vector>

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h") {
        print_usage(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_path;
    if (args.front() == "--config" || args.front() == "-c") {
        if (args.size() < 2) {
            std::println(stderr, "Missing value for {}", args.front());
            return 1;
        }
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    auto command = parse_command_line(args);
    if (!command) {
        std::println(stderr, "{}", command.error());
        print_usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = daemon_socket_path(config_path);

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is niriusd running?");
        return 1;
    }

    if (!client.send_command(*command)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    auto result = client.read_result();
    if (!result) {
        std::println(stderr, "No result from daemon: {}", result.error());
        return 1;
    }

    if (*result) {
        auto msg = trim(**result);
        if (!msg.empty()) std::println("{}", msg);
        return 0;
    }

    auto msg = trim(result->error());
    if (!msg.empty()) std::println(stderr, "{}", msg);
    return 1;
}
