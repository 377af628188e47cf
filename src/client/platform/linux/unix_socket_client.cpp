#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <nlohmann/json.hpp>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::~UnixSocketClient() {
    close();
}

bool UnixSocketClient::connect(const std::string& socket_path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path)) return false;
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close();
        return false;
    }
    return true;
}

bool UnixSocketClient::send_command(const Command& command) {
    if (fd_ < 0) return false;

    std::string msg = command_to_json(command).dump();
    size_t sent_total = 0;
    while (sent_total < msg.size()) {
        ssize_t n = ::send(fd_, msg.data() + sent_total, msg.size() - sent_total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent_total += static_cast<size_t>(n);
    }
    return ::shutdown(fd_, SHUT_WR) == 0;
}

std::expected<CommandResult, std::string> UnixSocketClient::read_result(int timeout_ms) {
    if (fd_ < 0) return std::unexpected("not connected");

    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
    std::string reply;

    while (true) {
        int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret < 0 && errno == EINTR) continue;
        if (ret == 0) return std::unexpected("timed out waiting for niriusd");
        if (ret < 0) return std::unexpected(std::format("poll() failed: {}", std::strerror(errno)));

        char tmp[4096];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) return std::unexpected(std::format("recv() failed: {}", std::strerror(errno)));
        if (n == 0) break;
        reply.append(tmp, static_cast<size_t>(n));
    }

    if (reply.empty()) return std::unexpected("niriusd closed the connection without a result");

    try {
        return result_from_json(nlohmann::json::parse(reply));
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::format("invalid result from niriusd: {}", e.what()));
    }
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}
