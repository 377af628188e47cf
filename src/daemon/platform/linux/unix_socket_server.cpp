#include "platform/linux/unix_socket_server.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& socket_path) {
    // A daemon that died without cleaning up leaves its socket file behind
    if (::unlink(socket_path.c_str()) < 0 && errno != ENOENT) {
        std::println(stderr, "ipc: could not remove stale socket {}: {}", socket_path, std::strerror(errno));
        return false;
    }

    listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long");
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind() failed: {}", std::strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }
    socket_path_ = socket_path;

    if (::listen(listen_fd_, 16) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        stop();
        return false;
    }

    return true;
}

void UnixSocketServer::stop() {
    for (int fd : clients_) {
        ::close(fd);
    }
    clients_.clear();

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

// Client sockets stay blocking: each connection is served to completion
// before the next one is accepted.
int UnixSocketServer::accept_client() {
    int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            std::println(stderr, "ipc: accept() failed: {}", std::strerror(errno));
        }
        return -1;
    }

    timeval timeout{};
    timeout.tv_sec = CLIENT_TIMEOUT_MS / 1000;
    timeout.tv_usec = (CLIENT_TIMEOUT_MS % 1000) * 1000;
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0 ||
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout)) < 0) {
        std::println(stderr, "ipc: could not set client timeout: {}", std::strerror(errno));
        ::close(fd);
        return -1;
    }

    clients_.push_back(fd);
    return fd;
}

std::expected<nlohmann::json, std::string> UnixSocketServer::read_request(int client_fd) {
    std::string buf;
    char tmp[4096];
    while (true) {
        ssize_t n = ::recv(client_fd, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return std::unexpected(std::format("no complete request within {} ms", CLIENT_TIMEOUT_MS));
        }
        if (n < 0) return std::unexpected(std::format("recv() failed: {}", std::strerror(errno)));
        if (n == 0) break;

        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > MAX_REQUEST_BYTES) {
            return std::unexpected(std::format("request exceeds {} bytes", MAX_REQUEST_BYTES));
        }
    }

    try {
        return nlohmann::json::parse(buf);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::format("request is not JSON: {}", e.what()));
    }
}

bool UnixSocketServer::send_result(int client_fd, const CommandResult& result) {
    std::string msg = result_to_json(result).dump() + "\n";
    size_t sent_total = 0;
    while (sent_total < msg.size()) {
        ssize_t n = ::send(client_fd, msg.data() + sent_total, msg.size() - sent_total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            std::println(stderr, "ipc: could not send result to client: {}", std::strerror(errno));
            return false;
        }
        sent_total += static_cast<size_t>(n);
    }

    if (::shutdown(client_fd, SHUT_WR) < 0) {
        std::println(stderr, "ipc: shutdown() failed: {}", std::strerror(errno));
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase(clients_, client_fd);
}
