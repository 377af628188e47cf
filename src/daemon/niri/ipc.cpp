#include "niri/ipc.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using json = nlohmann::json;

namespace {

enum class LineStatus { Ok, Eof };

int connect_socket(const std::string& path, std::string& error) {
    if (path.empty()) {
        error = "niri socket unknown, is $NIRI_SOCKET set?";
        return -1;
    }

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        error = std::format("socket() failed: {}", std::strerror(errno));
        return -1;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        error = "niri socket path too long";
        ::close(fd);
        return -1;
    }
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = std::format("cannot connect to niri at {}: {}", path, std::strerror(errno));
        ::close(fd);
        return -1;
    }
    return fd;
}

bool send_line(int fd, const json& msg) {
    std::string line = msg.dump() + "\n";
    size_t sent_total = 0;
    while (sent_total < line.size()) {
        ssize_t n = ::send(fd, line.data() + sent_total, line.size() - sent_total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent_total += static_cast<size_t>(n);
    }
    return true;
}

// A trailing unterminated line at end of stream still counts as a line.
LineStatus read_line(int fd, std::string& buf, std::string& line) {
    while (true) {
        auto pos = buf.find('\n');
        if (pos != std::string::npos) {
            line = buf.substr(0, pos);
            buf.erase(0, pos + 1);
            return LineStatus::Ok;
        }

        char tmp[4096];
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            if (buf.empty()) return LineStatus::Eof;
            line = std::move(buf);
            buf.clear();
            return LineStatus::Ok;
        }
        buf.append(tmp, static_cast<size_t>(n));
    }
}

// Unwrap {"Ok": payload} / {"Err": message}.
std::expected<json, std::string> unwrap_reply(const std::string& line) {
    json reply;
    try {
        reply = json::parse(line);
    } catch (const json::exception& e) {
        return std::unexpected(std::format("invalid reply from niri: {}", e.what()));
    }

    if (reply.is_object() && reply.contains("Ok")) return reply["Ok"];
    if (reply.is_object() && reply.contains("Err")) {
        auto& err = reply["Err"];
        return std::unexpected(err.is_string() ? err.get<std::string>() : err.dump());
    }
    return std::unexpected(unexpected_reply(reply));
}

} // namespace

std::string unexpected_reply(const json& reply) {
    return "received unexpected reply: " + reply.dump();
}

// --- NiriIpc ---

NiriIpc::NiriIpc(std::string socket_path) : socket_path_(std::move(socket_path)) {}

std::expected<json, std::string> NiriIpc::request(const json& req) {
    std::string error;
    int fd = connect_socket(socket_path_, error);
    if (fd < 0) return std::unexpected(error);

    if (!send_line(fd, req)) {
        ::close(fd);
        return std::unexpected(std::format("sending request to niri failed: {}", std::strerror(errno)));
    }
    ::shutdown(fd, SHUT_WR);

    std::string buf;
    std::string line;
    auto status = read_line(fd, buf, line);
    ::close(fd);
    if (status == LineStatus::Eof) {
        return std::unexpected("niri closed the connection without replying");
    }
    return unwrap_reply(line);
}

std::expected<std::vector<Window>, std::string> NiriIpc::windows() {
    auto resp = request("Windows");
    if (!resp) return std::unexpected(resp.error());
    if (!resp->is_object() || !resp->contains("Windows")) {
        return std::unexpected(unexpected_reply(*resp));
    }

    try {
        std::vector<Window> result;
        for (auto& w : (*resp)["Windows"]) result.push_back(window_from_json(w));
        return result;
    } catch (const json::exception& e) {
        return std::unexpected(std::format("malformed window list: {}", e.what()));
    }
}

std::expected<std::vector<Workspace>, std::string> NiriIpc::workspaces() {
    auto resp = request("Workspaces");
    if (!resp) return std::unexpected(resp.error());
    if (!resp->is_object() || !resp->contains("Workspaces")) {
        return std::unexpected(unexpected_reply(*resp));
    }

    try {
        std::vector<Workspace> result;
        for (auto& ws : (*resp)["Workspaces"]) result.push_back(workspace_from_json(ws));
        return result;
    } catch (const json::exception& e) {
        return std::unexpected(std::format("malformed workspace list: {}", e.what()));
    }
}

std::expected<std::optional<Window>, std::string> NiriIpc::focused_window() {
    auto resp = request("FocusedWindow");
    if (!resp) return std::unexpected(resp.error());
    if (!resp->is_object() || !resp->contains("FocusedWindow")) {
        return std::unexpected(unexpected_reply(*resp));
    }

    auto& w = (*resp)["FocusedWindow"];
    if (w.is_null()) return std::optional<Window>{};
    try {
        return std::optional<Window>{window_from_json(w)};
    } catch (const json::exception& e) {
        return std::unexpected(std::format("malformed window: {}", e.what()));
    }
}

std::expected<void, std::string> NiriIpc::perform(const Action& action) {
    auto resp = request(action_request(action));
    if (!resp) return std::unexpected(resp.error());
    if (*resp != "Handled") return std::unexpected(unexpected_reply(*resp));
    return {};
}

// --- NiriEventFeed ---

NiriEventFeed::NiriEventFeed(std::string socket_path) : socket_path_(std::move(socket_path)) {}

NiriEventFeed::~NiriEventFeed() {
    if (fd_ >= 0) ::close(fd_);
}

bool NiriEventFeed::subscribe() {
    std::string error;
    fd_ = connect_socket(socket_path_, error);
    if (fd_ < 0) {
        std::println(stderr, "niri: {}", error);
        return false;
    }

    if (!send_line(fd_, "EventStream")) {
        std::println(stderr, "niri: could not request event stream: {}", std::strerror(errno));
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    std::string line;
    if (read_line(fd_, buf_, line) == LineStatus::Eof) {
        std::println(stderr, "niri: connection closed while subscribing");
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    auto reply = unwrap_reply(line);
    if (!reply || *reply != "Handled") {
        std::println(stderr, "niri: event stream refused: {}",
                     reply ? unexpected_reply(*reply) : reply.error());
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    return true;
}

EventFeed::ReadStatus NiriEventFeed::read_event(Event& event, std::string& error) {
    if (fd_ < 0) return ReadStatus::Eof;

    std::string line;
    if (read_line(fd_, buf_, line) == LineStatus::Eof) return ReadStatus::Eof;

    try {
        auto parsed = parse_event(json::parse(line));
        if (!parsed) {
            error = parsed.error();
            return ReadStatus::Error;
        }
        event = std::move(*parsed);
        return ReadStatus::Ok;
    } catch (const json::exception& e) {
        error = std::format("invalid event JSON: {}", e.what());
        return ReadStatus::Error;
    }
}

void NiriEventFeed::interrupt() {
    if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}
