#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

std::string niri_socket_path(const Config& config) {
    return config.niri_socket.empty() ? platform::niri_socket() : config.niri_socket;
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose || config_.verbose),
      niri_(niri_socket_path(config_)),
      event_feed_(niri_socket_path(config_)),
      core_(config_, verbose_, niri_) {}

LinuxEventLoop::~LinuxEventLoop() {
    event_feed_.interrupt();
    if (sync_thread_.joinable()) sync_thread_.join();

    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (feed_closed_fd_ >= 0) ::close(feed_closed_fd_);
}

bool LinuxEventLoop::init() {
    // Initial state, then the live stream on its own connection
    if (!core_.event_sync().prime()) return false;
    if (!event_feed_.subscribe()) return false;
    log("Subscribed to niri event stream");

    // IPC socket
    auto ipc_path = config_.daemon_socket();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd. The mask is inherited by the sync thread.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Written by the sync thread once the event stream ends
    feed_closed_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (feed_closed_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0) return true;
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.listen_fd(), EPOLLIN) ||
        !add_fd(feed_closed_fd_, EPOLLIN)) {
        return false;
    }

    sync_thread_ = std::jthread([this] {
        core_.event_sync().run(event_feed_);
        uint64_t val = 1;
        if (::write(feed_closed_fd_, &val, sizeof(val)) < 0) {
            std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
        }
    });

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal, shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == feed_closed_fd_) {
                std::println(stderr, "niri has quit and so do I. Goodbye!");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.listen_fd()) {
                serve_client();
            }
        }
    }

    ipc_server_.stop();
}

// Serve one connection to completion: command in, result out, close.
void LinuxEventLoop::serve_client() {
    int client_fd = ipc_server_.accept_client();
    if (client_fd < 0) return;

    auto request = ipc_server_.read_request(client_fd);
    if (!request) {
        std::println(stderr, "ipc: dropping client: {}", request.error());
    } else if (!ipc_server_.send_result(client_fd, core_.handle_request(*request))) {
        log("Result could not be delivered");
    }
    ipc_server_.close_client(client_fd);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[nirius] {}", msg);
    }
}
