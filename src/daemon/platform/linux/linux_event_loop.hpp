#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "niri/ipc.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <atomic>
#include <string>
#include <thread>

// Runs niriusd: the main thread serves client commands from an epoll loop,
// a second thread applies niri's event stream to the same store. The daemon
// stops on SIGINT/SIGTERM or when niri closes the event stream.
class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    // Prime the store, subscribe to events, open the command socket.
    bool init();
    void run();

private:
    void serve_client();
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // niri connections, one for requests and one for the event stream
    NiriIpc niri_;
    NiriEventFeed event_feed_;

    UnixSocketServer ipc_server_;
    DaemonCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int feed_closed_fd_ = -1;   // eventfd, written when the event stream ends

    std::atomic<bool> running_{false};
    std::jthread sync_thread_;
};
