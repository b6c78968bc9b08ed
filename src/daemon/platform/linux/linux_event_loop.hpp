#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "event_hub.hpp"
#include "platform/linux/sway_window_manager.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/titlebar_painter.hpp"

#include <atomic>
#include <memory>
#include <set>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void drop_client(int fd);
    void dispatch_window_event(const WindowEvent& event);
    void update_write_interest();
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    UnixSocketServer ipc_server_;
    EventHub events_;
    SwayWindowManager window_mgr_;
    std::unique_ptr<TitleBarPainter> painter_;

    // Portable business logic
    DaemonCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    // Clients registered for EPOLLOUT while their output queue drains
    std::set<int> write_armed_;

    std::atomic<bool> running_{false};
};
