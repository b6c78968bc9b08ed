#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      events_(ipc_server_),
      window_mgr_(config_, events_, verbose_),
      painter_(platform::make_titlebar_painter()),
      core_(config_, verbose_, ipc_server_, window_mgr_, *painter_, events_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool LinuxEventLoop::init() {
    if (config_.backend.type != "sway") {
        std::println(stderr, "Unknown backend type: {}", config_.backend.type);
        return false;
    }

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Window manager is required: every command goes through it
    if (!window_mgr_.connect()) {
        std::println(stderr, "Failed to connect to sway IPC");
        return false;
    }
    if (window_mgr_.subscribe_window_events()) {
        log("Sway IPC connected, watching window events");
    } else {
        log("Sway IPC connected (window events unavailable)");
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
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

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    if (window_mgr_.event_fd() >= 0) {
        add_fd(window_mgr_.event_fd(), EPOLLIN);
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, window_mgr_.poll_timeout_ms());
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (auto& expired : window_mgr_.expire_pending()) {
            dispatch_window_event(expired);
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) < 0) continue;
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            if (fd == window_mgr_.event_fd()) {
                WindowEvent event;
                if (window_mgr_.read_event(event)) {
                    dispatch_window_event(event);
                } else if (window_mgr_.event_fd() < 0) {
                    std::println(stderr, "Sway event socket closed");
                }
                continue;
            }

            if (events[i].events & EPOLLOUT) {
                if (!ipc_server_.flush(fd)) {
                    drop_client(fd);
                    continue;
                }
            }
            if (events[i].events & (EPOLLIN | EPOLLHUP | EPOLLERR)) {
                handle_client(fd);
            }
        }

        update_write_interest();
    }

    log("Stopped");
}

void LinuxEventLoop::handle_client(int fd) {
    // Drain every complete line the last recv delivered.
    do {
        nlohmann::json cmd;
        switch (ipc_server_.read_command(fd, cmd)) {
            case ReadStatus::Incomplete:
                return;
            case ReadStatus::Closed:
                drop_client(fd);
                return;
            case ReadStatus::Message:
                break;
        }

        std::string cmd_str;
        if (cmd.is_object() && cmd.contains("cmd") && cmd["cmd"].is_string()) {
            cmd_str = cmd["cmd"].get<std::string>();
        }
        auto response = core_.handle_command(fd, cmd_str, cmd);
        if (response.value("status", "") == "pending") continue;
        if (!ipc_server_.send_response(fd, response)) {
            drop_client(fd);
            return;
        }
    } while (ipc_server_.has_pending(fd));
}

void LinuxEventLoop::dispatch_window_event(const WindowEvent& event) {
    if (event.change == WindowEvent::Change::CreateFailed) {
        log("Window " + event.label + " failed to map: " + event.error);
    }
    core_.on_window_event(event);
}

// Events and deferred replies can queue output for any client, so interest
// is reconciled once per wakeup rather than at each send.
void LinuxEventLoop::update_write_interest() {
    auto want = ipc_server_.clients_with_output();

    for (int fd : want) {
        if (write_armed_.contains(fd)) continue;
        epoll_event ev{.events = EPOLLIN | EPOLLOUT, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) == 0) write_armed_.insert(fd);
    }

    for (auto it = write_armed_.begin(); it != write_armed_.end();) {
        if (std::ranges::find(want, *it) != want.end()) {
            ++it;
            continue;
        }
        epoll_event ev{.events = EPOLLIN, .data = {.fd = *it}};
        epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, *it, &ev);
        it = write_armed_.erase(it);
    }
}

void LinuxEventLoop::drop_client(int fd) {
    write_armed_.erase(fd);
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    core_.on_client_closed(fd);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[tabdock] {}", msg);
    }
}
