#pragma once

#include "config.hpp"
#include "event_hub.hpp"
#include "platform/ipc_server.hpp"
#include "platform/titlebar_painter.hpp"
#include "platform/window_manager.hpp"
#include "window_commands.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

class DaemonCore {
public:
    DaemonCore(const Config& config, bool verbose, IpcServer& ipc,
               WindowManager& windows, TitleBarPainter& painter, EventHub& events);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // `client_fd` identifies the connection for commands that subscribe it.
    // A {"status":"pending"} reply is not sent; the real reply follows once
    // the host finishes mapping the window.
    nlohmann::json handle_command(int client_fd, const std::string& cmd_str,
                                  const nlohmann::json& cmd);

    void on_client_closed(int client_fd);
    void on_window_event(const WindowEvent& event);

    WindowCommands& commands() { return commands_; }

private:
    nlohmann::json handle_set_titlebar_theme(const nlohmann::json& cmd);
    nlohmann::json handle_create(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_close(const nlohmann::json& cmd);
    nlohmann::json handle_list(const nlohmann::json& cmd);
    nlohmann::json handle_focus(const nlohmann::json& cmd);
    nlohmann::json handle_emit(const nlohmann::json& cmd);
    nlohmann::json handle_broadcast(const nlohmann::json& cmd);
    nlohmann::json handle_attach(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);

    void complete_create(const std::string& label,
                         const std::expected<WindowCreationResult, std::string>& result);
    void log(const std::string& msg);

    bool verbose_;
    IpcServer& ipc_;
    WindowManager& windows_;
    EventHub& events_;
    WindowCommands commands_;

    // Clients waiting on a create, by window label
    std::map<std::string, std::vector<int>> pending_creates_;
};
