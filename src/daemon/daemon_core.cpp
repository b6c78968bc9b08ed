#include "daemon_core.hpp"

#include "titlebar_theme.hpp"

#include <expected>
#include <print>

using json = nlohmann::json;

namespace {

json ok() {
    return {{"status", "ok"}};
}

json error(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

std::expected<std::string, std::string> string_arg(const json& cmd, const char* key) {
    if (!cmd.contains(key) || !cmd[key].is_string()) {
        return std::unexpected(std::string("Invalid parameters: missing string field '") + key + "'");
    }
    return cmd[key].get<std::string>();
}

// Payloads are opaque strings; a structured payload is forwarded as its JSON text.
std::string payload_arg(const json& cmd) {
    if (!cmd.contains("payload") || cmd["payload"].is_null()) return {};
    if (cmd["payload"].is_string()) return cmd["payload"].get<std::string>();
    return cmd["payload"].dump();
}

} // namespace

DaemonCore::DaemonCore(const Config& config, bool verbose, IpcServer& ipc,
                       WindowManager& windows, TitleBarPainter& painter, EventHub& events)
    : verbose_(verbose), ipc_(ipc), windows_(windows), events_(events),
      commands_(windows, painter, config.window, verbose) {}

DaemonCore::~DaemonCore() = default;

json DaemonCore::handle_command(int client_fd, const std::string& cmd_str, const json& cmd) {
    if (cmd_str == "set_titlebar_theme") return handle_set_titlebar_theme(cmd);
    if (cmd_str == "create_session_window") return handle_create(client_fd, cmd);
    if (cmd_str == "close_session_window") return handle_close(cmd);
    if (cmd_str == "list_session_windows") return handle_list(cmd);
    if (cmd_str == "focus_session_window") return handle_focus(cmd);
    if (cmd_str == "emit_to_window") return handle_emit(cmd);
    if (cmd_str == "broadcast_to_session_windows") return handle_broadcast(cmd);
    if (cmd_str == "attach") return handle_attach(client_fd, cmd);
    if (cmd_str == "status") return handle_status(cmd);
    return error("unknown command");
}

json DaemonCore::handle_set_titlebar_theme(const json& cmd) {
    if (!cmd.contains("is_dark") || !cmd["is_dark"].is_boolean()) {
        return error("Invalid parameters: missing boolean field 'is_dark'");
    }
    auto res = commands_.set_titlebar_theme(cmd["is_dark"].get<bool>());
    if (!res) return error(res.error());
    return ok();
}

json DaemonCore::handle_create(int client_fd, const json& cmd) {
    if (!cmd.contains("params")) {
        return error("Invalid parameters: missing object field 'params'");
    }
    auto params = CreateSessionWindowParams::from_json(cmd["params"]);
    if (!params) return error(params.error());

    // Still mapping from an earlier request: answer both together.
    auto waiting = pending_creates_.find(session_window_label(params->tab_id));
    if (waiting != pending_creates_.end()) {
        waiting->second.push_back(client_fd);
        return {{"status", "pending"}};
    }

    auto res = commands_.create_session_window(*params);
    if (!res) return error(res.error());

    if (res->pending) {
        pending_creates_[res->window_label].push_back(client_fd);
        return {{"status", "pending"}};
    }

    json resp = res->to_json();
    resp["status"] = "ok";
    return resp;
}

void DaemonCore::complete_create(const std::string& label,
                                 const std::expected<WindowCreationResult, std::string>& result) {
    auto node = pending_creates_.extract(label);
    if (node.empty()) return;

    json resp;
    if (result) {
        resp = result->to_json();
        resp["status"] = "ok";
    } else {
        log("Create failed for " + label + ": " + result.error());
        resp = error(result.error());
    }

    for (int fd : node.mapped()) {
        if (!ipc_.send_response(fd, resp)) log("Could not deliver create reply to client");
    }
}

json DaemonCore::handle_close(const json& cmd) {
    auto label = string_arg(cmd, "window_label");
    if (!label) return error(label.error());

    auto res = commands_.close_session_window(*label);
    if (!res) return error(res.error());
    return ok();
}

json DaemonCore::handle_list(const json& /*cmd*/) {
    auto res = commands_.list_session_windows();
    if (!res) return error(res.error());

    json resp = ok();
    resp["windows"] = *res;
    return resp;
}

json DaemonCore::handle_focus(const json& cmd) {
    auto label = string_arg(cmd, "window_label");
    if (!label) return error(label.error());

    auto res = commands_.focus_session_window(*label);
    if (!res) return error(res.error());
    return ok();
}

json DaemonCore::handle_emit(const json& cmd) {
    auto label = string_arg(cmd, "window_label");
    if (!label) return error(label.error());
    auto event = string_arg(cmd, "event_name");
    if (!event) return error(event.error());

    auto res = commands_.emit_to_window(*label, *event, payload_arg(cmd));
    if (!res) return error(res.error());
    return ok();
}

json DaemonCore::handle_broadcast(const json& cmd) {
    auto event = string_arg(cmd, "event_name");
    if (!event) return error(event.error());

    auto res = commands_.broadcast_to_session_windows(*event, payload_arg(cmd));
    if (!res) return error(res.error());

    json resp = ok();
    resp["count"] = *res;
    return resp;
}

json DaemonCore::handle_attach(int client_fd, const json& cmd) {
    auto label = string_arg(cmd, "window_label");
    if (!label) return error(label.error());

    events_.attach(*label, client_fd);
    log("Listener attached to " + *label);
    return {{"status", "ok"}, {"message", "attached"}};
}

json DaemonCore::handle_status(const json& /*cmd*/) {
    auto open = windows_.windows();
    if (!open) return error(open.error());

    size_t sessions = 0;
    for (auto& w : *open) {
        if (is_session_window_label(w->label())) ++sessions;
    }

    std::string theme = "unset";
    if (auto color = commands_.current_titlebar_color()) {
        theme = *color == kDarkTitleBarColor ? "dark" : "light";
    }

    return {
        {"status", "ok"},
        {"windows", open->size()},
        {"session_windows", sessions},
        {"listeners", events_.listener_count()},
        {"theme", theme},
    };
}

void DaemonCore::on_client_closed(int client_fd) {
    events_.detach_client(client_fd);
    // The window itself still gets painted and focused once it maps.
    for (auto& [label, fds] : pending_creates_) {
        std::erase(fds, client_fd);
    }
}

void DaemonCore::on_window_event(const WindowEvent& event) {
    switch (event.change) {
        case WindowEvent::Change::Created:
            if (pending_creates_.contains(event.label)) {
                complete_create(event.label, commands_.finish_session_window(event.label));
            }
            break;
        case WindowEvent::Change::CreateFailed:
            complete_create(event.label,
                            std::unexpected("Failed to create window: " + event.error));
            break;
        case WindowEvent::Change::Closed:
            events_.drop_label(event.label);
            log("Window closed by host: " + event.label);
            break;
        case WindowEvent::Change::Focused:
            break;
    }
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[tabdock] {}", msg);
    }
}
