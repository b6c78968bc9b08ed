#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdio>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  create --tab-id ID --title TITLE [--session-id ID]");
    std::println(stderr, "         [--project-path PATH] [--engine NAME]   Open (or focus) a session window");
    std::println(stderr, "  close LABEL                       Close a session window");
    std::println(stderr, "  list                              List session windows");
    std::println(stderr, "  focus LABEL                       Focus a session window");
    std::println(stderr, "  emit LABEL EVENT [PAYLOAD]        Send an event to one window");
    std::println(stderr, "  broadcast EVENT [PAYLOAD]         Send an event to every session window");
    std::println(stderr, "  theme dark|light                  Recolor window title bars");
    std::println(stderr, "  listen LABEL                      Print events delivered to LABEL");
    std::println(stderr, "  status                            Show daemon status");
}

// Positional arguments after the command, with --flags removed.
static std::vector<std::string> positionals(int argc, char* argv[]) {
    std::vector<std::string> out;
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.starts_with("--")) {
            ++i; // every flag takes a value
            continue;
        }
        out.push_back(arg);
    }
    return out;
}

static bool build_create(int argc, char* argv[], json& cmd) {
    json params = json::object();
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (i + 1 >= argc) break;
        if (arg == "--tab-id") params["tab_id"] = argv[++i];
        else if (arg == "--title") params["title"] = argv[++i];
        else if (arg == "--session-id") params["session_id"] = argv[++i];
        else if (arg == "--project-path") params["project_path"] = argv[++i];
        else if (arg == "--engine") params["engine"] = argv[++i];
    }
    if (!params.contains("tab_id") || !params.contains("title")) {
        std::println(stderr, "create requires --tab-id and --title");
        return false;
    }
    cmd = {{"cmd", "create_session_window"}, {"params", params}};
    return true;
}

static int listen_events(UnixSocketClient& client) {
    json event;
    while (client.recv(event, -1)) {
        std::println("{} {}", event.value("event", ""), event.value("payload", ""));
        std::fflush(stdout);
    }
    std::println(stderr, "Connection to daemon closed");
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    auto args = positionals(argc, argv);

    auto need = [&](size_t n) {
        if (args.size() >= n) return true;
        std::println(stderr, "{}: missing arguments", command);
        usage(argv[0]);
        return false;
    };

    json cmd;
    if (command == "create") {
        if (!build_create(argc, argv, cmd)) return 1;
    } else if (command == "close") {
        if (!need(1)) return 1;
        cmd = {{"cmd", "close_session_window"}, {"window_label", args[0]}};
    } else if (command == "list") {
        cmd = {{"cmd", "list_session_windows"}};
    } else if (command == "focus") {
        if (!need(1)) return 1;
        cmd = {{"cmd", "focus_session_window"}, {"window_label", args[0]}};
    } else if (command == "emit") {
        if (!need(2)) return 1;
        cmd = {{"cmd", "emit_to_window"}, {"window_label", args[0]}, {"event_name", args[1]},
               {"payload", args.size() > 2 ? args[2] : ""}};
    } else if (command == "broadcast") {
        if (!need(1)) return 1;
        cmd = {{"cmd", "broadcast_to_session_windows"}, {"event_name", args[0]},
               {"payload", args.size() > 1 ? args[1] : ""}};
    } else if (command == "theme") {
        if (!need(1)) return 1;
        if (args[0] != "dark" && args[0] != "light") {
            std::println(stderr, "theme must be dark or light");
            return 1;
        }
        cmd = {{"cmd", "set_titlebar_theme"}, {"is_dark", args[0] == "dark"}};
    } else if (command == "listen") {
        if (!need(1)) return 1;
        cmd = {{"cmd", "attach"}, {"window_label", args[0]}};
    } else if (command == "status") {
        cmd = {{"cmd", "status"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is tabdock running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    auto status = response.value("status", "");
    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "listen") {
        return listen_events(client);
    } else if (command == "create") {
        std::println("{}", response.value("window_label", ""));
    } else if (command == "list") {
        for (auto& label : response.value("windows", json::array())) {
            std::println("{}", label.get<std::string>());
        }
    } else if (command == "broadcast") {
        std::println("Delivered to {} window(s)", response.value("count", 0));
    } else if (command == "status") {
        std::println("Windows: {} ({} session)", response.value("windows", 0),
                     response.value("session_windows", 0));
        std::println("Listeners: {}", response.value("listeners", 0));
        std::println("Theme: {}", response.value("theme", "unset"));
    } else if (status == "ok") {
        std::println("OK");
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}
