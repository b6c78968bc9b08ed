#pragma once

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>

class SwayIpc {
public:
    SwayIpc();
    ~SwayIpc();

    SwayIpc(const SwayIpc&) = delete;
    SwayIpc& operator=(const SwayIpc&) = delete;

    // Connect to Sway IPC. With an empty path $SWAYSOCK is used.
    bool connect(const std::string& path = {});
    bool connected() const { return query_fd_ >= 0; }

    // Run a command string (i3-ipc RUN_COMMAND). Fails with sway's own error text.
    std::expected<void, std::string> run_command(const std::string& command);

    std::expected<nlohmann::json, std::string> get_tree();

    // Opens the event socket and subscribes to `events`, e.g. R"(["window"])".
    bool subscribe(const std::string& events);

    // Read one event. Call when event_fd() is readable.
    bool read_event(uint32_t& type, nlohmann::json& payload);

    // FD for epoll registration (event subscription socket).
    int event_fd() const { return event_fd_; }

    static constexpr uint32_t EVENT_WINDOW = 0x80000003;

private:
    // i3-ipc binary protocol
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr uint32_t MSG_RUN_COMMAND = 0;
    static constexpr uint32_t MSG_SUBSCRIBE = 2;
    static constexpr uint32_t MSG_GET_TREE = 4;

    bool send_message(int fd, uint32_t type, const std::string& payload = "");
    bool recv_message(int fd, uint32_t& type, std::string& payload);
    std::expected<std::string, std::string> request(uint32_t type, const std::string& payload);

    int connect_socket(const std::string& path);

    int query_fd_ = -1;   // for RUN_COMMAND, GET_TREE
    int event_fd_ = -1;   // for subscribed events
    std::string sway_sock_;
};
